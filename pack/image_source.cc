/*
 * Copyright 2019 Google LLC
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "pack/image_source.h"

#include "common/logging.h"
#include "process/color.h"

namespace mmp {
GrayImage::GrayImage() : width_(0), height_(0) {}

GrayImage::GrayImage(const Image& src) : width_(0), height_(0) {
  CopyFrom(src);
}

GrayImage::GrayImage(int width, int height, const float* values)
    : width_(width), height_(height) {
  MMP_ASSERT_LOGIC(width >= 0 && height >= 0);
  values_.assign(values, values + static_cast<size_t>(width) * height);
}

void GrayImage::CopyFrom(const Image& src) {
  const uint32_t channel_count = src.GetChannelCount();
  MMP_ASSERT_LOGIC(!src.IsValid() ||
                   (channel_count > 0 && channel_count <= kColorChannelCount));
  width_ = static_cast<int>(src.GetWidth());
  height_ = static_cast<int>(src.GetHeight());
  const size_t pixel_count = static_cast<size_t>(width_) * height_;
  values_.resize(pixel_count);

  const Image::Component* src_pixel = src.GetData();
  float* dst = values_.data();
  float* const dst_end = dst + pixel_count;
  if (channel_count < 3) {
    for (; dst != dst_end; ++dst, src_pixel += channel_count) {
      *dst = Image::ComponentToFloat(src_pixel[0]);
    }
  } else {
    for (; dst != dst_end; ++dst, src_pixel += channel_count) {
      *dst = GetPerceivedBrightness(
          Image::ComponentToFloat(src_pixel[kColorChannelR]),
          Image::ComponentToFloat(src_pixel[kColorChannelG]),
          Image::ComponentToFloat(src_pixel[kColorChannelB]));
    }
  }
}

float GrayImage::Sample(int x, int y) const {
  MMP_ASSERT_LOGIC(x >= 0 && x < width_ && y >= 0 && y < height_);
  return values_[static_cast<size_t>(y) * width_ + x];
}
}  // namespace mmp
