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

#ifndef MMP_PACK_PACKED_IMAGE_H_
#define MMP_PACK_PACKED_IMAGE_H_

#include <vector>
#include "common/logging.h"
#include "process/color.h"
#include "process/image.h"

namespace mmp {
// Packed RGBA output, stored as floating-point values in [0, 1], row-major
// starting at row 0.
class PackedImage {
 public:
  PackedImage() : width_(0), height_(0) {}

  bool IsValid() const { return width_ > 0 && height_ > 0; }
  int GetWidth() const { return width_; }
  int GetHeight() const { return height_; }

  // width*height RGBA quadruples.
  const float* GetData() const { return pixels_.data(); }
  size_t GetDataSize() const { return pixels_.size(); }

  ColorF GetPixel(int x, int y) const {
    MMP_ASSERT_LOGIC(x >= 0 && x < width_ && y >= 0 && y < height_);
    const float* const src = GetRow(y) + x * kColorChannelCount;
    ColorF color;
    color.Assign(src[kColorChannelR], src[kColorChannelG],
                 src[kColorChannelB], src[kColorChannelA]);
    return color;
  }

  const float* GetRow(int y) const {
    return pixels_.data() + static_cast<size_t>(y) * width_ * kColorChannelCount;
  }
  float* ModifyRow(int y) {
    return pixels_.data() + static_cast<size_t>(y) * width_ * kColorChannelCount;
  }

  void Reset(int width, int height) {
    MMP_ASSERT_LOGIC(width > 0 && height > 0);
    width_ = width;
    height_ = height;
    pixels_.clear();
    pixels_.resize(static_cast<size_t>(width) * height * kColorChannelCount);
  }

  void Clear() {
    width_ = 0;
    height_ = 0;
    pixels_.clear();
  }

  // Quantize to an 8-bit RGBA image.
  void CopyTo(Image* dst) const;

 private:
  int width_;
  int height_;
  std::vector<float> pixels_;
};
}  // namespace mmp

#endif  // MMP_PACK_PACKED_IMAGE_H_
