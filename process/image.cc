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

#include "process/image.h"

#include "process/image_fallback.h"
#include "process/image_gif.h"
#include "process/image_jpg.h"
#include "process/image_png.h"

namespace mmp {
constexpr Image::Component Image::kComponentMax;
constexpr float Image::kComponentToFloatScale;

Image::Image() : width_(0), height_(0), channel_count_(0) {
  Clear();
}

Image::~Image() {
  Clear();
}

void Image::Clear() {
  width_ = 0;
  height_ = 0;
  channel_count_ = 0;
  buffer_.clear();
}

bool Image::Read(const void* buffer, size_t size, Logger* logger) {
  Clear();

  // Source textures are frequently saved with the wrong extension, so
  // determine type from the header.
  bool success;
  if (HasPngHeader(buffer, size)) {
    success = PngRead(
        buffer, size, &width_, &height_, &channel_count_, &buffer_, logger);
  } else if (HasJpgHeader(buffer, size)) {
    success = JpgRead(
        buffer, size, &width_, &height_, &channel_count_, &buffer_, logger);
  } else if (HasGifHeader(buffer, size)) {
    success = GifRead(
        buffer, size, &width_, &height_, &channel_count_, &buffer_, logger);
  } else {
    success = ImageFallbackRead(
        buffer, size, &width_, &height_, &channel_count_, &buffer_, logger);
  }
  if (!success) {
    Clear();
  }
  return success;
}

bool Image::Write(const char* path, int png_level, Logger* logger) const {
  MMP_ASSERT_LOGIC(IsValid());
  return PngWrite(path, width_, height_, channel_count_, buffer_.data(),
                  png_level, logger);
}

void Image::CreateFromFloat(const float* data, size_t width, size_t height,
                            size_t channel_count) {
  MMP_ASSERT_LOGIC(channel_count > 0 && channel_count <= kColorChannelCount);
  Clear();
  const size_t size = width * height * channel_count;
  buffer_.resize(size);
  const float* src = data;
  const float* const src_end = data + size;
  Component* dst = buffer_.data();
  for (; src != src_end; ++src, ++dst) {
    *dst = FloatToComponent(*src);
  }
  width_ = static_cast<uint32_t>(width);
  height_ = static_cast<uint32_t>(height);
  channel_count_ = static_cast<uint8_t>(channel_count);
}

void Image::CreateWxH(size_t width, size_t height,
                      const Component* color, size_t channel_count) {
  MMP_ASSERT_LOGIC(width > 0);
  MMP_ASSERT_LOGIC(height > 0);
  MMP_ASSERT_LOGIC(channel_count > 0 && channel_count <= kColorChannelCount);
  Clear();
  const size_t pixel_count = width * height;
  buffer_.resize(pixel_count * channel_count);
  Component* dst = buffer_.data();
  for (size_t i = 0; i != pixel_count; ++i) {
    for (size_t j = 0; j != channel_count; ++j) {
      *dst++ = color[j];
    }
  }
  width_ = static_cast<uint32_t>(width);
  height_ = static_cast<uint32_t>(height);
  channel_count_ = static_cast<uint8_t>(channel_count);
}
}  // namespace mmp
