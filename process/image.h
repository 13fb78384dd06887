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

#ifndef MMP_PROCESS_IMAGE_H_
#define MMP_PROCESS_IMAGE_H_

#include <limits>
#include <vector>
#include "common/common.h"
#include "common/logging.h"
#include "process/color.h"

namespace mmp {
// Quantized image with 1-4 interleaved 8-bit channels, as read from or written
// to image files.
class Image {
 public:
  // A single component (R, G, B, or A).
  using Component = uint8_t;

  static constexpr Image::Component kComponentMax =
      std::numeric_limits<Image::Component>::max();
  static constexpr float kComponentToFloatScale = 1.0f / kComponentMax;

  inline static constexpr float ComponentToFloat(Image::Component c) {
    return c * kComponentToFloatScale;
  }

  inline static constexpr Image::Component FloatToComponent(float f) {
    return f <= 0.0f ?
        0 : (f >= 1.0f ? kComponentMax :
             static_cast<Image::Component>(f * kComponentMax + 0.5f));
  }

  Image();
  ~Image();

  bool IsValid() const { return width_ != 0; }
  uint32_t GetWidth() const { return width_; }
  uint32_t GetHeight() const { return height_; }
  uint32_t GetChannelCount() const { return channel_count_; }
  const Component* GetData() const { return buffer_.data(); }
  Component* ModifyData() { return buffer_.data(); }

  const Component* GetPixel(uint32_t x, uint32_t y) const {
    MMP_ASSERT_LOGIC(x < width_ && y < height_);
    return buffer_.data() + (y * width_ + x) * channel_count_;
  }

  void Clear();

  // Decode an image file held in memory. The format is determined from the
  // file header rather than the file extension.
  bool Read(const void* buffer, size_t size, Logger* logger);

  // Encode as PNG.
  // * png_level: PNG compression level [0=fastest, 9=smallest].
  bool Write(const char* path, int png_level, Logger* logger) const;

  // Quantize floating-point components in [0, 1] (out-of-range values are
  // clamped). No color space conversion is applied.
  void CreateFromFloat(const float* data, size_t width, size_t height,
                       size_t channel_count);

  void CreateWxH(size_t width, size_t height,
                 const Component* color, size_t channel_count);

  template <size_t kCount>
  void CreateWxH(size_t width, size_t height,
                 const Component (&color)[kCount]) {
    CreateWxH(width, height, color, kCount);
  }

 private:
  uint32_t width_;
  uint32_t height_;
  uint8_t channel_count_;
  std::vector<Component> buffer_;
};
}  // namespace mmp
#endif  // MMP_PROCESS_IMAGE_H_
