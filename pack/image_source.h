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

#ifndef MMP_PACK_IMAGE_SOURCE_H_
#define MMP_PACK_IMAGE_SOURCE_H_

#include <vector>
#include "common/common.h"
#include "process/image.h"

namespace mmp {
// Read-only grayscale sample source for a single mask slot.
class ImageSource {
 public:
  virtual ~ImageSource() {}
  virtual int GetWidth() const = 0;
  virtual int GetHeight() const = 0;

  // Grayscale intensity in [0, 1]. Coordinates must be within bounds.
  virtual float Sample(int x, int y) const = 0;
};

// Grayscale reduction of a decoded image.
// * 1 channel: the value.
// * 2 channels: the gray value. Alpha is ignored.
// * 3 or 4 channels: perceived brightness of RGB. Alpha is ignored.
// Components are mapped linearly to [0, 1] (mask data is not sRGB encoded).
class GrayImage : public ImageSource {
 public:
  GrayImage();
  explicit GrayImage(const Image& src);

  // Construct from explicit values, row-major.
  GrayImage(int width, int height, const float* values);

  void CopyFrom(const Image& src);

  bool IsValid() const { return width_ > 0 && height_ > 0; }
  int GetWidth() const override { return width_; }
  int GetHeight() const override { return height_; }
  float Sample(int x, int y) const override;

 private:
  int width_;
  int height_;
  std::vector<float> values_;
};
}  // namespace mmp

#endif  // MMP_PACK_IMAGE_SOURCE_H_
