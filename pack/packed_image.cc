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

#include "pack/packed_image.h"

namespace mmp {
void PackedImage::CopyTo(Image* dst) const {
  MMP_ASSERT_LOGIC(IsValid());
  dst->CreateFromFloat(pixels_.data(), width_, height_, kColorChannelCount);
}
}  // namespace mmp
