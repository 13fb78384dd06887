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

#ifndef MMP_PROCESS_IMAGE_FALLBACK_H_
#define MMP_PROCESS_IMAGE_FALLBACK_H_

#include "process/image.h"

// Read any other format stb_image understands (TGA, BMP, PSD, HDR, PNM).
// Texture sources are commonly TGA or PSD, which have no reliable header
// signature, so this is tried last.
namespace mmp {
bool ImageFallbackRead(
    const void* src, size_t src_size,
    uint32_t* out_width, uint32_t* out_height, uint8_t* out_channel_count,
    std::vector<Image::Component>* out_buffer, Logger* logger);
}  // namespace mmp

#endif  // MMP_PROCESS_IMAGE_FALLBACK_H_
