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

#ifndef MMP_PACK_PACKER_H_
#define MMP_PACK_PACKER_H_

#include "common/common.h"
#include "common/config.h"
#include "common/scheduler.h"
#include "pack/image_source.h"
#include "pack/packed_image.h"

namespace mmp {
enum PackStatus : uint8_t {
  kPackStatusOk,
  // A source, or the requested output, has a non-positive width or height.
  kPackStatusInvalidDimensions,
};

const char* GetPackStatusName(PackStatus status);

// Channel input. The fallback value is used for every pixel when the source
// is absent.
struct ChannelSpec {
  const ImageSource* source = nullptr;
  float fallback = 0.0f;

  bool IsPresent() const { return source != nullptr; }
};

struct PackRequest {
  // Indexed by MaskSlot.
  ChannelSpec channels[kMaskSlotCount];

  // Store 1-value in the smoothness (alpha) channel, for both the source and
  // the fallback.
  bool invert_smoothness = false;

  const ChannelSpec& GetChannel(MaskSlot slot) const {
    return channels[slot];
  }
  ChannelSpec& ModifyChannel(MaskSlot slot) {
    return channels[slot];
  }
};

struct SizeResolution {
  int width = 0;
  int height = 0;

  // Bit (1 << slot) is set for each present source whose size does not match.
  uint32_t dropped_mask = 0;

  bool IsDropped(MaskSlot slot) const {
    return (dropped_mask & (1u << slot)) != 0;
  }
};

// Establish the output size from the first present source, in slot order. If
// no source is present, the size is kDefaultPackSize^2. Sources of any other
// size are marked as dropped.
PackStatus ResolveSize(const ImageSource* const (&sources)[kMaskSlotCount],
                       SizeResolution* out_resolution);
PackStatus ResolveSize(const PackRequest& request,
                       SizeResolution* out_resolution);

// Fill an RGBA image from per-slot samples or fallbacks.
// * All present sources must be width x height (see ResolveSize).
// * If scheduler is non-null, bands of rows are composited on its worker
//   threads. The result is identical to the serial result.
// * On failure, out_image is cleared.
PackStatus Composite(const PackRequest& request, int width, int height,
                     PackedImage* out_image, Scheduler* scheduler = nullptr);

struct PackResult {
  PackedImage image;
  uint32_t dropped_mask = 0;

  bool IsDropped(MaskSlot slot) const {
    return (dropped_mask & (1u << slot)) != 0;
  }
};

// ResolveSize followed by Composite, with dropped sources replaced by their
// fallbacks.
PackStatus Pack(const PackRequest& request, PackResult* out_result,
                Scheduler* scheduler = nullptr);
}  // namespace mmp

#endif  // MMP_PACK_PACKER_H_
