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

#include "pack/packer.h"

#include <algorithm>
#include "common/logging.h"

namespace mmp {
namespace {
// Bands per worker, so uneven job timing still balances.
constexpr int kBandsPerWorker = 4;

void CompositeRows(const PackRequest& request, int y_begin, int y_end,
                   PackedImage* image) {
  const int width = image->GetWidth();
  for (int y = y_begin; y != y_end; ++y) {
    float* dst = image->ModifyRow(y);
    for (int x = 0; x != width; ++x, dst += kColorChannelCount) {
      for (size_t i = 0; i != kMaskSlotCount; ++i) {
        const MaskSlot slot = static_cast<MaskSlot>(i);
        const ChannelSpec& channel = request.GetChannel(slot);
        dst[MaskSlotToChannel(slot)] =
            channel.IsPresent() ? channel.source->Sample(x, y)
                                : channel.fallback;
      }
      if (request.invert_smoothness) {
        float& a = dst[MaskSlotToChannel(kMaskSlotSmoothness)];
        a = 1.0f - a;
      }
    }
  }
}

void CompositeBands(const PackRequest& request, PackedImage* image,
                    Scheduler* scheduler) {
  const int height = image->GetHeight();
  const int band_count = std::min(
      height, static_cast<int>(scheduler->GetWorkerCount()) * kBandsPerWorker);
  const int band_height = (height + band_count - 1) / band_count;
  for (int y_begin = 0; y_begin < height; y_begin += band_height) {
    const int y_end = std::min(y_begin + band_height, height);
    scheduler->Schedule([&request, y_begin, y_end, image]() {
      CompositeRows(request, y_begin, y_end, image);
    });
  }
  scheduler->WaitForAllComplete();
}
}  // namespace

const char* GetPackStatusName(PackStatus status) {
  switch (status) {
  case kPackStatusOk:
    return "Ok";
  case kPackStatusInvalidDimensions:
    return "InvalidDimensions";
  }
  return "Unknown";
}

PackStatus ResolveSize(const ImageSource* const (&sources)[kMaskSlotCount],
                       SizeResolution* out_resolution) {
  *out_resolution = SizeResolution();
  for (const ImageSource* source : sources) {
    if (source && (source->GetWidth() <= 0 || source->GetHeight() <= 0)) {
      return kPackStatusInvalidDimensions;
    }
  }

  const ImageSource* required = nullptr;
  for (const ImageSource* source : sources) {
    if (source) {
      required = source;
      break;
    }
  }
  if (!required) {
    out_resolution->width = kDefaultPackSize;
    out_resolution->height = kDefaultPackSize;
    return kPackStatusOk;
  }

  const int width = required->GetWidth();
  const int height = required->GetHeight();
  out_resolution->width = width;
  out_resolution->height = height;
  for (size_t i = 0; i != kMaskSlotCount; ++i) {
    const ImageSource* const source = sources[i];
    if (source &&
        (source->GetWidth() != width || source->GetHeight() != height)) {
      out_resolution->dropped_mask |= 1u << i;
    }
  }
  return kPackStatusOk;
}

PackStatus ResolveSize(const PackRequest& request,
                       SizeResolution* out_resolution) {
  const ImageSource* sources[kMaskSlotCount];
  for (size_t i = 0; i != kMaskSlotCount; ++i) {
    sources[i] = request.channels[i].source;
  }
  return ResolveSize(sources, out_resolution);
}

PackStatus Composite(const PackRequest& request, int width, int height,
                     PackedImage* out_image, Scheduler* scheduler) {
  out_image->Clear();
  if (width <= 0 || height <= 0) {
    return kPackStatusInvalidDimensions;
  }
  for (const ChannelSpec& channel : request.channels) {
    if (channel.IsPresent()) {
      MMP_ASSERT_LOGIC(channel.source->GetWidth() == width &&
                       channel.source->GetHeight() == height);
    }
  }

  out_image->Reset(width, height);
  try {
    if (scheduler && scheduler->GetWorkerCount() != 0) {
      CompositeBands(request, out_image, scheduler);
    } else {
      CompositeRows(request, 0, height, out_image);
    }
  } catch (...) {
    out_image->Clear();
    throw;
  }
  return kPackStatusOk;
}

PackStatus Pack(const PackRequest& request, PackResult* out_result,
                Scheduler* scheduler) {
  out_result->image.Clear();
  out_result->dropped_mask = 0;

  SizeResolution resolution;
  const PackStatus resolve_status = ResolveSize(request, &resolution);
  if (resolve_status != kPackStatusOk) {
    return resolve_status;
  }

  PackRequest resolved = request;
  for (size_t i = 0; i != kMaskSlotCount; ++i) {
    if (resolution.IsDropped(static_cast<MaskSlot>(i))) {
      resolved.channels[i].source = nullptr;
    }
  }
  out_result->dropped_mask = resolution.dropped_mask;
  return Composite(resolved, resolution.width, resolution.height,
                   &out_result->image, scheduler);
}
}  // namespace mmp
