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

#include "common/config.h"

#include "common/logging.h"

namespace mmp {
const char* GetMaskSlotName(MaskSlot slot) {
  static const char* const kNames[] = {
      "Metallic",              // kMaskSlotMetallic
      "Ambient Occlusion",     // kMaskSlotOcclusion
      "Detail Mask",           // kMaskSlotDetail
      "Smoothness/Roughness",  // kMaskSlotSmoothness
  };
  static_assert(MMP_ARRAY_SIZE(kNames) == kMaskSlotCount, "");
  MMP_ASSERT_LOGIC(slot < kMaskSlotCount);
  return kNames[slot];
}

const std::string& PackSettings::GetSourcePath(MaskSlot slot) const {
  switch (slot) {
  case kMaskSlotMetallic:
    return metallic_path;
  case kMaskSlotOcclusion:
    return occlusion_path;
  case kMaskSlotDetail:
    return detail_path;
  case kMaskSlotSmoothness:
    return smoothness_path;
  default:
    MMP_ASSERT_LOGIC(false);
    return metallic_path;
  }
}

float PackSettings::GetFallback(MaskSlot slot) const {
  switch (slot) {
  case kMaskSlotMetallic:
    return default_metallic;
  case kMaskSlotOcclusion:
    return default_occlusion;
  case kMaskSlotDetail:
    return default_detail;
  case kMaskSlotSmoothness:
    return default_smoothness;
  default:
    MMP_ASSERT_LOGIC(false);
    return 0.0f;
  }
}

const PackSettings PackSettings::kDefault;
}  // namespace mmp
