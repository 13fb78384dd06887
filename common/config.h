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

#ifndef MMP_COMMON_CONFIG_H_
#define MMP_COMMON_CONFIG_H_

#include <string>
#include "common/common.h"

namespace mmp {
// Logical mask map slots, in the priority order used to establish the output
// size and the default output name. Each slot maps to the output channel of
// the same index (R, G, B, A).
enum MaskSlot : uint8_t {
  kMaskSlotMetallic,
  kMaskSlotOcclusion,
  kMaskSlotDetail,
  kMaskSlotSmoothness,
  kMaskSlotCount
};

// Human-readable slot name, used as logging context.
const char* GetMaskSlotName(MaskSlot slot);

// Output size used when no source texture is assigned.
constexpr int kDefaultPackSize = 512;

// Fallback values for slots with no source texture.
constexpr float kFallbackMetallic = 0.5f;
constexpr float kFallbackOcclusion = 1.0f;
constexpr float kFallbackDetail = 0.5f;
constexpr float kFallbackSmoothness = 0.5f;

// Suffix appended to derived output names, and the name used when there is no
// source to derive it from.
constexpr char kMaskNameSuffix[] = "Mask";
constexpr char kMaskNameDefault[] = "LitMask";

struct PackSettings {
  // Source texture paths, one per slot. An empty path leaves the slot
  // unassigned, so its fallback value is used instead.
  std::string metallic_path;
  std::string occlusion_path;
  std::string detail_path;
  std::string smoothness_path;

  // Fallback values in the range [0, 1], used for the whole channel when the
  // slot has no source (or its source was dropped).
  float default_metallic = kFallbackMetallic;
  float default_occlusion = kFallbackOcclusion;
  float default_detail = kFallbackDetail;
  float default_smoothness = kFallbackSmoothness;

  // Store 1-smoothness in the alpha channel. Use this when the smoothness
  // source is actually a roughness map. This also applies to the fallback.
  bool invert_smoothness = false;

  // PNG compression level [0=fastest, 9=smallest].
  uint8_t png_level = 9;

  // Number of worker threads used to composite rows. 0 composites on the
  // calling thread.
  uint32_t worker_count = 0;

  // Print packing time stats.
  bool print_timing = false;

  const std::string& GetSourcePath(MaskSlot slot) const;
  float GetFallback(MaskSlot slot) const;

  static const PackSettings kDefault;
};

}  // namespace mmp

#endif  // MMP_COMMON_CONFIG_H_
