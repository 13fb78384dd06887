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

#ifndef MMP_PROCESS_COLOR_H_
#define MMP_PROCESS_COLOR_H_

#include "common/common.h"
#include "common/config.h"

namespace mmp {
// Channel indices, indicating RGBA component ordering in the uncompressed
// buffer.
enum ColorChannel : uint8_t {
  kColorChannelR,
  kColorChannelG,
  kColorChannelB,
  kColorChannelA,
  kColorChannelCount
};

// Each mask slot is packed into the channel with the same index.
static_assert(kMaskSlotCount == kColorChannelCount, "");

inline ColorChannel MaskSlotToChannel(MaskSlot slot) {
  return static_cast<ColorChannel>(slot);
}

// Floating-point color.
struct ColorF {
  float c[kColorChannelCount];

  float r() const { return c[kColorChannelR]; }
  float g() const { return c[kColorChannelG]; }
  float b() const { return c[kColorChannelB]; }
  float a() const { return c[kColorChannelA]; }

  void Assign(float r, float g, float b, float a) {
    c[kColorChannelR] = r;
    c[kColorChannelG] = g;
    c[kColorChannelB] = b;
    c[kColorChannelA] = a;
  }

  friend bool operator==(const ColorF& a, const ColorF& b) {
    for (size_t i = 0; i != kColorChannelCount; ++i) {
      if (a.c[i] != b.c[i]) {
        return false;
      }
    }
    return true;
  }

  friend bool operator!=(const ColorF& a, const ColorF& b) {
    return !(a == b);
  }
};

// Rec. 601 luma weighting, matching the grayscale value game engines report
// for a color.
inline float GetPerceivedBrightness(float r, float g, float b) {
  return 0.299f * r + 0.587f * g + 0.114f * b;
}
}  // namespace mmp

#endif  // MMP_PROCESS_COLOR_H_
