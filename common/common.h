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

#ifndef MMP_COMMON_COMMON_H_
#define MMP_COMMON_COMMON_H_

#include <stddef.h>
#include <stdint.h>

// Used for Win32 file queries.
#ifdef _MSC_VER
#define NOMINMAX
#define WIN32_LEAN_AND_MEAN
#include <windows.h>

#ifdef ERROR
#undef ERROR
#endif  // ERROR
#endif  // _MSC_VER

namespace mmp {
// NOLINTNEXTLINE: Disable warning about old-style cast (it's not a cast!)
template <class T, size_t LEN> char(&ArraySizeHelper(T(&)[LEN]))[LEN];
#define MMP_ARRAY_SIZE(array) (sizeof(mmp::ArraySizeHelper(array)))

template <typename T>
inline constexpr T Clamp(T value, T lower, T upper) {
  return value < lower ? lower : (value > upper ? upper : value);
}
}  // namespace mmp

#endif  // MMP_COMMON_COMMON_H_
