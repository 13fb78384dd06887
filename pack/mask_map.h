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

#ifndef MMP_PACK_MASK_MAP_H_
#define MMP_PACK_MASK_MAP_H_

#include <string>
#include "common/config.h"
#include "common/logging.h"

namespace mmp {
// Read the source textures named in settings, pack them into a mask map, and
// write it as PNG to dst_path (or GetDefaultOutputPath if dst_path is empty).
// * Sources that fail to load, or whose size does not match the first source,
//   are reported and replaced by their fallback values.
// * Returns false if any error was logged. The output is still written when
//   the only errors are unreadable sources.
bool PackMaskMap(const PackSettings& settings, const std::string& dst_path,
                 Logger* logger);
}  // namespace mmp

#endif  // MMP_PACK_MASK_MAP_H_
