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

#ifndef MMP_PACK_NAMING_H_
#define MMP_PACK_NAMING_H_

#include <string>
#include "common/config.h"

namespace mmp {
// Derive the mask map name from a source texture name (without directory or
// extension).
// * null: kMaskNameDefault.
// * Names already ending in kMaskNameSuffix are returned unchanged.
// * Otherwise the last word is replaced by kMaskNameSuffix, where words are
//   split by '_', '-' or ' ', or else by capitalization (e.g.
//   "Rock_Albedo" -> "Rock_Mask", "RockAlbedo" -> "RockMask"). Without either
//   the last character is replaced. A name with none of these to cut, i.e. a
//   single character other than a delimiter, is unchanged.
std::string DeriveName(const char* base_name);

// Remove the last word of a name, keeping any trailing delimiter. Returns false
// and copies the name unchanged if there is nothing to remove.
bool RemoveLastWord(const std::string& name, std::string* out_base);

// Default output path, named after the first assigned source in slot order and
// placed beside it. With no sources, this is kMaskNameDefault in the current
// directory.
std::string GetDefaultOutputPath(
    const std::string (&source_paths)[kMaskSlotCount]);
std::string GetDefaultOutputPath(const PackSettings& settings);
}  // namespace mmp

#endif  // MMP_PACK_NAMING_H_
