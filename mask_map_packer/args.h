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

#ifndef MASK_MAP_PACKER_ARGS_H_
#define MASK_MAP_PACKER_ARGS_H_

#include <string>
#include "common/config.h"
#include "common/logging.h"

struct Args {
  mmp::PackSettings settings;

  // Output PNG path. If empty, the path is derived from the first source.
  std::string dst;

  // Set if parsing completed without a job to run (e.g. --help).
  bool exit = false;
};

bool ParseArgs(
    int argc, const char* const* argv, Args* out_args, mmp::Logger* logger);

#endif  // MASK_MAP_PACKER_ARGS_H_
