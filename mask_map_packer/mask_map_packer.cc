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

#include "args.h"  // NOLINT: Silence relative path warning.
#include "common/logging.h"
#include "pack/mask_map.h"

int main(int argc, char* argv[]) {
  mmp::PrintLogger logger;

  Args args;
  if (!ParseArgs(argc, argv, &args, &logger)) {
    return -1;
  }
  if (args.exit) {
    return 0;
  }

  return mmp::PackMaskMap(args.settings, args.dst, &logger) ? 0 : -1;
}
