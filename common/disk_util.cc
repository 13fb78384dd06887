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

#include "common/disk_util.h"

#include "common/common_util.h"

#ifdef _MSC_VER
#include <stdlib.h>
#else  // _MSC_VER
#include <sys/stat.h>
#endif  // _MSC_VER

namespace mmp {
namespace {
bool DirectoryExists(const char* path) {
#ifdef _MSC_VER
  const DWORD attr = GetFileAttributesA(path);
  return attr != INVALID_FILE_ATTRIBUTES && (attr & FILE_ATTRIBUTE_DIRECTORY);
#else  // _MSC_VER
  struct stat st;
  return stat(path, &st) == 0 && S_ISDIR(st.st_mode);
#endif  // _MSC_VER
}

size_t GetLengthOfExistingDirectoryForFile(const std::string& file_path) {
  for (size_t len = file_path.length(); len > 0; --len) {
    len = file_path.find_last_of("\\/", len);
    if (len == std::string::npos) {
      return 0;
    }
    const std::string dir = file_path.substr(0, len);
    if (dir.empty() || DirectoryExists(dir.c_str())) {
      return len;
    }
  }
  return 0;
}

size_t GetFileSize(FILE* fp) {
  const long pos = ftell(fp);  // NOLINT: ftell returns long.
  fseek(fp, 0, SEEK_END);
  const long file_size = ftell(fp);  // NOLINT: ftell returns long.
  fseek(fp, pos, SEEK_SET);
  return file_size < 0 ? 0 : static_cast<size_t>(file_size);
}
}  // namespace

std::vector<std::string> CreateDirectoryForFile(const std::string& file_path) {
  size_t pos = GetLengthOfExistingDirectoryForFile(file_path);
  std::vector<std::string> created_dirs;
  for (;;) {
    pos = file_path.find_first_of("\\/", pos + 1);
    if (pos == std::string::npos) {
      break;
    }
    std::string dir = file_path.substr(0, pos);
    if (!dir.empty() && !DirectoryExists(dir.c_str())) {
#ifdef _MSC_VER
      CreateDirectoryA(dir.c_str(), NULL);
#else  // _MSC_VER
      mkdir(dir.c_str(), 0777);
#endif  // _MSC_VER
      created_dirs.emplace_back(std::move(dir));
    }
  }
  return created_dirs;
}

bool ReadBinary(const std::string& src_path, std::vector<uint8_t>* out_data) {
  FileSentry file(src_path.c_str(), "rb");
  if (!file.fp) {
    return false;
  }
  const size_t size = GetFileSize(file.fp);
  out_data->resize(size);
  return size == 0 || fread(out_data->data(), 1, size, file.fp) == size;
}

bool WriteBinary(const std::string& dst_path, const void* data, size_t size) {
  FileSentry file(dst_path.c_str(), "wb");
  return file.fp && fwrite(data, 1, size, file.fp) == size;
}

bool IsSameFile(const std::string& path0, const std::string& path1) {
#ifdef _MSC_VER
  char full0[_MAX_PATH];
  char full1[_MAX_PATH];
  if (!_fullpath(full0, path0.c_str(), sizeof(full0)) ||
      !_fullpath(full1, path1.c_str(), sizeof(full1))) {
    return false;
  }
  return StringEqualCI(full0, full1);
#else  // _MSC_VER
  struct stat st0;
  struct stat st1;
  if (stat(path0.c_str(), &st0) != 0 || stat(path1.c_str(), &st1) != 0) {
    return false;
  }
  return st0.st_dev == st1.st_dev && st0.st_ino == st1.st_ino;
#endif  // _MSC_VER
}
}  // namespace mmp
