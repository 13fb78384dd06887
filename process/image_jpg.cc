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

#include "process/image_jpg.h"

#include "turbojpeg.h"  // NOLINT: Silence relative path warning.

namespace mmp {
namespace {
struct JpgDecompressor {
  tjhandle handle;
  JpgDecompressor() : handle(tjInitDecompress()) {}
  ~JpgDecompressor() {
    if (handle) {
      tjDestroy(handle);
    }
  }
};

const char* JpgGetErrorStr(tjhandle handle) {
  // TODO: Use tjGetErrorStr2(handle), which is thread-safe but only
  // available in newer versions of the library.
  return tjGetErrorStr();
}
}  // namespace

bool HasJpgHeader(const void* src, size_t src_size) {
  // JPEG doesn't have a fixed header signature, but the first two bytes should
  // always be FF D8. Checking just these two bytes isn't completely accurate,
  // but is unique amongst the image formats we support.
  // See: https://en.wikipedia.org/wiki/JPEG_File_Interchange_Format
  if (src_size < 2) {
    return false;
  }
  const uint8_t* const header = static_cast<const uint8_t*>(src);
  return header[0] == 0xff && header[1] == 0xd8;
}

bool JpgRead(
    const void* src, size_t src_size,
    uint32_t* out_width, uint32_t* out_height, uint8_t* out_channel_count,
    std::vector<Image::Component>* out_buffer, Logger* logger) {
  JpgDecompressor decompressor;
  int width, height, subsamp, colorspace;
  const int header_result = tjDecompressHeader3(decompressor.handle,
      static_cast<const uint8_t*>(src),
      static_cast<unsigned long>(src_size),  // NOLINT
      &width, &height, &subsamp, &colorspace);
  if (header_result != 0) {
    Log<MMP_ERROR_JPG_DECODE_HEADER>(
        logger, "", JpgGetErrorStr(decompressor.handle));
    return false;
  }

  // Mask sources are usually authored as grayscale, so keep those to a single
  // channel.
  const bool is_gray = colorspace == TJCS_GRAY;
  const int channel_count = is_gray ? 1 : 3;
  const int format = is_gray ? TJPF_GRAY : TJPF_RGB;
  const int pitch = width * channel_count;
  const int kFlags = 0;
  const size_t dst_size = static_cast<size_t>(pitch) * height;
  out_buffer->resize(dst_size);
  const int decompress_result = tjDecompress2(decompressor.handle,
      static_cast<const uint8_t*>(src),
      static_cast<unsigned long>(src_size),  // NOLINT
      out_buffer->data(), width, pitch, height, format, kFlags);
  if (decompress_result != 0) {
    Log<MMP_ERROR_JPG_DECOMPRESS>(
        logger, "", JpgGetErrorStr(decompressor.handle));
    return false;
  }
  *out_width = width;
  *out_height = height;
  *out_channel_count = static_cast<uint8_t>(channel_count);
  return true;
}
}  // namespace mmp
