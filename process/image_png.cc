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

#include "process/image_png.h"

#include <string.h>
#include "png.h"  // NOLINT: Silence relative path warning.

namespace mmp {
namespace {
constexpr int kPngBitDepth = 8;

// libpng reports through these with the logger as its error pointer. Errors
// longjmp back to the setjmp in the reader or writer.
template <What kWhat>
void ErrorCallback(png_struct* png, const char* message) {
  Logger* const logger = static_cast<Logger*>(png_get_error_ptr(png));
  Log<kWhat>(logger, "", message);
  png_longjmp(png, 1);
}

template <What kWhat>
void WarnCallback(png_struct* png, const char* message) {
  // Texture authoring tools write this profile constantly and it's harmless,
  // so ignore it to reduce spam.
  if (strcmp(message, "iCCP: known incorrect sRGB profile") == 0) {
    return;
  }
  Logger* const logger = static_cast<Logger*>(png_get_error_ptr(png));
  Log<kWhat>(logger, "", message);
}

int ChannelCountToColorType(uint8_t channel_count) {
  switch (channel_count) {
  case 1:
    return PNG_COLOR_TYPE_GRAY;
  case 2:
    return PNG_COLOR_TYPE_GRAY_ALPHA;
  case 3:
    return PNG_COLOR_TYPE_RGB;
  case 4:
    return PNG_COLOR_TYPE_RGB_ALPHA;
  default:
    MMP_ASSERT_LOGIC(false);
    return PNG_COLOR_TYPE_GRAY;
  }
}

std::vector<png_bytep> GetRows(const Image::Component* data, uint32_t height,
                               size_t row_stride) {
  std::vector<png_bytep> rows(height);
  for (size_t y = 0; y != height; ++y) {
    rows[y] = const_cast<png_bytep>(data + row_stride * y);
  }
  return rows;
}

// Single decode of an in-memory PNG. The destructor frees libpng state on both
// success and error.
class PngReader {
 public:
  PngReader(const void* src, size_t src_size, Logger* logger)
      : logger_(logger), png_(nullptr), info_(nullptr),
        read_pos_(static_cast<const uint8_t*>(src)),
        read_end_(read_pos_ + src_size) {}

  ~PngReader() {
    if (png_) {
      png_destroy_read_struct(&png_, &info_, nullptr);
    }
  }

  bool Read(uint32_t* out_width, uint32_t* out_height,
            uint8_t* out_channel_count,
            std::vector<Image::Component>* out_buffer) {
    png_ = png_create_read_struct(
        PNG_LIBPNG_VER_STRING, logger_, ErrorCallback<MMP_ERROR_PNG_DECODE>,
        WarnCallback<MMP_WARN_PNG_DECODE>);
    info_ = png_ ? png_create_info_struct(png_) : nullptr;
    if (!png_ || !info_) {
      Log<MMP_ERROR_PNG_READ_INIT>(logger_, "");
      return false;
    }
    if (setjmp(png_jmpbuf(png_))) {
      return false;
    }
    png_set_read_fn(png_, this, ReadCallback);

    // Expand palettes and low bit depths and scale 16-bit down, so every
    // layout arrives as 8 bits per component. Gray stays gray.
    png_set_expand(png_);
    png_set_scale_16(png_);
    png_read_info(png_, info_);
    png_read_update_info(png_, info_);

    const uint32_t width = png_get_image_width(png_, info_);
    const uint32_t height = png_get_image_height(png_, info_);
    const uint8_t channel_count = png_get_channels(png_, info_);
    MMP_ASSERT_FORMAT(png_get_bit_depth(png_, info_) == kPngBitDepth);
    MMP_ASSERT_FORMAT(channel_count >= 1 && channel_count <= 4);
    const size_t row_stride = static_cast<size_t>(width) * channel_count;
    MMP_ASSERT_FORMAT(png_get_rowbytes(png_, info_) == row_stride);

    std::vector<Image::Component> buffer(height * row_stride);
    std::vector<png_bytep> rows = GetRows(buffer.data(), height, row_stride);
    png_read_image(png_, rows.data());

    *out_width = width;
    *out_height = height;
    *out_channel_count = channel_count;
    out_buffer->swap(buffer);
    return true;
  }

 private:
  Logger* logger_;
  png_struct* png_;
  png_info* info_;
  const uint8_t* read_pos_;
  const uint8_t* const read_end_;

  static void ReadCallback(
      png_struct* png, png_byte* out_bytes, png_size_t byte_count) {
    PngReader* const reader = static_cast<PngReader*>(png_get_io_ptr(png));
    const size_t remain = reader->read_end_ - reader->read_pos_;
    if (byte_count > remain) {
      Log<MMP_ERROR_PNG_READ_SHORT>(reader->logger_, "",
                                    static_cast<size_t>(byte_count), remain);
      png_longjmp(png, 1);
    }
    memcpy(out_bytes, reader->read_pos_, byte_count);
    reader->read_pos_ += byte_count;
  }
};

// Single encode to a file. The file is closed explicitly on success so flush
// errors are reported.
class PngWriter {
 public:
  PngWriter(const char* path, Logger* logger)
      : path_(path), logger_(logger), fp_(nullptr), png_(nullptr),
        info_(nullptr) {}

  ~PngWriter() {
    if (png_) {
      png_destroy_write_struct(&png_, &info_);
    }
    if (fp_) {
      fclose(fp_);
    }
  }

  bool Write(uint32_t width, uint32_t height, uint8_t channel_count,
             const Image::Component* data, int level) {
    fp_ = fopen(path_, "wb");
    if (!fp_) {
      Log<MMP_ERROR_IO_WRITE_IMAGE>(logger_, "", path_);
      return false;
    }
    png_ = png_create_write_struct(
        PNG_LIBPNG_VER_STRING, logger_, ErrorCallback<MMP_ERROR_PNG_ENCODE>,
        WarnCallback<MMP_WARN_PNG_ENCODE>);
    info_ = png_ ? png_create_info_struct(png_) : nullptr;
    if (!png_ || !info_) {
      Log<MMP_ERROR_PNG_WRITE_INIT>(logger_, "");
      return false;
    }
    if (setjmp(png_jmpbuf(png_))) {
      return false;
    }
    png_init_io(png_, fp_);

    png_set_IHDR(png_, info_, width, height, kPngBitDepth,
                 ChannelCountToColorType(channel_count), PNG_INTERLACE_NONE,
                 PNG_COMPRESSION_TYPE_DEFAULT, PNG_FILTER_TYPE_DEFAULT);
    png_set_compression_level(png_, Clamp(level, 0, 9));
    png_write_info(png_, info_);
    std::vector<png_bytep> rows = GetRows(
        data, height, static_cast<size_t>(width) * channel_count);
    png_write_image(png_, rows.data());
    png_write_end(png_, nullptr);

    FILE* const fp = fp_;
    fp_ = nullptr;
    if (fclose(fp) != 0) {
      Log<MMP_ERROR_IO_WRITE_IMAGE>(logger_, "", path_);
      return false;
    }
    return true;
  }

 private:
  const char* path_;
  Logger* logger_;
  FILE* fp_;
  png_struct* png_;
  png_info* info_;
};
}  // namespace

bool HasPngHeader(const void* src, size_t src_size) {
  constexpr size_t kHeaderSize = 8;
  return src_size >= kHeaderSize &&
         png_sig_cmp(static_cast<png_const_bytep>(src), 0, kHeaderSize) == 0;
}

bool PngRead(
    const void* src, size_t src_size,
    uint32_t* out_width, uint32_t* out_height, uint8_t* out_channel_count,
    std::vector<Image::Component>* out_buffer, Logger* logger) {
  PngReader reader(src, src_size, logger);
  return reader.Read(out_width, out_height, out_channel_count, out_buffer);
}

bool PngWrite(
    const char* path, uint32_t width, uint32_t height, uint8_t channel_count,
    const Image::Component* data, int level, Logger* logger) {
  PngWriter writer(path, logger);
  return writer.Write(width, height, channel_count, data, level);
}
}  // namespace mmp
