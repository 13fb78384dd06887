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

#include "process/image_gif.h"

#include <string.h>
#include <algorithm>
#include "gif_lib.h"  // NOLINT: Silence relative path warning.

namespace mmp {
namespace {
using Pixel = Image::Component[kColorChannelCount];

struct GifReadContext {
  const uint8_t* pos;
  const uint8_t* end;
};

int GifReadCallback(GifFileType* gif, GifByteType* out_data, int request_size) {
  GifReadContext* const context = static_cast<GifReadContext*>(gif->UserData);
  const int remain_size = static_cast<int>(context->end - context->pos);
  const int read_size = std::min(remain_size, request_size);
  memcpy(out_data, context->pos, read_size);
  context->pos += read_size;
  return read_size;
}

void SetPixel(uint8_t r, uint8_t g, uint8_t b, uint8_t a,
              Image::Component* out_pixel) {
  out_pixel[kColorChannelR] = r;
  out_pixel[kColorChannelG] = g;
  out_pixel[kColorChannelB] = b;
  out_pixel[kColorChannelA] = a;
}

// Decodes the first frame of a GIF into an RGBA buffer. Later frames are
// irrelevant to a static mask.
class GifDecoder {
 public:
  explicit GifDecoder(Logger* logger)
      : logger_(logger), gif_(nullptr), transparent_index_(-1) {}

  ~GifDecoder() {
    if (gif_) {
      int error_code;
      DGifCloseFile(gif_, &error_code);
    }
  }

  bool Open(const void* src, size_t src_size) {
    const uint8_t* const begin = static_cast<const uint8_t*>(src);
    context_.pos = begin;
    context_.end = begin + src_size;
    int error_code = 0;
    gif_ = DGifOpen(&context_, GifReadCallback, &error_code);
    if (!gif_) {
      Log<MMP_ERROR_GIF_OPEN>(logger_, "", error_code);
      return false;
    }
    if (gif_->SWidth <= 0 || gif_->SHeight <= 0) {
      Log<MMP_ERROR_GIF_BAD_SIZE>(logger_, "", gif_->SWidth, gif_->SHeight);
      return false;
    }
    return true;
  }

  uint32_t GetWidth() const { return gif_->SWidth; }
  uint32_t GetHeight() const { return gif_->SHeight; }

  // Skip ahead to the first image descriptor, recording the transparent color
  // index from the graphics control block (GCB) if one precedes it.
  bool SeekToFirstImage() {
    transparent_index_ = NO_TRANSPARENT_COLOR;
    for (;;) {
      GifRecordType type;
      if (DGifGetRecordType(gif_, &type) == GIF_ERROR) {
        Log<MMP_ERROR_GIF_RECORD_TYPE>(logger_, "", gif_->Error);
        return false;
      }
      if (type == IMAGE_DESC_RECORD_TYPE) {
        if (DGifGetImageDesc(gif_) == GIF_ERROR) {
          Log<MMP_ERROR_GIF_IMAGE_DESC>(logger_, "", gif_->Error);
          return false;
        }
        return true;
      }
      if (type != EXTENSION_RECORD_TYPE) {
        Log<MMP_ERROR_GIF_NO_RECORDS>(logger_, "");
        return false;
      }
      if (!ReadExtension()) {
        return false;
      }
    }
  }

  bool ReadFrame(std::vector<Image::Component>* out_buffer) {
    const uint32_t width = GetWidth();
    const uint32_t height = GetHeight();
    const uint32_t x0 = gif_->Image.Left;
    const uint32_t y0 = gif_->Image.Top;
    const uint32_t dx = gif_->Image.Width;
    const uint32_t dy = gif_->Image.Height;
    const uint32_t x1 = x0 + dx;
    const uint32_t y1 = y0 + dy;
    if (x1 > width || y1 > height) {
      Log<MMP_ERROR_GIF_FRAME_BOUNDS>(
          logger_, "", x0, y0, x1, y1, width, height);
      return false;
    }

    // Pixels outside the frame rectangle show the background color.
    const size_t pixel_count = static_cast<size_t>(width) * height;
    out_buffer->resize(pixel_count * kColorChannelCount);
    Pixel background;
    GetBackgroundColor(background);
    Image::Component* const pixels = out_buffer->data();
    for (size_t i = 0; i != pixel_count; ++i) {
      memcpy(pixels + i * kColorChannelCount, background, sizeof(background));
    }

    const size_t row_stride = static_cast<size_t>(width) * kColorChannelCount;
    Image::Component* const frame_pixels =
        pixels + y0 * row_stride + x0 * kColorChannelCount;
    std::vector<GifPixelType> row_buffer(dx);
    if (gif_->Image.Interlace) {
      // Interlacing just modifies row order.
      static const uint8_t kInterlacedOffsets[] = { 0, 4, 2, 1 };
      static const uint8_t kInterlacedJumps[] = { 8, 8, 4, 2 };
      for (size_t pass = 0; pass != 4; ++pass) {
        for (uint32_t y = kInterlacedOffsets[pass]; y < dy;
             y += kInterlacedJumps[pass]) {
          if (!ReadLine(dx, row_buffer.data(), frame_pixels + y * row_stride)) {
            return false;
          }
        }
      }
    } else {
      for (uint32_t y = 0; y != dy; ++y) {
        if (!ReadLine(dx, row_buffer.data(), frame_pixels + y * row_stride)) {
          return false;
        }
      }
    }
    return true;
  }

 private:
  Logger* logger_;
  GifFileType* gif_;
  GifReadContext context_;
  int transparent_index_;

  bool ReadExtension() {
    int extension_code;
    GifByteType* extension = nullptr;
    int result = DGifGetExtension(gif_, &extension_code, &extension);
    for (;;) {
      if (result == GIF_ERROR) {
        Log<MMP_ERROR_GIF_EXTENSION>(logger_, "", gif_->Error);
        return false;
      }
      if (!extension) {
        return true;
      }
      if (extension_code == GRAPHICS_EXT_FUNC_CODE) {
        const uint32_t len = extension[0];
        GraphicsControlBlock gcb;
        if (DGifExtensionToGCB(len, extension + 1, &gcb) == GIF_ERROR) {
          Log<MMP_ERROR_GIF_BAD_GCB>(logger_, "");
          return false;
        }
        transparent_index_ = gcb.TransparentColor;
      }
      result = DGifGetExtensionNext(gif_, &extension);
    }
  }

  const ColorMapObject* GetPalette() const {
    return gif_->Image.ColorMap ? gif_->Image.ColorMap : gif_->SColorMap;
  }

  void GetBackgroundColor(Pixel& out_color) const {
    SetPixel(0, 0, 0, Image::kComponentMax, out_color);
    const ColorMapObject* const palette = gif_->SColorMap;
    if (transparent_index_ != NO_TRANSPARENT_COLOR &&
        gif_->SBackGroundColor == transparent_index_) {
      out_color[kColorChannelA] = 0;
    } else if (palette && palette->Colors &&
               gif_->SBackGroundColor < palette->ColorCount) {
      const GifColorType& color = palette->Colors[gif_->SBackGroundColor];
      SetPixel(color.Red, color.Green, color.Blue, Image::kComponentMax,
               out_color);
    }
  }

  bool ReadLine(uint32_t width, GifPixelType* row_buffer,
                Image::Component* out_pixels) {
    if (DGifGetLine(gif_, row_buffer, width) == GIF_ERROR) {
      Log<MMP_ERROR_GIF_READ_LINE>(logger_, "", gif_->Error);
      return false;
    }
    const ColorMapObject* const palette = GetPalette();
    const int color_count = palette && palette->Colors ? palette->ColorCount : 0;
    for (size_t i = 0; i != width; ++i) {
      Image::Component* const pixel = out_pixels + i * kColorChannelCount;
      const int color_index = row_buffer[i];
      if (color_index == transparent_index_) {
        SetPixel(0, 0, 0, 0, pixel);
      } else if (color_index < color_count) {
        const GifColorType& color = palette->Colors[color_index];
        SetPixel(color.Red, color.Green, color.Blue, Image::kComponentMax,
                 pixel);
      }
    }
    return true;
  }
};
}  // namespace

bool HasGifHeader(const void* src, size_t src_size) {
  // Expect "GIF87a" or "GIF89a".
  // See: https://en.wikipedia.org/wiki/GIF
  if (src_size < 6) {
    return false;
  }
  const uint8_t* const b = static_cast<const uint8_t*>(src);
  return b[0] == 'G' && b[1] == 'I' && b[2] == 'F' &&
    b[3] == '8' && (b[4] == '7' || b[4] == '9') && b[5] == 'a';
}

bool GifRead(
    const void* src, size_t src_size,
    uint32_t* out_width, uint32_t* out_height, uint8_t* out_channel_count,
    std::vector<Image::Component>* out_buffer, Logger* logger) {
  GifDecoder decoder(logger);
  if (!decoder.Open(src, src_size) || !decoder.SeekToFirstImage() ||
      !decoder.ReadFrame(out_buffer)) {
    return false;
  }
  *out_width = decoder.GetWidth();
  *out_height = decoder.GetHeight();
  *out_channel_count = kColorChannelCount;
  return true;
}
}  // namespace mmp
