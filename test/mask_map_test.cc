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

#include "pack/mask_map.h"

#include <stdio.h>
#include <algorithm>
#include <vector>
#include "common/disk_util.h"
#include "gif_lib.h"  // NOLINT: Silence relative path warning.
#include "gtest/gtest.h"
#include "process/image.h"
#include "test_util.h"  // NOLINT: Silence relative path warning.
#include "turbojpeg.h"  // NOLINT: Silence relative path warning.

namespace mmp {
namespace {
const WhatInfo* GetWhatInfo(What what) {
  return &kWhatInfos[what];
}

class MaskMapTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dir_ = GetTestOutputDir() + "/";
    CreateDirectoryForFile(dir_ + "x");
  }

  std::string GetPath(const char* name) const {
    return dir_ + name;
  }

  // Write a single-channel PNG filled with value.
  std::string WriteGray(const char* name, uint32_t width, uint32_t height,
                        Image::Component value) {
    const std::string path = GetPath(name);
    remove(path.c_str());
    const Image::Component color[] = { value };
    Image image;
    image.CreateWxH(width, height, color);
    VectorLogger logger;
    EXPECT_TRUE(image.Write(path.c_str(), 9, &logger));
    return path;
  }

  std::string WriteRgb(const char* name, uint32_t width, uint32_t height,
                       const Image::Component (&color)[3]) {
    const std::string path = GetPath(name);
    remove(path.c_str());
    Image image;
    image.CreateWxH(width, height, color);
    VectorLogger logger;
    EXPECT_TRUE(image.Write(path.c_str(), 9, &logger));
    return path;
  }

  // Write a grayscale JPG filled with value.
  std::string WriteGrayJpg(const char* name, int width, int height,
                           Image::Component value) {
    const std::string path = GetPath(name);
    remove(path.c_str());
    std::vector<unsigned char> pixels(width * height, value);
    tjhandle tj = tjInitCompress();
    EXPECT_TRUE(tj != nullptr);
    if (!tj) {
      return path;
    }
    unsigned char* jpg = nullptr;
    unsigned long jpg_size = 0;
    const int result = tjCompress2(
        tj, pixels.data(), width, 0, height, TJPF_GRAY, &jpg, &jpg_size,
        TJSAMP_GRAY, 100, TJFLAG_ACCURATEDCT);
    tjDestroy(tj);
    EXPECT_EQ(result, 0);
    EXPECT_TRUE(WriteBinary(path, jpg, jpg_size));
    tjFree(jpg);
    return path;
  }

  // Write a single-frame GIF with a graphics control block marking
  // transparent_index as transparent.
  std::string WriteGif(const char* name, int width, int height,
                       const GifColorType (&colors)[4],
                       const std::vector<GifPixelType>& indices,
                       int transparent_index) {
    const std::string path = GetPath(name);
    remove(path.c_str());
    int error_code = 0;
    GifFileType* const gif = EGifOpenFileName(path.c_str(), false, &error_code);
    EXPECT_TRUE(gif != nullptr) << "error " << error_code;
    if (!gif) {
      return path;
    }
    ColorMapObject* const palette = GifMakeMapObject(4, colors);
    EGifSetGifVersion(gif, true);
    EXPECT_NE(EGifPutScreenDesc(gif, width, height, 8, 0, palette), GIF_ERROR);
    GifFreeMapObject(palette);

    GraphicsControlBlock gcb;
    gcb.DisposalMode = DISPOSAL_UNSPECIFIED;
    gcb.UserInputFlag = false;
    gcb.DelayTime = 0;
    gcb.TransparentColor = transparent_index;
    GifByteType extension[4];
    const size_t extension_size = EGifGCBToExtension(&gcb, extension);
    EXPECT_NE(EGifPutExtension(gif, GRAPHICS_EXT_FUNC_CODE,
                               static_cast<int>(extension_size), extension),
              GIF_ERROR);

    EXPECT_NE(EGifPutImageDesc(gif, 0, 0, width, height, false, nullptr),
              GIF_ERROR);
    std::vector<GifPixelType> row(width);
    for (int y = 0; y != height; ++y) {
      std::copy(indices.begin() + y * width, indices.begin() + (y + 1) * width,
                row.begin());
      EXPECT_NE(EGifPutLine(gif, row.data(), width), GIF_ERROR);
    }
    EXPECT_NE(EGifCloseFile(gif, &error_code), GIF_ERROR);
    return path;
  }

  static bool ReadImage(const std::string& path, Image* out_image) {
    std::vector<uint8_t> data;
    if (!ReadBinary(path, &data)) {
      return false;
    }
    VectorLogger logger;
    return out_image->Read(data.data(), data.size(), &logger);
  }

  static void ExpectAllPixels(const Image& image, Image::Component r,
                              Image::Component g, Image::Component b,
                              Image::Component a) {
    ASSERT_EQ(image.GetChannelCount(), 4u);
    for (uint32_t y = 0; y != image.GetHeight(); ++y) {
      for (uint32_t x = 0; x != image.GetWidth(); ++x) {
        const Image::Component* const pixel = image.GetPixel(x, y);
        ASSERT_EQ(pixel[kColorChannelR], r) << "at " << x << "," << y;
        ASSERT_EQ(pixel[kColorChannelG], g) << "at " << x << "," << y;
        ASSERT_EQ(pixel[kColorChannelB], b) << "at " << x << "," << y;
        ASSERT_EQ(pixel[kColorChannelA], a) << "at " << x << "," << y;
      }
    }
  }

  std::string dir_;
};

// Checks the red (metallic) channel of each pixel, row-major.
void ExpectRedChannel(const Image& image,
                      const std::vector<Image::Component>& expected,
                      int tolerance) {
  ASSERT_EQ(image.GetChannelCount(), 4u);
  ASSERT_EQ(image.GetWidth() * image.GetHeight(), expected.size());
  for (uint32_t y = 0; y != image.GetHeight(); ++y) {
    for (uint32_t x = 0; x != image.GetWidth(); ++x) {
      const Image::Component* const pixel = image.GetPixel(x, y);
      EXPECT_NEAR(pixel[kColorChannelR], expected[y * image.GetWidth() + x],
                  tolerance) << "at " << x << "," << y;
      EXPECT_EQ(pixel[kColorChannelG], 255) << "at " << x << "," << y;
      EXPECT_EQ(pixel[kColorChannelB], 128) << "at " << x << "," << y;
      EXPECT_EQ(pixel[kColorChannelA], 128) << "at " << x << "," << y;
    }
  }
}

TEST_F(MaskMapTest, PacksAllSources) {
  PackSettings settings;
  settings.metallic_path = WriteGray("Rock_Metallic.png", 2, 2, 10);
  settings.occlusion_path = WriteGray("Rock_AO.png", 2, 2, 20);
  settings.detail_path = WriteGray("Rock_Detail.png", 2, 2, 30);
  settings.smoothness_path = WriteGray("Rock_Smoothness.png", 2, 2, 40);
  const std::string dst_path = GetPath("packed.png");
  remove(dst_path.c_str());

  VectorLogger logger;
  ASSERT_TRUE(PackMaskMap(settings, dst_path, &logger));
  EXPECT_EQ(logger.GetErrorCount(), 0u);
  EXPECT_TRUE(logger.Contains(GetWhatInfo(MMP_INFO_SAVED)));

  Image image;
  ASSERT_TRUE(ReadImage(dst_path, &image));
  EXPECT_EQ(image.GetWidth(), 2u);
  EXPECT_EQ(image.GetHeight(), 2u);
  ExpectAllPixels(image, 10, 20, 30, 40);
}

TEST_F(MaskMapTest, DefaultOutputPath) {
  PackSettings settings;
  settings.occlusion_path = WriteGray("Stone_AO.png", 4, 4, 255);
  const std::string expected_path = GetPath("Stone_Mask.png");
  remove(expected_path.c_str());

  VectorLogger logger;
  ASSERT_TRUE(PackMaskMap(settings, "", &logger));
  Image image;
  ASSERT_TRUE(ReadImage(expected_path, &image));
  ExpectAllPixels(image, 128, 255, 128, 128);
}

TEST_F(MaskMapTest, NoSourcesUsesDefaultSize) {
  const PackSettings settings;
  const std::string dst_path = GetPath("empty.png");
  VectorLogger logger;
  ASSERT_TRUE(PackMaskMap(settings, dst_path, &logger));
  EXPECT_TRUE(logger.Contains(GetWhatInfo(MMP_INFO_DEFAULT_SIZE)));

  Image image;
  ASSERT_TRUE(ReadImage(dst_path, &image));
  EXPECT_EQ(image.GetWidth(), 512u);
  EXPECT_EQ(image.GetHeight(), 512u);
  ExpectAllPixels(image, 128, 255, 128, 128);
}

TEST_F(MaskMapTest, DropsMismatchedSource) {
  PackSettings settings;
  settings.metallic_path = WriteGray("Small_Metallic.png", 4, 4, 255);
  settings.detail_path = WriteGray("Large_Detail.png", 8, 8, 0);
  settings.default_detail = 0.0f;
  settings.default_smoothness = 1.0f;
  const std::string dst_path = GetPath("dropped.png");

  VectorLogger logger;
  ASSERT_TRUE(PackMaskMap(settings, dst_path, &logger));
  EXPECT_TRUE(logger.Contains(GetWhatInfo(MMP_WARN_SIZE_MISMATCH)));
  EXPECT_EQ(logger.GetErrorCount(), 0u);

  Image image;
  ASSERT_TRUE(ReadImage(dst_path, &image));
  EXPECT_EQ(image.GetWidth(), 4u);
  EXPECT_EQ(image.GetHeight(), 4u);
  ExpectAllPixels(image, 255, 255, 0, 255);
}

TEST_F(MaskMapTest, InvertSmoothness) {
  PackSettings settings;
  settings.smoothness_path = WriteGray("Metal_Roughness.png", 3, 3, 255);
  settings.invert_smoothness = true;
  const std::string dst_path = GetPath("inverted.png");

  VectorLogger logger;
  ASSERT_TRUE(PackMaskMap(settings, dst_path, &logger));
  Image image;
  ASSERT_TRUE(ReadImage(dst_path, &image));
  ExpectAllPixels(image, 128, 255, 128, 0);
}

TEST_F(MaskMapTest, ColorSourceIsReducedToGray) {
  PackSettings settings;
  const Image::Component kRed[] = { 255, 0, 0 };
  settings.metallic_path = WriteRgb("Red_Metallic.png", 2, 2, kRed);
  const std::string dst_path = GetPath("red.png");

  VectorLogger logger;
  ASSERT_TRUE(PackMaskMap(settings, dst_path, &logger));
  Image image;
  ASSERT_TRUE(ReadImage(dst_path, &image));
  ExpectAllPixels(image, 76, 255, 128, 128);
}

TEST_F(MaskMapTest, GrayJpgSource) {
  PackSettings settings;
  settings.metallic_path = WriteGrayJpg("Jpg_Metallic.jpg", 8, 8, 100);

  // Gray JPGs decode to a single channel.
  Image source;
  ASSERT_TRUE(ReadImage(settings.metallic_path, &source));
  EXPECT_EQ(source.GetChannelCount(), 1u);
  EXPECT_EQ(source.GetWidth(), 8u);
  EXPECT_EQ(source.GetHeight(), 8u);

  const std::string dst_path = GetPath("jpg.png");
  VectorLogger logger;
  ASSERT_TRUE(PackMaskMap(settings, dst_path, &logger));
  EXPECT_EQ(logger.GetErrorCount(), 0u);
  Image image;
  ASSERT_TRUE(ReadImage(dst_path, &image));
  ExpectRedChannel(image, std::vector<Image::Component>(64, 100), 1);
}

TEST_F(MaskMapTest, GifSourceWithTransparency) {
  const GifColorType kColors[4] = {
    { 200, 200, 200 },
    { 255, 255, 255 },
    { 255, 0, 0 },
    { 0, 0, 0 },
  };
  // Index 1 is white but transparent, so it reads as zero.
  const std::vector<GifPixelType> indices = {
    0, 1, 2, 3,
    3, 2, 1, 0,
  };
  PackSettings settings;
  settings.metallic_path =
      WriteGif("Gif_Metallic.gif", 4, 2, kColors, indices, 1);

  Image source;
  ASSERT_TRUE(ReadImage(settings.metallic_path, &source));
  ASSERT_EQ(source.GetChannelCount(), 4u);
  EXPECT_EQ(source.GetPixel(0, 0)[kColorChannelA], 255);
  EXPECT_EQ(source.GetPixel(1, 0)[kColorChannelA], 0);

  const std::string dst_path = GetPath("gif.png");
  VectorLogger logger;
  ASSERT_TRUE(PackMaskMap(settings, dst_path, &logger));
  EXPECT_EQ(logger.GetErrorCount(), 0u);
  Image image;
  ASSERT_TRUE(ReadImage(dst_path, &image));
  ExpectRedChannel(image, { 200, 0, 76, 0, 0, 76, 0, 200 }, 0);
}

TEST_F(MaskMapTest, TgaSource) {
  // Uncompressed 8-bit grayscale, 2x2, top-left origin.
  const uint8_t kTga[] = {
    0, 0, 3,           // No ID, no color map, uncompressed gray.
    0, 0, 0, 0, 0,     // Color map spec.
    0, 0, 0, 0,        // Origin.
    2, 0, 2, 0,        // Width, height.
    8, 0x20,           // Bits per pixel, top-left descriptor.
    10, 20,
    30, 40,
  };
  PackSettings settings;
  settings.metallic_path = GetPath("Tga_Metallic.tga");
  ASSERT_TRUE(WriteBinary(settings.metallic_path, kTga, sizeof(kTga)));

  const std::string dst_path = GetPath("tga.png");
  VectorLogger logger;
  ASSERT_TRUE(PackMaskMap(settings, dst_path, &logger));
  EXPECT_EQ(logger.GetErrorCount(), 0u);
  Image image;
  ASSERT_TRUE(ReadImage(dst_path, &image));
  EXPECT_EQ(image.GetWidth(), 2u);
  EXPECT_EQ(image.GetHeight(), 2u);
  ExpectRedChannel(image, { 10, 20, 30, 40 }, 0);
}

TEST_F(MaskMapTest, WorkersMatchSerial) {
  PackSettings settings;
  settings.metallic_path = WriteGray("Tile_Metallic.png", 33, 65, 200);
  settings.smoothness_path = WriteGray("Tile_Smoothness.png", 33, 65, 100);
  const std::string serial_path = GetPath("serial.png");
  const std::string workers_path = GetPath("workers.png");

  VectorLogger logger;
  ASSERT_TRUE(PackMaskMap(settings, serial_path, &logger));
  settings.worker_count = 4;
  ASSERT_TRUE(PackMaskMap(settings, workers_path, &logger));

  std::vector<uint8_t> serial_data;
  std::vector<uint8_t> workers_data;
  ASSERT_TRUE(ReadBinary(serial_path, &serial_data));
  ASSERT_TRUE(ReadBinary(workers_path, &workers_data));
  EXPECT_EQ(serial_data, workers_data);
}

TEST_F(MaskMapTest, PrintTimingLogsStages) {
  PackSettings settings;
  settings.print_timing = true;
  const std::string dst_path = GetPath("timed.png");

  VectorLogger logger;
  ASSERT_TRUE(PackMaskMap(settings, dst_path, &logger));
  size_t timing_count = 0;
  for (const Message& message : logger.GetMessages()) {
    if (message.what_info == GetWhatInfo(MMP_INFO_TIMING)) {
      ++timing_count;
    }
  }
  // Load, Composite, Write and Pack.
  EXPECT_EQ(timing_count, 4u);

  settings.print_timing = false;
  logger.Clear();
  ASSERT_TRUE(PackMaskMap(settings, dst_path, &logger));
  EXPECT_FALSE(logger.Contains(GetWhatInfo(MMP_INFO_TIMING)));
}

TEST_F(MaskMapTest, RefusesToStompSource) {
  PackSettings settings;
  settings.metallic_path = WriteGray("Keep_Metallic.png", 2, 2, 77);

  VectorLogger logger;
  EXPECT_FALSE(PackMaskMap(settings, settings.metallic_path, &logger));
  EXPECT_TRUE(logger.Contains(GetWhatInfo(MMP_ERROR_STOMP)));

  // The source is untouched.
  Image image;
  ASSERT_TRUE(ReadImage(settings.metallic_path, &image));
  EXPECT_EQ(image.GetChannelCount(), 1u);
  EXPECT_EQ(image.GetPixel(0, 0)[0], 77);
}

TEST_F(MaskMapTest, MissingSourceUsesFallback) {
  PackSettings settings;
  settings.metallic_path = GetPath("does_not_exist.png");
  settings.occlusion_path = WriteGray("Present_AO.png", 2, 2, 0);
  const std::string dst_path = GetPath("missing.png");
  remove(dst_path.c_str());

  VectorLogger logger;
  EXPECT_FALSE(PackMaskMap(settings, dst_path, &logger));
  EXPECT_TRUE(logger.Contains(GetWhatInfo(MMP_ERROR_IO_READ_IMAGE)));

  Image image;
  ASSERT_TRUE(ReadImage(dst_path, &image));
  ExpectAllPixels(image, 128, 0, 128, 128);
}

TEST_F(MaskMapTest, UndecodableSourceUsesFallback) {
  const std::string bad_path = GetPath("Garbage_Detail.png");
  const char kGarbage[] = "not an image";
  ASSERT_TRUE(WriteBinary(bad_path, kGarbage, sizeof(kGarbage)));
  PackSettings settings;
  settings.detail_path = bad_path;
  settings.default_detail = 1.0f;
  const std::string dst_path = GetPath("garbage.png");

  VectorLogger logger;
  EXPECT_FALSE(PackMaskMap(settings, dst_path, &logger));
  EXPECT_TRUE(logger.Contains(GetWhatInfo(MMP_ERROR_IMAGE_DECODE)));

  Image image;
  ASSERT_TRUE(ReadImage(dst_path, &image));
  EXPECT_EQ(image.GetWidth(), 512u);
  ExpectAllPixels(image, 128, 255, 255, 128);
}

TEST_F(MaskMapTest, CreatesOutputDirectory) {
  const PackSettings settings;
  const std::string dst_path = GetPath("nested/dir/out.png");
  VectorLogger logger;
  ASSERT_TRUE(PackMaskMap(settings, dst_path, &logger));
  Image image;
  EXPECT_TRUE(ReadImage(dst_path, &image));
}
}  // namespace
}  // namespace mmp
