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

#include "pack/image_source.h"

#include "gtest/gtest.h"
#include "process/color.h"

namespace mmp {
namespace {
constexpr float kTol = 1.0e-6f;

TEST(GrayImageTest, Empty) {
  const GrayImage gray;
  EXPECT_FALSE(gray.IsValid());
  EXPECT_EQ(gray.GetWidth(), 0);
  EXPECT_EQ(gray.GetHeight(), 0);
}

TEST(GrayImageTest, SingleChannel) {
  const Image::Component kGray[] = { 51 };
  Image image;
  image.CreateWxH(3, 2, kGray);
  const GrayImage gray(image);
  ASSERT_TRUE(gray.IsValid());
  EXPECT_EQ(gray.GetWidth(), 3);
  EXPECT_EQ(gray.GetHeight(), 2);
  EXPECT_NEAR(gray.Sample(2, 1), 0.2f, kTol);
}

TEST(GrayImageTest, GrayAlphaIgnoresAlpha) {
  const Image::Component kGrayAlpha[] = { 255, 0 };
  Image image;
  image.CreateWxH(2, 2, kGrayAlpha);
  const GrayImage gray(image);
  EXPECT_NEAR(gray.Sample(0, 0), 1.0f, kTol);
  EXPECT_NEAR(gray.Sample(1, 1), 1.0f, kTol);
}

TEST(GrayImageTest, RgbUsesPerceivedBrightness) {
  const Image::Component kRed[] = { 255, 0, 0 };
  const Image::Component kGreen[] = { 0, 255, 0 };
  const Image::Component kBlue[] = { 0, 0, 255 };
  Image image;
  image.CreateWxH(1, 1, kRed);
  EXPECT_NEAR(GrayImage(image).Sample(0, 0), 0.299f, kTol);
  image.CreateWxH(1, 1, kGreen);
  EXPECT_NEAR(GrayImage(image).Sample(0, 0), 0.587f, kTol);
  image.CreateWxH(1, 1, kBlue);
  EXPECT_NEAR(GrayImage(image).Sample(0, 0), 0.114f, kTol);
}

TEST(GrayImageTest, RgbaIgnoresAlpha) {
  const Image::Component kWhiteClear[] = { 255, 255, 255, 0 };
  Image image;
  image.CreateWxH(2, 1, kWhiteClear);
  EXPECT_NEAR(GrayImage(image).Sample(1, 0), 1.0f, kTol);
}

TEST(GrayImageTest, EqualComponentsKeepValue) {
  const Image::Component kGray[] = { 64, 64, 64, 255 };
  Image image;
  image.CreateWxH(1, 1, kGray);
  EXPECT_NEAR(GrayImage(image).Sample(0, 0), 64.0f / 255.0f, kTol);
}

TEST(GrayImageTest, RowMajorSampling) {
  Image image;
  const Image::Component kBlack[] = { 0 };
  image.CreateWxH(3, 2, kBlack);
  image.ModifyData()[1 * 3 + 2] = 255;
  const GrayImage gray(image);
  EXPECT_NEAR(gray.Sample(2, 1), 1.0f, kTol);
  EXPECT_EQ(gray.Sample(1, 1), 0.0f);
  EXPECT_EQ(gray.Sample(2, 0), 0.0f);
}

TEST(GrayImageTest, ExplicitValues) {
  const float kValues[] = { 0.0f, 0.25f, 0.5f, 1.0f };
  const GrayImage gray(2, 2, kValues);
  EXPECT_EQ(gray.Sample(0, 0), 0.0f);
  EXPECT_EQ(gray.Sample(1, 0), 0.25f);
  EXPECT_EQ(gray.Sample(0, 1), 0.5f);
  EXPECT_EQ(gray.Sample(1, 1), 1.0f);
}

TEST(GrayImageTest, OutOfBoundsAsserts) {
  const float kValues[] = { 0.0f };
  const GrayImage gray(1, 1, kValues);
  EXPECT_THROW(gray.Sample(1, 0), AssertException);
  EXPECT_THROW(gray.Sample(0, -1), AssertException);
}

TEST(PerceivedBrightnessTest, WeightsSumToOne) {
  EXPECT_NEAR(GetPerceivedBrightness(1.0f, 1.0f, 1.0f), 1.0f, kTol);
  EXPECT_EQ(GetPerceivedBrightness(0.0f, 0.0f, 0.0f), 0.0f);
}
}  // namespace
}  // namespace mmp
