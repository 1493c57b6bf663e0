// Repository: ClipForge-render
// Component: Frame transform (crop/scale, colour, blur, fade) unit tests

#include <gtest/gtest.h>

#include <cstdint>
#include <utility>

#include "clipforge/render/FrameTransform.hpp"
#include "clipforge/render/Image.hpp"

namespace clipforge::render {
namespace {

RgbFrame Solid(int w, int h, uint8_t r, uint8_t g, uint8_t b) {
  RgbFrame f(w, h);
  for (size_t i = 0; i < f.data.size(); i += 3) {
    f.data[i] = r;
    f.data[i + 1] = g;
    f.data[i + 2] = b;
  }
  return f;
}

void ExpectPixel(const RgbFrame& f, int x, int y, int r, int g, int b) {
  const uint8_t* p = f.Pixel(x, y);
  EXPECT_EQ(p[0], r) << "at " << x << "," << y;
  EXPECT_EQ(p[1], g) << "at " << x << "," << y;
  EXPECT_EQ(p[2], b) << "at " << x << "," << y;
}

// ---------------------------------------------------------------------------
// Crop / scale
// ---------------------------------------------------------------------------

TEST(CenterCropTest, PortraitNineSixteenIsUntouched) {
  EXPECT_EQ(ComputeCenterCrop(1080, 1920), (CropRect{0, 0, 1080, 1920}));
  EXPECT_EQ(ComputeCenterCrop(720, 1280), (CropRect{0, 0, 720, 1280}));
}

TEST(CenterCropTest, LandscapeCropsWidth) {
  // int(1080 * 9/16) = 607, centred.
  EXPECT_EQ(ComputeCenterCrop(1920, 1080), (CropRect{656, 0, 607, 1080}));
}

TEST(CenterCropTest, TallCropsHeight) {
  EXPECT_EQ(ComputeCenterCrop(1080, 2400), (CropRect{0, 240, 1080, 1920}));
}

TEST(FrameScalerTest, OutputsPortraitFrameSize) {
  FrameScaler scaler;
  RgbFrame out;
  ASSERT_TRUE(scaler.ResizeAndCrop(Solid(90, 160, 40, 80, 120), out));
  EXPECT_EQ(out.width, kOutputWidth);
  EXPECT_EQ(out.height, kOutputHeight);
  const uint8_t* p = out.Pixel(540, 960);
  EXPECT_NEAR(p[0], 40, 4);
  EXPECT_NEAR(p[1], 80, 4);
  EXPECT_NEAR(p[2], 120, 4);
}

TEST(FrameScalerTest, LandscapeKeepsOnlyCentre) {
  RgbFrame in = Solid(320, 180, 255, 0, 0);
  for (int y = 0; y < in.height; ++y) {
    for (int x = 100; x < 220; ++x) {
      uint8_t* p = in.Pixel(x, y);
      p[0] = 0;
      p[1] = 255;
      p[2] = 0;
    }
  }
  FrameScaler scaler;
  RgbFrame out;
  ASSERT_TRUE(scaler.ResizeAndCrop(in, out));
  for (int x : {0, 540, kOutputWidth - 1}) {
    const uint8_t* p = out.Pixel(x, 960);
    EXPECT_LT(p[0], 32) << "x=" << x;
    EXPECT_GT(p[1], 223) << "x=" << x;
  }
}

TEST(FrameScalerTest, RejectsEmptyFrame) {
  FrameScaler scaler;
  RgbFrame out;
  EXPECT_FALSE(scaler.ResizeAndCrop(RgbFrame(), out));
}

// ---------------------------------------------------------------------------
// Colour effects
// ---------------------------------------------------------------------------

TEST(ColorEffectsTest, IdentityLeavesFrameUntouched) {
  RgbFrame f = Solid(2, 2, 200, 100, 50);
  ApplyColorEffects(f, ColorEffects{});
  ExpectPixel(f, 1, 1, 200, 100, 50);
}

TEST(ColorEffectsTest, ExposureScalesValue) {
  RgbFrame f = Solid(1, 1, 100, 100, 100);
  ColorEffects e;
  e.exposure = 1.5;
  ApplyColorEffects(f, e);
  ExpectPixel(f, 0, 0, 150, 150, 150);
}

TEST(ColorEffectsTest, BrightnessOffsetTruncates) {
  RgbFrame f = Solid(1, 1, 100, 100, 100);
  ColorEffects e;
  e.brightness = 1.2;  // +25.5
  ApplyColorEffects(f, e);
  ExpectPixel(f, 0, 0, 125, 125, 125);
}

TEST(ColorEffectsTest, ContrastClipsAtWhite) {
  RgbFrame f = Solid(1, 1, 200, 200, 200);
  ColorEffects e;
  e.contrast = 2.0;
  ApplyColorEffects(f, e);
  ExpectPixel(f, 0, 0, 255, 255, 255);
}

TEST(ColorEffectsTest, ExposureAppliesBeforeBrightness) {
  RgbFrame f = Solid(1, 1, 100, 100, 100);
  ColorEffects e;
  e.exposure = 2.0;
  e.brightness = 0.5;  // -63.75
  ApplyColorEffects(f, e);
  // (100 * 2) - 63.75 = 136.25; the other order would give 72.
  ExpectPixel(f, 0, 0, 136, 136, 136);
}

TEST(ColorEffectsTest, ZeroSaturationProducesGray) {
  RgbFrame f = Solid(1, 1, 200, 100, 50);
  ColorEffects e;
  e.saturation = 0.0;
  ApplyColorEffects(f, e);
  ExpectPixel(f, 0, 0, 200, 200, 200);
}

TEST(ColorEffectsTest, ValueChangePreservesHue) {
  RgbFrame f = Solid(1, 1, 200, 100, 0);
  ColorEffects e;
  e.exposure = 0.5;
  ApplyColorEffects(f, e);
  ExpectPixel(f, 0, 0, 100, 50, 0);
}

TEST(ColorEffectsTest, FromVideoSettingsCopiesFields) {
  VideoSettings v;
  v.exposure = 1.1;
  v.saturation = 0.4;
  const ColorEffects e = ColorEffects::FromVideoSettings(v);
  EXPECT_DOUBLE_EQ(e.exposure, 1.1);
  EXPECT_DOUBLE_EQ(e.saturation, 0.4);
  EXPECT_FALSE(e.IsIdentity());
}

// ---------------------------------------------------------------------------
// Blur
// ---------------------------------------------------------------------------

TEST(BlurTest, KernelSizeIsAlwaysOdd) {
  EXPECT_EQ(BlurKernelSize(0), 0);
  EXPECT_EQ(BlurKernelSize(-3), 0);
  EXPECT_EQ(BlurKernelSize(1), 3);
  EXPECT_EQ(BlurKernelSize(2), 3);
  EXPECT_EQ(BlurKernelSize(2.7), 3);
  EXPECT_EQ(BlurKernelSize(3), 7);
  EXPECT_EQ(BlurKernelSize(4), 5);
}

TEST(BlurTest, SigmaFollowsKernelSize) {
  EXPECT_NEAR(GaussianSigmaForKernel(3), 0.8, 1e-9);
  EXPECT_NEAR(GaussianSigmaForKernel(7), 1.4, 1e-9);
  EXPECT_NEAR(GaussianBlur(5).sigma(), 1.1, 1e-9);
  EXPECT_DOUBLE_EQ(GaussianBlur(0).sigma(), 0.0);
}

TEST(BlurTest, ZeroKernelLeavesFrameUntouched) {
  RgbFrame f = Solid(4, 4, 10, 20, 30);
  f.Pixel(1, 1)[0] = 250;
  GaussianBlur blur(0);
  EXPECT_FALSE(blur.enabled());
  ASSERT_TRUE(blur.Apply(f));
  ExpectPixel(f, 1, 1, 250, 20, 30);
  ExpectPixel(f, 0, 0, 10, 20, 30);
}

TEST(BlurTest, UniformFrameUnchanged) {
  RgbFrame f = Solid(16, 16, 90, 120, 30);
  GaussianBlur blur(7);
  ASSERT_TRUE(blur.Apply(f));
  for (const auto& xy : {std::make_pair(0, 0), std::make_pair(8, 8), std::make_pair(15, 15)}) {
    const uint8_t* p = f.Pixel(xy.first, xy.second);
    EXPECT_NEAR(p[0], 90, 2);
    EXPECT_NEAR(p[1], 120, 2);
    EXPECT_NEAR(p[2], 30, 2);
  }
}

TEST(BlurTest, SpreadsPointEnergy) {
  RgbFrame f = Solid(9, 9, 0, 0, 0);
  f.Pixel(4, 4)[0] = 255;
  GaussianBlur blur(3);
  ASSERT_TRUE(blur.Apply(f));
  EXPECT_LT(f.Pixel(4, 4)[0], 255);
  EXPECT_GT(f.Pixel(3, 4)[0], 0);
  EXPECT_GT(f.Pixel(5, 5)[0], 0);
  EXPECT_LE(f.Pixel(0, 0)[0], 2);
  EXPECT_LE(f.Pixel(4, 4)[1], 1);
}

TEST(BlurTest, GraphFollowsFrameSizeChanges) {
  GaussianBlur blur(5);
  RgbFrame small = Solid(8, 8, 200, 200, 200);
  ASSERT_TRUE(blur.Apply(small));
  RgbFrame large = Solid(20, 12, 40, 80, 120);
  ASSERT_TRUE(blur.Apply(large));
  EXPECT_NEAR(large.Pixel(10, 6)[0], 40, 2);
  EXPECT_NEAR(large.Pixel(10, 6)[2], 120, 2);
}

// ---------------------------------------------------------------------------
// Master fade
// ---------------------------------------------------------------------------

TEST(MasterFadeTest, AlphaRamps) {
  EXPECT_DOUBLE_EQ(MasterFadeAlpha(0.0, 10.0, 1.0, 1.0), 0.0);
  EXPECT_DOUBLE_EQ(MasterFadeAlpha(0.5, 10.0, 1.0, 0.0), 0.5);
  EXPECT_DOUBLE_EQ(MasterFadeAlpha(5.0, 10.0, 1.0, 1.0), 1.0);
  EXPECT_DOUBLE_EQ(MasterFadeAlpha(9.5, 10.0, 0.0, 1.0), 0.5);
  EXPECT_DOUBLE_EQ(MasterFadeAlpha(3.0, 10.0, 0.0, 0.0), 1.0);
}

TEST(MasterFadeTest, FadeOutOverridesFadeIn) {
  // Both windows cover t = 0.25 in a one second clip.
  EXPECT_DOUBLE_EQ(MasterFadeAlpha(0.25, 1.0, 1.0, 1.0), 0.75);
}

TEST(MasterFadeTest, ApplyRoundsToNearest) {
  RgbFrame f = Solid(1, 1, 255, 101, 0);
  ApplyMasterFade(f, 0.5);
  ExpectPixel(f, 0, 0, 128, 51, 0);
}

}  // namespace
}  // namespace clipforge::render
