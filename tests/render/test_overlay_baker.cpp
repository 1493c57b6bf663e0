// Repository: ClipForge-render
// Component: OverlayBaker unit tests

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "clipforge/render/OverlayBaker.hpp"
#include "fixtures/TempDirectory.h"

namespace clipforge::render {
namespace {

constexpr const char* kSystemFontDir = "/usr/share/fonts/truetype/dejavu";
constexpr const char* kSystemFont = "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf";

class OfflineFontFetcher : public FontFetcher {
 public:
  std::optional<FontCatalog> FetchCatalog(const std::string&) override { return std::nullopt; }
  bool Download(const std::string&, const std::string&) override { return false; }
};

// Solid 20x10 binary PPM.
void WritePpm(const std::string& path) {
  std::ofstream out(path, std::ios::binary);
  out << "P6\n20 10\n255\n";
  for (int i = 0; i < 20 * 10; ++i) {
    out.put(static_cast<char>(200));
    out.put(static_cast<char>(30));
    out.put(static_cast<char>(30));
  }
}

class OverlayBakerTest : public ::testing::Test {
 protected:
  OverlayBakerTest() : dir_("baker") {
    FontResolverOptions options;
    options.cache_dir = dir_.Subdir("font_cache");
    options.fonts_dir = kSystemFontDir;
    options.catalog_cache_file = dir_.File("font_catalog.json");
    options.fallback_font = kSystemFont;
    resolver_ = std::make_unique<FontResolver>(options, fetcher_);

    OverlayBakerConfig config;
    config.default_font_path = kSystemFont;
    config.logo_dir = dir_.Subdir("logos");
    config.signature_dir = dir_.Subdir("signatures");
    baker_ = std::make_unique<OverlayBaker>(*resolver_, config);
  }

  void SetUp() override {
    if (!std::filesystem::exists(kSystemFont)) {
      GTEST_SKIP() << "DejaVuSans not installed";
    }
  }

  testing::TempDirectory dir_;
  OfflineFontFetcher fetcher_;
  std::unique_ptr<FontResolver> resolver_;
  std::unique_ptr<OverlayBaker> baker_;
};

TEST(OverlayTimingTest, DefaultsSpanWholeVideo) {
  PrebakedOverlay overlay;
  ApplyTiming(OverlayTiming{}, 12.0, overlay);
  EXPECT_DOUBLE_EQ(overlay.start_s, 0.0);
  EXPECT_DOUBLE_EQ(overlay.end_s, 12.0);
}

TEST(OverlayTimingTest, ZeroEndMeansVideoEnd) {
  OverlayTiming timing;
  timing.start_time_s = 2.0;
  timing.end_time_s = 0.0;
  timing.fade_in_s = 0.5;
  timing.fade_out_s = 1.0;
  PrebakedOverlay overlay;
  ApplyTiming(timing, 12.0, overlay);
  EXPECT_DOUBLE_EQ(overlay.start_s, 2.0);
  EXPECT_DOUBLE_EQ(overlay.end_s, 12.0);
  EXPECT_DOUBLE_EQ(overlay.fade_in_s, 0.5);
  EXPECT_DOUBLE_EQ(overlay.fade_out_s, 1.0);

  timing.end_time_s = 7.5;
  ApplyTiming(timing, 12.0, overlay);
  EXPECT_DOUBLE_EQ(overlay.end_s, 7.5);
}

TEST(ScaleAlphaTest, ScalesOnlyAlphaChannel) {
  RgbaBitmap bitmap(2, 1);
  bitmap.data = {10, 20, 30, 200, 40, 50, 60, 100};
  ScaleAlpha(bitmap, 0.5);
  EXPECT_EQ(bitmap.data, (std::vector<uint8_t>{10, 20, 30, 100, 40, 50, 60, 50}));

  ScaleAlpha(bitmap, 1.0);
  EXPECT_EQ(bitmap.data[3], 100);
}

TEST_F(OverlayBakerTest, BakesKeywordPositionedText) {
  TextOverlaySpec spec;
  spec.text = "Breathe in";
  spec.font = "DejaVuSans";
  spec.font_size = 48;
  spec.font_color = "yellow";
  spec.position = KeywordPosition{VerticalAnchor::kTop, HorizontalAnchor::kLeft};
  spec.margins = Margins{120, 50, 100, 60};

  const auto overlay = baker_->BakeText(spec, "text_0", 10.0);
  ASSERT_TRUE(overlay.has_value());
  EXPECT_EQ(overlay->label, "text_0");
  EXPECT_FALSE(overlay->bitmap.Empty());
  EXPECT_EQ(overlay->position.y, 120);
  EXPECT_EQ(overlay->position.x, 60);
  EXPECT_DOUBLE_EQ(overlay->end_s, 10.0);
}

TEST_F(OverlayBakerTest, LongTextWrapsWithinPixelBox) {
  TextOverlaySpec spec;
  spec.text = "one two three four five six seven eight nine ten eleven twelve";
  spec.font = "DejaVuSans";
  spec.font_size = 40;
  spec.position = PixelPosition{960, 100, 300};

  const auto overlay = baker_->BakeText(spec, "text_1", 10.0);
  ASSERT_TRUE(overlay.has_value());
  EXPECT_LE(overlay->bitmap.width, 310);
  EXPECT_GT(overlay->bitmap.height, 2 * 40);
}

TEST_F(OverlayBakerTest, EmptyTextOrBadColourIsDropped) {
  TextOverlaySpec spec;
  spec.font = "DejaVuSans";
  spec.text = "   ";
  EXPECT_FALSE(baker_->BakeText(spec, "text_0", 10.0).has_value());

  spec.text = "hello";
  spec.font_color = "not-a-colour";
  EXPECT_FALSE(baker_->BakeText(spec, "text_0", 10.0).has_value());
}

TEST_F(OverlayBakerTest, UnknownFamilyFallsBackToDefaultFont) {
  TextOverlaySpec spec;
  spec.text = "fallback";
  spec.font = "NoSuchFamily";
  EXPECT_TRUE(baker_->BakeText(spec, "signature", 10.0).has_value());
}

TEST_F(OverlayBakerTest, MissingImageIsDropped) {
  ImageOverlaySpec spec;
  spec.name = "absent.png";
  EXPECT_FALSE(baker_->BakeImage(spec, dir_.File("logos"), "logo", 10.0).has_value());

  spec.name.clear();
  EXPECT_FALSE(baker_->BakeImage(spec, dir_.File("logos"), "logo", 10.0).has_value());
}

TEST_F(OverlayBakerTest, BakesThumbnailedLogoInCorner) {
  WritePpm(dir_.File("logos/brand.ppm"));
  ImageOverlaySpec spec;
  spec.name = "brand.ppm";
  spec.size = 10;
  spec.opacity = 0.5;

  const auto overlay = baker_->BakeImage(spec, dir_.File("logos"), "logo", 10.0);
  ASSERT_TRUE(overlay.has_value());
  EXPECT_EQ(overlay->bitmap.width, 10);
  EXPECT_EQ(overlay->bitmap.height, 5);
  EXPECT_NEAR(overlay->bitmap.Pixel(5, 2)[3], 127, 2);
  // Bottom-centre with the default 25 px bottom and right margins.
  EXPECT_EQ(overlay->position.y, kOutputHeight - 25 - 5);
  EXPECT_EQ(overlay->position.x, (kOutputWidth - 25 - 10) / 2);
}

TEST_F(OverlayBakerTest, BakeCollectsAllOverlayKinds) {
  WritePpm(dir_.File("logos/brand.ppm"));
  RenderRequest request;
  request.video.duration_s = 8.0;
  TextOverlaySpec text;
  text.text = "first";
  text.font = "DejaVuSans";
  request.text_overlays.push_back(text);
  text.text = "";
  request.text_overlays.push_back(text);
  TextOverlaySpec signature;
  signature.text = "@clipforge";
  signature.font = "DejaVuSans";
  request.signature = signature;
  ImageOverlaySpec logo;
  logo.name = "brand.ppm";
  request.logo = logo;

  const auto overlays = baker_->Bake(request);
  ASSERT_EQ(overlays.size(), 3u);
  EXPECT_EQ(overlays[0].label, "text_0");
  EXPECT_EQ(overlays[1].label, "signature");
  EXPECT_EQ(overlays[2].label, "logo");
  for (const auto& o : overlays) EXPECT_DOUBLE_EQ(o.end_s, 8.0);
}

}  // namespace
}  // namespace clipforge::render
