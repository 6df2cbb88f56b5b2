#include <boxscan/vision/feature_extractor.hpp>
#include <gtest/gtest.h>
#include <cstddef>
#include <numeric>
#include <vector>

namespace nc = boxscan::core;
namespace nv = boxscan::vision;

namespace {

/// Black grayscale image with a white filled rectangle.
nc::Image make_rectangle(std::uint32_t w, std::uint32_t h, nc::BBox rect) {
  std::vector<std::byte> buf(static_cast<std::size_t>(w) * h, std::byte{0});
  for (int y = rect.y; y < rect.y + rect.h; ++y) {
    for (int x = rect.x; x < rect.x + rect.w; ++x) {
      buf[static_cast<std::size_t>(y) * w + static_cast<std::size_t>(x)] = std::byte{255};
    }
  }
  return nc::Image(w, h, nc::PixelFormat::Grayscale8, std::move(buf));
}

/// Left half black, right half white.
nc::Image make_vertical_step(std::uint32_t w, std::uint32_t h) {
  std::vector<std::byte> buf(static_cast<std::size_t>(w) * h, std::byte{0});
  for (std::uint32_t y = 0; y < h; ++y) {
    for (std::uint32_t x = w / 2; x < w; ++x) {
      buf[static_cast<std::size_t>(y) * w + x] = std::byte{255};
    }
  }
  return nc::Image(w, h, nc::PixelFormat::Grayscale8, std::move(buf));
}

float sum(const std::vector<float>& v) { return std::accumulate(v.begin(), v.end(), 0.f); }

}  // namespace

TEST(FeatureExtractor, AllTypesInOrder) {
  nv::FeatureExtractor extractor;
  const auto features = extractor.extract(make_rectangle(100, 100, {20, 30, 60, 30}), 4);
  ASSERT_EQ(features.size(), nc::kFeatureTypeCount);
  EXPECT_EQ(features[0].type, nc::FeatureType::ColorHistogram);
  EXPECT_EQ(features[1].type, nc::FeatureType::Edge);
  EXPECT_EQ(features[2].type, nc::FeatureType::TextLayout);
  EXPECT_EQ(features[3].type, nc::FeatureType::Shape);
  for (const auto& f : features) {
    EXPECT_EQ(f.region_id, 4u);
    EXPECT_GE(f.confidence, 0.f);
    EXPECT_LE(f.confidence, 1.f);
  }
}

TEST(FeatureExtractor, ColorHistogramIsNormalized) {
  nv::FeatureExtractor extractor;
  auto fv = extractor.extract_type(make_rectangle(100, 100, {20, 30, 60, 30}),
                                   nc::FeatureType::ColorHistogram, 0);
  ASSERT_TRUE(fv.has_value());
  EXPECT_EQ(fv->values.size(), 48u);
  EXPECT_NEAR(sum(fv->values), 1.f, 1e-4f);
}

TEST(FeatureExtractor, EdgeOrientationFollowsGradient) {
  nv::FeatureExtractor extractor;
  auto fv = extractor.extract_type(make_vertical_step(64, 64), nc::FeatureType::Edge, 0);
  ASSERT_TRUE(fv.has_value());
  ASSERT_EQ(fv->values.size(), 18u);
  EXPECT_NEAR(fv->values[0], 1.f, 1e-4f);
  EXPECT_GT(fv->confidence, 0.f);
}

TEST(FeatureExtractor, LayoutOfBlankImage) {
  nv::FeatureExtractor extractor;
  auto fv = extractor.extract_type(make_rectangle(64, 64, {0, 0, 0, 0}),
                                   nc::FeatureType::TextLayout, 0);
  ASSERT_TRUE(fv.has_value());
  ASSERT_EQ(fv->values.size(), 16u + 5u);
  EXPECT_FLOAT_EQ(fv->values[16], 0.f);  // mean density
  EXPECT_FLOAT_EQ(fv->values[18], 0.5f);  // centroid x
  EXPECT_FLOAT_EQ(fv->values[19], 0.5f);  // centroid y
  EXPECT_FLOAT_EQ(fv->confidence, 0.2f);
}

TEST(FeatureExtractor, LayoutNeedsOnePixelPerCell) {
  nv::FeatureExtractor extractor;
  auto fv = extractor.extract_type(make_rectangle(3, 3, {0, 0, 1, 1}),
                                   nc::FeatureType::TextLayout, 0);
  ASSERT_FALSE(fv.has_value());
  EXPECT_EQ(fv.error(), nc::ScanError::InvalidImage);
}

TEST(FeatureExtractor, ShapeOfRectangle) {
  nv::FeatureExtractor extractor;
  auto fv = extractor.extract_type(make_rectangle(100, 100, {20, 30, 60, 30}),
                                   nc::FeatureType::Shape, 0);
  ASSERT_TRUE(fv.has_value());
  ASSERT_EQ(fv->values.size(), 10u);
  EXPECT_NEAR(fv->values[7], 2.f, 0.1f);   // aspect
  EXPECT_GT(fv->values[8], 0.9f);          // extent
  EXPECT_NEAR(fv->values[9], 1.f, 1e-3f);  // solidity
}

TEST(FeatureExtractor, InvalidImageYieldsNothing) {
  nv::FeatureExtractor extractor;
  EXPECT_TRUE(extractor.extract(nc::Image{}, 0).empty());
  auto fv = extractor.extract_type(nc::Image{}, nc::FeatureType::Edge, 0);
  ASSERT_FALSE(fv.has_value());
  EXPECT_EQ(fv.error(), nc::ScanError::InvalidImage);
}
