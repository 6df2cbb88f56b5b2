#include <boxscan/vision/box_assessor.hpp>
#include <gtest/gtest.h>
#include <cstddef>
#include <vector>

namespace nc = boxscan::core;
namespace nv = boxscan::vision;

namespace {

nc::Image make_uniform(std::uint32_t w, std::uint32_t h, unsigned char value) {
  std::vector<std::byte> buf(nc::Image::min_bytes(w, h, nc::PixelFormat::BGR8),
                             static_cast<std::byte>(value));
  return nc::Image(w, h, nc::PixelFormat::BGR8, std::move(buf));
}

/// Grayscale checkerboard with \p cell pixel squares: edges everywhere.
nc::Image make_checkerboard(std::uint32_t w, std::uint32_t h, std::uint32_t cell) {
  std::vector<std::byte> buf(static_cast<std::size_t>(w) * h);
  for (std::uint32_t y = 0; y < h; ++y) {
    for (std::uint32_t x = 0; x < w; ++x) {
      const bool dark = ((x / cell) + (y / cell)) % 2 == 0;
      buf[static_cast<std::size_t>(y) * w + x] = static_cast<std::byte>(dark ? 0 : 255);
    }
  }
  return nc::Image(w, h, nc::PixelFormat::Grayscale8, std::move(buf));
}

}  // namespace

TEST(BoxAssessor, ConditionBands) {
  EXPECT_EQ(nv::BoxAssessor::condition_for(0.95f), nc::BoxCondition::Perfect);
  EXPECT_EQ(nv::BoxAssessor::condition_for(0.7f), nc::BoxCondition::Good);
  EXPECT_EQ(nv::BoxAssessor::condition_for(0.5f), nc::BoxCondition::Worn);
  EXPECT_EQ(nv::BoxAssessor::condition_for(0.3f), nc::BoxCondition::Damaged);
  EXPECT_EQ(nv::BoxAssessor::condition_for(0.1f), nc::BoxCondition::SeverelyDamaged);
}

TEST(BoxAssessor, PlainSurfaceIsIntactFront) {
  nv::BoxAssessor assessor;
  const auto a = assessor.assess(make_uniform(200, 200, 128));
  EXPECT_EQ(a.condition, nc::BoxCondition::Perfect);
  EXPECT_EQ(a.angle, nc::BoxAngle::Front);
  EXPECT_FLOAT_EQ(a.edge_density, 0.f);
  EXPECT_FLOAT_EQ(a.integrity, 1.f);
  EXPECT_NEAR(a.brightness, 128.f / 255.f, 1e-3f);
  EXPECT_EQ(a.lighting, nc::BoxLighting::LowContrast);
}

TEST(BoxAssessor, Exposure) {
  nv::BoxAssessor assessor;
  EXPECT_EQ(assessor.assess(make_uniform(120, 120, 250)).lighting,
            nc::BoxLighting::Overexposed);
  EXPECT_EQ(assessor.assess(make_uniform(120, 120, 20)).lighting,
            nc::BoxLighting::Underexposed);
}

TEST(BoxAssessor, WideCropIsTopFace) {
  nv::BoxAssessor assessor;
  EXPECT_EQ(assessor.assess(make_uniform(300, 100, 128)).angle, nc::BoxAngle::Top);
  EXPECT_EQ(assessor.assess(make_uniform(100, 300, 128)).angle, nc::BoxAngle::LeftSide);
}

TEST(BoxAssessor, DenseEdgesReadAsDamage) {
  nv::BoxAssessor assessor;
  const auto a = assessor.assess(make_checkerboard(120, 120, 4));
  EXPECT_GT(a.edge_density, 0.27f);
  EXPECT_TRUE(nc::is_damaged(a.condition));
  EXPECT_EQ(a.lighting, nc::BoxLighting::Normal);
}

TEST(BoxAssessor, UnreadableCropIsSeverelyDamaged) {
  nv::BoxAssessor assessor;
  const auto a = assessor.assess(nc::Image{});
  EXPECT_EQ(a.condition, nc::BoxCondition::SeverelyDamaged);
  EXPECT_FLOAT_EQ(a.integrity, 0.f);
}
