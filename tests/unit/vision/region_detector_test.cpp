#include <boxscan/vision/mock_region_proposer.hpp>
#include <boxscan/vision/region_detector.hpp>
#include <gtest/gtest.h>
#include <memory>
#include <vector>

namespace nc = boxscan::core;
namespace nv = boxscan::vision;

namespace {

nc::Image make_photo(std::uint32_t w = 640, std::uint32_t h = 480) {
  std::vector<std::byte> buf(nc::Image::min_bytes(w, h, nc::PixelFormat::BGR8),
                             std::byte{200});
  return nc::Image(w, h, nc::PixelFormat::BGR8, std::move(buf));
}

std::shared_ptr<nv::MockRegionProposer> proposer_with(std::vector<nv::Proposal> proposals) {
  auto p = std::make_shared<nv::MockRegionProposer>();
  p->set_proposals(std::move(proposals));
  return p;
}

}  // namespace

TEST(RegionDetector, SelectFiltersUnusableProposals) {
  nv::RegionDetector detector(nullptr);
  const std::vector<nv::Proposal> proposals{
      {{100, 100, 150, 200}, 0.9f},  // kept
      {{300, 300, 150, 150}, 0.2f},  // low confidence
      {{10, 10, 50, 50}, 0.9f},      // too small
      {{0, 0, 600, 450}, 0.9f},      // background
      {{100, 300, 420, 120}, 0.9f},  // too elongated
  };
  const auto out = detector.select(proposals, 640, 480);
  ASSERT_EQ(out.size(), 1u);
  EXPECT_EQ(out[0].bbox, (nc::BBox{100, 100, 150, 200}));
}

TEST(RegionDetector, OverlappingProposalsKeepMostConfident) {
  nv::RegionDetector detector(nullptr);
  const auto out = detector.select(
      {{{110, 105, 150, 200}, 0.8f}, {{100, 100, 150, 200}, 0.9f}}, 640, 480);
  ASSERT_EQ(out.size(), 1u);
  EXPECT_FLOAT_EQ(out[0].confidence, 0.9f);
  EXPECT_EQ(out[0].bbox.x, 100);
}

TEST(RegionDetector, ReadingOrderAndCap) {
  nv::RegionDetectorConfig config;
  config.max_regions = 2;
  nv::RegionDetector detector(nullptr, config);
  const auto out = detector.select({{{50, 250, 150, 150}, 0.6f},
                                    {{400, 50, 150, 150}, 0.7f},
                                    {{100, 100, 150, 200}, 0.9f}},
                                   640, 480);
  ASSERT_EQ(out.size(), 2u);
  EXPECT_EQ(out[0].bbox.x, 400);
  EXPECT_EQ(out[1].bbox.x, 100);
}

TEST(RegionDetector, DetectCropsWithPadding) {
  nv::RegionDetector detector(
      proposer_with({{{400, 50, 150, 150}, 0.7f}, {{100, 100, 150, 200}, 0.9f}}));
  auto regions = detector.detect(make_photo());
  ASSERT_TRUE(regions.has_value());
  ASSERT_EQ(regions->size(), 2u);
  const auto& first = (*regions)[0];
  const auto& second = (*regions)[1];
  EXPECT_EQ(first.id, 0u);
  EXPECT_EQ(second.id, 1u);
  EXPECT_EQ(first.bbox.x, 400);
  EXPECT_EQ(first.image.width(), 170u);
  EXPECT_EQ(first.image.height(), 170u);
  EXPECT_EQ(second.image.width(), 170u);
  EXPECT_EQ(second.image.height(), 220u);
  EXPECT_FLOAT_EQ(second.detection_confidence, 0.9f);
  EXPECT_FALSE(first.is_fallback);
  EXPECT_EQ(first.condition, nc::BoxCondition::Perfect);
}

TEST(RegionDetector, NothingFoundFallsBackToWholeImage) {
  nv::RegionDetector detector(proposer_with({}));
  auto regions = detector.detect(make_photo());
  ASSERT_TRUE(regions.has_value());
  ASSERT_EQ(regions->size(), 1u);
  const auto& r = (*regions)[0];
  EXPECT_TRUE(r.is_fallback);
  EXPECT_FLOAT_EQ(r.detection_confidence, 0.5f);
  EXPECT_EQ(r.bbox, (nc::BBox{0, 0, 640, 480}));
  EXPECT_EQ(r.image.width(), 640u);
}

TEST(RegionDetector, ProposerFailureFallsBack) {
  auto proposer = proposer_with({{{100, 100, 150, 200}, 0.9f}});
  proposer->set_failure(nc::ScanError::DetectionFailure);
  nv::RegionDetector detector(proposer);
  auto regions = detector.detect(make_photo());
  ASSERT_TRUE(regions.has_value());
  ASSERT_EQ(regions->size(), 1u);
  EXPECT_TRUE((*regions)[0].is_fallback);

  nv::RegionDetector without_proposer(nullptr);
  auto whole = without_proposer.detect(make_photo());
  ASSERT_TRUE(whole.has_value());
  EXPECT_TRUE((*whole)[0].is_fallback);
}

TEST(RegionDetector, InvalidImageFails) {
  nv::RegionDetector detector(proposer_with({}));
  auto regions = detector.detect(nc::Image{});
  ASSERT_FALSE(regions.has_value());
  EXPECT_EQ(regions.error(), nc::ScanError::DetectionFailure);

  // Buffer too small for the stated dimensions.
  auto broken = detector.detect(
      nc::Image(640, 480, nc::PixelFormat::BGR8, std::vector<std::byte>(16)));
  ASSERT_FALSE(broken.has_value());
}

TEST(RegionDetector, Deterministic) {
  nv::RegionDetector detector(
      proposer_with({{{400, 50, 150, 150}, 0.7f}, {{100, 100, 150, 200}, 0.9f}}));
  const auto photo = make_photo();
  auto a = detector.detect(photo);
  auto b = detector.detect(photo);
  ASSERT_TRUE(a && b);
  ASSERT_EQ(a->size(), b->size());
  for (std::size_t i = 0; i < a->size(); ++i) {
    EXPECT_EQ((*a)[i].bbox, (*b)[i].bbox);
    EXPECT_EQ((*a)[i].id, (*b)[i].id);
  }
}
