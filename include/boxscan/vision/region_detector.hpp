#pragma once

#include <boxscan/core/error.hpp>
#include <boxscan/core/image.hpp>
#include <boxscan/core/region.hpp>
#include <boxscan/vision/box_assessor.hpp>
#include <boxscan/vision/region_proposer.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <vector>

namespace boxscan::vision {

struct RegionDetectorConfig {
  float min_confidence{0.3f};
  std::uint32_t min_side{100};       // pixels
  long long min_area{10000};         // pixels
  float max_area_ratio{0.8f};        // larger boxes are background
  float min_aspect{0.3f};
  float max_aspect{3.0f};
  float nms_iou_threshold{0.5f};
  int crop_padding{10};
  std::size_t max_regions{10};
  float fallback_confidence{0.5f};
};

/// Proposes, filters and crops candidate box regions in one photograph.
///
/// Proposals are filtered by confidence, size, area ratio and aspect, then
/// overlapping proposals are suppressed (IoU above nms_iou_threshold keeps the
/// most confident). Survivors are cropped with padding, assessed, and numbered
/// in reading order. When nothing survives the whole image becomes a single
/// fallback region. Pure: no state changes between calls.
class RegionDetector {
 public:
  RegionDetector(std::shared_ptr<IRegionProposer> proposer,
                 RegionDetectorConfig config = {},
                 BoxAssessor assessor = BoxAssessor{});

  /// DetectionFailure if the image is unusable (empty, inconsistent) so that
  /// not even the fallback region can be built.
  [[nodiscard]] std::expected<std::vector<boxscan::core::Region>, boxscan::core::ScanError>
  detect(const boxscan::core::Image& image) const;

  /// Filtering and non-max suppression only (exposed for tests and tools).
  [[nodiscard]] std::vector<Proposal> select(std::vector<Proposal> proposals,
                                             std::uint32_t image_width,
                                             std::uint32_t image_height) const;

  [[nodiscard]] const RegionDetectorConfig& config() const noexcept { return config_; }

 private:
  std::shared_ptr<IRegionProposer> proposer_;
  RegionDetectorConfig config_;
  BoxAssessor assessor_;
};

}  // namespace boxscan::vision
