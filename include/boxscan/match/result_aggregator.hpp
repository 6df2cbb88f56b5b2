#pragma once

#include <boxscan/core/region_result.hpp>
#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace boxscan::match {

struct AggregationInput {
  std::string session_id;
  core::ImageSource source{core::ImageSource::Camera};
  std::chrono::steady_clock::time_point started{};  // first region proposal
  std::size_t cancelled_regions{0};
};

/// Builds the final MultiDrugResult for one photograph.
///
/// Regions are kept in region order. Two regions whose best candidate names
/// the same catalog entry form one logical detection: the higher confidence
/// wins (the earlier region on ties) and the other gets duplicate_of set.
/// Aggregate confidence is the mean best confidence of the kept detections.
class ResultAggregator {
 public:
  static constexpr std::size_t kTooManyObjects = 5;

  [[nodiscard]] core::MultiDrugResult aggregate(std::vector<core::RegionResult> regions,
                                                const AggregationInput& input) const;

  [[nodiscard]] static core::FrameQuality frame_quality(
      const std::vector<core::RegionResult>& regions) noexcept;
};

}  // namespace boxscan::match
