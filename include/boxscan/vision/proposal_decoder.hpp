#pragma once

#include <boxscan/vision/raw_detections.hpp>
#include <boxscan/vision/region_proposer.hpp>
#include <cstdint>
#include <vector>

namespace boxscan::vision {

/// Decodes RawDetections -> proposals in image pixels: score threshold,
/// optional class filter, model-to-image scaling and clamping.
class ProposalDecoder {
 public:
  /// \param accepted_classes Class ids treated as boxes; empty accepts every class.
  explicit ProposalDecoder(float score_threshold,
                           std::vector<std::int64_t> accepted_classes = {});

  /// \param scale_x, scale_y Factors from model input to image coordinates.
  [[nodiscard]] std::vector<Proposal> decode(const RawDetections& raw,
                                             float scale_x, float scale_y,
                                             std::uint32_t image_width,
                                             std::uint32_t image_height) const;

  void set_score_threshold(float t) noexcept { score_threshold_ = t; }
  [[nodiscard]] float score_threshold() const noexcept { return score_threshold_; }

 private:
  float score_threshold_;
  std::vector<std::int64_t> accepted_classes_;
};

}  // namespace boxscan::vision
