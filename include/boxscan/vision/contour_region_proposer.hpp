#pragma once

#include <boxscan/vision/region_proposer.hpp>

namespace boxscan::vision {

struct ContourProposerConfig {
  double blur_sigma{1.5};
  double canny_low{50.0};
  double canny_high{150.0};
  int dilate_iterations{2};
  double approx_epsilon{0.02};  // fraction of the contour perimeter
};

/// Model-free proposer: edge map -> external contours -> bounding boxes.
/// Confidence rewards rectangular outlines (four-vertex approximation and a
/// contour that fills its bounding box).
class ContourRegionProposer : public IRegionProposer {
 public:
  explicit ContourRegionProposer(ContourProposerConfig config = {});

  [[nodiscard]] std::expected<std::vector<Proposal>, boxscan::core::ScanError>
  propose(const boxscan::core::Image& image) override;

 private:
  ContourProposerConfig config_;
};

}  // namespace boxscan::vision
