#pragma once

#include <boxscan/core/error.hpp>
#include <boxscan/core/feature_vector.hpp>
#include <boxscan/core/image.hpp>
#include <cstddef>
#include <expected>
#include <vector>

namespace boxscan::vision {

struct FeatureExtractorConfig {
  int color_bins{16};        // per channel
  int orientation_bins{18};  // over 0-180 degrees
  int layout_grid{4};        // layout_grid x layout_grid cells
  float text_cell_density{0.15f};
};

/// Visual descriptors of a cropped box, one FeatureVector per type:
///   ColorHistogram  per-channel BGR histograms, L1-normalized together;
///                   confidence is the normalized entropy.
///   Edge            Sobel orientation histogram weighted by magnitude.
///   TextLayout      edge density per grid cell followed by
///                   {mean, stddev, centroid x, centroid y, text-cell ratio}.
///   Shape           log-scaled Hu moments of the dominant contour plus
///                   aspect ratio, extent and solidity.
/// Each type is computed on its own; one failing does not stop the others.
class FeatureExtractor {
 public:
  explicit FeatureExtractor(FeatureExtractorConfig config = {});

  [[nodiscard]] std::vector<boxscan::core::FeatureVector> extract(
      const boxscan::core::Image& image, std::size_t region_id) const;

  [[nodiscard]] std::expected<boxscan::core::FeatureVector, boxscan::core::ScanError>
  extract_type(const boxscan::core::Image& image, boxscan::core::FeatureType type,
               std::size_t region_id) const;

  [[nodiscard]] const FeatureExtractorConfig& config() const noexcept { return config_; }

 private:
  FeatureExtractorConfig config_;
};

}  // namespace boxscan::vision
