#pragma once

#include <boxscan/core/error.hpp>
#include <boxscan/core/feature_vector.hpp>
#include <boxscan/core/visual_match.hpp>
#include <cstddef>
#include <expected>
#include <span>
#include <vector>

namespace boxscan::index {

struct OptimizeReport {
  std::size_t duplicates_removed{0};
  std::size_t vectors_updated{0};
};

/// Store of reference box images described by feature vectors.
/// nearest() is called concurrently by scans; optimize() runs exclusively.
/// Any store failure is reported as ScanError::IndexUnavailable.
class IVisualCatalogStore {
 public:
  virtual ~IVisualCatalogStore() = default;

  /// Up to \p k stored images most similar to \p features, best first.
  [[nodiscard]] virtual std::expected<std::vector<core::VisualMatch>, core::ScanError> nearest(
      std::span<const core::FeatureVector> features, std::size_t k) const = 0;

  /// Merge staged additions and drop near-duplicates.
  [[nodiscard]] virtual std::expected<OptimizeReport, core::ScanError> optimize() = 0;
};

}  // namespace boxscan::index
