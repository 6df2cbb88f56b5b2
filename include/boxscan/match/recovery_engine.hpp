#pragma once

#include <boxscan/core/catalog.hpp>
#include <boxscan/core/region.hpp>
#include <boxscan/core/text.hpp>
#include <boxscan/core/visual_match.hpp>
#include <cstddef>
#include <memory>
#include <span>

namespace boxscan::match {

struct RecoveryConfig {
  float damage_quality_threshold{0.5f};
  double max_distance_ratio{0.34};  // strict upper bound on distance / key length
  int max_confidence{95};
  int visual_boost{10};
  std::size_t max_alternatives{3};
};

/// Reconstructs text read from damaged boxes.
///
/// Dictionary completion compares token windows of the text (as read and with
/// OCR confusions folded) against every catalog search key and accepts the
/// closest key whose distance-to-length ratio is below max_distance_ratio.
/// A visual match naming the same drug raises the confidence and retags the
/// result as VisualCrossReference. When nothing is accepted the original text
/// is returned with method None and low_quality set.
class RecoveryEngine {
 public:
  RecoveryEngine(std::shared_ptr<const core::ICatalogStore> catalog, RecoveryConfig config);

  /// Low quality score or a Damaged / SeverelyDamaged box.
  [[nodiscard]] bool is_damaged(const core::ExtractedText& text,
                                core::BoxCondition condition) const noexcept;

  [[nodiscard]] core::RecoveredText recover(
      const core::ExtractedText& text,
      std::span<const core::VisualMatch> visual_matches) const;

  [[nodiscard]] const RecoveryConfig& config() const noexcept { return config_; }

 private:
  std::shared_ptr<const core::ICatalogStore> catalog_;
  RecoveryConfig config_;
};

}  // namespace boxscan::match
