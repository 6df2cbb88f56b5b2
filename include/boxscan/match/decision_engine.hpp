#pragma once

#include <boxscan/core/match_candidate.hpp>
#include <boxscan/core/region_result.hpp>
#include <boxscan/core/visual_match.hpp>
#include <cstddef>
#include <optional>
#include <span>
#include <vector>

namespace boxscan::match {

struct DecisionConfig {
  int high_threshold{core::kHighBand};
  int low_floor{core::kMediumBand};
  int tie_margin{3};
  std::size_t max_alternatives{5};
};

struct Decision {
  std::optional<core::MatchCandidate> best;
  std::vector<core::MatchCandidate> alternatives;
  core::RecommendedAction action{core::Rescan{}};
};

/// Turns one region's candidates into a recommended action:
///   AutoSelect   exactly one candidate >= high_threshold, nothing within
///                tie_margin of it, no visual match naming another drug;
///   ShowOptions  best >= low_floor otherwise;
///   ManualEntry  best below low_floor;
///   Rescan       no candidates, or extraction failed.
/// Stateless; one call per region.
class DecisionEngine {
 public:
  explicit DecisionEngine(DecisionConfig config = {});

  [[nodiscard]] Decision decide(std::vector<core::MatchCandidate> candidates,
                                std::span<const core::VisualMatch> visual_matches,
                                bool extraction_failed) const;

  [[nodiscard]] const DecisionConfig& config() const noexcept { return config_; }

 private:
  DecisionConfig config_;
};

}  // namespace boxscan::match
