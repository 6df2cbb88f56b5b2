#pragma once

#include <boxscan/core/catalog.hpp>
#include <boxscan/core/match_candidate.hpp>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace boxscan::match {

/// Thresholds are percentages. Category names are normalized (lowercase).
struct MatchConfig {
  std::map<std::string, int, std::less<>> category_thresholds{
      {"antibiotic", 85},
      {"analgesic", 75},
      {"diabetes", 90},
      {"hypertension", 85},
      {"cholesterol", 80},
  };
  int default_threshold{80};
  int containment_floor{50};
  int phonetic_floor{50};
  double phonetic_factor{0.85};
  int phonetic_cap{85};

  /// Edit-distance threshold for \p category, clamped to [10, 100].
  [[nodiscard]] int threshold_for(std::string_view category) const;
};

/// Multi-algorithm fuzzy matcher over a catalog. Exact, prefix/containment,
/// edit-distance and phonetic matching run independently; their hits are
/// merged per catalog entry (highest confidence wins, agreement is recorded).
/// Stateless apart from the catalog reference; match() is const and may run
/// concurrently.
class MatchEngine {
 public:
  MatchEngine(std::shared_ptr<const core::ICatalogStore> catalog, MatchConfig config);

  /// Ranked candidates (best first) for \p text, all tagged with \p region_id.
  /// Candidates never have type NoMatch.
  [[nodiscard]] std::vector<core::MatchCandidate> match(std::string_view text,
                                                        std::size_t region_id) const;

  [[nodiscard]] const MatchConfig& config() const noexcept { return config_; }

 private:
  std::shared_ptr<const core::ICatalogStore> catalog_;
  MatchConfig config_;
};

}  // namespace boxscan::match
