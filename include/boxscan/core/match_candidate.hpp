#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace boxscan::core {

enum class MatchAlgorithm : std::uint8_t {
  Exact,
  PrefixContainment,
  EditDistance,
  Phonetic,
};

/// Confidence tier. Exact => 100, High => [80, 99], Medium => [60, 79],
/// Low => [1, 59], NoMatch => 0.
enum class MatchType : std::uint8_t {
  Exact,
  High,
  Medium,
  Low,
  NoMatch,
};

inline constexpr int kHighBand = 80;
inline constexpr int kMediumBand = 60;
inline constexpr int kMaxFuzzyConfidence = 99;

/// Scored hypothesis linking one region's text to one catalog entry.
struct MatchCandidate {
  std::size_t region_id{0};
  std::uint64_t entry_id{0};
  std::string drug_name;  // canonical name of the entry
  std::string category;
  int confidence{0};      // 0-100, after caps and boosts
  int raw_confidence{0};  // as reported by the winning algorithm
  MatchAlgorithm algorithm{MatchAlgorithm::EditDistance};
  std::uint8_t agreeing_algorithms{0};  // bit per MatchAlgorithm
  MatchType type{MatchType::NoMatch};
  bool is_generic_match{false};         // resolved through a brand alias
  std::optional<std::string> brand_name;
  bool multi_algorithm_confirmed{false};
  bool visual_confirmed{false};
  std::uint64_t usage_count{0};

  void add_algorithm(MatchAlgorithm a) noexcept {
    agreeing_algorithms |= static_cast<std::uint8_t>(1u << static_cast<unsigned>(a));
  }
  [[nodiscard]] bool has_algorithm(MatchAlgorithm a) const noexcept {
    return (agreeing_algorithms >> static_cast<unsigned>(a)) & 1u;
  }
  [[nodiscard]] int algorithm_count() const noexcept;
};

/// Tier for a confidence. Only an exact-algorithm hit at 100 is Exact.
[[nodiscard]] MatchType classify_match(MatchAlgorithm algorithm, int confidence) noexcept;

/// Clamp confidence (non-exact hits are capped at 99) and set the tier.
void apply_banding(MatchCandidate& candidate) noexcept;

/// Strict ranking: confidence, then multi-algorithm, visual, exact, raw
/// confidence, catalog usage, and finally entry id.
[[nodiscard]] bool ranks_before(const MatchCandidate& a, const MatchCandidate& b) noexcept;

[[nodiscard]] std::string_view to_string(MatchType type) noexcept;
[[nodiscard]] std::string_view to_string(MatchAlgorithm algorithm) noexcept;

}  // namespace boxscan::core
