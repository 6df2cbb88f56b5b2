#include <boxscan/core/match_candidate.hpp>
#include <algorithm>

namespace boxscan::core {

int MatchCandidate::algorithm_count() const noexcept {
  int n = 0;
  for (unsigned bits = agreeing_algorithms; bits != 0; bits &= bits - 1) ++n;
  return n;
}

MatchType classify_match(MatchAlgorithm algorithm, int confidence) noexcept {
  if (algorithm == MatchAlgorithm::Exact && confidence >= 100) return MatchType::Exact;
  if (confidence >= kHighBand) return MatchType::High;
  if (confidence >= kMediumBand) return MatchType::Medium;
  if (confidence > 0) return MatchType::Low;
  return MatchType::NoMatch;
}

void apply_banding(MatchCandidate& candidate) noexcept {
  const bool exact =
      candidate.algorithm == MatchAlgorithm::Exact && candidate.confidence >= 100;
  candidate.confidence =
      exact ? 100 : std::clamp(candidate.confidence, 0, kMaxFuzzyConfidence);
  candidate.type = classify_match(candidate.algorithm, candidate.confidence);
  candidate.multi_algorithm_confirmed = candidate.algorithm_count() >= 2;
}

bool ranks_before(const MatchCandidate& a, const MatchCandidate& b) noexcept {
  if (a.confidence != b.confidence) return a.confidence > b.confidence;
  if (a.multi_algorithm_confirmed != b.multi_algorithm_confirmed)
    return a.multi_algorithm_confirmed;
  if (a.visual_confirmed != b.visual_confirmed) return a.visual_confirmed;
  const bool a_exact = a.type == MatchType::Exact;
  const bool b_exact = b.type == MatchType::Exact;
  if (a_exact != b_exact) return a_exact;
  if (a.raw_confidence != b.raw_confidence) return a.raw_confidence > b.raw_confidence;
  if (a.usage_count != b.usage_count) return a.usage_count > b.usage_count;
  return a.entry_id < b.entry_id;
}

std::string_view to_string(MatchType type) noexcept {
  switch (type) {
    case MatchType::Exact:
      return "EXACT";
    case MatchType::High:
      return "HIGH";
    case MatchType::Medium:
      return "MEDIUM";
    case MatchType::Low:
      return "LOW";
    case MatchType::NoMatch:
      return "NO_MATCH";
  }
  return "NO_MATCH";
}

std::string_view to_string(MatchAlgorithm algorithm) noexcept {
  switch (algorithm) {
    case MatchAlgorithm::Exact:
      return "exact";
    case MatchAlgorithm::PrefixContainment:
      return "prefix";
    case MatchAlgorithm::EditDistance:
      return "edit-distance";
    case MatchAlgorithm::Phonetic:
      return "phonetic";
  }
  return "unknown";
}

}  // namespace boxscan::core
