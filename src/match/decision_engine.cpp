#include <boxscan/match/decision_engine.hpp>
#include <boxscan/match/text_normalize.hpp>
#include <algorithm>

namespace boxscan::match {

namespace {

/// The strongest visual match names a different drug and none names ours.
bool visually_contradicted(const core::MatchCandidate& best,
                           std::span<const core::VisualMatch> visual_matches) {
  if (visual_matches.empty() || best.visual_confirmed) return false;
  const std::string name = normalize_text(best.drug_name);
  const bool any_agrees = std::any_of(
      visual_matches.begin(), visual_matches.end(),
      [&name](const core::VisualMatch& v) { return normalize_text(v.drug_name) == name; });
  return !any_agrees;
}

}  // namespace

DecisionEngine::DecisionEngine(DecisionConfig config) : config_(config) {}

Decision DecisionEngine::decide(std::vector<core::MatchCandidate> candidates,
                                std::span<const core::VisualMatch> visual_matches,
                                bool extraction_failed) const {
  Decision d;
  if (extraction_failed) {
    d.action = core::Rescan{core::ScanError::ExtractionFailure};
    return d;
  }

  std::erase_if(candidates, [](const core::MatchCandidate& c) {
    return c.type == core::MatchType::NoMatch || c.confidence <= 0;
  });
  if (candidates.empty()) {
    d.action = core::Rescan{core::ScanError::NoMatchFound};
    return d;
  }
  std::sort(candidates.begin(), candidates.end(), core::ranks_before);

  const core::MatchCandidate& best = candidates.front();
  const auto high_count = std::count_if(
      candidates.begin(), candidates.end(),
      [this](const core::MatchCandidate& c) { return c.confidence >= config_.high_threshold; });
  const bool close_competitor =
      candidates.size() > 1 &&
      best.confidence - candidates[1].confidence <= config_.tie_margin;

  if (best.confidence >= config_.high_threshold && high_count == 1 && !close_competitor &&
      !visually_contradicted(best, visual_matches)) {
    d.action = core::AutoSelect{};
  } else if (best.confidence >= config_.low_floor) {
    const auto options = std::count_if(
        candidates.begin(), candidates.end(),
        [this](const core::MatchCandidate& c) { return c.confidence >= config_.low_floor; });
    d.action = core::ShowOptions{
        std::min(static_cast<std::size_t>(options), config_.max_alternatives + 1)};
  } else {
    d.action = core::ManualEntry{best.drug_name};
  }

  const std::size_t n_alt = std::min(candidates.size() - 1, config_.max_alternatives);
  d.alternatives.assign(std::make_move_iterator(candidates.begin() + 1),
                        std::make_move_iterator(candidates.begin() + 1 +
                                                static_cast<std::ptrdiff_t>(n_alt)));
  d.best = std::move(candidates.front());
  return d;
}

}  // namespace boxscan::match
