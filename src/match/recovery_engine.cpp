#include <boxscan/match/recovery_engine.hpp>
#include <boxscan/core/log.hpp>
#include <boxscan/core/match_candidate.hpp>
#include <boxscan/match/string_distance.hpp>
#include <boxscan/match/text_normalize.hpp>
#include <algorithm>
#include <cmath>
#include <limits>
#include <string>
#include <vector>

namespace boxscan::match {

namespace {

struct Completion {
  double ratio{std::numeric_limits<double>::max()};
  std::string display;  // name shown to the matcher (canonical or brand)
  std::string canonical;
  std::uint64_t usage{0};
};

bool better(const Completion& a, const Completion& b) {
  if (a.ratio != b.ratio) return a.ratio < b.ratio;
  if (a.usage != b.usage) return a.usage > b.usage;
  return a.display < b.display;
}

/// Smallest distance / key length over token windows around the key's size.
double best_ratio(const std::vector<std::string>& tokens, const std::string& key) {
  const std::size_t nk =
      static_cast<std::size_t>(std::count(key.begin(), key.end(), ' ')) + 1;
  const std::size_t min_size = nk > 1 ? nk - 1 : 1;
  const std::size_t max_size = std::min(tokens.size(), nk + 1);
  double best = std::numeric_limits<double>::max();
  for (std::size_t size = min_size; size <= max_size; ++size) {
    for (std::size_t start = 0; start + size <= tokens.size(); ++start) {
      const std::string window = join_tokens(tokens, start, size);
      const double d = static_cast<double>(levenshtein(window, key));
      best = std::min(best, d / static_cast<double>(key.size()));
    }
  }
  return best;
}

std::string display_name(const core::CatalogEntry& e, const std::string& key) {
  for (const auto& b : e.brand_aliases) {
    if (strip_dosage(b) == key) return b;
  }
  return e.canonical_name;
}

}  // namespace

RecoveryEngine::RecoveryEngine(std::shared_ptr<const core::ICatalogStore> catalog,
                               RecoveryConfig config)
    : catalog_(std::move(catalog)), config_(config) {}

bool RecoveryEngine::is_damaged(const core::ExtractedText& text,
                                core::BoxCondition condition) const noexcept {
  return text.quality < config_.damage_quality_threshold || core::is_damaged(condition);
}

core::RecoveredText RecoveryEngine::recover(
    const core::ExtractedText& text,
    std::span<const core::VisualMatch> visual_matches) const {
  core::RecoveredText out;
  out.region_id = text.region_id;
  out.text = text.raw_text;
  out.method = core::RecoveryMethod::None;
  out.low_quality = true;

  const std::string query = strip_dosage(text.raw_text);
  if (query.empty() || !catalog_) return out;
  const auto tokens = tokenize(query);
  const auto folded = tokenize(fold_ocr_confusions(query));

  std::vector<Completion> accepted;
  for (const auto& e : catalog_->list_all()) {
    Completion best_for_entry;
    for (const auto& key : e.search_keys) {
      if (key.size() < 3) continue;
      const double ratio = std::min(best_ratio(tokens, key), best_ratio(folded, key));
      if (ratio >= config_.max_distance_ratio) continue;
      Completion c{ratio, display_name(e, key), e.canonical_name, e.usage_count};
      if (better(c, best_for_entry)) best_for_entry = std::move(c);
    }
    if (!best_for_entry.display.empty()) accepted.push_back(std::move(best_for_entry));
  }

  if (accepted.empty()) {
    core::log_debug("recovery") << "region " << text.region_id << ": no completion for '"
                                << text.raw_text << "'";
    return out;
  }
  std::sort(accepted.begin(), accepted.end(), better);

  const Completion& top = accepted.front();
  out.text = top.display;
  out.method = core::RecoveryMethod::DictionaryCompletion;
  out.low_quality = false;
  out.confidence = std::min(config_.max_confidence,
                            static_cast<int>(std::lround((1.0 - top.ratio) * 100.0)));
  for (std::size_t i = 1; i < accepted.size() && out.alternatives.size() < config_.max_alternatives;
       ++i) {
    out.alternatives.push_back(accepted[i].display);
  }

  const std::string canonical = normalize_text(top.canonical);
  const bool confirmed = std::any_of(
      visual_matches.begin(), visual_matches.end(),
      [&canonical](const core::VisualMatch& v) { return normalize_text(v.drug_name) == canonical; });
  if (confirmed) {
    out.confidence = std::min(core::kMaxFuzzyConfidence, out.confidence + config_.visual_boost);
    out.method = core::RecoveryMethod::VisualCrossReference;
  }
  return out;
}

}  // namespace boxscan::match
