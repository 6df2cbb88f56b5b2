#include <boxscan/match/match_engine.hpp>
#include <boxscan/match/string_distance.hpp>
#include <boxscan/match/text_normalize.hpp>
#include <algorithm>
#include <cmath>
#include <optional>

namespace boxscan::match {

namespace {

constexpr std::size_t kMinKeyLength = 3;

struct Key {
  std::string text;
  std::optional<std::string> brand;
};

std::vector<Key> keys_of(const core::CatalogEntry& e) {
  std::vector<Key> keys;
  auto push = [&keys](std::string text, std::optional<std::string> brand) {
    if (text.empty()) return;
    for (const auto& k : keys) {
      if (k.text == text) return;
    }
    keys.push_back({std::move(text), std::move(brand)});
  };
  push(strip_dosage(e.canonical_name), std::nullopt);
  push(strip_dosage(e.generic_name), std::nullopt);
  for (const auto& b : e.brand_aliases) push(strip_dosage(b), b);
  for (const auto& k : e.search_keys) push(k, std::nullopt);
  return keys;
}

std::optional<std::string> brand_for(const core::CatalogEntry& e, std::string_view key) {
  for (const auto& k : keys_of(e)) {
    if (k.text == key) return k.brand;
  }
  return std::nullopt;
}

std::size_t token_count(std::string_view s) {
  return static_cast<std::size_t>(std::count(s.begin(), s.end(), ' ')) + 1;
}

/// Best similarity of \p key against windows of \p tokens with roughly the
/// key's token count. \p accept filters windows (e.g. phonetic equality).
template <class Accept>
double best_window(const std::vector<std::string>& tokens, const std::string& key,
                   Accept&& accept) {
  const std::size_t nk = token_count(key);
  const std::size_t min_size = nk > 1 ? nk - 1 : 1;
  const std::size_t max_size = std::min(tokens.size(), nk + 1);
  double best = 0.0;
  for (std::size_t size = min_size; size <= max_size; ++size) {
    for (std::size_t start = 0; start + size <= tokens.size(); ++start) {
      const std::string window = join_tokens(tokens, start, size);
      if (!accept(window)) continue;
      best = std::max(best, similarity_percent(window, key));
    }
  }
  return best;
}

bool contains_tokens(const std::string& haystack, const std::string& needle) {
  const std::string h = " " + haystack + " ";
  return h.find(" " + needle + " ") != std::string::npos;
}

int containment_confidence(const std::string& query,
                           const std::vector<std::string>& tokens,
                           const std::string& key) {
  std::size_t matched = 0;
  if (contains_tokens(query, key)) {
    matched = key.size();
  } else if (query.size() >= kMinKeyLength && key.starts_with(query)) {
    matched = query.size();
  } else {
    for (const auto& t : tokens) {
      if (t.size() >= kMinKeyLength && key.starts_with(t)) {
        matched = std::max(matched, t.size());
      }
    }
  }
  if (matched == 0) return 0;
  const double ratio = (static_cast<double>(matched) / static_cast<double>(key.size()) +
                        static_cast<double>(matched) / static_cast<double>(query.size())) /
                       2.0;
  return static_cast<int>(std::lround(95.0 * ratio));
}

class Merger {
 public:
  explicit Merger(std::size_t region_id) : region_id_(region_id) {}

  void add(const core::CatalogEntry& e, core::MatchAlgorithm algorithm, int confidence,
           int raw_confidence, const std::optional<std::string>& brand) {
    auto [it, inserted] = merged_.try_emplace(e.id);
    core::MatchCandidate& c = it->second;
    if (inserted) {
      c.region_id = region_id_;
      c.entry_id = e.id;
      c.drug_name = e.canonical_name;
      c.category = e.category;
      c.usage_count = e.usage_count;
    }
    c.add_algorithm(algorithm);
    if (inserted || confidence > c.confidence ||
        (confidence == c.confidence && raw_confidence > c.raw_confidence)) {
      c.confidence = confidence;
      c.raw_confidence = raw_confidence;
      c.algorithm = algorithm;
      c.is_generic_match = brand.has_value();
      c.brand_name = brand;
    }
  }

  std::vector<core::MatchCandidate> finish() && {
    std::vector<core::MatchCandidate> out;
    out.reserve(merged_.size());
    for (auto& [id, c] : merged_) {
      core::apply_banding(c);
      if (c.type != core::MatchType::NoMatch) out.push_back(std::move(c));
    }
    std::sort(out.begin(), out.end(), core::ranks_before);
    return out;
  }

 private:
  std::size_t region_id_;
  std::map<std::uint64_t, core::MatchCandidate> merged_;
};

}  // namespace

int MatchConfig::threshold_for(std::string_view category) const {
  const auto it = category_thresholds.find(category);
  const int t = it != category_thresholds.end() ? it->second : default_threshold;
  return std::clamp(t, 10, 100);
}

MatchEngine::MatchEngine(std::shared_ptr<const core::ICatalogStore> catalog,
                         MatchConfig config)
    : catalog_(std::move(catalog)), config_(std::move(config)) {}

std::vector<core::MatchCandidate> MatchEngine::match(std::string_view text,
                                                     std::size_t region_id) const {
  const std::string query = strip_dosage(text);
  if (query.empty() || !catalog_) return {};

  const std::string full = normalize_text(text);
  const auto tokens = tokenize(query);
  const auto folded_tokens = tokenize(fold_ocr_confusions(query));

  Merger merger(region_id);

  for (const std::string& key : {query, full}) {
    for (const auto& e : catalog_->lookup_by_key(key)) {
      merger.add(e, core::MatchAlgorithm::Exact, 100, 100, brand_for(e, key));
    }
  }

  for (const auto& category : catalog_->categories()) {
    const int threshold = config_.threshold_for(category);
    for (const auto& e : catalog_->list_by_category(category)) {
      for (const auto& key : keys_of(e)) {
        if (key.text.size() < kMinKeyLength || key.text == query || key.text == full) {
          continue;
        }

        const int contained = containment_confidence(query, tokens, key.text);
        if (contained >= config_.containment_floor) {
          merger.add(e, core::MatchAlgorithm::PrefixContainment, contained, contained,
                     key.brand);
        }

        const double sim = best_window(tokens, key.text, [](const std::string&) { return true; });
        const int edit = std::min(core::kMaxFuzzyConfidence, static_cast<int>(std::lround(sim)));
        if (edit >= threshold) {
          merger.add(e, core::MatchAlgorithm::EditDistance, edit,
                     static_cast<int>(std::lround(sim)), key.brand);
        }

        const std::string folded_key = fold_ocr_confusions(key.text);
        const std::string sound = phonetic_key(folded_key);
        if (sound.empty()) continue;
        const double folded_sim = best_window(
            folded_tokens, folded_key,
            [&sound](const std::string& w) { return phonetic_key(w) == sound; });
        const int phonetic = std::min(
            config_.phonetic_cap,
            static_cast<int>(std::lround(config_.phonetic_factor * folded_sim)));
        if (folded_sim > 0.0 && phonetic >= config_.phonetic_floor) {
          merger.add(e, core::MatchAlgorithm::Phonetic, phonetic,
                     static_cast<int>(std::lround(folded_sim)), key.brand);
        }
      }
    }
  }

  return std::move(merger).finish();
}

}  // namespace boxscan::match
