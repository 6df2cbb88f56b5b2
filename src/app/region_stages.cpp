#include "region_stages.hpp"
#include <boxscan/core/log.hpp>
#include <boxscan/match/text_normalize.hpp>
#include <algorithm>
#include <vector>

namespace boxscan::app::detail {

namespace {

bool names_match(const core::MatchCandidate& c, const core::VisualMatch& v) {
  const std::string visual = match::normalize_text(v.drug_name);
  if (visual.empty()) return false;
  if (match::normalize_text(c.drug_name) == visual) return true;
  return c.brand_name && match::normalize_text(*c.brand_name) == visual;
}

/// Hits of the extracted text above the recovery cap stand uncapped; they
/// replace the capped hit for the same entry.
void keep_unrecovered_hits(std::vector<core::MatchCandidate>& capped,
                           std::vector<core::MatchCandidate> original, int cap) {
  for (auto& o : original) {
    if (o.confidence <= cap) continue;
    auto it = std::find_if(capped.begin(), capped.end(), [&o](const core::MatchCandidate& c) {
      return c.entry_id == o.entry_id;
    });
    if (it == capped.end()) {
      capped.push_back(std::move(o));
    } else if (o.confidence > it->confidence) {
      *it = std::move(o);
    }
  }
}

}  // namespace

ExtractionStage::ExtractionStage(std::shared_ptr<const vision::TextExtractor> extractor)
    : extractor_(std::move(extractor)) {}

std::expected<void, core::ScanError> ExtractionStage::process(core::RegionContext& ctx) {
  auto text = extractor_->extract(ctx.region, ctx.stop);
  if (!text) {
    if (text.error() == core::ScanError::Cancelled) {
      return std::unexpected(core::ScanError::Cancelled);
    }
    ctx.extraction_failed = true;
    ctx.result.errors.push_back(core::ScanError::ExtractionFailure);
    return {};
  }
  ctx.match_text = text->raw_text;
  ctx.result.extracted = std::move(*text);
  return {};
}

VisualStage::VisualStage(std::shared_ptr<const vision::FeatureExtractor> features,
                         std::shared_ptr<const index::IVisualCatalogStore> store, std::size_t k)
    : features_(std::move(features)), store_(std::move(store)), k_(k) {}

std::expected<void, core::ScanError> VisualStage::process(core::RegionContext& ctx) {
  ctx.result.features = features_->extract(ctx.region.image, ctx.region.id);
  if (!store_ || ctx.result.features.empty()) {
    return {};
  }
  auto matches = store_->nearest(ctx.result.features, k_);
  if (!matches) {
    core::log_warn("visual") << "region " << ctx.region.id << ": visual catalog unavailable ("
                             << core::to_string(matches.error()) << ")";
    ctx.result.visual_gap = true;
    ctx.result.errors.push_back(core::ScanError::IndexUnavailable);
    return {};
  }
  ctx.result.visual_matches = std::move(*matches);
  ctx.result.visual_match = !ctx.result.visual_matches.empty();
  return {};
}

RecoveryStage::RecoveryStage(std::shared_ptr<const match::RecoveryEngine> engine)
    : engine_(std::move(engine)) {}

std::expected<void, core::ScanError> RecoveryStage::process(core::RegionContext& ctx) {
  if (ctx.extraction_failed || !ctx.result.extracted) {
    return {};
  }
  if (!engine_->is_damaged(*ctx.result.extracted, ctx.region.condition)) {
    return {};
  }
  core::RecoveredText recovered = engine_->recover(*ctx.result.extracted,
                                                   ctx.result.visual_matches);
  if (recovered.method == core::RecoveryMethod::None) {
    ctx.result.errors.push_back(core::ScanError::RecoveryFailure);
  } else {
    ctx.match_text = recovered.text;
    ctx.confidence_cap = recovered.confidence;
  }
  ctx.result.recovered = std::move(recovered);
  return {};
}

MatchStage::MatchStage(std::shared_ptr<const match::MatchEngine> engine)
    : engine_(std::move(engine)) {}

std::expected<void, core::ScanError> MatchStage::process(core::RegionContext& ctx) {
  if (ctx.extraction_failed) {
    return {};
  }
  auto candidates = engine_->match(ctx.match_text, ctx.region.id);
  if (ctx.confidence_cap) {
    for (auto& c : candidates) {
      c.confidence = std::min(c.confidence, *ctx.confidence_cap);
    }
    if (ctx.result.extracted) {
      keep_unrecovered_hits(candidates,
                            engine_->match(ctx.result.extracted->raw_text, ctx.region.id),
                            *ctx.confidence_cap);
    }
  }
  for (auto& c : candidates) {
    c.visual_confirmed = std::any_of(
        ctx.result.visual_matches.begin(), ctx.result.visual_matches.end(),
        [&c](const core::VisualMatch& v) { return names_match(c, v); });
    core::apply_banding(c);
  }
  std::erase_if(candidates, [](const core::MatchCandidate& c) {
    return c.type == core::MatchType::NoMatch;
  });
  std::sort(candidates.begin(), candidates.end(), core::ranks_before);
  ctx.candidates = std::move(candidates);
  return {};
}

DecisionStage::DecisionStage(match::DecisionEngine engine) : engine_(engine) {}

std::expected<void, core::ScanError> DecisionStage::process(core::RegionContext& ctx) {
  auto decision = engine_.decide(ctx.candidates, ctx.result.visual_matches,
                                 ctx.extraction_failed);
  ctx.result.best = std::move(decision.best);
  ctx.result.alternatives = std::move(decision.alternatives);
  ctx.result.action = std::move(decision.action);
  core::log_debug("decision") << "region " << ctx.region.id << ": "
                              << core::action_name(ctx.result.action) << " "
                              << ctx.result.confidence();
  return {};
}

}  // namespace boxscan::app::detail
