#include <boxscan/match/result_aggregator.hpp>
#include <algorithm>
#include <map>
#include <variant>

namespace boxscan::match {

core::FrameQuality ResultAggregator::frame_quality(
    const std::vector<core::RegionResult>& regions) noexcept {
  if (regions.empty()) return core::FrameQuality::NoDetection;
  if (regions.size() > kTooManyObjects) return core::FrameQuality::TooManyObjects;

  double sum = 0.0;
  for (const auto& r : regions) sum += r.detection_confidence;
  const double mean = sum / static_cast<double>(regions.size());
  if (mean > 0.8) return core::FrameQuality::Excellent;
  if (mean > 0.6) return core::FrameQuality::Good;
  if (mean > 0.4) return core::FrameQuality::Acceptable;
  return core::FrameQuality::Poor;
}

core::MultiDrugResult ResultAggregator::aggregate(std::vector<core::RegionResult> regions,
                                                  const AggregationInput& input) const {
  std::sort(regions.begin(), regions.end(),
            [](const core::RegionResult& a, const core::RegionResult& b) {
              return a.region_id < b.region_id;
            });

  core::MultiDrugResult out;
  out.session_id = input.session_id;
  out.source = input.source;
  out.frame_quality = frame_quality(regions);

  // entry id -> index of the highest-confidence region naming it
  std::map<std::uint64_t, std::size_t> winner;
  for (std::size_t i = 0; i < regions.size(); ++i) {
    const auto& r = regions[i];
    if (!r.best) continue;
    auto [it, inserted] = winner.try_emplace(r.best->entry_id, i);
    if (!inserted && r.confidence() > regions[it->second].confidence()) {
      it->second = i;
    }
  }
  for (std::size_t i = 0; i < regions.size(); ++i) {
    auto& r = regions[i];
    if (!r.best) continue;
    const auto& kept = regions[winner.at(r.best->entry_id)];
    if (&kept == &r) continue;
    r.duplicate_of = kept.region_id;
    out.duplicates.push_back({kept.region_id, r.region_id, r.best->drug_name});
  }

  auto& stats = out.statistics;
  stats.region_count = regions.size();
  stats.cancelled_regions = input.cancelled_regions;
  double sum = 0.0;
  for (const auto& r : regions) {
    if (std::holds_alternative<core::AutoSelect>(r.action)) ++stats.auto_selected;
    else if (std::holds_alternative<core::ShowOptions>(r.action)) ++stats.show_options;
    else if (std::holds_alternative<core::ManualEntry>(r.action)) ++stats.manual_entry;
    else ++stats.rescan;
    if (r.recovered && r.recovered->method != core::RecoveryMethod::None) ++stats.recovered;
    if (r.visual_match) ++stats.visual_matches;
    if (r.has_error(core::ScanError::ExtractionFailure)) ++stats.failed_extractions;

    if (r.best && !r.duplicate_of) {
      out.detections.push_back(r.region_id);
      out.drug_names.push_back(r.best->drug_name);
      sum += r.confidence();
    }
  }
  if (!out.detections.empty()) {
    out.aggregate_confidence = sum / static_cast<double>(out.detections.size());
  }

  out.regions = std::move(regions);
  out.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - input.started);
  return out;
}

}  // namespace boxscan::match
