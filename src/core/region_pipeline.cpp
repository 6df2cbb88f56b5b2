#include <boxscan/core/region_pipeline.hpp>
#include <boxscan/core/log.hpp>
#include <chrono>

namespace boxscan::core {

void RegionPipeline::add_stage(std::unique_ptr<IRegionStage> stage) {
  if (stage) {
    stages_.push_back(std::move(stage));
  }
}

std::expected<RegionResult, ScanError> RegionPipeline::run(
    const Region& region,
    std::stop_token stop,
    StageTimingCallback* timing_cb) const {
  if (stages_.empty()) {
    return std::unexpected(ScanError::InvalidConfig);
  }

  RegionContext ctx{region, stop, RegionResult{}, {}, std::nullopt, false, {}};
  ctx.result.region_id = region.id;
  ctx.result.bbox = region.bbox;
  ctx.result.detection_confidence = region.detection_confidence;

  for (std::size_t i = 0; i < stages_.size(); ++i) {
    if (stop.stop_requested()) {
      return std::unexpected(ScanError::Cancelled);
    }

    const auto stage_start = std::chrono::steady_clock::now();
    auto status = stages_[i]->process(ctx);
    if (timing_cb && *timing_cb) {
      const auto stage_end = std::chrono::steady_clock::now();
      const double ms = 1e-6 * static_cast<double>(
          std::chrono::duration_cast<std::chrono::nanoseconds>(stage_end - stage_start).count());
      (*timing_cb)(i, ms);
    }

    if (!status) {
      if (status.error() == ScanError::Cancelled) {
        return std::unexpected(ScanError::Cancelled);
      }
      core::log_warn("pipeline") << "region " << region.id << " stage " << stages_[i]->name()
                                 << " failed: " << to_string(status.error());
      ctx.result.errors.push_back(status.error());
    }
  }

  // A region that finishes after a rescan request is dropped as well.
  if (stop.stop_requested()) {
    return std::unexpected(ScanError::Cancelled);
  }
  return std::move(ctx.result);
}

}  // namespace boxscan::core
