#pragma once

#ifdef BOXSCAN_HAS_TBB

#include <boxscan/app/scanner.hpp>
#include <boxscan/core/error.hpp>
#include <boxscan/core/image.hpp>
#include <boxscan/core/region_result.hpp>
#include <expected>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace boxscan::app {

/// Receives each finished scan with its session id. May be invoked from TBB
/// worker threads; must be thread-safe.
using ScanResultCallback = std::function<void(
    const std::string& session_id,
    const std::expected<core::MultiDrugResult, core::ScanError>& result)>;

/// Scans a batch of (session_id, image) work items in parallel using TBB.
///
/// Each work item gets its own ScanSession tagged with \p source; failures
/// (DetectionFailure) are passed to the callback like successes. The scanner
/// is shared by all tasks, so its recognizer and proposer must be thread-safe.
void process_batch_tbb(const Scanner& scanner,
                       const std::vector<std::pair<std::string, core::Image>>& work_items,
                       ScanResultCallback callback,
                       core::ImageSource source = core::ImageSource::File);

}  // namespace boxscan::app

#endif  // BOXSCAN_HAS_TBB
