#include <boxscan/app/scanner_tbb.hpp>

#ifdef BOXSCAN_HAS_TBB

#include <boxscan/core/session.hpp>
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <cstddef>

namespace boxscan::app {

void process_batch_tbb(const Scanner& scanner,
                       const std::vector<std::pair<std::string, core::Image>>& work_items,
                       ScanResultCallback callback, core::ImageSource source) {
  if (work_items.empty() || !callback) return;

  const std::size_t n = work_items.size();
  tbb::parallel_for(
      tbb::blocked_range<std::size_t>(0, n),
      [&scanner, &work_items, &callback, source](const tbb::blocked_range<std::size_t>& range) {
        for (std::size_t i = range.begin(); i != range.end(); ++i) {
          const std::string& session_id = work_items[i].first;
          core::ScanSession session(session_id, source);
          const auto result = scanner.process(work_items[i].second, session);
          callback(session_id, result);
        }
      });
}

}  // namespace boxscan::app

#endif  // BOXSCAN_HAS_TBB
