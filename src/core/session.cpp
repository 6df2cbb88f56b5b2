#include <boxscan/core/session.hpp>

namespace boxscan::core {

ScanSession::ScanSession(std::string id, ImageSource source)
    : id_(std::move(id)), source_(source) {}

std::stop_token ScanSession::begin_scan() {
  std::lock_guard lock(mutex_);
  stop_ = std::stop_source();
  ++scans_;
  return stop_.get_token();
}

void ScanSession::request_rescan() {
  std::lock_guard lock(mutex_);
  stop_.request_stop();
}

bool ScanSession::rescan_requested() const {
  std::lock_guard lock(mutex_);
  return stop_.stop_requested();
}

void ScanSession::record(const MultiDrugResult& result) {
  std::lock_guard lock(mutex_);
  last_ = result;
}

std::optional<MultiDrugResult> ScanSession::last_result() const {
  std::lock_guard lock(mutex_);
  return last_;
}

std::size_t ScanSession::scan_count() const {
  std::lock_guard lock(mutex_);
  return scans_;
}

}  // namespace boxscan::core
