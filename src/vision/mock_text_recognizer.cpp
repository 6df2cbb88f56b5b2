#include <boxscan/vision/mock_text_recognizer.hpp>
#include <algorithm>

namespace boxscan::vision {

namespace nc = boxscan::core;

void MockTextRecognizer::set_text(std::size_t region_id, std::string text,
                                  std::optional<float> confidence) {
  std::lock_guard lock(mutex_);
  scripts_[region_id].reply = RecognizedText{std::move(text), confidence};
}

void MockTextRecognizer::set_default_text(std::string text, std::optional<float> confidence) {
  std::lock_guard lock(mutex_);
  default_reply_ = RecognizedText{std::move(text), confidence};
}

void MockTextRecognizer::set_failure(std::size_t region_id, nc::ScanError error, int times) {
  std::lock_guard lock(mutex_);
  auto& s = scripts_[region_id];
  s.failure = error;
  s.failures_left = times;
}

void MockTextRecognizer::set_latency(std::size_t region_id, std::chrono::milliseconds latency) {
  std::lock_guard lock(mutex_);
  scripts_[region_id].latency = latency;
}

void MockTextRecognizer::set_hook(std::function<void(std::size_t)> hook) {
  std::lock_guard lock(mutex_);
  hook_ = std::move(hook);
}

int MockTextRecognizer::call_count(std::size_t region_id) const {
  std::lock_guard lock(mutex_);
  auto it = scripts_.find(region_id);
  return it == scripts_.end() ? 0 : it->second.calls;
}

std::expected<RecognizedText, nc::ScanError> MockTextRecognizer::recognize(
    const nc::Region& region, const RecognitionOptions& options) {
  std::function<void(std::size_t)> hook;
  {
    std::lock_guard lock(mutex_);
    hook = hook_;
  }
  if (hook) {
    hook(region.id);
  }

  std::unique_lock lock(mutex_);
  auto& s = scripts_[region.id];
  ++s.calls;

  if (s.latency.count() > 0) {
    const auto wait_for = std::min(s.latency, options.timeout);
    std::stop_token stop = options.stop;
    // Nothing notifies wake_; only a stop request ends the wait early.
    static_cast<void>(wake_.wait_for(lock, stop, wait_for, [] { return false; }));
    if (stop.stop_requested()) {
      return std::unexpected(nc::ScanError::Cancelled);
    }
    if (s.latency > options.timeout) {
      return std::unexpected(nc::ScanError::Timeout);
    }
  } else if (options.stop.stop_requested()) {
    return std::unexpected(nc::ScanError::Cancelled);
  }

  if (s.failure) {
    const nc::ScanError error = *s.failure;
    if (s.failures_left > 0 && --s.failures_left == 0) {
      s.failure.reset();
    }
    return std::unexpected(error);
  }
  return s.reply ? *s.reply : default_reply_;
}

}  // namespace boxscan::vision
