#pragma once

#include <boxscan/vision/text_recognizer.hpp>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace boxscan::vision {

/// Recognizer scripted per region id (for tests/demo). Regions without a
/// script get the default text. Latency is simulated with an interruptible
/// wait so timeouts and cancellation behave like a real service.
class MockTextRecognizer : public ITextRecognizer {
 public:
  void set_text(std::size_t region_id, std::string text,
                std::optional<float> confidence = std::nullopt);
  void set_default_text(std::string text, std::optional<float> confidence = std::nullopt);

  /// Fail the next \p times calls for \p region_id with \p error (0 = always).
  void set_failure(std::size_t region_id, boxscan::core::ScanError error, int times = 0);

  void set_latency(std::size_t region_id, std::chrono::milliseconds latency);

  /// Called with the region id at the start of every recognize().
  void set_hook(std::function<void(std::size_t)> hook);

  [[nodiscard]] int call_count(std::size_t region_id) const;

  [[nodiscard]] std::expected<RecognizedText, boxscan::core::ScanError> recognize(
      const boxscan::core::Region& region, const RecognitionOptions& options) override;

 private:
  struct Script {
    std::optional<RecognizedText> reply;
    std::optional<boxscan::core::ScanError> failure;
    int failures_left{0};  // 0 with failure set: fail forever
    std::chrono::milliseconds latency{0};
    int calls{0};
  };

  mutable std::mutex mutex_;
  std::condition_variable_any wake_;
  std::map<std::size_t, Script> scripts_;
  RecognizedText default_reply_;
  std::function<void(std::size_t)> hook_;
};

}  // namespace boxscan::vision
