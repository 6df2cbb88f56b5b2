#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace boxscan::core {

/// Raw recognizer output for one region plus a quality score in [0, 1].
/// quality is computed locally from the text; service_confidence is whatever
/// the recognizer reported, when it reported anything.
struct ExtractedText {
  std::size_t region_id{0};
  std::string raw_text;
  float quality{0.f};
  std::optional<float> service_confidence;
  std::chrono::milliseconds duration{0};
  std::uint32_t attempts{0};
};

enum class RecoveryMethod : std::uint8_t {
  DictionaryCompletion,
  VisualCrossReference,
  None,
};

/// Reconstruction of damaged text. Only produced for damaged regions; when
/// present it replaces ExtractedText as matching input, and both are kept on
/// the RegionResult.
struct RecoveredText {
  std::size_t region_id{0};
  std::string text;
  RecoveryMethod method{RecoveryMethod::None};
  int confidence{0};  // 0-100
  bool low_quality{false};
  std::vector<std::string> alternatives;
};

[[nodiscard]] inline const char* to_string(RecoveryMethod method) noexcept {
  switch (method) {
    case RecoveryMethod::DictionaryCompletion:
      return "DICTIONARY_COMPLETION";
    case RecoveryMethod::VisualCrossReference:
      return "VISUAL_CROSS_REFERENCE";
    case RecoveryMethod::None:
      return "NONE";
  }
  return "NONE";
}

}  // namespace boxscan::core
