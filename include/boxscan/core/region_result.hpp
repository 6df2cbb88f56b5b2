#pragma once

#include <boxscan/core/error.hpp>
#include <boxscan/core/feature_vector.hpp>
#include <boxscan/core/image.hpp>
#include <boxscan/core/match_candidate.hpp>
#include <boxscan/core/text.hpp>
#include <boxscan/core/visual_match.hpp>
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace boxscan::core {

/// Recommended next step for one region (closed set).
struct AutoSelect {};
struct ShowOptions {
  std::size_t option_count{0};
};
struct ManualEntry {
  std::string suggestion;
};
struct Rescan {
  ScanError reason{ScanError::NoMatchFound};
};

using RecommendedAction = std::variant<AutoSelect, ShowOptions, ManualEntry, Rescan>;

[[nodiscard]] std::string_view action_name(const RecommendedAction& action) noexcept;

/// Terminal output for one region. Every candidate it holds carries the same
/// region_id as the result itself.
struct RegionResult {
  std::size_t region_id{0};
  BBox bbox{};
  float detection_confidence{0.f};
  std::optional<MatchCandidate> best;
  std::vector<MatchCandidate> alternatives;  // ranked, best excluded
  RecommendedAction action{Rescan{}};
  bool visual_match{false};
  bool visual_gap{false};  // visual catalog was unavailable for this region

  std::optional<ExtractedText> extracted;
  std::optional<RecoveredText> recovered;
  std::vector<FeatureVector> features;
  std::vector<VisualMatch> visual_matches;
  std::vector<ScanError> errors;
  std::optional<std::size_t> duplicate_of;  // kept region with the same drug

  [[nodiscard]] int confidence() const noexcept { return best ? best->confidence : 0; }
  [[nodiscard]] bool has_error(ScanError e) const noexcept;
};

enum class ImageSource : std::uint8_t {
  Camera,
  Gallery,
  File,
  Synthetic,
};

/// Overall usability of the photograph.
enum class FrameQuality : std::uint8_t {
  Excellent,
  Good,
  Acceptable,
  Poor,
  NoDetection,
  TooManyObjects,
};

struct DuplicateRecord {
  std::size_t kept_region_id{0};
  std::size_t duplicate_region_id{0};
  std::string drug_name;
};

struct ScanStatistics {
  std::size_t region_count{0};
  std::size_t cancelled_regions{0};
  std::size_t auto_selected{0};
  std::size_t show_options{0};
  std::size_t manual_entry{0};
  std::size_t rescan{0};
  std::size_t recovered{0};
  std::size_t visual_matches{0};
  std::size_t failed_extractions{0};
};

/// Everything found in one photograph. Immutable once returned.
struct MultiDrugResult {
  std::string session_id;
  std::vector<RegionResult> regions;     // region order, duplicates included
  std::vector<std::size_t> detections;   // region ids of deduplicated drugs
  std::vector<DuplicateRecord> duplicates;
  std::vector<std::string> drug_names;   // deduplicated, region order
  double aggregate_confidence{0.0};
  FrameQuality frame_quality{FrameQuality::NoDetection};
  ScanStatistics statistics;
  std::chrono::milliseconds duration{0};
  ImageSource source{ImageSource::Camera};

  [[nodiscard]] const RegionResult* find_region(std::size_t region_id) const noexcept;
};

[[nodiscard]] std::string_view to_string(FrameQuality quality) noexcept;
[[nodiscard]] std::string_view to_string(ImageSource source) noexcept;

}  // namespace boxscan::core
