#include <boxscan/app/config.hpp>
#include <boxscan/match/text_normalize.hpp>
#include <charconv>
#include <chrono>
#include <fstream>
#include <string_view>

namespace boxscan::app {

namespace {

constexpr std::string_view kCategoryPrefix = "category_threshold.";
constexpr std::string_view kWeightPrefix = "feature_weight.";

void trim(std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    s.clear();
    return;
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  s = s.substr(start, end == std::string::npos ? std::string::npos : end - start + 1);
}

bool parse_line(std::string_view line, std::string& key, std::string& value) {
  const auto pos = line.find('=');
  if (pos == std::string_view::npos) return false;
  key.assign(line.substr(0, pos));
  value.assign(line.substr(pos + 1));
  trim(key);
  trim(value);
  return !key.empty();
}

/// Parse the whole of \p value into \p out; on failure \p out is untouched.
template <typename T>
bool parse_number(const std::string& value, T& out) {
  T parsed{};
  const char* end = value.data() + value.size();
  const auto [ptr, ec] = std::from_chars(value.data(), end, parsed);
  if (ec != std::errc{} || ptr != end) {
    core::log_warn("config") << "ignoring malformed number '" << value << "'";
    return false;
  }
  out = parsed;
  return true;
}

void parse_millis(const std::string& value, std::chrono::milliseconds& out) {
  long long ms = 0;
  if (parse_number(value, ms) && ms >= 0) out = std::chrono::milliseconds(ms);
}

void parse_weight(std::string_view type_name, const std::string& value,
                  index::FeatureWeights& weights) {
  auto type = core::feature_type_from_string(type_name);
  if (!type) {
    core::log_warn("config") << "unknown feature type '" << type_name << "'";
    return;
  }
  float w = 0.f;
  if (!parse_number(value, w) || w < 0.f) return;
  switch (*type) {
    case core::FeatureType::ColorHistogram:
      weights.color = w;
      break;
    case core::FeatureType::Edge:
      weights.edge = w;
      break;
    case core::FeatureType::TextLayout:
      weights.layout = w;
      break;
    case core::FeatureType::Shape:
      weights.shape = w;
      break;
  }
}

}  // namespace

ScanConfig default_config() {
  ScanConfig c;
  c.proposer_type = ProposerType::Contour;
  c.recognizer_type = RecognizerType::Mock;
  c.worker_count = 0;
  c.log_level = core::LogLevel::Warn;
  return c;
}

ScanConfig load_config(const std::string& path) {
  ScanConfig c = default_config();
  std::ifstream f(path);
  if (!f) {
    core::log_warn("config") << "cannot open " << path << ", using defaults";
    return c;
  }

  std::string line;
  std::string key;
  std::string value;
  while (std::getline(f, line)) {
    trim(line);
    if (line.empty() || line[0] == '#') continue;
    if (!parse_line(line, key, value)) continue;

    if (key == "model_path") c.model_path = value;
    else if (key == "proposer") {
      if (value == "mock") c.proposer_type = ProposerType::Mock;
      else if (value == "contour") c.proposer_type = ProposerType::Contour;
      else if (value == "onnx") c.proposer_type = ProposerType::Onnx;
    }
    else if (key == "recognizer") {
      if (value == "mock") c.recognizer_type = RecognizerType::Mock;
      else if (value == "tesseract") c.recognizer_type = RecognizerType::Tesseract;
    }
    else if (key == "proposal_score_threshold") parse_number(value, c.proposal_score_threshold);
    else if (key == "tessdata_path") c.tessdata_path = value;
    else if (key == "ocr_language") c.ocr_language = value;
    else if (key == "catalog_path") c.catalog_path = value;
    else if (key == "visual_catalog_path") c.visual_catalog_path = value;
    else if (key == "worker_count") parse_number(value, c.worker_count);
    else if (key == "visual_k") parse_number(value, c.visual_k);
    else if (key == "log_level") {
      if (!core::parse_log_level(value, c.log_level)) {
        core::log_warn("config") << "unknown log_level '" << value << "'";
      }
    }
    // detection
    else if (key == "min_detection_confidence") parse_number(value, c.detector.min_confidence);
    else if (key == "min_region_side") parse_number(value, c.detector.min_side);
    else if (key == "min_region_area") parse_number(value, c.detector.min_area);
    else if (key == "max_area_ratio") parse_number(value, c.detector.max_area_ratio);
    else if (key == "nms_iou_threshold") parse_number(value, c.detector.nms_iou_threshold);
    else if (key == "crop_padding") parse_number(value, c.detector.crop_padding);
    else if (key == "max_regions") parse_number(value, c.detector.max_regions);
    // text extraction
    else if (key == "ocr_timeout_ms") parse_millis(value, c.extractor.timeout);
    else if (key == "ocr_max_retries") parse_number(value, c.extractor.max_retries);
    else if (key == "ocr_backoff_initial_ms") parse_millis(value, c.extractor.backoff_initial);
    else if (key == "ocr_backoff_max_ms") parse_millis(value, c.extractor.backoff_max);
    // recovery
    else if (key == "damage_quality_threshold") parse_number(value, c.recovery.damage_quality_threshold);
    else if (key == "recovery_max_distance_ratio") parse_number(value, c.recovery.max_distance_ratio);
    else if (key == "recovery_visual_boost") parse_number(value, c.recovery.visual_boost);
    // matching
    else if (key == "default_threshold") parse_number(value, c.match.default_threshold);
    else if (key == "containment_floor") parse_number(value, c.match.containment_floor);
    else if (key == "phonetic_floor") parse_number(value, c.match.phonetic_floor);
    else if (key == "phonetic_factor") parse_number(value, c.match.phonetic_factor);
    else if (key == "phonetic_cap") parse_number(value, c.match.phonetic_cap);
    else if (key.starts_with(kCategoryPrefix)) {
      const std::string category =
          match::normalize_text(std::string_view(key).substr(kCategoryPrefix.size()));
      int threshold = 0;
      if (!category.empty() && parse_number(value, threshold)) {
        c.match.category_thresholds[category] = threshold;
      }
    }
    // decision
    else if (key == "high_threshold") parse_number(value, c.decision.high_threshold);
    else if (key == "low_floor") parse_number(value, c.decision.low_floor);
    else if (key == "tie_margin") parse_number(value, c.decision.tie_margin);
    else if (key == "max_alternatives") parse_number(value, c.decision.max_alternatives);
    // visual index
    else if (key == "similarity_floor") parse_number(value, c.index.similarity_floor);
    else if (key == "agreement_threshold") parse_number(value, c.index.agreement_threshold);
    else if (key == "duplicate_threshold") parse_number(value, c.index.duplicate_threshold);
    else if (key.starts_with(kWeightPrefix)) {
      parse_weight(std::string_view(key).substr(kWeightPrefix.size()), value, c.index.weights);
    }
  }
  return c;
}

}  // namespace boxscan::app
