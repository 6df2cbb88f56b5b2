#pragma once

#include <boxscan/core/log.hpp>
#include <boxscan/index/feature_index.hpp>
#include <boxscan/match/decision_engine.hpp>
#include <boxscan/match/match_engine.hpp>
#include <boxscan/match/recovery_engine.hpp>
#include <boxscan/vision/box_assessor.hpp>
#include <boxscan/vision/contour_region_proposer.hpp>
#include <boxscan/vision/feature_extractor.hpp>
#include <boxscan/vision/region_detector.hpp>
#include <boxscan/vision/text_extractor.hpp>
#include <cstddef>
#include <string>

namespace boxscan::app {

/// Region proposer: mock (scripted), contour (OpenCV, no model) or onnx.
enum class ProposerType {
  Mock,
  Contour,
  Onnx,
};

/// Text recognizer: mock (scripted) or tesseract.
enum class RecognizerType {
  Mock,
  Tesseract,
};

/// Scanner configuration: backends, data files and per-component settings.
struct ScanConfig {
  ProposerType proposer_type{ProposerType::Contour};
  std::string model_path;
  float proposal_score_threshold{0.5f};

  RecognizerType recognizer_type{RecognizerType::Mock};
  std::string tessdata_path;
  std::string ocr_language{"eng+tur"};

  std::string catalog_path;
  std::string visual_catalog_path;

  std::size_t worker_count{0};  // 0 = hardware concurrency
  std::size_t visual_k{10};
  core::LogLevel log_level{core::LogLevel::Warn};

  vision::RegionDetectorConfig detector;
  vision::ContourProposerConfig contour;
  vision::BoxAssessorConfig assessor;
  vision::TextExtractorConfig extractor;
  vision::FeatureExtractorConfig features;
  index::FeatureIndexConfig index;
  match::MatchConfig match;
  match::RecoveryConfig recovery;
  match::DecisionConfig decision;
};

/// Load config from a simple key=value file (one per line, '#' comments).
/// Unknown keys are ignored and malformed values keep their defaults.
/// Per-category thresholds: category_threshold.<category>=<int>.
/// Visual weights: feature_weight.<color|edge|layout|shape>=<float>.
ScanConfig load_config(const std::string& path);

/// Default config when no file is provided.
ScanConfig default_config();

}  // namespace boxscan::app
