#include <boxscan/vision/region_detector.hpp>
#include <boxscan/core/log.hpp>
#include <opencv2/core/types.hpp>
#include <opencv2/dnn.hpp>
#include <algorithm>

namespace boxscan::vision {

namespace nc = boxscan::core;

RegionDetector::RegionDetector(std::shared_ptr<IRegionProposer> proposer,
                               RegionDetectorConfig config,
                               BoxAssessor assessor)
    : proposer_(std::move(proposer)), config_(config), assessor_(std::move(assessor)) {}

std::vector<Proposal> RegionDetector::select(std::vector<Proposal> proposals,
                                             std::uint32_t image_width,
                                             std::uint32_t image_height) const {
  const nc::BBox bounds{0, 0, static_cast<int>(image_width), static_cast<int>(image_height)};
  const double image_area = static_cast<double>(bounds.area());

  std::vector<cv::Rect> rects;
  std::vector<float> scores;
  std::vector<Proposal> kept;
  for (auto& p : proposals) {
    p.bbox = nc::intersect(p.bbox, bounds);
    if (p.bbox.empty() || p.confidence < config_.min_confidence) continue;
    if (p.bbox.w < static_cast<int>(config_.min_side) ||
        p.bbox.h < static_cast<int>(config_.min_side)) {
      continue;
    }
    if (p.bbox.area() < config_.min_area) continue;
    if (image_area > 0.0 &&
        static_cast<double>(p.bbox.area()) / image_area > config_.max_area_ratio) {
      continue;
    }
    const float aspect = static_cast<float>(p.bbox.w) / static_cast<float>(p.bbox.h);
    if (aspect < config_.min_aspect || aspect > config_.max_aspect) continue;

    rects.emplace_back(p.bbox.x, p.bbox.y, p.bbox.w, p.bbox.h);
    scores.push_back(p.confidence);
    kept.push_back(p);
  }
  if (kept.empty()) return {};

  std::vector<int> indices;
  cv::dnn::NMSBoxes(rects, scores, config_.min_confidence, config_.nms_iou_threshold, indices);

  // NMSBoxes returns indices by descending score.
  std::vector<Proposal> out;
  for (int idx : indices) {
    if (out.size() >= config_.max_regions) break;
    out.push_back(kept[static_cast<std::size_t>(idx)]);
  }
  std::sort(out.begin(), out.end(), [](const Proposal& a, const Proposal& b) {
    if (a.bbox.y != b.bbox.y) return a.bbox.y < b.bbox.y;
    return a.bbox.x < b.bbox.x;
  });
  return out;
}

std::expected<std::vector<nc::Region>, nc::ScanError> RegionDetector::detect(
    const nc::Image& image) const {
  if (!image.valid()) {
    return std::unexpected(nc::ScanError::DetectionFailure);
  }

  std::vector<Proposal> proposals;
  if (proposer_) {
    auto proposed = proposer_->propose(image);
    if (proposed) {
      proposals = std::move(*proposed);
    } else {
      core::log_warn("detector") << "proposer failed (" << nc::to_string(proposed.error())
                                 << "), using whole image";
    }
  }

  std::vector<nc::Region> regions;
  for (const auto& p : select(std::move(proposals), image.width(), image.height())) {
    nc::Region r;
    r.id = regions.size();
    r.bbox = p.bbox;
    r.image = image.crop(nc::pad_and_clamp(p.bbox, config_.crop_padding, image.width(),
                                           image.height()));
    if (r.image.empty()) continue;
    r.detection_confidence = p.confidence;
    const BoxAssessment a = assessor_.assess(r.image);
    r.condition = a.condition;
    r.angle = a.angle;
    r.lighting = a.lighting;
    regions.push_back(std::move(r));
  }

  if (regions.empty()) {
    nc::Region whole;
    whole.id = 0;
    whole.bbox = nc::BBox{0, 0, static_cast<int>(image.width()), static_cast<int>(image.height())};
    whole.image = image.crop(whole.bbox);
    if (whole.image.empty()) {
      return std::unexpected(nc::ScanError::DetectionFailure);
    }
    whole.detection_confidence = config_.fallback_confidence;
    whole.is_fallback = true;
    const BoxAssessment a = assessor_.assess(whole.image);
    whole.condition = a.condition;
    whole.angle = a.angle;
    whole.lighting = a.lighting;
    regions.push_back(std::move(whole));
    core::log_info("detector") << "no box found, falling back to the whole image";
  }
  return regions;
}

}  // namespace boxscan::vision
