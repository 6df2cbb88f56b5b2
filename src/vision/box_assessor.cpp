#include <boxscan/vision/box_assessor.hpp>
#include "image_cv_utils.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <numbers>

namespace boxscan::vision {

namespace nc = boxscan::core;

BoxAssessor::BoxAssessor(BoxAssessorConfig config) : config_(config) {}

nc::BoxCondition BoxAssessor::condition_for(float integrity) noexcept {
  if (integrity > 0.8f) return nc::BoxCondition::Perfect;
  if (integrity > 0.6f) return nc::BoxCondition::Good;
  if (integrity > 0.4f) return nc::BoxCondition::Worn;
  if (integrity > 0.2f) return nc::BoxCondition::Damaged;
  return nc::BoxCondition::SeverelyDamaged;
}

BoxAssessment BoxAssessor::assess(const nc::Image& crop) const {
  BoxAssessment a;
  auto gray = detail::to_gray(crop);
  if (!gray || gray->empty()) {
    a.condition = nc::BoxCondition::SeverelyDamaged;
    a.integrity = 0.f;
    return a;
  }

  cv::Scalar mean;
  cv::Scalar stddev;
  cv::meanStdDev(*gray, mean, stddev);
  a.brightness = static_cast<float>(mean[0] / 255.0);
  a.contrast = static_cast<float>(std::min(1.0, stddev[0] / 128.0));

  if (a.brightness > config_.overexposed_brightness) a.lighting = nc::BoxLighting::Overexposed;
  else if (a.brightness < config_.underexposed_brightness) a.lighting = nc::BoxLighting::Underexposed;
  else if (a.contrast < config_.low_contrast) a.lighting = nc::BoxLighting::LowContrast;
  else a.lighting = nc::BoxLighting::Normal;

  cv::Mat edges;
  cv::Canny(*gray, edges, 50.0, 150.0);
  a.edge_density = static_cast<float>(cv::countNonZero(edges)) /
                   static_cast<float>(std::max(1, edges.rows * edges.cols));

  const float excess = std::max(0.f, a.edge_density - config_.clean_edge_density);
  a.integrity = std::clamp(1.f - excess / config_.damage_edge_span, 0.f, 1.f);
  a.condition = condition_for(a.integrity);

  // Dominant orientation of the edge mass decides between front and angled;
  // the crop's proportions and where the edges sit decide the face.
  const cv::Moments m = cv::moments(edges, true);
  if (m.m00 > 0.0) {
    const double skew =
        0.5 * std::atan2(2.0 * m.mu11, m.mu20 - m.mu02) * 180.0 / std::numbers::pi;
    const double abs_skew = std::fabs(skew);
    if (abs_skew > config_.angled_skew_degrees && abs_skew < 90.0 - config_.angled_skew_degrees) {
      a.angle = nc::BoxAngle::Angled;
      return a;
    }
  }
  const double aspect = static_cast<double>(gray->cols) / static_cast<double>(gray->rows);
  const double cx = m.m00 > 0.0 ? m.m10 / m.m00 / gray->cols : 0.5;
  const double cy = m.m00 > 0.0 ? m.m01 / m.m00 / gray->rows : 0.5;
  if (aspect >= 2.0) {
    a.angle = cy > 0.5 ? nc::BoxAngle::Bottom : nc::BoxAngle::Top;
  } else if (aspect <= 0.5) {
    a.angle = cx > 0.5 ? nc::BoxAngle::RightSide : nc::BoxAngle::LeftSide;
  } else {
    a.angle = nc::BoxAngle::Front;
  }
  return a;
}

}  // namespace boxscan::vision
