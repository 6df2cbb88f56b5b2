#include <boxscan/vision/contour_region_proposer.hpp>
#include "image_cv_utils.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <vector>

namespace boxscan::vision {

ContourRegionProposer::ContourRegionProposer(ContourProposerConfig config)
    : config_(config) {}

std::expected<std::vector<Proposal>, boxscan::core::ScanError>
ContourRegionProposer::propose(const boxscan::core::Image& image) {
  auto valid = validate_input(image);
  if (!valid) {
    return std::unexpected(valid.error());
  }
  auto gray = detail::to_gray(image);
  if (!gray) {
    return std::unexpected(boxscan::core::ScanError::InvalidImage);
  }

  cv::Mat blurred;
  cv::GaussianBlur(*gray, blurred, cv::Size(5, 5), config_.blur_sigma);
  cv::Mat edges;
  cv::Canny(blurred, edges, config_.canny_low, config_.canny_high);
  if (config_.dilate_iterations > 0) {
    cv::dilate(edges, edges, cv::Mat(), cv::Point(-1, -1), config_.dilate_iterations);
  }

  std::vector<std::vector<cv::Point>> contours;
  cv::findContours(edges, contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);

  std::vector<Proposal> out;
  out.reserve(contours.size());
  for (const auto& contour : contours) {
    const cv::Rect rect = cv::boundingRect(contour);
    if (rect.area() <= 0) continue;

    std::vector<cv::Point> approx;
    cv::approxPolyDP(contour, approx, config_.approx_epsilon * cv::arcLength(contour, true), true);

    const double fill = std::min(
        1.0, std::fabs(cv::contourArea(contour)) / static_cast<double>(rect.area()));
    const double shape = approx.size() == 4 ? 1.0 : 0.75;
    const float confidence = static_cast<float>(std::clamp(fill * shape, 0.0, 1.0));
    out.push_back({{rect.x, rect.y, rect.width, rect.height}, confidence});
  }
  return out;
}

}  // namespace boxscan::vision
