#include <boxscan/vision/feature_extractor.hpp>
#include "image_cv_utils.hpp"
#include <boxscan/core/log.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <array>
#include <cmath>

namespace boxscan::vision {

namespace nc = boxscan::core;

namespace {

constexpr std::array<nc::FeatureType, nc::kFeatureTypeCount> kAllTypes{
    nc::FeatureType::ColorHistogram, nc::FeatureType::Edge, nc::FeatureType::TextLayout,
    nc::FeatureType::Shape};

void l1_normalize(std::vector<float>& v) {
  double sum = 0.0;
  for (float x : v) sum += x;
  if (sum <= 0.0) return;
  for (float& x : v) x = static_cast<float>(x / sum);
}

float normalized_entropy(const std::vector<float>& p) {
  if (p.size() < 2) return 0.f;
  double h = 0.0;
  for (float x : p) {
    if (x > 0.f) h -= x * std::log2(static_cast<double>(x));
  }
  return static_cast<float>(h / std::log2(static_cast<double>(p.size())));
}

std::expected<std::vector<float>, nc::ScanError> color_histogram(const cv::Mat& bgr, int bins,
                                                                 float& confidence) {
  std::vector<cv::Mat> channels;
  cv::split(bgr, channels);
  std::vector<float> values;
  values.reserve(static_cast<std::size_t>(bins) * channels.size());
  const int hist_size[] = {bins};
  const float range[] = {0.f, 256.f};
  const float* ranges[] = {range};
  for (const auto& ch : channels) {
    cv::Mat hist;
    const int channel_idx[] = {0};
    cv::calcHist(&ch, 1, channel_idx, cv::Mat(), hist, 1, hist_size, ranges);
    for (int i = 0; i < bins; ++i) values.push_back(hist.at<float>(i));
  }
  l1_normalize(values);
  confidence = normalized_entropy(values);
  return values;
}

std::expected<std::vector<float>, nc::ScanError> edge_histogram(const cv::Mat& gray, int bins,
                                                                float& confidence) {
  cv::Mat dx;
  cv::Mat dy;
  cv::Sobel(gray, dx, CV_32F, 1, 0, 3);
  cv::Sobel(gray, dy, CV_32F, 0, 1, 3);
  cv::Mat magnitude;
  cv::Mat angle;
  cv::cartToPolar(dx, dy, magnitude, angle, true);

  std::vector<float> values(static_cast<std::size_t>(bins), 0.f);
  double total = 0.0;
  for (int y = 0; y < magnitude.rows; ++y) {
    const float* mag = magnitude.ptr<float>(y);
    const float* ang = angle.ptr<float>(y);
    for (int x = 0; x < magnitude.cols; ++x) {
      if (mag[x] <= 0.f) continue;
      const float a = std::fmod(ang[x], 180.f);
      const int bin = std::min(bins - 1, static_cast<int>(a / 180.f * static_cast<float>(bins)));
      values[static_cast<std::size_t>(bin)] += mag[x];
      total += mag[x];
    }
  }
  l1_normalize(values);
  const double mean_magnitude = total / std::max(1, magnitude.rows * magnitude.cols);
  confidence = static_cast<float>(std::clamp(mean_magnitude / 50.0, 0.0, 1.0));
  return values;
}

std::expected<std::vector<float>, nc::ScanError> text_layout(const cv::Mat& gray, int grid,
                                                             float text_density,
                                                             float& confidence) {
  if (gray.cols < grid || gray.rows < grid) {
    return std::unexpected(nc::ScanError::InvalidImage);
  }
  cv::Mat edges;
  cv::Canny(gray, edges, 50.0, 150.0);

  std::vector<float> values;
  values.reserve(static_cast<std::size_t>(grid * grid) + 5);
  double sum = 0.0;
  double sum_sq = 0.0;
  double cx = 0.0;
  double cy = 0.0;
  int text_cells = 0;
  for (int gy = 0; gy < grid; ++gy) {
    for (int gx = 0; gx < grid; ++gx) {
      const cv::Rect cell(gx * edges.cols / grid, gy * edges.rows / grid,
                          (gx + 1) * edges.cols / grid - gx * edges.cols / grid,
                          (gy + 1) * edges.rows / grid - gy * edges.rows / grid);
      const float density = static_cast<float>(cv::countNonZero(edges(cell))) /
                            static_cast<float>(std::max(1, cell.area()));
      values.push_back(density);
      sum += density;
      sum_sq += static_cast<double>(density) * density;
      cx += density * (gx + 0.5) / grid;
      cy += density * (gy + 0.5) / grid;
      if (density > text_density) ++text_cells;
    }
  }
  const double cells = static_cast<double>(grid * grid);
  const double mean = sum / cells;
  const double stddev = std::sqrt(std::max(0.0, sum_sq / cells - mean * mean));
  values.push_back(static_cast<float>(mean));
  values.push_back(static_cast<float>(stddev));
  values.push_back(static_cast<float>(sum > 0.0 ? cx / sum : 0.5));
  values.push_back(static_cast<float>(sum > 0.0 ? cy / sum : 0.5));
  const double text_ratio = text_cells / cells;
  values.push_back(static_cast<float>(text_ratio));
  confidence = text_cells > 0 ? static_cast<float>(0.5 + 0.5 * text_ratio) : 0.2f;
  return values;
}

std::expected<std::vector<float>, nc::ScanError> shape_descriptor(const cv::Mat& gray,
                                                                  float& confidence) {
  cv::Mat mask;
  cv::threshold(gray, mask, 0, 255, cv::THRESH_BINARY | cv::THRESH_OTSU);
  std::vector<std::vector<cv::Point>> contours;
  cv::findContours(mask, contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);
  if (contours.empty()) {
    return std::unexpected(nc::ScanError::InvalidImage);
  }
  const auto largest = std::max_element(
      contours.begin(), contours.end(), [](const auto& a, const auto& b) {
        return std::fabs(cv::contourArea(a)) < std::fabs(cv::contourArea(b));
      });
  const double area = std::fabs(cv::contourArea(*largest));
  const cv::Rect rect = cv::boundingRect(*largest);
  if (area <= 0.0 || rect.area() <= 0) {
    return std::unexpected(nc::ScanError::InvalidImage);
  }

  double hu[7];
  cv::HuMoments(cv::moments(*largest), hu);
  std::vector<float> values;
  values.reserve(10);
  for (double h : hu) {
    const double scaled = h == 0.0 ? 0.0 : -std::copysign(1.0, h) * std::log10(std::fabs(h));
    values.push_back(static_cast<float>(scaled));
  }
  std::vector<cv::Point> hull;
  cv::convexHull(*largest, hull);
  const double hull_area = std::fabs(cv::contourArea(hull));
  values.push_back(static_cast<float>(static_cast<double>(rect.width) / rect.height));
  values.push_back(static_cast<float>(area / rect.area()));
  values.push_back(static_cast<float>(hull_area > 0.0 ? area / hull_area : 0.0));

  const double coverage = area / static_cast<double>(std::max(1, gray.rows * gray.cols));
  confidence = static_cast<float>(std::clamp(coverage * 2.0, 0.1, 1.0));
  return values;
}

}  // namespace

FeatureExtractor::FeatureExtractor(FeatureExtractorConfig config) : config_(config) {}

std::expected<nc::FeatureVector, nc::ScanError> FeatureExtractor::extract_type(
    const nc::Image& image, nc::FeatureType type, std::size_t region_id) const {
  nc::FeatureVector fv;
  fv.region_id = region_id;
  fv.type = type;

  std::expected<std::vector<float>, nc::ScanError> values =
      std::unexpected(nc::ScanError::InvalidImage);
  if (type == nc::FeatureType::ColorHistogram) {
    auto bgr = detail::to_bgr(image);
    if (!bgr) return std::unexpected(nc::ScanError::InvalidImage);
    values = color_histogram(*bgr, config_.color_bins, fv.confidence);
  } else {
    auto gray = detail::to_gray(image);
    if (!gray) return std::unexpected(nc::ScanError::InvalidImage);
    switch (type) {
      case nc::FeatureType::Edge:
        values = edge_histogram(*gray, config_.orientation_bins, fv.confidence);
        break;
      case nc::FeatureType::TextLayout:
        values = text_layout(*gray, config_.layout_grid, config_.text_cell_density,
                             fv.confidence);
        break;
      case nc::FeatureType::Shape:
        values = shape_descriptor(*gray, fv.confidence);
        break;
      case nc::FeatureType::ColorHistogram:
        break;
    }
  }
  if (!values) {
    return std::unexpected(values.error());
  }
  fv.values = std::move(*values);
  return fv;
}

std::vector<nc::FeatureVector> FeatureExtractor::extract(const nc::Image& image,
                                                         std::size_t region_id) const {
  std::vector<nc::FeatureVector> out;
  out.reserve(kAllTypes.size());
  for (const auto type : kAllTypes) {
    auto fv = extract_type(image, type, region_id);
    if (fv) {
      out.push_back(std::move(*fv));
    } else {
      core::log_debug("features") << "region " << region_id << ": no " << nc::to_string(type)
                                  << " features (" << nc::to_string(fv.error()) << ")";
    }
  }
  return out;
}

}  // namespace boxscan::vision
