#include <boxscan/vision/load_image.hpp>
#include "image_cv_utils.hpp"
#include <opencv2/imgcodecs.hpp>

namespace boxscan::vision {

std::optional<boxscan::core::Image> load_image(const std::string& path) {
  cv::Mat mat = cv::imread(path, cv::IMREAD_UNCHANGED);
  if (mat.empty()) return std::nullopt;
  if (mat.depth() != CV_8U) {
    mat.convertTo(mat, CV_8U, 1.0 / 256.0);
  }

  boxscan::core::PixelFormat format = boxscan::core::PixelFormat::BGR8;
  if (mat.channels() == 1) format = boxscan::core::PixelFormat::Grayscale8;
  else if (mat.channels() == 4) format = boxscan::core::PixelFormat::BGRA8;

  return detail::mat_to_image(mat, format);
}

}  // namespace boxscan::vision
