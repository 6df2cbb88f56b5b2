#include "image_cv_utils.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <cstddef>
#include <cstring>
#include <vector>

namespace boxscan::vision::detail {

namespace nc = boxscan::core;

std::optional<cv::Mat> image_to_mat(const nc::Image& image) {
  if (!image.valid()) return std::nullopt;

  const int w = static_cast<int>(image.width());
  const int h = static_cast<int>(image.height());
  auto* data = const_cast<std::byte*>(image.data().data());
  const std::size_t step = static_cast<std::size_t>(w) * nc::Image::bytes_per_pixel(image.format());

  switch (image.format()) {
    case nc::PixelFormat::Grayscale8:
      return cv::Mat(h, w, CV_8UC1, data, step);
    case nc::PixelFormat::RGB8:
    case nc::PixelFormat::BGR8:
      return cv::Mat(h, w, CV_8UC3, data, step);
    case nc::PixelFormat::RGBA8:
    case nc::PixelFormat::BGRA8:
      return cv::Mat(h, w, CV_8UC4, data, step);
    case nc::PixelFormat::Unknown:
    default:
      return std::nullopt;
  }
}

nc::Image mat_to_image(const cv::Mat& mat, nc::PixelFormat format) {
  if (mat.empty()) return nc::Image();

  const cv::Mat packed = mat.isContinuous() ? mat : mat.clone();
  const std::size_t len = packed.total() * packed.elemSize();
  std::vector<std::byte> buffer(len);
  std::memcpy(buffer.data(), packed.ptr(), len);
  return nc::Image(static_cast<std::uint32_t>(packed.cols),
                   static_cast<std::uint32_t>(packed.rows), format, std::move(buffer));
}

std::optional<cv::Mat> to_bgr(const nc::Image& image) {
  auto mat = image_to_mat(image);
  if (!mat) return std::nullopt;

  cv::Mat out;
  switch (image.format()) {
    case nc::PixelFormat::Grayscale8:
      cv::cvtColor(*mat, out, cv::COLOR_GRAY2BGR);
      break;
    case nc::PixelFormat::RGB8:
      cv::cvtColor(*mat, out, cv::COLOR_RGB2BGR);
      break;
    case nc::PixelFormat::RGBA8:
      cv::cvtColor(*mat, out, cv::COLOR_RGBA2BGR);
      break;
    case nc::PixelFormat::BGRA8:
      cv::cvtColor(*mat, out, cv::COLOR_BGRA2BGR);
      break;
    case nc::PixelFormat::BGR8:
    default:
      out = mat->clone();
      break;
  }
  return out;
}

std::optional<cv::Mat> to_gray(const nc::Image& image) {
  auto mat = image_to_mat(image);
  if (!mat) return std::nullopt;

  cv::Mat out;
  switch (image.format()) {
    case nc::PixelFormat::RGB8:
      cv::cvtColor(*mat, out, cv::COLOR_RGB2GRAY);
      break;
    case nc::PixelFormat::BGR8:
      cv::cvtColor(*mat, out, cv::COLOR_BGR2GRAY);
      break;
    case nc::PixelFormat::RGBA8:
      cv::cvtColor(*mat, out, cv::COLOR_RGBA2GRAY);
      break;
    case nc::PixelFormat::BGRA8:
      cv::cvtColor(*mat, out, cv::COLOR_BGRA2GRAY);
      break;
    case nc::PixelFormat::Grayscale8:
    default:
      out = mat->clone();
      break;
  }
  return out;
}

}  // namespace boxscan::vision::detail
