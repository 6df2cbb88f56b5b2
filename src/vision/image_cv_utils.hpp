#pragma once

#include <boxscan/core/image.hpp>
#include <opencv2/core/mat.hpp>
#include <optional>

namespace boxscan::vision::detail {

/// Wrap an Image as a cv::Mat without copying. Returns nullopt if the image is
/// empty, inconsistent, or of unknown format.
std::optional<cv::Mat> image_to_mat(const boxscan::core::Image& image);

/// Copy a cv::Mat (8-bit, 1/3/4 channels) into an Image.
boxscan::core::Image mat_to_image(const cv::Mat& mat, boxscan::core::PixelFormat format);

/// 3-channel BGR copy of the image, whatever its format.
std::optional<cv::Mat> to_bgr(const boxscan::core::Image& image);

/// Single-channel 8-bit copy of the image.
std::optional<cv::Mat> to_gray(const boxscan::core::Image& image);

}  // namespace boxscan::vision::detail
