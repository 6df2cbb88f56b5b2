#pragma once

#include <boxscan/core/image.hpp>
#include <optional>
#include <string>

namespace boxscan::vision {

/// Load an image file (any format OpenCV reads). BGR8, or Grayscale8 for
/// single-channel files. nullopt if the file cannot be decoded.
[[nodiscard]] std::optional<boxscan::core::Image> load_image(const std::string& path);

}  // namespace boxscan::vision
