#pragma once

#include <cstdint>
#include <vector>

namespace boxscan::vision {

/// Raw detector output in model input coordinates, before decoding.
struct RawDetections {
  std::vector<float> boxes;  // [x1, y1, x2, y2] per detection
  std::vector<float> scores;
  std::vector<std::int64_t> class_ids;
  std::uint32_t num_detections{0};
};

}  // namespace boxscan::vision
