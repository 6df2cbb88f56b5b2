#pragma once

#include <boxscan/core/image.hpp>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace boxscan::core {

/// Physical state of a box, best to worst.
enum class BoxCondition : std::uint8_t {
  Perfect,
  Good,
  Worn,
  Damaged,
  SeverelyDamaged,
};

/// Which face of the box the camera sees.
enum class BoxAngle : std::uint8_t {
  Front,
  Top,
  Bottom,
  LeftSide,
  RightSide,
  Angled,
};

enum class BoxLighting : std::uint8_t {
  Normal,
  Overexposed,
  Underexposed,
  LowContrast,
};

/// One candidate box found in a photograph. Built once by RegionDetector and
/// treated as immutable afterwards; owned by the process() call that made it.
struct Region {
  std::size_t id{0};  // detection order index
  BBox bbox{};
  Image image;        // padded crop
  float detection_confidence{0.f};
  BoxCondition condition{BoxCondition::Good};
  BoxAngle angle{BoxAngle::Front};
  BoxLighting lighting{BoxLighting::Normal};
  bool is_fallback{false};  // whole image used because nothing was detected
};

[[nodiscard]] bool is_damaged(BoxCondition condition) noexcept;

[[nodiscard]] std::string_view to_string(BoxCondition condition) noexcept;
[[nodiscard]] std::string_view to_string(BoxAngle angle) noexcept;
[[nodiscard]] std::string_view to_string(BoxLighting lighting) noexcept;

}  // namespace boxscan::core
