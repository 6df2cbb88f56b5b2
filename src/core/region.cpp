#include <boxscan/core/region.hpp>

namespace boxscan::core {

bool is_damaged(BoxCondition condition) noexcept {
  return condition == BoxCondition::Damaged ||
         condition == BoxCondition::SeverelyDamaged;
}

std::string_view to_string(BoxCondition condition) noexcept {
  switch (condition) {
    case BoxCondition::Perfect:
      return "perfect";
    case BoxCondition::Good:
      return "good";
    case BoxCondition::Worn:
      return "worn";
    case BoxCondition::Damaged:
      return "damaged";
    case BoxCondition::SeverelyDamaged:
      return "severely-damaged";
  }
  return "unknown";
}

std::string_view to_string(BoxAngle angle) noexcept {
  switch (angle) {
    case BoxAngle::Front:
      return "front";
    case BoxAngle::Top:
      return "top";
    case BoxAngle::Bottom:
      return "bottom";
    case BoxAngle::LeftSide:
      return "left-side";
    case BoxAngle::RightSide:
      return "right-side";
    case BoxAngle::Angled:
      return "angled";
  }
  return "unknown";
}

std::string_view to_string(BoxLighting lighting) noexcept {
  switch (lighting) {
    case BoxLighting::Normal:
      return "normal";
    case BoxLighting::Overexposed:
      return "overexposed";
    case BoxLighting::Underexposed:
      return "underexposed";
    case BoxLighting::LowContrast:
      return "low-contrast";
  }
  return "unknown";
}

}  // namespace boxscan::core
