#include <boxscan/core/region_result.hpp>
#include <algorithm>

namespace boxscan::core {

namespace {

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};

}  // namespace

std::string_view action_name(const RecommendedAction& action) noexcept {
  return std::visit(overloaded{
                        [](const AutoSelect&) { return std::string_view("AUTO_SELECT"); },
                        [](const ShowOptions&) { return std::string_view("SHOW_OPTIONS"); },
                        [](const ManualEntry&) { return std::string_view("MANUAL_ENTRY"); },
                        [](const Rescan&) { return std::string_view("RESCAN"); },
                    },
                    action);
}

bool RegionResult::has_error(ScanError e) const noexcept {
  return std::find(errors.begin(), errors.end(), e) != errors.end();
}

const RegionResult* MultiDrugResult::find_region(std::size_t region_id) const noexcept {
  for (const auto& r : regions) {
    if (r.region_id == region_id) return &r;
  }
  return nullptr;
}

std::string_view to_string(FrameQuality quality) noexcept {
  switch (quality) {
    case FrameQuality::Excellent:
      return "EXCELLENT";
    case FrameQuality::Good:
      return "GOOD";
    case FrameQuality::Acceptable:
      return "ACCEPTABLE";
    case FrameQuality::Poor:
      return "POOR";
    case FrameQuality::NoDetection:
      return "NO_DETECTION";
    case FrameQuality::TooManyObjects:
      return "TOO_MANY_OBJECTS";
  }
  return "POOR";
}

std::string_view to_string(ImageSource source) noexcept {
  switch (source) {
    case ImageSource::Camera:
      return "camera";
    case ImageSource::Gallery:
      return "gallery";
    case ImageSource::File:
      return "file";
    case ImageSource::Synthetic:
      return "synthetic";
  }
  return "camera";
}

}  // namespace boxscan::core
