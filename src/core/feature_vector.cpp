#include <boxscan/core/feature_vector.hpp>
#include <charconv>
#include <sstream>

namespace boxscan::core {

std::string FeatureVector::serialize() const {
  std::ostringstream os;
  os.precision(7);
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) os << ',';
    os << values[i];
  }
  return os.str();
}

std::expected<std::vector<float>, ScanError> parse_feature_values(
    std::string_view text) {
  std::vector<float> out;
  if (text.empty()) return out;

  std::size_t pos = 0;
  while (pos <= text.size()) {
    const std::size_t comma = text.find(',', pos);
    const std::string_view item =
        text.substr(pos, comma == std::string_view::npos ? std::string_view::npos
                                                         : comma - pos);
    float value = 0.f;
    const auto [ptr, ec] =
        std::from_chars(item.data(), item.data() + item.size(), value);
    if (ec != std::errc{} || ptr != item.data() + item.size()) {
      return std::unexpected(ScanError::InvalidInput);
    }
    out.push_back(value);
    if (comma == std::string_view::npos) break;
    pos = comma + 1;
  }
  return out;
}

std::string_view to_string(FeatureType type) noexcept {
  switch (type) {
    case FeatureType::ColorHistogram:
      return "color";
    case FeatureType::Edge:
      return "edge";
    case FeatureType::TextLayout:
      return "layout";
    case FeatureType::Shape:
      return "shape";
  }
  return "unknown";
}

std::expected<FeatureType, ScanError> feature_type_from_string(std::string_view name) {
  if (name == "color") return FeatureType::ColorHistogram;
  if (name == "edge") return FeatureType::Edge;
  if (name == "layout") return FeatureType::TextLayout;
  if (name == "shape") return FeatureType::Shape;
  return std::unexpected(ScanError::InvalidInput);
}

}  // namespace boxscan::core
