#pragma once

#include <boxscan/core/error.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace boxscan::core {

enum class FeatureType : std::uint8_t {
  ColorHistogram,
  Edge,
  TextLayout,
  Shape,
};

inline constexpr std::size_t kFeatureTypeCount = 4;

/// One visual descriptor of a region. Several per region, one per type.
struct FeatureVector {
  std::size_t region_id{0};
  FeatureType type{FeatureType::ColorHistogram};
  std::vector<float> values;
  float confidence{0.f};  // extraction confidence in [0, 1]

  /// Comma-separated values, as stored by the visual catalog.
  [[nodiscard]] std::string serialize() const;
};

/// Parse a comma-separated list written by FeatureVector::serialize().
[[nodiscard]] std::expected<std::vector<float>, ScanError> parse_feature_values(
    std::string_view text);

[[nodiscard]] std::string_view to_string(FeatureType type) noexcept;
[[nodiscard]] std::expected<FeatureType, ScanError> feature_type_from_string(
    std::string_view name);

}  // namespace boxscan::core
