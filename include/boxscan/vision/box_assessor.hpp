#pragma once

#include <boxscan/core/image.hpp>
#include <boxscan/core/region.hpp>

namespace boxscan::vision {

struct BoxAssessment {
  boxscan::core::BoxCondition condition{boxscan::core::BoxCondition::Good};
  boxscan::core::BoxAngle angle{boxscan::core::BoxAngle::Front};
  boxscan::core::BoxLighting lighting{boxscan::core::BoxLighting::Normal};
  float brightness{0.f};    // mean intensity, 0-1
  float contrast{0.f};      // intensity stddev / 128, 0-1
  float edge_density{0.f};  // fraction of Canny edge pixels
  float integrity{1.f};     // 1 = intact surface
};

struct BoxAssessorConfig {
  float overexposed_brightness{0.8f};
  float underexposed_brightness{0.2f};
  float low_contrast{0.3f};
  float clean_edge_density{0.12f};   // at or below: no damage signal
  float damage_edge_span{0.25f};     // edge density above clean that means fully damaged
  double angled_skew_degrees{20.0};
};

/// Estimates condition, viewing angle and lighting of a cropped box.
/// Creases, tears and scuffs show up as dense, irregular edges, so integrity
/// falls as edge density rises above what printed text produces.
class BoxAssessor {
 public:
  explicit BoxAssessor(BoxAssessorConfig config = {});

  [[nodiscard]] BoxAssessment assess(const boxscan::core::Image& crop) const;

  [[nodiscard]] static boxscan::core::BoxCondition condition_for(float integrity) noexcept;

 private:
  BoxAssessorConfig config_;
};

}  // namespace boxscan::vision
