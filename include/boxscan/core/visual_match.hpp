#pragma once

#include <boxscan/core/feature_vector.hpp>
#include <string>
#include <vector>

namespace boxscan::core {

/// A stored catalog image that looks like the scanned region.
struct VisualMatch {
  std::string image_ref;
  std::string drug_name;
  float similarity{0.f};  // combined, in [0, 1]
  std::vector<FeatureType> agreeing_types;
};

}  // namespace boxscan::core
