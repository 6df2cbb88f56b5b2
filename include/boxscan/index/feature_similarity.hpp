#pragma once

#include <boxscan/core/feature_vector.hpp>
#include <span>
#include <vector>

namespace boxscan::index {

/// Per-type weights of the combined visual similarity.
struct FeatureWeights {
  float color{0.30f};
  float edge{0.20f};
  float layout{0.35f};
  float shape{0.15f};

  [[nodiscard]] float weight(core::FeatureType type) const noexcept;
};

/// Similarity of two vectors of the same type, in [0, 1]:
/// histogram intersection for colour, cosine for edge and layout,
/// 1 / (1 + L2) for shape. Vectors of different length compare as 0.
[[nodiscard]] float type_similarity(core::FeatureType type, std::span<const float> a,
                                    std::span<const float> b);

struct SimilarityBreakdown {
  float combined{0.f};                          // weighted mean over compared types
  std::vector<core::FeatureType> agreeing;      // similarity >= agreement threshold
  std::size_t compared_types{0};
};

/// Compare two feature sets type by type. Types present on one side only are
/// skipped; combined is 0 when nothing could be compared.
[[nodiscard]] SimilarityBreakdown compare_features(std::span<const core::FeatureVector> a,
                                                   std::span<const core::FeatureVector> b,
                                                   const FeatureWeights& weights,
                                                   float agreement_threshold);

}  // namespace boxscan::index
