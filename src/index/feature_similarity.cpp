#include <boxscan/index/feature_similarity.hpp>
#include <algorithm>
#include <cmath>

namespace boxscan::index {

namespace {

const core::FeatureVector* find_type(std::span<const core::FeatureVector> set,
                                     core::FeatureType type) {
  for (const auto& fv : set) {
    if (fv.type == type) return &fv;
  }
  return nullptr;
}

float cosine(std::span<const float> a, std::span<const float> b) {
  double dot = 0.0;
  double na = 0.0;
  double nb = 0.0;
  for (std::size_t i = 0; i < a.size(); ++i) {
    dot += static_cast<double>(a[i]) * b[i];
    na += static_cast<double>(a[i]) * a[i];
    nb += static_cast<double>(b[i]) * b[i];
  }
  if (na == 0.0 && nb == 0.0) return 1.f;
  if (na == 0.0 || nb == 0.0) return 0.f;
  return static_cast<float>(std::clamp(dot / (std::sqrt(na) * std::sqrt(nb)), 0.0, 1.0));
}

}  // namespace

float FeatureWeights::weight(core::FeatureType type) const noexcept {
  switch (type) {
    case core::FeatureType::ColorHistogram:
      return color;
    case core::FeatureType::Edge:
      return edge;
    case core::FeatureType::TextLayout:
      return layout;
    case core::FeatureType::Shape:
      return shape;
  }
  return 0.f;
}

float type_similarity(core::FeatureType type, std::span<const float> a,
                      std::span<const float> b) {
  if (a.size() != b.size() || a.empty()) {
    return 0.f;
  }
  switch (type) {
    case core::FeatureType::ColorHistogram: {
      double inter = 0.0;
      for (std::size_t i = 0; i < a.size(); ++i) inter += std::min(a[i], b[i]);
      return static_cast<float>(std::clamp(inter, 0.0, 1.0));
    }
    case core::FeatureType::Edge:
    case core::FeatureType::TextLayout:
      return cosine(a, b);
    case core::FeatureType::Shape: {
      double sq = 0.0;
      for (std::size_t i = 0; i < a.size(); ++i) {
        const double d = static_cast<double>(a[i]) - b[i];
        sq += d * d;
      }
      return static_cast<float>(1.0 / (1.0 + std::sqrt(sq)));
    }
  }
  return 0.f;
}

SimilarityBreakdown compare_features(std::span<const core::FeatureVector> a,
                                     std::span<const core::FeatureVector> b,
                                     const FeatureWeights& weights, float agreement_threshold) {
  SimilarityBreakdown out;
  double weighted = 0.0;
  double total_weight = 0.0;
  for (const auto& fa : a) {
    const core::FeatureVector* fb = find_type(b, fa.type);
    if (fb == nullptr || fb->values.size() != fa.values.size()) continue;
    const float w = weights.weight(fa.type);
    if (w <= 0.f) continue;
    const float sim = type_similarity(fa.type, fa.values, fb->values);
    weighted += static_cast<double>(w) * sim;
    total_weight += w;
    ++out.compared_types;
    if (sim >= agreement_threshold) {
      out.agreeing.push_back(fa.type);
    }
  }
  if (total_weight > 0.0) {
    out.combined = static_cast<float>(weighted / total_weight);
  }
  return out;
}

}  // namespace boxscan::index
