#pragma once

#include <boxscan/core/error.hpp>
#include <boxscan/core/image.hpp>
#include <expected>
#include <vector>

namespace boxscan::vision {

/// Candidate box before filtering and non-max suppression (image pixels).
struct Proposal {
  boxscan::core::BBox bbox{};
  float confidence{0.f};
};

/// Abstract box proposer: Image -> raw proposals.
/// Implement propose(); optionally override validate_input and warmup.
class IRegionProposer {
 public:
  virtual ~IRegionProposer() = default;

  [[nodiscard]] virtual std::expected<std::vector<Proposal>, boxscan::core::ScanError>
  propose(const boxscan::core::Image& image) = 0;

  /// Optional: validate image format/dimensions before propose. Default: accept valid images.
  [[nodiscard]] virtual std::expected<void, boxscan::core::ScanError>
  validate_input(const boxscan::core::Image& image) const {
    if (!image.valid()) return std::unexpected(boxscan::core::ScanError::InvalidImage);
    return {};
  }

  /// Optional: warmup run (e.g. dummy inference). Default: no-op.
  virtual void warmup() {}
};

}  // namespace boxscan::vision
