#pragma once

#include <boxscan/vision/region_proposer.hpp>
#include <optional>
#include <vector>

namespace boxscan::vision {

/// Proposer that returns configurable boxes (for tests/demo).
class MockRegionProposer : public IRegionProposer {
 public:
  /// Set proposals to return on every propose() call.
  void set_proposals(std::vector<Proposal> proposals);

  /// Make propose() fail with \p error; nullopt clears it.
  void set_failure(std::optional<boxscan::core::ScanError> error);

  [[nodiscard]] std::expected<std::vector<Proposal>, boxscan::core::ScanError>
  propose(const boxscan::core::Image& image) override;

 private:
  std::vector<Proposal> proposals_;
  std::optional<boxscan::core::ScanError> failure_;
};

}  // namespace boxscan::vision
