#include <boxscan/vision/mock_region_proposer.hpp>

namespace boxscan::vision {

void MockRegionProposer::set_proposals(std::vector<Proposal> proposals) {
  proposals_ = std::move(proposals);
}

void MockRegionProposer::set_failure(std::optional<boxscan::core::ScanError> error) {
  failure_ = error;
}

std::expected<std::vector<Proposal>, boxscan::core::ScanError>
MockRegionProposer::propose(const boxscan::core::Image& image) {
  auto valid = validate_input(image);
  if (!valid) {
    return std::unexpected(valid.error());
  }
  if (failure_) {
    return std::unexpected(*failure_);
  }
  return proposals_;
}

}  // namespace boxscan::vision
