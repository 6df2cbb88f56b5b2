#include <boxscan/vision/proposal_decoder.hpp>
#include <algorithm>
#include <cmath>
#include <cstddef>

namespace boxscan::vision {

ProposalDecoder::ProposalDecoder(float score_threshold,
                                 std::vector<std::int64_t> accepted_classes)
    : score_threshold_(score_threshold),
      accepted_classes_(std::move(accepted_classes)) {}

std::vector<Proposal> ProposalDecoder::decode(const RawDetections& raw,
                                              float scale_x, float scale_y,
                                              std::uint32_t image_width,
                                              std::uint32_t image_height) const {
  std::vector<Proposal> out;
  const std::size_t n = static_cast<std::size_t>(raw.num_detections);
  const boxscan::core::BBox bounds{0, 0, static_cast<int>(image_width),
                                   static_cast<int>(image_height)};

  for (std::size_t i = 0; i < n; ++i) {
    const float score = i < raw.scores.size() ? raw.scores[i] : 0.f;
    if (score < score_threshold_) continue;
    if (!accepted_classes_.empty() && i < raw.class_ids.size() &&
        std::find(accepted_classes_.begin(), accepted_classes_.end(), raw.class_ids[i]) ==
            accepted_classes_.end()) {
      continue;
    }
    if (i * 4 + 3 >= raw.boxes.size()) break;

    const float x1 = raw.boxes[i * 4 + 0] * scale_x;
    const float y1 = raw.boxes[i * 4 + 1] * scale_y;
    const float x2 = raw.boxes[i * 4 + 2] * scale_x;
    const float y2 = raw.boxes[i * 4 + 3] * scale_y;
    const boxscan::core::BBox box{
        static_cast<int>(std::lround(std::min(x1, x2))),
        static_cast<int>(std::lround(std::min(y1, y2))),
        static_cast<int>(std::lround(std::fabs(x2 - x1))),
        static_cast<int>(std::lround(std::fabs(y2 - y1)))};
    const boxscan::core::BBox clamped = boxscan::core::intersect(box, bounds);
    if (clamped.empty()) continue;
    out.push_back({clamped, std::clamp(score, 0.f, 1.f)});
  }
  return out;
}

}  // namespace boxscan::vision
