#pragma once

#include <boxscan/core/error.hpp>
#include <boxscan/core/image.hpp>
#include <boxscan/vision/proposal_decoder.hpp>
#include <boxscan/vision/raw_detections.hpp>
#include <boxscan/vision/region_proposer.hpp>
#include <array>
#include <memory>
#include <string>

namespace boxscan::vision {

/// ONNX Runtime box detector: loads an ONNX model and implements IRegionProposer.
///
/// Expected model: detection model with one float image input ([1,3,H,W] or
/// [1,H,W,3], RGB scaled to [0, 1]) and either:
/// - **Three outputs**: boxes [1,N,4] / [N,4], scores [1,N], class_ids [1,N];
/// - **One output (YOLO-style)**: [1, N, 6] or [1, 6, N] with
///   (xmin, ymin, xmax, ymax, score, class_id) per detection.
/// The image is resized to the model input; boxes are scaled back by the
/// ProposalDecoder.
class OnnxRegionProposer : public IRegionProposer {
 public:
  /// \param model_path Path to the .onnx model file.
  /// \param decoder Score threshold and class filter for raw detections.
  /// \param output_names Optional {boxes, scores, class_ids}; if any empty, names are
  ///        inferred from the model (first three outputs in order).
  OnnxRegionProposer(std::string model_path,
                     ProposalDecoder decoder,
                     std::array<std::string, 3> output_names = {});

  ~OnnxRegionProposer() override;

  OnnxRegionProposer(const OnnxRegionProposer&) = delete;
  OnnxRegionProposer& operator=(const OnnxRegionProposer&) = delete;

  [[nodiscard]] std::expected<std::vector<Proposal>, boxscan::core::ScanError>
  propose(const boxscan::core::Image& image) override;

  /// Raw model output for an image already resized to the model input.
  [[nodiscard]] std::expected<RawDetections, boxscan::core::ScanError>
  infer(const boxscan::core::Image& model_sized_image);

  [[nodiscard]] std::uint32_t input_width() const noexcept;
  [[nodiscard]] std::uint32_t input_height() const noexcept;

  void warmup() override;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
  ProposalDecoder decoder_;
};

}  // namespace boxscan::vision
