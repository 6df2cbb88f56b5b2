#include <boxscan/vision/onnx_region_proposer.hpp>
#include "image_cv_utils.hpp"
#include <boxscan/core/log.hpp>
#include <onnxruntime_cxx_api.h>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <array>
#include <cstdint>
#include <stdexcept>
#include <vector>

namespace boxscan::vision {

namespace nc = boxscan::core;

namespace {

constexpr int64_t kNumChannels = 3;

Ort::MemoryInfo cpu_memory_info() {
  return Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
}

/// Copy HWC float buffer to NCHW.
void hwc_to_nchw(const float* hwc, std::uint32_t h, std::uint32_t w, float* nchw) {
  const std::size_t hw = static_cast<std::size_t>(h) * w;
  for (std::size_t i = 0; i < hw; ++i) {
    nchw[0 * hw + i] = hwc[i * kNumChannels + 0];
    nchw[1 * hw + i] = hwc[i * kNumChannels + 1];
    nchw[2 * hw + i] = hwc[i * kNumChannels + 2];
  }
}

/// Append \p n detections stored either row-major ([N, cols]) or
/// column-major ([cols, N]). Column 4 is the score, column 5 (if present)
/// the class id.
void append_rows(const float* data, int64_t n, int64_t cols, bool row_major,
                 RawDetections& out) {
  auto at = [&](int64_t i, int64_t c) {
    return row_major ? data[i * cols + c] : data[c * n + i];
  };
  for (int64_t i = 0; i < n; ++i) {
    for (int64_t c = 0; c < 4; ++c) out.boxes.push_back(at(i, c));
    out.scores.push_back(at(i, 4));
    out.class_ids.push_back(cols > 5 ? static_cast<int64_t>(at(i, 5)) : 0);
  }
  out.num_detections += static_cast<std::uint32_t>(n);
}

}  // namespace

struct OnnxRegionProposer::Impl {
  Ort::Env env{ORT_LOGGING_LEVEL_WARNING, "boxscan"};
  Ort::SessionOptions session_options;
  Ort::Session session{nullptr};

  std::string input_name;
  std::array<std::string, 3> output_names;
  std::vector<const char*> output_name_ptrs;

  std::uint32_t input_height{0};
  std::uint32_t input_width{0};
  bool input_is_nchw{true};
  bool single_output{false};

  Impl() {
    session_options.SetIntraOpNumThreads(1);
    session_options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);
  }
};

OnnxRegionProposer::OnnxRegionProposer(std::string model_path,
                                       ProposalDecoder decoder,
                                       std::array<std::string, 3> output_names)
    : impl_(std::make_unique<Impl>()), decoder_(std::move(decoder)) {
  impl_->session = Ort::Session(impl_->env, model_path.c_str(), impl_->session_options);

  Ort::AllocatorWithDefaultOptions allocator;
  if (impl_->session.GetInputCount() == 0) {
    throw std::runtime_error("OnnxRegionProposer: model has no inputs");
  }
  impl_->input_name = impl_->session.GetInputNameAllocated(0, allocator).get();

  const auto dims =
      impl_->session.GetInputTypeInfo(0).GetTensorTypeAndShapeInfo().GetShape();
  if (dims.size() != 4u) {
    throw std::runtime_error("OnnxRegionProposer: expected 4D input");
  }
  if (dims[1] == kNumChannels) {
    impl_->input_is_nchw = true;
    impl_->input_height = static_cast<std::uint32_t>(dims[2]);
    impl_->input_width = static_cast<std::uint32_t>(dims[3]);
  } else if (dims[3] == kNumChannels) {
    impl_->input_is_nchw = false;
    impl_->input_height = static_cast<std::uint32_t>(dims[1]);
    impl_->input_width = static_cast<std::uint32_t>(dims[2]);
  } else {
    throw std::runtime_error("OnnxRegionProposer: expected input shape [1,3,H,W] or [1,H,W,3]");
  }
  if (dims[1] <= 0 || dims[2] <= 0 || dims[3] <= 0) {
    throw std::runtime_error("OnnxRegionProposer: dynamic input dimensions are not supported");
  }

  const std::size_t num_outputs = impl_->session.GetOutputCount();
  if (num_outputs == 1u) {
    impl_->single_output = true;
    impl_->output_names[0] = impl_->session.GetOutputNameAllocated(0, allocator).get();
    impl_->output_name_ptrs.push_back(impl_->output_names[0].c_str());
  } else if (num_outputs >= 3u) {
    for (std::size_t i = 0; i < 3u; ++i) {
      impl_->output_names[i] =
          output_names[i].empty()
              ? std::string(impl_->session.GetOutputNameAllocated(i, allocator).get())
              : output_names[i];
    }
    for (const auto& name : impl_->output_names) {
      impl_->output_name_ptrs.push_back(name.c_str());
    }
  } else {
    throw std::runtime_error(
        "OnnxRegionProposer: model must have 1 output (YOLO-style) or at least 3 outputs");
  }
}

OnnxRegionProposer::~OnnxRegionProposer() = default;

std::uint32_t OnnxRegionProposer::input_width() const noexcept { return impl_->input_width; }
std::uint32_t OnnxRegionProposer::input_height() const noexcept { return impl_->input_height; }

std::expected<std::vector<Proposal>, nc::ScanError> OnnxRegionProposer::propose(
    const nc::Image& image) {
  auto valid = validate_input(image);
  if (!valid) {
    return std::unexpected(valid.error());
  }
  auto bgr = detail::to_bgr(image);
  if (!bgr) {
    return std::unexpected(nc::ScanError::InvalidImage);
  }

  cv::Mat resized;
  cv::resize(*bgr, resized,
             cv::Size(static_cast<int>(impl_->input_width), static_cast<int>(impl_->input_height)),
             0, 0, cv::INTER_LINEAR);
  auto raw = infer(detail::mat_to_image(resized, nc::PixelFormat::BGR8));
  if (!raw) {
    return std::unexpected(raw.error());
  }

  const float sx = static_cast<float>(image.width()) / static_cast<float>(impl_->input_width);
  const float sy = static_cast<float>(image.height()) / static_cast<float>(impl_->input_height);
  auto proposals = decoder_.decode(*raw, sx, sy, image.width(), image.height());
  core::log_debug("onnx") << raw->num_detections << " raw detections, " << proposals.size()
                          << " above threshold";
  return proposals;
}

std::expected<RawDetections, nc::ScanError> OnnxRegionProposer::infer(
    const nc::Image& model_sized_image) {
  if (model_sized_image.width() != impl_->input_width ||
      model_sized_image.height() != impl_->input_height) {
    return std::unexpected(nc::ScanError::InvalidImage);
  }
  auto bgr = detail::to_bgr(model_sized_image);
  if (!bgr) {
    return std::unexpected(nc::ScanError::InvalidImage);
  }

  cv::Mat rgb;
  cv::cvtColor(*bgr, rgb, cv::COLOR_BGR2RGB);
  cv::Mat hwc;
  rgb.convertTo(hwc, CV_32FC3, 1.0 / 255.0);

  const std::uint32_t h = impl_->input_height;
  const std::uint32_t w = impl_->input_width;
  const std::size_t num_floats = static_cast<std::size_t>(kNumChannels) * h * w;
  std::vector<float> tensor_data(num_floats);
  if (impl_->input_is_nchw) {
    hwc_to_nchw(hwc.ptr<float>(), h, w, tensor_data.data());
  } else {
    std::copy(hwc.ptr<float>(), hwc.ptr<float>() + num_floats, tensor_data.begin());
  }

  const std::array<int64_t, 4> shape =
      impl_->input_is_nchw
          ? std::array<int64_t, 4>{1, kNumChannels, static_cast<int64_t>(h), static_cast<int64_t>(w)}
          : std::array<int64_t, 4>{1, static_cast<int64_t>(h), static_cast<int64_t>(w), kNumChannels};
  Ort::MemoryInfo mem_info = cpu_memory_info();
  Ort::Value input_tensor = Ort::Value::CreateTensor<float>(
      mem_info, tensor_data.data(), num_floats, shape.data(), shape.size());

  const char* input_names_c[] = {impl_->input_name.c_str()};
  std::vector<Ort::Value> outputs;
  try {
    outputs = impl_->session.Run(Ort::RunOptions{nullptr}, input_names_c, &input_tensor, 1,
                                 impl_->output_name_ptrs.data(),
                                 impl_->output_name_ptrs.size());
  } catch (const Ort::Exception& e) {
    core::log_error("onnx") << "inference failed: " << e.what();
    return std::unexpected(nc::ScanError::DetectionFailure);
  }

  RawDetections result;

  if (impl_->single_output) {
    // [1, N, 6] or [1, 6, N]
    if (outputs.size() != 1u) {
      return std::unexpected(nc::ScanError::DetectionFailure);
    }
    const auto out_shape = outputs[0].GetTensorTypeAndShapeInfo().GetShape();
    const float* data = outputs[0].GetTensorData<float>();
    if (out_shape.size() == 3u && out_shape[0] == 1 && out_shape[2] == 6) {
      append_rows(data, out_shape[1], 6, true, result);
    } else if (out_shape.size() == 3u && out_shape[0] == 1 && out_shape[1] == 6) {
      append_rows(data, out_shape[2], 6, false, result);
    } else {
      return std::unexpected(nc::ScanError::DetectionFailure);
    }
    return result;
  }

  // Three outputs: boxes [1,N,4] or [N,4], scores [1,N], class ids [1,N].
  if (outputs.size() < 3u) {
    return std::unexpected(nc::ScanError::DetectionFailure);
  }
  const auto boxes_shape = outputs[0].GetTensorTypeAndShapeInfo().GetShape();
  int64_t n = 0;
  if (boxes_shape.size() == 3u && boxes_shape[0] == 1 && boxes_shape[2] == 4) {
    n = boxes_shape[1];
  } else if (boxes_shape.size() == 2u && boxes_shape[1] == 4) {
    n = boxes_shape[0];
  }
  if (n < 0) {
    return std::unexpected(nc::ScanError::DetectionFailure);
  }

  const float* boxes = outputs[0].GetTensorData<float>();
  const float* scores = outputs[1].GetTensorData<float>();
  const int64_t* classes = outputs[2].GetTensorData<int64_t>();
  result.num_detections = static_cast<std::uint32_t>(n);
  result.boxes.assign(boxes, boxes + n * 4);
  result.scores.assign(scores, scores + n);
  result.class_ids.assign(classes, classes + n);
  return result;
}

void OnnxRegionProposer::warmup() {
  std::vector<std::byte> buffer(
      nc::Image::min_bytes(impl_->input_width, impl_->input_height, nc::PixelFormat::BGR8),
      std::byte{0});
  nc::Image blank(impl_->input_width, impl_->input_height, nc::PixelFormat::BGR8,
                  std::move(buffer));
  auto warm = infer(blank);
  if (!warm) {
    core::log_warn("onnx") << "warmup inference failed: " << nc::to_string(warm.error());
  }
}

}  // namespace boxscan::vision
