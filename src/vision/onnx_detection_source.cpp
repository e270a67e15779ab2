#include <tilefuse/vision/onnx_detection_source.hpp>
#include "frame_cv_utils.hpp"
#include <tilefuse/core/error.hpp>
#include <tilefuse/core/frame.hpp>
#include <tilefuse/core/log.hpp>
#include <tilefuse/vision/detection_decoder.hpp>
#include <onnxruntime_cxx_api.h>
#include <opencv2/imgproc.hpp>
#include <cstdint>
#include <cstring>
#include <expected>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace tilefuse::vision {

namespace {

constexpr int64_t kNumChannels = 3;

Ort::MemoryInfo CpuMemoryInfo() {
  return Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
}

/// 8-bit frame -> RGB float [0, 1] at the model input size, HWC.
cv::Mat preprocess(const cv::Mat& image, core::PixelFormat format, int width, int height) {
  cv::Mat rgb;
  switch (format) {
    case core::PixelFormat::Grayscale8:
      cv::cvtColor(image, rgb, cv::COLOR_GRAY2RGB);
      break;
    case core::PixelFormat::BGR8:
      cv::cvtColor(image, rgb, cv::COLOR_BGR2RGB);
      break;
    case core::PixelFormat::RGBA8:
      cv::cvtColor(image, rgb, cv::COLOR_RGBA2RGB);
      break;
    case core::PixelFormat::BGRA8:
      cv::cvtColor(image, rgb, cv::COLOR_BGRA2RGB);
      break;
    default:
      rgb = image;
      break;
  }
  cv::Mat resized;
  if (rgb.cols != width || rgb.rows != height) {
    cv::resize(rgb, resized, cv::Size(width, height), 0, 0, cv::INTER_LINEAR);
  } else {
    resized = rgb;
  }
  cv::Mat out;
  resized.convertTo(out, CV_32FC3, 1.0 / 255.0);
  return out;
}

/// Copy HWC (height, width, channels) float buffer to NCHW (batch, channels, height, width).
void HwcToNchw(const float* hwc, std::uint32_t h, std::uint32_t w, float* nchw) {
  const std::size_t hw = static_cast<std::size_t>(h) * w;
  for (std::uint32_t y = 0; y < h; ++y) {
    for (std::uint32_t x = 0; x < w; ++x) {
      const std::size_t src_idx = (static_cast<std::size_t>(y) * w + x) * kNumChannels;
      nchw[0 * hw + y * w + x] = hwc[src_idx + 0];
      nchw[1 * hw + y * w + x] = hwc[src_idx + 1];
      nchw[2 * hw + y * w + x] = hwc[src_idx + 2];
    }
  }
}

/// Reads [1, N, 6] or [1, 6, N] (xmin, ymin, xmax, ymax, score, class_id).
std::expected<InferenceResult, core::PipelineError> parse_single_output(Ort::Value& out) {
  const auto shape = out.GetTensorTypeAndShapeInfo().GetShape();
  const float* data = out.GetTensorData<float>();
  int64_t n = -1;
  bool rows_are_n6 = false;
  if (shape.size() == 3u && shape[0] == 1 && shape[2] == 6) {
    n = shape[1];
    rows_are_n6 = true;
  } else if (shape.size() == 3u && shape[0] == 1 && shape[1] == 6) {
    n = shape[2];
  }
  if (n < 0) {
    return std::unexpected(core::PipelineError::InferenceFailed);
  }

  InferenceResult result;
  result.num_detections = static_cast<std::uint32_t>(n);
  result.boxes.reserve(static_cast<std::size_t>(n) * 4u);
  result.scores.reserve(static_cast<std::size_t>(n));
  result.class_ids.reserve(static_cast<std::size_t>(n));
  for (int64_t i = 0; i < n; ++i) {
    float v[6];
    for (int64_t c = 0; c < 6; ++c) {
      v[c] = rows_are_n6 ? data[i * 6 + c] : data[c * n + i];
    }
    result.boxes.insert(result.boxes.end(), {v[0], v[1], v[2], v[3]});
    result.scores.push_back(v[4]);
    result.class_ids.push_back(static_cast<int64_t>(v[5]));
  }
  return result;
}

/// Reads boxes [1,N,4] / [N,4] / [1,4,N], scores [1,N] / [N], class_ids [1,N] / [N].
std::expected<InferenceResult, core::PipelineError> parse_three_outputs(std::vector<Ort::Value>& outputs) {
  Ort::Value& boxes_val = outputs[0];
  Ort::Value& scores_val = outputs[1];
  Ort::Value& classes_val = outputs[2];
  const std::vector<int64_t> boxes_shape = boxes_val.GetTensorTypeAndShapeInfo().GetShape();

  int64_t n = -1;
  bool boxes_is_n4 = true;
  if (boxes_shape.size() == 3u && boxes_shape[0] == 1 && boxes_shape[2] == 4) {
    n = boxes_shape[1];
  } else if (boxes_shape.size() == 3u && boxes_shape[0] == 1 && boxes_shape[1] == 4) {
    n = boxes_shape[2];
    boxes_is_n4 = false;
  } else if (boxes_shape.size() == 2u && boxes_shape[1] == 4) {
    n = boxes_shape[0];
  }
  if (n < 0) {
    return std::unexpected(core::PipelineError::InferenceFailed);
  }
  const auto scores_count = scores_val.GetTensorTypeAndShapeInfo().GetElementCount();
  const auto classes_count = classes_val.GetTensorTypeAndShapeInfo().GetElementCount();
  if (scores_count < static_cast<std::size_t>(n) || classes_count < static_cast<std::size_t>(n)) {
    return std::unexpected(core::PipelineError::InferenceFailed);
  }

  const float* boxes_data = boxes_val.GetTensorData<float>();
  const float* scores_data = scores_val.GetTensorData<float>();
  const bool classes_are_float =
      classes_val.GetTensorTypeAndShapeInfo().GetElementType() == ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT;

  InferenceResult result;
  result.num_detections = static_cast<std::uint32_t>(n);
  result.boxes.reserve(static_cast<std::size_t>(n) * 4u);
  result.scores.reserve(static_cast<std::size_t>(n));
  result.class_ids.reserve(static_cast<std::size_t>(n));
  for (int64_t i = 0; i < n; ++i) {
    for (int64_t c = 0; c < 4; ++c) {
      result.boxes.push_back(boxes_is_n4 ? boxes_data[i * 4 + c] : boxes_data[c * n + i]);
    }
    result.scores.push_back(scores_data[i]);
    result.class_ids.push_back(classes_are_float
                                   ? static_cast<int64_t>(classes_val.GetTensorData<float>()[i])
                                   : classes_val.GetTensorData<int64_t>()[i]);
  }
  return result;
}

}  // namespace

struct OnnxDetectionSource::Impl {
  Ort::Env env{ORT_LOGGING_LEVEL_WARNING, "tilefuse"};
  Ort::SessionOptions session_options;
  Ort::Session session{nullptr};
  std::string input_name;
  std::array<std::string, 3> output_names;
  std::vector<const char*> output_name_ptrs;
  int64_t input_height{-1};  // -1: dynamic
  int64_t input_width{-1};
  bool input_is_nchw{true};
  /// True if model has a single output with [1, N, 6] or [1, 6, N].
  bool use_yolo_single_output{false};

  Impl() {
    session_options.SetIntraOpNumThreads(1);
    session_options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);
  }
};

OnnxDetectionSource::OnnxDetectionSource(std::string model_path,
                                         std::string input_name,
                                         std::array<std::string, 3> output_names)
    : impl_(std::make_unique<Impl>()) {
  impl_->session = Ort::Session(impl_->env, model_path.c_str(), impl_->session_options);

  Ort::AllocatorWithDefaultOptions allocator;
  if (impl_->session.GetInputCount() == 0) {
    throw std::runtime_error("OnnxDetectionSource: model has no inputs");
  }
  if (input_name.empty()) {
    impl_->input_name = impl_->session.GetInputNameAllocated(0, allocator).get();
  } else {
    impl_->input_name = std::move(input_name);
  }

  const std::vector<int64_t> dims =
      impl_->session.GetInputTypeInfo(0).GetTensorTypeAndShapeInfo().GetShape();
  if (dims.size() != 4u) {
    throw std::runtime_error("OnnxDetectionSource: expected 4D input");
  }
  // NCHW: [1, C, H, W] or NHWC: [1, H, W, C]
  if (dims[1] == kNumChannels) {
    impl_->input_is_nchw = true;
    impl_->input_height = dims[2];
    impl_->input_width = dims[3];
  } else if (dims[3] == kNumChannels) {
    impl_->input_is_nchw = false;
    impl_->input_height = dims[1];
    impl_->input_width = dims[2];
  } else {
    throw std::runtime_error("OnnxDetectionSource: expected input shape [1,3,H,W] or [1,H,W,3]");
  }

  const size_t num_outputs = impl_->session.GetOutputCount();
  if (num_outputs == 1u) {
    impl_->use_yolo_single_output = true;
    impl_->output_names[0] = impl_->session.GetOutputNameAllocated(0, allocator).get();
    impl_->output_name_ptrs.push_back(impl_->output_names[0].c_str());
  } else if (num_outputs >= 3u) {
    for (std::size_t i = 0; i < 3u; ++i) {
      impl_->output_names[i] = output_names[i].empty()
                                   ? std::string(impl_->session.GetOutputNameAllocated(i, allocator).get())
                                   : output_names[i];
    }
    for (const auto& name : impl_->output_names) {
      impl_->output_name_ptrs.push_back(name.c_str());
    }
  } else {
    throw std::runtime_error(
        "OnnxDetectionSource: model must have 1 output (YOLO-style) or at least 3 outputs "
        "(boxes, scores, class_ids)");
  }
  core::log::d("onnx: loaded " + model_path + " (" + std::to_string(num_outputs) + " outputs)");
}

OnnxDetectionSource::~OnnxDetectionSource() = default;

std::expected<void, core::PipelineError> OnnxDetectionSource::validate_input(
    const core::Frame& image) const {
  if (image.empty() || !image.is_valid()) {
    return std::unexpected(core::PipelineError::InvalidFrame);
  }
  return {};
}

std::expected<core::Detections, core::PipelineError> OnnxDetectionSource::infer(
    const core::Frame& image,
    const InferenceParams& params) {
  auto valid = validate_input(image);
  if (!valid) {
    return std::unexpected(valid.error());
  }
  auto mat = detail::frame_to_mat(image);
  if (!mat) {
    return std::unexpected(core::PipelineError::InvalidFrame);
  }

  const int64_t dynamic_side = static_cast<int64_t>(params.image_size);
  const int64_t h = impl_->input_height > 0 ? impl_->input_height : dynamic_side;
  const int64_t w = impl_->input_width > 0 ? impl_->input_width : dynamic_side;
  cv::Mat hwc = preprocess(*mat, image.format(), static_cast<int>(w), static_cast<int>(h));

  const std::size_t num_floats = static_cast<std::size_t>(kNumChannels * h * w);
  std::vector<float> tensor_data(num_floats);
  std::array<int64_t, 4> shape{};
  if (impl_->input_is_nchw) {
    HwcToNchw(hwc.ptr<float>(), static_cast<std::uint32_t>(h), static_cast<std::uint32_t>(w),
              tensor_data.data());
    shape = {1, kNumChannels, h, w};
  } else {
    std::memcpy(tensor_data.data(), hwc.ptr<float>(), num_floats * sizeof(float));
    shape = {1, h, w, kNumChannels};
  }

  Ort::MemoryInfo mem_info = CpuMemoryInfo();
  Ort::Value input_tensor = Ort::Value::CreateTensor<float>(
      mem_info, tensor_data.data(), num_floats, shape.data(), shape.size());

  const char* input_names_c[] = {impl_->input_name.c_str()};
  Ort::RunOptions run_options;
  std::vector<Ort::Value> outputs;
  try {
    outputs = impl_->session.Run(run_options, input_names_c, &input_tensor, 1,
                                 impl_->output_name_ptrs.data(), impl_->output_name_ptrs.size());
  } catch (const Ort::Exception& e) {
    core::log::w(std::string("onnx: run failed: ") + e.what());
    return std::unexpected(core::PipelineError::InferenceFailed);
  }

  std::expected<InferenceResult, core::PipelineError> raw =
      std::unexpected(core::PipelineError::InferenceFailed);
  if (impl_->use_yolo_single_output && outputs.size() == 1u) {
    raw = parse_single_output(outputs[0]);
  } else if (!impl_->use_yolo_single_output && outputs.size() >= 3u) {
    raw = parse_three_outputs(outputs);
  }
  if (!raw) {
    return std::unexpected(raw.error());
  }

  const DetectionDecoder decoder(params, static_cast<std::uint32_t>(w), static_cast<std::uint32_t>(h),
                                 image.width(), image.height());
  return decoder.decode(*raw);
}

void OnnxDetectionSource::warmup() {
  InferenceParams params;
  const std::uint32_t h = impl_->input_height > 0 ? static_cast<std::uint32_t>(impl_->input_height)
                                                  : params.image_size;
  const std::uint32_t w = impl_->input_width > 0 ? static_cast<std::uint32_t>(impl_->input_width)
                                                 : params.image_size;
  std::vector<std::byte> buffer(core::Frame::min_bytes(w, h, core::PixelFormat::RGB8), std::byte{0});
  const core::Frame frame(w, h, core::PixelFormat::RGB8, std::move(buffer));
  auto result = infer(frame, params);
  if (!result) {
    core::log::w("onnx: warmup failed: " + std::string(core::to_string(result.error())));
  }
}

}  // namespace tilefuse::vision
