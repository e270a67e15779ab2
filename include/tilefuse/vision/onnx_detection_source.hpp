#pragma once

#include <tilefuse/core/error.hpp>
#include <tilefuse/core/frame.hpp>
#include <tilefuse/vision/detection_source.hpp>
#include <tilefuse/vision/inference_result.hpp>
#include <array>
#include <memory>
#include <string>

namespace tilefuse::vision {

/// ONNX Runtime detector: loads an ONNX model and implements IDetectionSource.
///
/// Expected model: detection model with one float image input, [1,3,H,W] or
/// [1,H,W,3], and either:
/// - **One output (YOLO-style)**: [1, N, 6] or [1, 6, N] with
///   (xmin, ymin, xmax, ymax, score, class_id) per detection, or
/// - **Three outputs**: boxes [1,N,4], scores [1,N], class_ids [1,N].
/// Boxes are in model-input pixels. Dynamic spatial dims take
/// InferenceParams::image_size.
///
/// Input: any 8-bit Frame (Grayscale8, RGB8, BGR8, RGBA8, BGRA8). It is resized
/// to the model input, converted to RGB and scaled to [0, 1]. Detections come
/// back in the input frame's pixel coordinates. Masks are not produced.
class OnnxDetectionSource : public IDetectionSource {
 public:
  /// \param model_path Path to the .onnx model file.
  /// \param input_name Optional input tensor name; if empty, the first input is used.
  /// \param output_names Optional {boxes, scores, class_ids}; if any empty, names are
  ///        inferred from the model (first three outputs in order).
  /// Throws std::runtime_error if the model cannot be loaded or has an unsupported layout.
  OnnxDetectionSource(std::string model_path,
                      std::string input_name = {},
                      std::array<std::string, 3> output_names = {});

  ~OnnxDetectionSource() override;

  OnnxDetectionSource(const OnnxDetectionSource&) = delete;
  OnnxDetectionSource& operator=(const OnnxDetectionSource&) = delete;

  [[nodiscard]] std::expected<core::Detections, core::PipelineError> infer(
      const core::Frame& image,
      const InferenceParams& params) override;

  [[nodiscard]] std::expected<void, core::PipelineError> validate_input(
      const core::Frame& image) const override;

  void warmup() override;

  /// Session::Run is reentrant and infer() keeps its buffers local.
  [[nodiscard]] bool thread_safe() const noexcept override { return true; }

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace tilefuse::vision
