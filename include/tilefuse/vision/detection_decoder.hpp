#pragma once

#include <tilefuse/core/detection.hpp>
#include <tilefuse/vision/detection_source.hpp>
#include <tilefuse/vision/inference_result.hpp>
#include <cstdint>

namespace tilefuse::vision {

/// Keeps instances at or above the confidence threshold whose class passes the
/// filter; drops masks unless params.segment is set.
[[nodiscard]] core::Detections filter_detections(const core::Detections& detections,
                                                 const InferenceParams& params);

/// Decodes InferenceResult -> Detections: confidence threshold, class filter,
/// rescale from model input to source image, clipping, and per-class IoU
/// suppression at params.iou_threshold.
class DetectionDecoder {
 public:
  /// \param input_width, input_height Model input size the boxes refer to.
  /// \param image_width, image_height Size of the image that was fed to the model.
  DetectionDecoder(InferenceParams params,
                   std::uint32_t input_width,
                   std::uint32_t input_height,
                   std::uint32_t image_width,
                   std::uint32_t image_height);

  [[nodiscard]] core::Detections decode(const InferenceResult& result) const;

  [[nodiscard]] const InferenceParams& params() const noexcept { return params_; }

 private:
  InferenceParams params_;
  float scale_x_;
  float scale_y_;
  float image_width_;
  float image_height_;
};

}  // namespace tilefuse::vision
