#pragma once

#include <tilefuse/core/detection.hpp>
#include <tilefuse/core/error.hpp>
#include <tilefuse/core/frame.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <unordered_set>

namespace tilefuse::vision {

/// Per-call detector settings.
struct InferenceParams {
  std::uint32_t image_size{640};  // model input side, pixels
  float confidence_threshold{0.5f};
  float iou_threshold{0.7f};      // detector-internal NMS
  std::optional<std::unordered_set<core::ClassId>> class_filter;  // nullopt: all classes
  bool segment{false};

  [[nodiscard]] bool accepts_class(core::ClassId id) const {
    return !class_filter || class_filter->contains(id);
  }
};

/// Abstract detector: image -> Detections in the image's pixel coordinates.
///
/// Boxes are (x1, y1, x2, y2), confidences in [0, 1]; with params.segment
/// one binary mask per instance at the input image resolution.
/// Implement infer(); optionally override validate_input, warmup, thread_safe.
class IDetectionSource {
 public:
  virtual ~IDetectionSource() = default;

  [[nodiscard]] virtual std::expected<core::Detections, core::PipelineError> infer(
      const core::Frame& image,
      const InferenceParams& params) = 0;

  /// Optional: validate frame format/dimensions before infer. Default: accept.
  [[nodiscard]] virtual std::expected<void, core::PipelineError> validate_input(
      const core::Frame& /*image*/) const {
    return {};
  }

  /// Optional: warmup run (e.g. dummy inference). Call once after construction. Default: no-op.
  virtual void warmup() {}

  /// True if infer() may be called from several threads at once.
  [[nodiscard]] virtual bool thread_safe() const noexcept { return false; }
};

}  // namespace tilefuse::vision
