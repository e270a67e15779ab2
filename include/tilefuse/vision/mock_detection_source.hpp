#pragma once

#include <tilefuse/core/detection.hpp>
#include <tilefuse/vision/detection_source.hpp>
#include <atomic>
#include <cstddef>
#include <optional>

namespace tilefuse::vision {

/// Source that returns configurable synthetic detections (for tests/demo).
/// Applies the confidence threshold, class filter and segment flag like a real detector.
/// Configure before use; infer() itself does not modify configuration.
class MockDetectionSource : public IDetectionSource {
 public:
  /// Detections to return from every infer() call, in input-image coordinates.
  void set_detections(core::Detections detections);

  /// Make every infer() call fail with \p error (nullopt: succeed again).
  void set_failure(std::optional<core::PipelineError> error);

  [[nodiscard]] std::expected<core::Detections, core::PipelineError> infer(
      const core::Frame& image,
      const InferenceParams& params) override;

  [[nodiscard]] std::expected<void, core::PipelineError> validate_input(
      const core::Frame& image) const override;

  [[nodiscard]] bool thread_safe() const noexcept override { return true; }

  [[nodiscard]] std::size_t call_count() const noexcept { return calls_.load(); }

 private:
  core::Detections detections_to_return_;
  std::optional<core::PipelineError> failure_;
  std::atomic<std::size_t> calls_{0};
};

}  // namespace tilefuse::vision
