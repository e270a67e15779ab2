#include <tilefuse/vision/mock_detection_source.hpp>
#include <tilefuse/vision/detection_decoder.hpp>
#include <tilefuse/core/error.hpp>

namespace tilefuse::vision {

void MockDetectionSource::set_detections(core::Detections detections) {
  detections_to_return_ = std::move(detections);
}

void MockDetectionSource::set_failure(std::optional<core::PipelineError> error) {
  failure_ = error;
}

std::expected<core::Detections, core::PipelineError> MockDetectionSource::infer(
    const core::Frame& image,
    const InferenceParams& params) {
  ++calls_;
  auto valid = validate_input(image);
  if (!valid) {
    return std::unexpected(valid.error());
  }
  if (failure_) {
    return std::unexpected(*failure_);
  }
  return filter_detections(detections_to_return_, params);
}

std::expected<void, core::PipelineError> MockDetectionSource::validate_input(
    const core::Frame& image) const {
  if (image.empty()) {
    return std::unexpected(core::PipelineError::InvalidFrame);
  }
  return {};
}

}  // namespace tilefuse::vision
