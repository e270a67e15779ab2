#include <tilefuse/core/crop.hpp>
#include <stdexcept>
#include <string>

namespace tilefuse::core {

Crop::Crop(Rect rect,
           std::uint32_t tile_index,
           Frame local_image,
           FramePtr canvas,
           FramePtr original)
    : rect_(rect),
      tile_index_(tile_index),
      local_image_(std::move(local_image)),
      canvas_(std::move(canvas)),
      original_(std::move(original)) {}

void Crop::require_state(CropState expected, const char* operation) const {
  if (state_ != expected) {
    throw std::logic_error(std::string("Crop::") + operation + ": tile " +
                           std::to_string(tile_index_) + " is not in the required state");
  }
}

void Crop::set_detections(Detections detections) {
  require_state(CropState::Tiled, "set_detections");
  detections_ = std::move(detections);
  state_ = CropState::Inferred;
}

void Crop::set_inference_failed(PipelineError error) {
  require_state(CropState::Tiled, "set_inference_failed");
  detections_ = Detections{};
  inference_error_ = error;
  state_ = CropState::Inferred;
}

void Crop::set_remapped(Detections remapped, bool masks_dropped) {
  require_state(CropState::Inferred, "set_remapped");
  remapped_ = std::move(remapped);
  masks_dropped_ = masks_dropped;
  state_ = CropState::Remapped;
}

void Crop::set_scaled(Detections scaled) {
  require_state(CropState::Remapped, "set_scaled");
  remapped_ = std::move(scaled);
  state_ = CropState::Scaled;
}

}  // namespace tilefuse::core
