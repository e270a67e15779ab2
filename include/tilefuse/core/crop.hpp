#pragma once

#include <tilefuse/core/detection.hpp>
#include <tilefuse/core/error.hpp>
#include <tilefuse/core/frame.hpp>
#include <tilefuse/core/geometry.hpp>
#include <cstdint>
#include <optional>

namespace tilefuse::core {

/// Where a crop is in its lifecycle. Each step writes its result fields once.
enum class CropState : std::uint8_t {
  Tiled,     // geometry and pixels only
  Inferred,  // local-frame detections attached (possibly empty after a failure)
  Remapped,  // canvas-frame detections attached
  Scaled,    // canvas-frame detections rescaled to the original image
};

/// One tile of a tiling run: position, pixels and detection results.
///
/// The canvas and original images are shared with every other crop of the run
/// and never written. Geometry is fixed at construction.
class Crop {
 public:
  Crop(Rect rect,
       std::uint32_t tile_index,
       Frame local_image,
       FramePtr canvas,
       FramePtr original);

  [[nodiscard]] const Rect& rect() const noexcept { return rect_; }
  /// 1-based, row-major.
  [[nodiscard]] std::uint32_t tile_index() const noexcept { return tile_index_; }
  [[nodiscard]] const Frame& local_image() const noexcept { return local_image_; }
  [[nodiscard]] const FramePtr& canvas() const noexcept { return canvas_; }
  [[nodiscard]] const FramePtr& original() const noexcept { return original_; }

  [[nodiscard]] CropState state() const noexcept { return state_; }

  /// Detections in tile-local coordinates, as returned by the detector.
  [[nodiscard]] const Detections& detections() const noexcept { return detections_; }
  /// Detections in canvas coordinates (or original-image coordinates once Scaled).
  [[nodiscard]] const Detections& remapped() const noexcept { return remapped_; }

  /// Set when the detector failed on this crop; detections() is then empty.
  [[nodiscard]] const std::optional<PipelineError>& inference_error() const noexcept {
    return inference_error_;
  }
  /// True when this crop's masks were discarded for a shape mismatch.
  [[nodiscard]] bool masks_dropped() const noexcept { return masks_dropped_; }

  /// Tiled -> Inferred. Throws std::logic_error when called out of order.
  void set_detections(Detections detections);
  /// Tiled -> Inferred with empty detections.
  void set_inference_failed(PipelineError error);
  /// Inferred -> Remapped.
  void set_remapped(Detections remapped, bool masks_dropped);
  /// Remapped -> Scaled.
  void set_scaled(Detections scaled);

 private:
  void require_state(CropState expected, const char* operation) const;

  Rect rect_;
  std::uint32_t tile_index_;
  Frame local_image_;
  FramePtr canvas_;
  FramePtr original_;

  CropState state_{CropState::Tiled};
  Detections detections_;
  Detections remapped_;
  std::optional<PipelineError> inference_error_;
  bool masks_dropped_{false};
};

}  // namespace tilefuse::core
