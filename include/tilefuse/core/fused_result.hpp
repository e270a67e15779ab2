#pragma once

#include <tilefuse/core/detection.hpp>
#include <tilefuse/core/geometry.hpp>
#include <tilefuse/core/mask.hpp>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace tilefuse::core {

/// Final detections for one image after fusion, in NMS acceptance order.
/// Boxes and masks are in the frame given by image_width x image_height:
/// the original image when results were resized back, the canvas otherwise.
struct FusedResult {
  std::vector<float> confidences;
  std::vector<BBox> boxes;
  std::vector<ClassId> class_ids;
  std::vector<std::string> class_names;
  std::vector<BinaryMask> masks;  // empty unless segmenting

  std::uint32_t image_width{0};
  std::uint32_t image_height{0};
  std::uint32_t canvas_width{0};
  std::uint32_t canvas_height{0};

  /// Run diagnostics.
  std::size_t tiles_total{0};
  std::size_t tiles_skipped{0};
  std::size_t crops_failed{0};
  std::size_t crops_masks_dropped{0};

  [[nodiscard]] std::size_t size() const noexcept { return boxes.size(); }
  [[nodiscard]] bool empty() const noexcept { return boxes.empty(); }
};

}  // namespace tilefuse::core
