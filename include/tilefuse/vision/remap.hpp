#pragma once

#include <tilefuse/core/crop.hpp>
#include <tilefuse/core/geometry.hpp>
#include <cstdint>

namespace tilefuse::vision {

/// How a tile-sized instance mask is brought to canvas resolution.
enum class MaskPlacement : std::uint8_t {
  /// Nearest-neighbour resize of the tile mask to the whole canvas.
  Stretch,
  /// Tile mask pasted at the tile offset inside an empty canvas mask.
  Composite,
};

/// Box in tile-local coordinates -> canvas coordinates (offset only).
[[nodiscard]] core::BBox to_canvas(const core::BBox& local, const core::Rect& tile) noexcept;

/// Canvas box -> original-image box.
[[nodiscard]] core::BBox to_original(const core::BBox& canvas_box,
                                     std::uint32_t canvas_width,
                                     std::uint32_t canvas_height,
                                     std::uint32_t original_width,
                                     std::uint32_t original_height) noexcept;

/// Inferred -> Remapped: offsets boxes into the canvas and brings masks to
/// canvas resolution. Masks whose size differs from the tile, or a mask list
/// whose length differs from the box list, are dropped for the whole crop
/// (logged, crop.masks_dropped() set); boxes, classes and confidences are kept.
void remap_to_canvas(core::Crop& crop, MaskPlacement placement);

/// Remapped -> Scaled: rescales boxes and masks from canvas to original image.
void scale_to_original(core::Crop& crop);

}  // namespace tilefuse::vision
