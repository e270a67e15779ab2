#include <tilefuse/vision/remap.hpp>
#include "frame_cv_utils.hpp"
#include <tilefuse/core/detection.hpp>
#include <tilefuse/core/log.hpp>
#include <algorithm>
#include <string>

namespace tilefuse::vision {

namespace {

bool mask_fits_tile(const core::BinaryMask& mask, const core::Rect& tile) noexcept {
  return mask.width() == static_cast<std::uint32_t>(tile.width) &&
         mask.height() == static_cast<std::uint32_t>(tile.height);
}

core::BinaryMask composite_mask(const core::BinaryMask& local,
                                const core::Rect& tile,
                                std::uint32_t canvas_width,
                                std::uint32_t canvas_height) {
  core::BinaryMask out(canvas_width, canvas_height);
  for (std::uint32_t y = 0; y < local.height(); ++y) {
    const auto src = local.pixels().begin() + static_cast<std::ptrdiff_t>(y) * local.width();
    const auto dst = out.pixels().begin() +
                     static_cast<std::ptrdiff_t>(tile.y_start + static_cast<std::int32_t>(y)) * canvas_width +
                     tile.x_start;
    std::copy(src, src + local.width(), dst);
  }
  return out;
}

}  // namespace

core::BBox to_canvas(const core::BBox& local, const core::Rect& tile) noexcept {
  return local.translated(static_cast<float>(tile.x_start), static_cast<float>(tile.y_start));
}

core::BBox to_original(const core::BBox& canvas_box,
                       std::uint32_t canvas_width,
                       std::uint32_t canvas_height,
                       std::uint32_t original_width,
                       std::uint32_t original_height) noexcept {
  const float sx = static_cast<float>(original_width) / static_cast<float>(canvas_width);
  const float sy = static_cast<float>(original_height) / static_cast<float>(canvas_height);
  return canvas_box.scaled(sx, sy);
}

void remap_to_canvas(core::Crop& crop, MaskPlacement placement) {
  const core::Detections& local = crop.detections();
  const core::Rect& tile = crop.rect();
  const std::uint32_t canvas_w = crop.canvas()->width();
  const std::uint32_t canvas_h = crop.canvas()->height();

  core::Detections out;
  out.classes = local.classes;
  out.confidences = local.confidences;
  out.boxes.reserve(local.boxes.size());
  for (const auto& box : local.boxes) {
    out.boxes.push_back(to_canvas(box, tile));
  }

  bool dropped = false;
  if (local.has_masks()) {
    const bool shapes_ok =
        local.masks.size() == local.boxes.size() &&
        std::all_of(local.masks.begin(), local.masks.end(),
                    [&](const core::BinaryMask& m) { return mask_fits_tile(m, tile); });
    if (!shapes_ok) {
      core::log::w("remap: tile " + std::to_string(crop.tile_index()) +
                   ": instance masks do not match tile size " + std::to_string(tile.width) + "x" +
                   std::to_string(tile.height) + ", masks dropped");
      dropped = true;
    } else {
      out.masks.reserve(local.masks.size());
      for (const auto& mask : local.masks) {
        if (placement == MaskPlacement::Composite) {
          out.masks.push_back(composite_mask(mask, tile, canvas_w, canvas_h));
        } else {
          out.masks.push_back(detail::resize_mask(mask, canvas_w, canvas_h));
        }
      }
    }
  }
  crop.set_remapped(std::move(out), dropped);
}

void scale_to_original(core::Crop& crop) {
  const std::uint32_t canvas_w = crop.canvas()->width();
  const std::uint32_t canvas_h = crop.canvas()->height();
  const std::uint32_t orig_w = crop.original()->width();
  const std::uint32_t orig_h = crop.original()->height();

  core::Detections scaled = crop.remapped();
  for (auto& box : scaled.boxes) {
    box = to_original(box, canvas_w, canvas_h, orig_w, orig_h);
  }
  for (auto& mask : scaled.masks) {
    mask = detail::resize_mask(mask, orig_w, orig_h);
  }
  crop.set_scaled(std::move(scaled));
}

}  // namespace tilefuse::vision
