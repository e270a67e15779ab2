#pragma once

#include <cstdint>

namespace tilefuse::core {

/// Integer pixel rectangle, top-left origin.
struct Rect {
  std::int32_t x_start{0};
  std::int32_t y_start{0};
  std::int32_t width{0};
  std::int32_t height{0};

  [[nodiscard]] std::int32_t x_end() const noexcept { return x_start + width; }
  [[nodiscard]] std::int32_t y_end() const noexcept { return y_start + height; }

  /// True if the rectangle lies entirely inside a width x height canvas.
  [[nodiscard]] bool fits_in(std::int32_t canvas_width,
                             std::int32_t canvas_height) const noexcept {
    return x_start >= 0 && y_start >= 0 && width > 0 && height > 0 &&
           x_end() <= canvas_width && y_end() <= canvas_height;
  }

  friend bool operator==(const Rect&, const Rect&) = default;
};

/// Axis-aligned detection box in pixel coords: (x1, y1) top-left, (x2, y2) bottom-right.
struct BBox {
  float x1{0.f};
  float y1{0.f};
  float x2{0.f};
  float y2{0.f};

  [[nodiscard]] float width() const noexcept { return x2 - x1; }
  [[nodiscard]] float height() const noexcept { return y2 - y1; }
  [[nodiscard]] float area() const noexcept { return width() * height(); }

  [[nodiscard]] BBox translated(float dx, float dy) const noexcept {
    return {x1 + dx, y1 + dy, x2 + dx, y2 + dy};
  }
  [[nodiscard]] BBox scaled(float sx, float sy) const noexcept {
    return {x1 * sx, y1 * sy, x2 * sx, y2 * sy};
  }

  friend bool operator==(const BBox&, const BBox&) = default;
};

/// Overlap area of two boxes; each axis is clamped at zero.
[[nodiscard]] inline float intersection_area(const BBox& a, const BBox& b) noexcept {
  const float ix1 = a.x1 > b.x1 ? a.x1 : b.x1;
  const float iy1 = a.y1 > b.y1 ? a.y1 : b.y1;
  const float ix2 = a.x2 < b.x2 ? a.x2 : b.x2;
  const float iy2 = a.y2 < b.y2 ? a.y2 : b.y2;
  const float w = ix2 - ix1;
  const float h = iy2 - iy1;
  return (w > 0.f ? w : 0.f) * (h > 0.f ? h : 0.f);
}

}  // namespace tilefuse::core
