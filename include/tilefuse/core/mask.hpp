#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace tilefuse::core {

/// Binary instance mask, row-major, one byte per pixel with values 0 or 1.
/// A default-constructed (empty) mask means "no mask for this instance".
class BinaryMask {
 public:
  BinaryMask() = default;
  BinaryMask(std::uint32_t width, std::uint32_t height);
  BinaryMask(std::uint32_t width, std::uint32_t height, std::vector<std::uint8_t> pixels);

  [[nodiscard]] std::uint32_t width() const noexcept { return width_; }
  [[nodiscard]] std::uint32_t height() const noexcept { return height_; }
  [[nodiscard]] bool empty() const noexcept { return pixels_.empty(); }

  [[nodiscard]] std::uint8_t at(std::uint32_t x, std::uint32_t y) const noexcept {
    return pixels_[static_cast<std::size_t>(y) * width_ + x];
  }
  void set(std::uint32_t x, std::uint32_t y, bool on) noexcept {
    pixels_[static_cast<std::size_t>(y) * width_ + x] = on ? 1 : 0;
  }

  /// Fill the half-open pixel rectangle [x0, x1) x [y0, y1), clipped to the mask.
  void fill(std::int32_t x0, std::int32_t y0, std::int32_t x1, std::int32_t y1);

  [[nodiscard]] const std::vector<std::uint8_t>& pixels() const noexcept { return pixels_; }
  [[nodiscard]] std::vector<std::uint8_t>& pixels() noexcept { return pixels_; }

  /// Number of set pixels.
  [[nodiscard]] std::size_t count() const noexcept;

 private:
  std::uint32_t width_{0};
  std::uint32_t height_{0};
  std::vector<std::uint8_t> pixels_;
};

/// Set pixels common to both masks. Masks of different size are compared
/// over their shared top-left region.
[[nodiscard]] std::size_t intersection_count(const BinaryMask& a, const BinaryMask& b) noexcept;

}  // namespace tilefuse::core
