#include <tilefuse/core/mask.hpp>
#include <algorithm>
#include <stdexcept>

namespace tilefuse::core {

BinaryMask::BinaryMask(std::uint32_t width, std::uint32_t height)
    : width_(width),
      height_(height),
      pixels_(static_cast<std::size_t>(width) * height, 0) {}

BinaryMask::BinaryMask(std::uint32_t width,
                       std::uint32_t height,
                       std::vector<std::uint8_t> pixels)
    : width_(width), height_(height), pixels_(std::move(pixels)) {
  if (pixels_.size() != static_cast<std::size_t>(width_) * height_) {
    throw std::invalid_argument("BinaryMask: pixel buffer does not match width * height");
  }
  for (auto& p : pixels_) {
    p = p != 0 ? 1 : 0;
  }
}

void BinaryMask::fill(std::int32_t x0, std::int32_t y0, std::int32_t x1, std::int32_t y1) {
  const std::int32_t w = static_cast<std::int32_t>(width_);
  const std::int32_t h = static_cast<std::int32_t>(height_);
  x0 = std::clamp(x0, 0, w);
  x1 = std::clamp(x1, 0, w);
  y0 = std::clamp(y0, 0, h);
  y1 = std::clamp(y1, 0, h);
  for (std::int32_t y = y0; y < y1; ++y) {
    auto row = pixels_.begin() + static_cast<std::ptrdiff_t>(y) * w;
    std::fill(row + x0, row + x1, std::uint8_t{1});
  }
}

std::size_t BinaryMask::count() const noexcept {
  return static_cast<std::size_t>(
      std::count(pixels_.begin(), pixels_.end(), std::uint8_t{1}));
}

std::size_t intersection_count(const BinaryMask& a, const BinaryMask& b) noexcept {
  const std::uint32_t w = std::min(a.width(), b.width());
  const std::uint32_t h = std::min(a.height(), b.height());
  std::size_t n = 0;
  for (std::uint32_t y = 0; y < h; ++y) {
    const std::uint8_t* ra = a.pixels().data() + static_cast<std::size_t>(y) * a.width();
    const std::uint8_t* rb = b.pixels().data() + static_cast<std::size_t>(y) * b.width();
    for (std::uint32_t x = 0; x < w; ++x) {
      n += static_cast<std::size_t>(ra[x] & rb[x]);
    }
  }
  return n;
}

}  // namespace tilefuse::core
