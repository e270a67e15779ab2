#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

namespace tilefuse::core {

/// Memory: Frame owns a single contiguous, row-major, tightly packed buffer.
/// Large source images are shared between crops as FramePtr (shared, const);
/// nothing writes to a Frame once it has been wrapped in a FramePtr.

/// Pixel layout / format (8 bits per channel).
enum class PixelFormat : std::uint8_t {
  Unknown,
  Grayscale8,
  RGB8,
  BGR8,
  RGBA8,
  BGRA8,
};

/// Number of interleaved channels for a format; 0 for Unknown.
[[nodiscard]] std::uint32_t channel_count(PixelFormat format) noexcept;

/// Single image: dimensions, format and owned pixel buffer.
class Frame {
 public:
  Frame() = default;

  Frame(std::uint32_t width,
        std::uint32_t height,
        PixelFormat format,
        std::vector<std::byte> buffer)
      : width_(width),
        height_(height),
        format_(format),
        buffer_(std::move(buffer)) {}

  [[nodiscard]] std::uint32_t width() const noexcept { return width_; }
  [[nodiscard]] std::uint32_t height() const noexcept { return height_; }
  [[nodiscard]] PixelFormat format() const noexcept { return format_; }
  [[nodiscard]] std::uint32_t channels() const noexcept {
    return channel_count(format_);
  }
  [[nodiscard]] std::size_t row_bytes() const noexcept {
    return static_cast<std::size_t>(width_) * channels();
  }

  [[nodiscard]] std::span<std::byte> data() noexcept {
    return std::span<std::byte>(buffer_.data(), buffer_.size());
  }
  [[nodiscard]] std::span<const std::byte> data() const noexcept {
    return std::span<const std::byte>(buffer_.data(), buffer_.size());
  }

  [[nodiscard]] bool empty() const noexcept { return buffer_.empty(); }
  [[nodiscard]] std::size_t size_bytes() const noexcept { return buffer_.size(); }

  /// True when the buffer is large enough for the declared geometry.
  [[nodiscard]] bool is_valid() const noexcept;

  /// Minimum bytes required for given dimensions and format (for validation).
  [[nodiscard]] static std::size_t min_bytes(std::uint32_t width,
                                             std::uint32_t height,
                                             PixelFormat format);

 private:
  std::uint32_t width_{0};
  std::uint32_t height_{0};
  PixelFormat format_{PixelFormat::Unknown};
  std::vector<std::byte> buffer_;
};

/// Read-only shared image (canvas / original), referenced by every crop of a run.
using FramePtr = std::shared_ptr<const Frame>;

}  // namespace tilefuse::core
