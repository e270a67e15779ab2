#pragma once

#include <tilefuse/core/crop.hpp>
#include <tilefuse/core/error.hpp>
#include <tilefuse/core/frame.hpp>
#include <tilefuse/core/geometry.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <vector>

namespace tilefuse::vision {

/// Tile size and overlap for slicing a large image.
struct TileConfig {
  std::int32_t tile_width{700};
  std::int32_t tile_height{700};
  float overlap_x_pct{25.f};  // [0, 100)
  float overlap_y_pct{25.f};  // [0, 100)
  /// Rescale fused boxes/masks from the canvas back to the original image.
  bool resize_to_original{false};
};

/// Upper bound on steps_x * steps_y. Overlaps close to 100% on a small tile
/// would otherwise ask for billions of crops.
inline constexpr std::size_t kMaxTileCount = 1'000'000;

/// Grid layout derived from image size and TileConfig.
///
/// The canvas is the size the image is resized to so that the last tile on
/// each axis ends exactly on the canvas edge.
struct TileGrid {
  std::int32_t steps_x{0};
  std::int32_t steps_y{0};
  double stride_x{1.0};  // fraction of tile width between tile origins
  double stride_y{1.0};
  std::int32_t tile_width{0};
  std::int32_t tile_height{0};
  std::int32_t canvas_width{0};
  std::int32_t canvas_height{0};

  [[nodiscard]] std::size_t tile_count() const noexcept {
    return static_cast<std::size_t>(steps_x) * static_cast<std::size_t>(steps_y);
  }

  /// Canvas rectangle of tile (row, col); offsets rounded half away from zero.
  [[nodiscard]] core::Rect tile_rect(std::int32_t row, std::int32_t col) const noexcept;

  /// 1-based row-major sequence number of tile (row, col).
  [[nodiscard]] std::uint32_t tile_index(std::int32_t row, std::int32_t col) const noexcept {
    return static_cast<std::uint32_t>(row * steps_x + col + 1);
  }
};

/// Checks tile size and overlap ranges, and that the tile fits the image.
[[nodiscard]] std::expected<void, core::PipelineError> validate_tile_config(
    const TileConfig& config,
    std::uint32_t image_width,
    std::uint32_t image_height);

/// Step counts and canvas size for an image. InvalidConfig when validation fails,
/// when the grid exceeds kMaxTileCount tiles, or when the canvas does not fit int32.
[[nodiscard]] std::expected<TileGrid, core::PipelineError> compute_tile_grid(
    std::uint32_t image_width,
    std::uint32_t image_height,
    const TileConfig& config);

/// Output of one tiling run. Crops share canvas and original.
struct TilingResult {
  TileGrid grid;
  core::FramePtr original;
  core::FramePtr canvas;
  std::vector<core::Crop> crops;  // row-major
  std::size_t tiles_skipped{0};
};

/// Resizes \p image to the grid canvas and cuts it into overlapping crops.
///
/// Tiles that would leave the canvas are skipped with a warning and counted in
/// tiles_skipped. Errors: InvalidFrame for an empty or malformed image,
/// InvalidConfig for a bad TileConfig.
[[nodiscard]] std::expected<TilingResult, core::PipelineError> generate_tiles(
    core::FramePtr image,
    const TileConfig& config);

}  // namespace tilefuse::vision
