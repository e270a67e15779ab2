#include <tilefuse/vision/tiler.hpp>
#include "frame_cv_utils.hpp"
#include <tilefuse/core/log.hpp>
#include <opencv2/imgproc.hpp>
#include <cmath>
#include <cstdint>
#include <limits>
#include <memory>
#include <string>

namespace tilefuse::vision {

namespace {

bool overlap_in_range(float pct) noexcept {
  return std::isfinite(pct) && pct >= 0.f && pct < 100.f;
}

/// floor((image - tile) / (tile * stride)) + 1, kept in double so a tiny
/// stride cannot overflow before it is range-checked.
double step_count(std::uint32_t image_dim, std::int32_t tile_dim, double stride) noexcept {
  const double pitch = static_cast<double>(tile_dim) * stride;
  return std::floor((static_cast<double>(image_dim) - tile_dim) / pitch) + 1.0;
}

/// Canvas extent along one axis: last tile offset plus the tile.
std::int64_t canvas_extent(std::int32_t tile_dim, std::int32_t steps, double stride) noexcept {
  return std::llround(static_cast<double>(tile_dim) * (steps - 1) * stride) + tile_dim;
}

/// round(tile * index * stride), half away from zero.
std::int32_t tile_offset(std::int32_t tile_dim, std::int32_t index, double stride) noexcept {
  return static_cast<std::int32_t>(
      std::lround(static_cast<double>(tile_dim) * index * stride));
}

}  // namespace

core::Rect TileGrid::tile_rect(std::int32_t row, std::int32_t col) const noexcept {
  return core::Rect{tile_offset(tile_width, col, stride_x),
                    tile_offset(tile_height, row, stride_y),
                    tile_width, tile_height};
}

std::expected<void, core::PipelineError> validate_tile_config(const TileConfig& config,
                                                              std::uint32_t image_width,
                                                              std::uint32_t image_height) {
  if (config.tile_width <= 0 || config.tile_height <= 0) {
    core::log::e("tiling: tile size must be positive");
    return std::unexpected(core::PipelineError::InvalidConfig);
  }
  if (!overlap_in_range(config.overlap_x_pct) || !overlap_in_range(config.overlap_y_pct)) {
    core::log::e("tiling: overlap must be in [0, 100)");
    return std::unexpected(core::PipelineError::InvalidConfig);
  }
  if (static_cast<std::uint32_t>(config.tile_width) > image_width ||
      static_cast<std::uint32_t>(config.tile_height) > image_height) {
    core::log::e("tiling: tile " + std::to_string(config.tile_width) + "x" +
                 std::to_string(config.tile_height) + " is larger than image " +
                 std::to_string(image_width) + "x" + std::to_string(image_height));
    return std::unexpected(core::PipelineError::InvalidConfig);
  }
  return {};
}

std::expected<TileGrid, core::PipelineError> compute_tile_grid(std::uint32_t image_width,
                                                               std::uint32_t image_height,
                                                               const TileConfig& config) {
  auto valid = validate_tile_config(config, image_width, image_height);
  if (!valid) {
    return std::unexpected(valid.error());
  }

  TileGrid grid;
  grid.tile_width = config.tile_width;
  grid.tile_height = config.tile_height;
  grid.stride_x = 1.0 - static_cast<double>(config.overlap_x_pct) / 100.0;
  grid.stride_y = 1.0 - static_cast<double>(config.overlap_y_pct) / 100.0;

  const double steps_x = step_count(image_width, config.tile_width, grid.stride_x);
  const double steps_y = step_count(image_height, config.tile_height, grid.stride_y);
  constexpr auto max_tiles = static_cast<double>(kMaxTileCount);
  if (!(steps_x <= max_tiles) || !(steps_y <= max_tiles) || steps_x * steps_y > max_tiles) {
    core::log::e("tiling: overlap " + std::to_string(config.overlap_x_pct) + "/" +
                 std::to_string(config.overlap_y_pct) + "% gives more than " +
                 std::to_string(kMaxTileCount) + " tiles");
    return std::unexpected(core::PipelineError::InvalidConfig);
  }
  grid.steps_x = static_cast<std::int32_t>(steps_x);
  grid.steps_y = static_cast<std::int32_t>(steps_y);

  // Last tile's far edge lands on the canvas boundary.
  const std::int64_t canvas_w = canvas_extent(grid.tile_width, grid.steps_x, grid.stride_x);
  const std::int64_t canvas_h = canvas_extent(grid.tile_height, grid.steps_y, grid.stride_y);
  if (canvas_w > std::numeric_limits<std::int32_t>::max() ||
      canvas_h > std::numeric_limits<std::int32_t>::max()) {
    core::log::e("tiling: canvas " + std::to_string(canvas_w) + "x" + std::to_string(canvas_h) +
                 " is too large");
    return std::unexpected(core::PipelineError::InvalidConfig);
  }
  grid.canvas_width = static_cast<std::int32_t>(canvas_w);
  grid.canvas_height = static_cast<std::int32_t>(canvas_h);
  return grid;
}

std::expected<TilingResult, core::PipelineError> generate_tiles(core::FramePtr image,
                                                                const TileConfig& config) {
  if (!image || image->empty() || !image->is_valid()) {
    return std::unexpected(core::PipelineError::InvalidFrame);
  }
  auto mat_in = detail::frame_to_mat(*image);
  if (!mat_in) {
    return std::unexpected(core::PipelineError::InvalidFrame);
  }

  auto grid = compute_tile_grid(image->width(), image->height(), config);
  if (!grid) {
    return std::unexpected(grid.error());
  }

  TilingResult out;
  out.grid = *grid;
  out.original = image;

  if (static_cast<std::int32_t>(image->width()) == grid->canvas_width &&
      static_cast<std::int32_t>(image->height()) == grid->canvas_height) {
    out.canvas = image;
  } else {
    cv::Mat resized;
    cv::resize(*mat_in, resized, cv::Size(grid->canvas_width, grid->canvas_height),
               0, 0, cv::INTER_LINEAR);
    out.canvas = std::make_shared<const core::Frame>(
        detail::mat_to_frame(resized, image->format()));
  }
  auto canvas_mat = detail::frame_to_mat(*out.canvas);
  if (!canvas_mat) {
    return std::unexpected(core::PipelineError::InvalidFrame);
  }

  out.crops.reserve(grid->tile_count());
  for (std::int32_t row = 0; row < grid->steps_y; ++row) {
    for (std::int32_t col = 0; col < grid->steps_x; ++col) {
      const core::Rect rect = grid->tile_rect(row, col);
      const std::uint32_t index = grid->tile_index(row, col);
      // Not reached today: the canvas is sized so the last tile ends on its edge.
      if (!rect.fits_in(grid->canvas_width, grid->canvas_height)) {
        core::log::w("tiling: tile " + std::to_string(index) + " at (" +
                     std::to_string(rect.x_start) + "," + std::to_string(rect.y_start) +
                     ") exceeds canvas " + std::to_string(grid->canvas_width) + "x" +
                     std::to_string(grid->canvas_height) + ", skipped");
        ++out.tiles_skipped;
        continue;
      }

      const cv::Mat roi = (*canvas_mat)(cv::Rect(rect.x_start, rect.y_start, rect.width, rect.height));
      out.crops.emplace_back(rect, index, detail::mat_to_frame(roi, image->format()),
                             out.canvas, out.original);
    }
  }

  core::log::d("tiling: " + std::to_string(grid->steps_x) + "x" + std::to_string(grid->steps_y) +
               " tiles on canvas " + std::to_string(grid->canvas_width) + "x" +
               std::to_string(grid->canvas_height));
  return out;
}

}  // namespace tilefuse::vision
