#include <tilefuse/vision/tiler.hpp>
#include <gtest/gtest.h>
#include <cstddef>
#include <memory>
#include <tuple>
#include <utility>
#include <vector>

namespace tc = tilefuse::core;
namespace tv = tilefuse::vision;

namespace {

tc::FramePtr make_gray(std::uint32_t w, std::uint32_t h) {
  std::vector<std::byte> buf(static_cast<std::size_t>(w) * h);
  return std::make_shared<const tc::Frame>(w, h, tc::PixelFormat::Grayscale8, std::move(buf));
}

/// Every pixel holds (x / 100) * 10 + (y / 100): one value per 100x100 block.
tc::FramePtr make_block_image(std::uint32_t w, std::uint32_t h) {
  std::vector<std::byte> buf(static_cast<std::size_t>(w) * h);
  for (std::uint32_t y = 0; y < h; ++y) {
    for (std::uint32_t x = 0; x < w; ++x) {
      buf[static_cast<std::size_t>(y) * w + x] = static_cast<std::byte>((x / 100) * 10 + y / 100);
    }
  }
  return std::make_shared<const tc::Frame>(w, h, tc::PixelFormat::Grayscale8, std::move(buf));
}

/// True if the union of [start, start + len) intervals covers [0, extent).
bool covers(std::vector<std::pair<std::int32_t, std::int32_t>> intervals, std::int32_t extent) {
  std::vector<bool> hit(static_cast<std::size_t>(extent), false);
  for (const auto& [start, len] : intervals) {
    for (std::int32_t i = start; i < start + len && i < extent; ++i) {
      if (i >= 0) hit[static_cast<std::size_t>(i)] = true;
    }
  }
  for (bool h : hit) {
    if (!h) return false;
  }
  return true;
}

}  // namespace

TEST(TileGrid, LargeImageDefaultConfig) {
  // 1500x1000, 700x700 tiles, 25% overlap: pitch 525.
  auto grid = tv::compute_tile_grid(1500, 1000, tv::TileConfig{});
  ASSERT_TRUE(grid.has_value());
  EXPECT_EQ(grid->steps_x, 2);
  EXPECT_EQ(grid->steps_y, 1);
  EXPECT_EQ(grid->canvas_width, 1225);
  EXPECT_EQ(grid->canvas_height, 700);
  EXPECT_EQ(grid->tile_count(), 2u);
  EXPECT_EQ(grid->tile_rect(0, 0), (tc::Rect{0, 0, 700, 700}));
  EXPECT_EQ(grid->tile_rect(0, 1), (tc::Rect{525, 0, 700, 700}));
}

TEST(TileGrid, ZeroOverlapGivesExactMultiples) {
  tv::TileConfig config{100, 100, 0.f, 0.f, false};
  auto grid = tv::compute_tile_grid(400, 300, config);
  ASSERT_TRUE(grid.has_value());
  EXPECT_EQ(grid->steps_x, 4);
  EXPECT_EQ(grid->steps_y, 3);
  EXPECT_EQ(grid->canvas_width, 400);
  EXPECT_EQ(grid->canvas_height, 300);
  for (std::int32_t row = 0; row < grid->steps_y; ++row) {
    for (std::int32_t col = 0; col < grid->steps_x; ++col) {
      EXPECT_EQ(grid->tile_rect(row, col), (tc::Rect{col * 100, row * 100, 100, 100}));
    }
  }
}

TEST(TileGrid, TileIndexIsOneBasedRowMajor) {
  tv::TileConfig config{100, 100, 0.f, 0.f, false};
  auto grid = tv::compute_tile_grid(400, 300, config);
  ASSERT_TRUE(grid.has_value());
  EXPECT_EQ(grid->tile_index(0, 0), 1u);
  EXPECT_EQ(grid->tile_index(0, 3), 4u);
  EXPECT_EQ(grid->tile_index(1, 0), 5u);
  EXPECT_EQ(grid->tile_index(2, 3), 12u);
}

TEST(TileGrid, TilesCoverCanvasAndStayInside) {
  const std::vector<std::tuple<std::uint32_t, std::uint32_t, tv::TileConfig>> cases{
      {1500, 1000, tv::TileConfig{}},
      {1024, 768, tv::TileConfig{256, 256, 20.f, 10.f, false}},
      {999, 777, tv::TileConfig{300, 200, 33.f, 50.f, false}},
      {640, 640, tv::TileConfig{640, 640, 0.f, 0.f, false}},
      {1000, 1000, tv::TileConfig{128, 96, 12.5f, 40.f, false}},
      {5000, 300, tv::TileConfig{512, 300, 75.f, 0.f, false}},
  };
  for (const auto& [w, h, config] : cases) {
    auto grid = tv::compute_tile_grid(w, h, config);
    ASSERT_TRUE(grid.has_value()) << w << "x" << h;
    // Tiles form a cartesian grid, so coverage per axis is coverage of the canvas.
    std::vector<std::pair<std::int32_t, std::int32_t>> xs;
    std::vector<std::pair<std::int32_t, std::int32_t>> ys;
    for (std::int32_t row = 0; row < grid->steps_y; ++row) {
      for (std::int32_t col = 0; col < grid->steps_x; ++col) {
        const tc::Rect r = grid->tile_rect(row, col);
        EXPECT_TRUE(r.fits_in(grid->canvas_width, grid->canvas_height))
            << w << "x" << h << " tile (" << row << "," << col << ")";
        if (row == 0) xs.emplace_back(r.x_start, r.width);
        if (col == 0) ys.emplace_back(r.y_start, r.height);
      }
    }
    EXPECT_TRUE(covers(xs, grid->canvas_width)) << w << "x" << h;
    EXPECT_TRUE(covers(ys, grid->canvas_height)) << w << "x" << h;
    EXPECT_EQ(grid->tile_rect(grid->steps_y - 1, grid->steps_x - 1).x_end(), grid->canvas_width);
    EXPECT_EQ(grid->tile_rect(grid->steps_y - 1, grid->steps_x - 1).y_end(), grid->canvas_height);
  }
}

TEST(TileGrid, RejectsBadConfig) {
  EXPECT_EQ(tv::compute_tile_grid(100, 100, tv::TileConfig{0, 50, 0.f, 0.f, false}).error(),
            tc::PipelineError::InvalidConfig);
  EXPECT_EQ(tv::compute_tile_grid(100, 100, tv::TileConfig{50, -1, 0.f, 0.f, false}).error(),
            tc::PipelineError::InvalidConfig);
  EXPECT_EQ(tv::compute_tile_grid(100, 100, tv::TileConfig{50, 50, 100.f, 0.f, false}).error(),
            tc::PipelineError::InvalidConfig);
  EXPECT_EQ(tv::compute_tile_grid(100, 100, tv::TileConfig{50, 50, 0.f, -5.f, false}).error(),
            tc::PipelineError::InvalidConfig);
  // Tile larger than the image.
  EXPECT_EQ(tv::compute_tile_grid(100, 100, tv::TileConfig{101, 50, 0.f, 0.f, false}).error(),
            tc::PipelineError::InvalidConfig);
}

TEST(TileGrid, RejectsDegenerateOverlap) {
  // A 1px tile at 99.99999% overlap asks for ~4e10 steps per axis.
  auto grid = tv::compute_tile_grid(3000, 3000, tv::TileConfig{1, 1, 99.99999f, 0.f, false});
  ASSERT_FALSE(grid.has_value());
  EXPECT_EQ(grid.error(), tc::PipelineError::InvalidConfig);

  grid = tv::compute_tile_grid(3000, 3000, tv::TileConfig{1, 1, 0.f, 99.9f, false});
  ASSERT_FALSE(grid.has_value());
  EXPECT_EQ(grid.error(), tc::PipelineError::InvalidConfig);

  auto tiles = tv::generate_tiles(make_gray(1000, 1000), tv::TileConfig{1, 1, 99.99999f, 99.99999f, false});
  ASSERT_FALSE(tiles.has_value());
  EXPECT_EQ(tiles.error(), tc::PipelineError::InvalidConfig);
}

TEST(TileGrid, TileCountCapIsInclusive) {
  auto at_cap = tv::compute_tile_grid(1000, 1000, tv::TileConfig{1, 1, 0.f, 0.f, false});
  ASSERT_TRUE(at_cap.has_value());
  EXPECT_EQ(at_cap->tile_count(), tv::kMaxTileCount);
  EXPECT_EQ(at_cap->canvas_width, 1000);
  EXPECT_EQ(at_cap->canvas_height, 1000);

  auto over_cap = tv::compute_tile_grid(1001, 1000, tv::TileConfig{1, 1, 0.f, 0.f, false});
  ASSERT_FALSE(over_cap.has_value());
  EXPECT_EQ(over_cap.error(), tc::PipelineError::InvalidConfig);
}

TEST(GenerateTiles, SharesCanvasWhenNoResizeNeeded) {
  auto image = make_block_image(300, 200);
  auto tiles = tv::generate_tiles(image, tv::TileConfig{100, 100, 0.f, 0.f, false});
  ASSERT_TRUE(tiles.has_value());
  EXPECT_EQ(tiles->canvas.get(), image.get());
  EXPECT_EQ(tiles->original.get(), image.get());
  ASSERT_EQ(tiles->crops.size(), 6u);
  EXPECT_EQ(tiles->tiles_skipped, 0u);

  for (std::size_t i = 0; i < tiles->crops.size(); ++i) {
    const tc::Crop& crop = tiles->crops[i];
    EXPECT_EQ(crop.tile_index(), i + 1);
    EXPECT_EQ(crop.canvas().get(), image.get());
    EXPECT_EQ(crop.state(), tc::CropState::Tiled);
    const auto col = static_cast<std::uint32_t>(i % 3);
    const auto row = static_cast<std::uint32_t>(i / 3);
    ASSERT_EQ(crop.local_image().width(), 100u);
    ASSERT_EQ(crop.local_image().height(), 100u);
    const std::byte expected = static_cast<std::byte>(col * 10 + row);
    EXPECT_EQ(crop.local_image().data()[0], expected);
    EXPECT_EQ(crop.local_image().data()[99 * 100 + 99], expected);
  }
}

TEST(GenerateTiles, ResizesToCanvas) {
  auto image = make_gray(1500, 1000);
  auto tiles = tv::generate_tiles(image, tv::TileConfig{});
  ASSERT_TRUE(tiles.has_value());
  EXPECT_NE(tiles->canvas.get(), image.get());
  EXPECT_EQ(tiles->canvas->width(), 1225u);
  EXPECT_EQ(tiles->canvas->height(), 700u);
  EXPECT_EQ(tiles->canvas->format(), tc::PixelFormat::Grayscale8);
  ASSERT_EQ(tiles->crops.size(), 2u);
  EXPECT_EQ(tiles->crops.front().rect(), (tc::Rect{0, 0, 700, 700}));
  EXPECT_EQ(tiles->crops.back().rect(), (tc::Rect{525, 0, 700, 700}));
  for (const auto& crop : tiles->crops) {
    EXPECT_EQ(crop.canvas().get(), tiles->canvas.get());
    EXPECT_EQ(crop.original().get(), image.get());
  }
}

TEST(GenerateTiles, KeepsColorFormat) {
  std::vector<std::byte> buf(200 * 200 * 3);
  auto image = std::make_shared<const tc::Frame>(200, 200, tc::PixelFormat::BGR8, std::move(buf));
  auto tiles = tv::generate_tiles(image, tv::TileConfig{100, 100, 50.f, 50.f, false});
  ASSERT_TRUE(tiles.has_value());
  ASSERT_EQ(tiles->crops.size(), 9u);
  EXPECT_EQ(tiles->crops[4].rect(), (tc::Rect{50, 50, 100, 100}));
  EXPECT_EQ(tiles->crops[4].local_image().format(), tc::PixelFormat::BGR8);
  EXPECT_EQ(tiles->crops[4].local_image().size_bytes(), 100u * 100 * 3);
}

TEST(GenerateTiles, RejectsEmptyImage) {
  EXPECT_EQ(tv::generate_tiles(nullptr, tv::TileConfig{}).error(), tc::PipelineError::InvalidFrame);
  auto empty = std::make_shared<const tc::Frame>();
  EXPECT_EQ(tv::generate_tiles(empty, tv::TileConfig{}).error(), tc::PipelineError::InvalidFrame);
}

TEST(GenerateTiles, RejectsTileLargerThanImage) {
  auto image = make_gray(600, 800);
  EXPECT_EQ(tv::generate_tiles(image, tv::TileConfig{}).error(), tc::PipelineError::InvalidConfig);
}
