#include <tilefuse/core/geometry.hpp>
#include <tilefuse/core/mask.hpp>
#include <gtest/gtest.h>
#include <stdexcept>
#include <vector>

namespace tc = tilefuse::core;

TEST(Rect, FitsIn) {
  tc::Rect r{50, 20, 100, 80};
  EXPECT_EQ(r.x_end(), 150);
  EXPECT_EQ(r.y_end(), 100);
  EXPECT_TRUE(r.fits_in(150, 100));
  EXPECT_FALSE(r.fits_in(149, 100));
  EXPECT_FALSE(r.fits_in(150, 99));
  EXPECT_FALSE((tc::Rect{-1, 0, 10, 10}.fits_in(100, 100)));
  EXPECT_FALSE((tc::Rect{0, 0, 0, 10}.fits_in(100, 100)));
}

TEST(BBox, AreaTranslateScale) {
  tc::BBox b{10.f, 20.f, 30.f, 60.f};
  EXPECT_FLOAT_EQ(b.width(), 20.f);
  EXPECT_FLOAT_EQ(b.height(), 40.f);
  EXPECT_FLOAT_EQ(b.area(), 800.f);
  EXPECT_EQ(b.translated(5.f, -5.f), (tc::BBox{15.f, 15.f, 35.f, 55.f}));
  EXPECT_EQ(b.scaled(2.f, 0.5f), (tc::BBox{20.f, 10.f, 60.f, 30.f}));
}

TEST(BBox, IntersectionClampsAtZero) {
  tc::BBox a{0.f, 0.f, 10.f, 10.f};
  EXPECT_FLOAT_EQ(tc::intersection_area(a, {5.f, 5.f, 15.f, 15.f}), 25.f);
  EXPECT_FLOAT_EQ(tc::intersection_area(a, {10.f, 0.f, 20.f, 10.f}), 0.f);  // touching
  EXPECT_FLOAT_EQ(tc::intersection_area(a, {20.f, 20.f, 30.f, 30.f}), 0.f);
  // Disjoint on one axis only must not produce a negative-times-negative product.
  EXPECT_FLOAT_EQ(tc::intersection_area(a, {20.f, 20.f, 25.f, 25.f}), 0.f);
}

TEST(BinaryMask, FillAndCount) {
  tc::BinaryMask m(10, 8);
  EXPECT_EQ(m.count(), 0u);
  m.fill(2, 3, 5, 6);
  EXPECT_EQ(m.count(), 9u);
  EXPECT_EQ(m.at(2, 3), 1);
  EXPECT_EQ(m.at(5, 3), 0);
  m.fill(-5, -5, 1, 1);  // clipped
  EXPECT_EQ(m.count(), 10u);
}

TEST(BinaryMask, NormalizesToBinary) {
  tc::BinaryMask m(2, 2, {0, 255, 3, 0});
  EXPECT_EQ(m.at(1, 0), 1);
  EXPECT_EQ(m.at(0, 1), 1);
  EXPECT_EQ(m.count(), 2u);
}

TEST(BinaryMask, RejectsWrongBufferSize) {
  EXPECT_THROW(tc::BinaryMask(3, 3, std::vector<std::uint8_t>(8)), std::invalid_argument);
}

TEST(BinaryMask, IntersectionCount) {
  tc::BinaryMask a(10, 10);
  tc::BinaryMask b(10, 10);
  a.fill(0, 0, 6, 6);
  b.fill(4, 4, 10, 10);
  EXPECT_EQ(tc::intersection_count(a, b), 4u);
  EXPECT_EQ(tc::intersection_count(a, tc::BinaryMask()), 0u);
}
