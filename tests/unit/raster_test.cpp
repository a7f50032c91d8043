#include <dropshade/image/raster.h>

#include <gtest/gtest.h>

#include <vector>

using dropshade::image::Color;
using dropshade::image::Raster;

TEST(RasterTest, DefaultIsEmpty) {
    Raster raster;
    EXPECT_TRUE(raster.empty());
    EXPECT_EQ(raster.width(), 0);
    EXPECT_EQ(raster.height(), 0);
}

TEST(RasterTest, ResizeAllocatesTransparentPixels) {
    Raster raster(3, 2);
    EXPECT_FALSE(raster.empty());
    ASSERT_EQ(raster.pixels().size(), 3u * 2u * 4u);
    for (auto byte : raster.pixels()) {
        EXPECT_EQ(byte, 0);
    }
}

TEST(RasterTest, NegativeSizeClampsToEmpty) {
    Raster raster(-4, 10);
    EXPECT_TRUE(raster.empty());
    EXPECT_EQ(raster.width(), 0);
}

TEST(RasterTest, SetAndGetPixel) {
    Raster raster(4, 4);
    raster.set_pixel(2, 1, {10, 20, 30, 40});
    EXPECT_EQ(raster.pixel(2, 1), (Color{10, 20, 30, 40}));
    EXPECT_EQ(raster.alpha(2, 1), 40);
    EXPECT_EQ(raster.pixel(1, 2), (Color{0, 0, 0, 0}));
}

TEST(RasterTest, OutOfBoundsAccessIsIgnored) {
    Raster raster(2, 2);
    raster.set_pixel(-1, 0, {255, 255, 255, 255});
    raster.set_pixel(2, 0, {255, 255, 255, 255});
    raster.set_pixel(0, 5, {255, 255, 255, 255});
    EXPECT_EQ(raster.pixel(5, 5), (Color{0, 0, 0, 0}));
    for (auto byte : raster.pixels()) {
        EXPECT_EQ(byte, 0);
    }
}

TEST(RasterTest, ClearFillsEveryPixel) {
    Raster raster(3, 2);
    raster.clear({1, 2, 3, 4});
    for (int y = 0; y < 2; ++y) {
        for (int x = 0; x < 3; ++x) {
            EXPECT_EQ(raster.pixel(x, y), (Color{1, 2, 3, 4}));
        }
    }
}

TEST(RasterTest, FromRgbaRejectsMismatchedBuffer) {
    EXPECT_TRUE(Raster::from_rgba(2, 2, std::vector<std::uint8_t>(15, 0)).empty());
    EXPECT_TRUE(Raster::from_rgba(0, 2, {}).empty());

    Raster ok = Raster::from_rgba(1, 2, {1, 2, 3, 4, 5, 6, 7, 8});
    ASSERT_FALSE(ok.empty());
    EXPECT_EQ(ok.pixel(0, 1), (Color{5, 6, 7, 8}));
}
