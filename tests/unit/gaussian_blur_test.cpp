#include <dropshade/effects/gaussian_blur.h>

#include <gtest/gtest.h>

#include <cmath>
#include <numeric>

using dropshade::effects::blur_alpha;
using dropshade::effects::gaussian_kernel;
using dropshade::image::Raster;

TEST(GaussianBlurTest, KernelIsEmptyForNonPositiveSigma) {
    EXPECT_TRUE(gaussian_kernel(0.0f).empty());
    EXPECT_TRUE(gaussian_kernel(-2.0f).empty());
}

TEST(GaussianBlurTest, KernelIsNormalizedAndSymmetric) {
    const auto kernel = gaussian_kernel(4.0f);
    ASSERT_EQ(kernel.size(), 2u * 12u + 1u);
    const float sum = std::accumulate(kernel.begin(), kernel.end(), 0.0f);
    EXPECT_NEAR(sum, 1.0f, 1e-4f);
    for (size_t i = 0; i < kernel.size() / 2; ++i) {
        EXPECT_FLOAT_EQ(kernel[i], kernel[kernel.size() - 1 - i]);
    }
    EXPECT_GT(kernel[12], kernel[11]);
}

TEST(GaussianBlurTest, SmallSigmaStillHasNeighbours) {
    EXPECT_EQ(gaussian_kernel(0.1f).size(), 3u);
}

TEST(GaussianBlurTest, ZeroSigmaLeavesRasterUntouched) {
    Raster raster(5, 5);
    raster.set_pixel(2, 2, {0, 0, 0, 200});
    const Raster before = raster;
    blur_alpha(raster, 0.0f);
    EXPECT_EQ(raster, before);
}

TEST(GaussianBlurTest, SinglePixelSpreadsToNeighbours) {
    Raster raster(21, 21);
    raster.set_pixel(10, 10, {0, 0, 0, 255});
    blur_alpha(raster, 2.0f);

    EXPECT_LT(raster.alpha(10, 10), 255);
    EXPECT_GT(raster.alpha(10, 10), 0);
    EXPECT_GT(raster.alpha(11, 10), 0);
    EXPECT_GT(raster.alpha(10, 12), 0);
    EXPECT_GE(raster.alpha(10, 10), raster.alpha(11, 10));
    EXPECT_EQ(raster.alpha(0, 0), 0);
}

TEST(GaussianBlurTest, InteriorOfUniformAreaIsPreserved) {
    Raster raster(40, 40);
    raster.clear({0, 0, 0, 180});
    blur_alpha(raster, 3.0f);
    EXPECT_NEAR(raster.alpha(20, 20), 180, 1);
}

TEST(GaussianBlurTest, OutsideSamplesCountAsTransparent) {
    Raster raster(30, 30);
    raster.clear({0, 0, 0, 255});
    blur_alpha(raster, 3.0f);
    // At a corner only the inner half of the kernel (and its centre) lands on each axis.
    const auto kernel = gaussian_kernel(3.0f);
    const float half = std::accumulate(kernel.begin() + static_cast<long>(kernel.size() / 2),
                                       kernel.end(), 0.0f);
    EXPECT_NEAR(raster.alpha(0, 0), 255.0f * half * half, 1.0f);
    EXPECT_LT(raster.alpha(0, 15), raster.alpha(15, 15));
}

TEST(GaussianBlurTest, ColourChannelsAreNotBlurred) {
    Raster raster(9, 9);
    raster.set_pixel(4, 4, {200, 100, 50, 255});
    blur_alpha(raster, 1.5f);
    EXPECT_EQ(raster.pixel(4, 4).r, 200);
    EXPECT_EQ(raster.pixel(4, 4).g, 100);
    EXPECT_EQ(raster.pixel(4, 4).b, 50);
    EXPECT_EQ(raster.pixel(3, 4).r, 0);
}
