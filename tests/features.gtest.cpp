#include <gtest/gtest.h>

#include "hemascan/errors.hpp"
#include "hemascan/features.hpp"

#include <cmath>
#include <limits>

#include <opencv2/core.hpp>

using namespace hemascan;

namespace {

Raster solidRaster(int width, int height, cv::Vec3b rgb)
{
    Raster raster;
    raster.pixels = cv::Mat(height, width, CV_8UC3, cv::Scalar(rgb[0], rgb[1], rgb[2]));
    return raster;
}

// Top half red, bottom half blue.
Raster splitRaster(int width, int height)
{
    Raster raster;
    raster.pixels = cv::Mat(height, width, CV_8UC3, cv::Scalar(0, 0, 255));
    raster.pixels(cv::Rect(0, 0, width, height / 2)).setTo(cv::Scalar(255, 0, 0));
    return raster;
}

} // namespace

TEST(PallorIndex, MatchesReferenceValues)
{
    EXPECT_NEAR(redRatio(50, 80, 90), 0.2174, 1e-3);
    EXPECT_NEAR(pallorIndex(50, 80, 90, 0.15), 0.5391, 1e-3);
}

TEST(PallorIndex, HealthyTissueScoresZero)
{
    EXPECT_DOUBLE_EQ(pallorIndex(200, 60, 60, 0.7), 0.0);
}

TEST(PallorIndex, BlackImageIsFinite)
{
    double pallor = pallorIndex(0, 0, 0, 0.0);
    EXPECT_TRUE(std::isfinite(pallor));
    EXPECT_NEAR(pallor, 1.0, 1e-9);
}

TEST(PallorIndex, StaysInUnitRange)
{
    for (double r : {0.0, 10.0, 128.0, 255.0}) {
        for (double s : {0.0, 0.1, 0.3, 1.0}) {
            double p = pallorIndex(r, 255.0 - r, 40.0, s);
            EXPECT_GE(p, 0.0);
            EXPECT_LE(p, 1.0);
        }
    }
}

TEST(RegionOfInterest, PresetsMatchCaptureGuides)
{
    RegionOfInterest eyelid = RegionOfInterest::lowerEyelid();
    EXPECT_DOUBLE_EQ(eyelid.left(), 0.15);
    EXPECT_DOUBLE_EQ(eyelid.top(), 0.55);
    EXPECT_DOUBLE_EQ(eyelid.right(), 0.85);
    EXPECT_DOUBLE_EQ(eyelid.bottom(), 0.85);

    RegionOfInterest center = RegionOfInterest::fromPreset("nail_bed");
    EXPECT_DOUBLE_EQ(center.left(), 0.30);
    EXPECT_DOUBLE_EQ(center.bottom(), 0.70);

    EXPECT_THROW(RegionOfInterest::fromPreset("forehead"), std::invalid_argument);
}

TEST(RegionOfInterest, SettersClampToUnitInterval)
{
    RegionOfInterest roi;
    roi.setLeft(-0.5);
    roi.setRight(1.5);
    EXPECT_DOUBLE_EQ(roi.left(), 0.0);
    EXPECT_DOUBLE_EQ(roi.right(), 1.0);
}

TEST(RegionOfInterest, DegenerateRegionThrows)
{
    EXPECT_THROW(RegionOfInterest(0.5, 0.2, 0.5, 0.8).toPixels(100, 100), InvalidRoiError);
    EXPECT_THROW(RegionOfInterest(0.2, 0.9, 0.8, 0.1).toPixels(100, 100), InvalidRoiError);
    const double nan = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(RegionOfInterest(nan, 0.0, 1.0, 1.0).toPixels(100, 100), InvalidRoiError);
}

TEST(RegionOfInterest, TinyRegionStillCoversOnePixel)
{
    cv::Rect rect = RegionOfInterest(0.999, 0.999, 1.0, 1.0).toPixels(10, 10);
    EXPECT_GE(rect.width, 1);
    EXPECT_GE(rect.height, 1);
    EXPECT_LE(rect.x + rect.width, 10);
    EXPECT_LE(rect.y + rect.height, 10);
}

TEST(ColorFeatureExtractor, ScalesToInferenceSize)
{
    ColorFeatureExtractor extractor;
    ExtractedRegion region = extractor.extract(solidRaster(640, 480, {128, 128, 128}), RegionOfInterest::fullFrame());
    EXPECT_EQ(region.scaled.cols, 224);
    EXPECT_EQ(region.scaled.rows, 224);

    ColorFeatureExtractor small(32);
    ExtractedRegion tiny = small.extract(solidRaster(3, 2, {10, 20, 30}), RegionOfInterest(0.9, 0.9, 1.0, 1.0));
    EXPECT_EQ(tiny.scaled.cols, 32);
    EXPECT_EQ(tiny.scaled.rows, 32);
}

TEST(ColorFeatureExtractor, GreyFrameIsPale)
{
    ColorFeatureExtractor extractor(64);
    ExtractedRegion region = extractor.extract(solidRaster(100, 100, {128, 128, 128}), RegionOfInterest::centerRegion());
    EXPECT_NEAR(region.features.mean_red, 128.0, 1e-6);
    EXPECT_NEAR(region.features.saturation, 0.0, 1e-6);
    EXPECT_NEAR(region.features.brightness, 128.0 / 255.0, 1e-4);
    EXPECT_NEAR(region.features.pallor_index, 0.6, 1e-3);
}

TEST(ColorFeatureExtractor, RedDominantFrameIsNotPale)
{
    ColorFeatureExtractor extractor(64);
    ExtractedRegion region = extractor.extract(solidRaster(50, 50, {200, 60, 60}), RegionOfInterest::fullFrame());
    EXPECT_NEAR(region.features.saturation, 0.7, 1e-3);
    EXPECT_NEAR(region.features.pallor_index, 0.0, 1e-9);
}

TEST(ColorFeatureExtractor, ReleasesSourcePixels)
{
    ColorFeatureExtractor extractor(16);
    Raster raster = solidRaster(40, 40, {90, 90, 90});
    extractor.extract(std::move(raster), RegionOfInterest::fullFrame());
    EXPECT_TRUE(raster.empty());
}

TEST(ColorFeatureExtractor, AppliesRotationBeforeCropping)
{
    ColorFeatureExtractor extractor(16);
    RegionOfInterest eyelid = RegionOfInterest::lowerEyelid();

    ExtractedRegion upright = extractor.extract(splitRaster(40, 40), eyelid);
    EXPECT_GT(upright.features.mean_blue, upright.features.mean_red);

    Raster flipped = splitRaster(40, 40);
    flipped.rotation_degrees = 180;
    ExtractedRegion rotated = extractor.extract(std::move(flipped), eyelid);
    EXPECT_GT(rotated.features.mean_red, rotated.features.mean_blue);

    Raster skewed = splitRaster(40, 40);
    skewed.rotation_degrees = 45;
    EXPECT_THROW(extractor.extract(std::move(skewed), eyelid), DecodeError);
}

TEST(ColorFeatureExtractor, EmptyRasterIsDecodeError)
{
    ColorFeatureExtractor extractor;
    EXPECT_THROW(extractor.extract(Raster{}, RegionOfInterest::fullFrame()), DecodeError);
}
