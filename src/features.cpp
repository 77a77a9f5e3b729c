#include "hemascan/features.hpp"
#include "hemascan/errors.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

namespace hemascan {

namespace {

constexpr double kEpsilon = 0.001;
constexpr double kHealthyRedRatio = 0.50;
constexpr double kHealthySaturation = 0.30;
constexpr double kRedWeight = 0.6;
constexpr double kSaturationWeight = 0.4;

double clampFraction(double v)
{
    if (std::isnan(v)) {
        return v;
    }
    return std::min(1.0, std::max(0.0, v));
}

cv::Mat applyRotation(const cv::Mat &image, int degrees)
{
    int normalized = ((degrees % 360) + 360) % 360;
    cv::Mat rotated;
    switch (normalized) {
    case 0:
        return image;
    case 90:
        cv::rotate(image, rotated, cv::ROTATE_90_CLOCKWISE);
        return rotated;
    case 180:
        cv::rotate(image, rotated, cv::ROTATE_180);
        return rotated;
    case 270:
        cv::rotate(image, rotated, cv::ROTATE_90_COUNTERCLOCKWISE);
        return rotated;
    default:
        throw DecodeError("Unsupported rotation hint: " + std::to_string(degrees));
    }
}

} // namespace

RegionOfInterest::RegionOfInterest(double left, double top, double right, double bottom)
    : left_(clampFraction(left)), top_(clampFraction(top)), right_(clampFraction(right)), bottom_(clampFraction(bottom))
{
}

RegionOfInterest RegionOfInterest::lowerEyelid()
{
    return RegionOfInterest(0.15, 0.55, 0.85, 0.85);
}

RegionOfInterest RegionOfInterest::centerRegion()
{
    return RegionOfInterest(0.30, 0.30, 0.70, 0.70);
}

RegionOfInterest RegionOfInterest::fullFrame()
{
    return RegionOfInterest(0.0, 0.0, 1.0, 1.0);
}

RegionOfInterest RegionOfInterest::fromPreset(const std::string &name)
{
    if (name == "lower_eyelid") {
        return lowerEyelid();
    }
    if (name == "center" || name == "full_eye" || name == "nail_bed") {
        return centerRegion();
    }
    if (name == "full") {
        return fullFrame();
    }
    throw std::invalid_argument("Unknown ROI preset: " + name);
}

void RegionOfInterest::setLeft(double v) { left_ = clampFraction(v); }
void RegionOfInterest::setTop(double v) { top_ = clampFraction(v); }
void RegionOfInterest::setRight(double v) { right_ = clampFraction(v); }
void RegionOfInterest::setBottom(double v) { bottom_ = clampFraction(v); }

cv::Rect RegionOfInterest::toPixels(int width, int height) const
{
    // NaN bounds fail every comparison, so they land here too.
    if (!(left_ < right_) || !(top_ < bottom_)) {
        throw InvalidRoiError("Region of interest has zero area");
    }
    if (width <= 0 || height <= 0) {
        throw InvalidRoiError("Region of interest applied to an empty raster");
    }

    int x0 = static_cast<int>(left_ * width);
    int y0 = static_cast<int>(top_ * height);
    int x1 = static_cast<int>(right_ * width);
    int y1 = static_cast<int>(bottom_ * height);

    x0 = std::min(std::max(x0, 0), width - 1);
    y0 = std::min(std::max(y0, 0), height - 1);
    x1 = std::min(std::max(x1, x0 + 1), width);
    y1 = std::min(std::max(y1, y0 + 1), height);

    return cv::Rect(x0, y0, x1 - x0, y1 - y0);
}

double redRatio(double mean_red, double mean_green, double mean_blue)
{
    return mean_red / (mean_red + mean_green + mean_blue + kEpsilon);
}

double ColorFeatures::redRatio() const
{
    return hemascan::redRatio(mean_red, mean_green, mean_blue);
}

double pallorIndex(double mean_red, double mean_green, double mean_blue, double mean_saturation)
{
    const double ratio = redRatio(mean_red, mean_green, mean_blue);
    const double red_deficit = std::max(0.0, kHealthyRedRatio - ratio) / kHealthyRedRatio;
    const double saturation_deficit = std::max(0.0, kHealthySaturation - mean_saturation) / kHealthySaturation;
    return clampUnit(kRedWeight * red_deficit + kSaturationWeight * saturation_deficit);
}

ColorFeatureExtractor::ColorFeatureExtractor(int input_size) : input_size_(input_size)
{
    if (input_size_ <= 0) {
        throw std::invalid_argument("Inference input size must be positive");
    }
}

ExtractedRegion ColorFeatureExtractor::extract(Raster &&raster, const RegionOfInterest &roi) const
{
    if (raster.empty()) {
        throw DecodeError("Raster has no pixel data");
    }
    if (raster.pixels.type() != CV_8UC3) {
        throw DecodeError("Raster must be 8-bit, three channel RGB");
    }

    ExtractedRegion region;
    {
        cv::Mat oriented = applyRotation(raster.pixels, raster.rotation_degrees);
        cv::Rect rect = roi.toPixels(oriented.cols, oriented.rows);
        cv::resize(oriented(rect), region.scaled, cv::Size(input_size_, input_size_), 0, 0, cv::INTER_LINEAR);
    }
    // Full-resolution pixels are not kept past this point.
    raster.pixels.release();

    region.features = computeFeatures(region.scaled);
    return region;
}

ColorFeatures ColorFeatureExtractor::computeFeatures(const cv::Mat &rgb)
{
    if (rgb.empty() || rgb.type() != CV_8UC3) {
        throw DecodeError("Feature computation needs a non-empty RGB image");
    }

    ColorFeatures features;
    cv::Scalar channel_means = cv::mean(rgb);
    features.mean_red = channel_means[0];
    features.mean_green = channel_means[1];
    features.mean_blue = channel_means[2];

    cv::Mat unit;
    rgb.convertTo(unit, CV_32FC3, 1.0 / 255.0);
    cv::Mat hsv;
    cv::cvtColor(unit, hsv, cv::COLOR_RGB2HSV);
    cv::Scalar hsv_means = cv::mean(hsv);
    features.saturation = clampUnit(hsv_means[1]);
    features.brightness = clampUnit(hsv_means[2]);

    features.pallor_index = pallorIndex(features.mean_red, features.mean_green, features.mean_blue, features.saturation);
    return features;
}

} // namespace hemascan
