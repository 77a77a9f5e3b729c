#pragma once

#include "hemascan/common.hpp"

#include <string>

#include <opencv2/core/mat.hpp>

namespace hemascan {

/*! Fractional sub-rectangle of a raster, each bound in [0,1].
 *  Setters clamp into [0,1]; left < right and top < bottom are checked by the extractor.
 */
class RegionOfInterest {
public:
    RegionOfInterest() = default;
    RegionOfInterest(double left, double top, double right, double bottom);

    static RegionOfInterest lowerEyelid();  //!< Lower eyelid strip of a close-up eye image.
    static RegionOfInterest centerRegion(); //!< Centred square covering 40 % of each dimension.
    static RegionOfInterest fullFrame();

    //! Resolve a preset name ("lower_eyelid", "center", "full").
    //! \throws std::invalid_argument on an unknown name.
    static RegionOfInterest fromPreset(const std::string &name);

    void setLeft(double v);
    void setTop(double v);
    void setRight(double v);
    void setBottom(double v);

    double left() const { return left_; }
    double top() const { return top_; }
    double right() const { return right_; }
    double bottom() const { return bottom_; }

    bool isValid() const { return left_ < right_ && top_ < bottom_; }

    //! Pixel rectangle for a width x height image, at least 1x1 and fully inside.
    //! \throws InvalidRoiError if the fractional bounds are degenerate.
    cv::Rect toPixels(int width, int height) const;

private:
    double left_ = 0.0;
    double top_ = 0.0;
    double right_ = 1.0;
    double bottom_ = 1.0;
};

struct ColorFeatures {
    double mean_red = 0.0;     //!< [0,255]
    double mean_green = 0.0;   //!< [0,255]
    double mean_blue = 0.0;    //!< [0,255]
    double saturation = 0.0;   //!< Mean HSV saturation, [0,1]
    double brightness = 0.0;   //!< Mean HSV value, [0,1]
    double pallor_index = 0.0; //!< [0,1], see pallorIndex()

    double redRatio() const;
};

//! Red share of total intensity, with the same epsilon as the pallor index.
double redRatio(double mean_red, double mean_green, double mean_blue);

//! Tissue paleness estimate from mean channel intensities and saturation.
//! Healthy conjunctiva sits near a 0.50 red share with saturation above 0.30.
double pallorIndex(double mean_red, double mean_green, double mean_blue, double mean_saturation);

struct ExtractedRegion {
    cv::Mat scaled;          //!< input_size x input_size, CV_8UC3 RGB.
    ColorFeatures features;  //!< Computed over scaled.
};

class ColorFeatureExtractor {
public:
    static constexpr int kDefaultInputSize = 224;

    explicit ColorFeatureExtractor(int input_size = kDefaultInputSize);

    int inputSize() const { return input_size_; }

    /*! Rotate, crop to roi, scale to the inference size and compute colour statistics.
     *  The raster is consumed: its full-resolution pixels are released once the scaled crop exists.
     *  \throws DecodeError     if the raster holds no readable pixels.
     *  \throws InvalidRoiError if roi is degenerate.
     */
    ExtractedRegion extract(Raster &&raster, const RegionOfInterest &roi) const;

    //! Statistics over an RGB image; exposed for callers that already hold a scaled crop.
    static ColorFeatures computeFeatures(const cv::Mat &rgb);

private:
    int input_size_;
};

} // namespace hemascan
