#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <opencv2/core/mat.hpp>

namespace hemascan {

/*! Decoded image handed to the feature extractor.
 *  pixels is CV_8UC3 in RGB channel order, row-major.
 */
struct Raster {
    cv::Mat pixels;
    int rotation_degrees = 0; //!< Clockwise rotation to apply before cropping (0, 90, 180, 270).

    int width() const { return pixels.cols; }
    int height() const { return pixels.rows; }
    bool empty() const { return pixels.empty(); }
};

/*! Raw buffer as produced by the capture surface. */
struct CapturedFrame {
    std::vector<std::uint8_t> data;
    std::string format;       //!< "jpeg", "png", "rgb24", "bgr24", "nv12" or "nv21".
    int width = 0;
    int height = 0;
    int stride = 0;           //!< Luma / packed row stride in bytes, 0 means tightly packed.
    int rotation_degrees = 0;
    double timestamp = 0.0;   //!< Seconds, monotonic clock of the capture source.
};

//! Convert a captured buffer into an RGB raster.
//! \throws DecodeError if the format is unknown or the buffer is inconsistent.
Raster decodeFrame(const CapturedFrame &frame);

//! Decode an image file (JPEG/PNG/...) from disk.
//! \throws DecodeError if the file is missing or cannot be decoded.
Raster loadRasterFromFile(const std::string &path, int rotation_degrees = 0);

//! Build a raster from a packed RGB buffer. Copies the pixel data.
Raster rasterFromRgb(const std::uint8_t *rgb, int width, int height, int rotation_degrees = 0);

double clampUnit(double value);

std::int64_t currentEpochMillis();
//! Monotonic milliseconds, for intervals only.
std::int64_t currentSteadyMillis();
std::string currentIsoTimestamp();

} // namespace hemascan
