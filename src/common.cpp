#include "hemascan/common.hpp"
#include "hemascan/errors.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

namespace hemascan {

namespace {

std::string toLower(std::string fmt)
{
    std::transform(fmt.begin(), fmt.end(), fmt.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return fmt;
}

void requireDimensions(const CapturedFrame &frame, const char *format)
{
    if (frame.width <= 0 || frame.height <= 0) {
        throw DecodeError(std::string("Captured ") + format + " frame missing dimensions");
    }
}

cv::Mat decodePacked(const CapturedFrame &frame, int code)
{
    requireDimensions(frame, frame.format.c_str());
    const int stride = frame.stride > 0 ? frame.stride : frame.width * 3;
    if (stride < frame.width * 3) {
        throw DecodeError("Captured frame stride smaller than row size");
    }
    const std::size_t expected = static_cast<std::size_t>(stride) * frame.height;
    if (frame.data.size() < expected) {
        throw DecodeError("Captured frame data too small");
    }
    cv::Mat view(frame.height, frame.width, CV_8UC3, const_cast<std::uint8_t *>(frame.data.data()),
                 static_cast<std::size_t>(stride));
    if (code < 0) {
        return view.clone();
    }
    cv::Mat rgb;
    cv::cvtColor(view, rgb, code);
    return rgb;
}

cv::Mat decodeSemiPlanar(const CapturedFrame &frame, int code)
{
    requireDimensions(frame, frame.format.c_str());
    if (frame.width % 2 != 0 || frame.height % 2 != 0) {
        throw DecodeError("Semi-planar frame dimensions must be even");
    }
    const int stride = frame.stride > 0 ? frame.stride : frame.width;
    const std::size_t expected = static_cast<std::size_t>(stride) * frame.height * 3 / 2;
    if (frame.data.size() < expected) {
        throw DecodeError("Captured " + frame.format + " frame data too small");
    }
    cv::Mat yuv(frame.height * 3 / 2, stride, CV_8UC1, const_cast<std::uint8_t *>(frame.data.data()));
    cv::Mat cropped = yuv(cv::Rect(0, 0, frame.width, frame.height * 3 / 2));
    cv::Mat rgb;
    cv::cvtColor(cropped.clone(), rgb, code);
    return rgb;
}

} // namespace

Raster decodeFrame(const CapturedFrame &frame)
{
    if (frame.data.empty()) {
        throw DecodeError("Captured frame has no data");
    }

    std::string format = toLower(frame.format);
    if (format.empty()) {
        format = "jpeg";
    }

    Raster raster;
    raster.rotation_degrees = frame.rotation_degrees;

    if (format == "jpeg" || format == "jpg" || format == "png") {
        cv::Mat encoded(1, static_cast<int>(frame.data.size()), CV_8UC1,
                        const_cast<std::uint8_t *>(frame.data.data()));
        cv::Mat bgr = cv::imdecode(encoded, cv::IMREAD_COLOR);
        if (bgr.empty()) {
            throw DecodeError("Failed to decode encoded frame");
        }
        cv::cvtColor(bgr, raster.pixels, cv::COLOR_BGR2RGB);
    } else if (format == "rgb" || format == "rgb24") {
        raster.pixels = decodePacked(frame, -1);
    } else if (format == "bgr" || format == "bgr24") {
        raster.pixels = decodePacked(frame, cv::COLOR_BGR2RGB);
    } else if (format == "nv12") {
        raster.pixels = decodeSemiPlanar(frame, cv::COLOR_YUV2RGB_NV12);
    } else if (format == "nv21") {
        raster.pixels = decodeSemiPlanar(frame, cv::COLOR_YUV2RGB_NV21);
    } else {
        throw DecodeError("Unsupported frame format: " + frame.format);
    }
    return raster;
}

Raster loadRasterFromFile(const std::string &path, int rotation_degrees)
{
    cv::Mat bgr = cv::imread(path, cv::IMREAD_COLOR);
    if (bgr.empty()) {
        throw DecodeError("Failed to read image: " + path);
    }
    Raster raster;
    cv::cvtColor(bgr, raster.pixels, cv::COLOR_BGR2RGB);
    raster.rotation_degrees = rotation_degrees;
    return raster;
}

Raster rasterFromRgb(const std::uint8_t *rgb, int width, int height, int rotation_degrees)
{
    if (!rgb || width <= 0 || height <= 0) {
        throw DecodeError("RGB buffer is empty");
    }
    Raster raster;
    raster.pixels = cv::Mat(height, width, CV_8UC3, const_cast<std::uint8_t *>(rgb)).clone();
    raster.rotation_degrees = rotation_degrees;
    return raster;
}

double clampUnit(double value)
{
    if (std::isnan(value)) {
        return 0.0;
    }
    return std::min(1.0, std::max(0.0, value));
}

std::int64_t currentSteadyMillis()
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
}

std::int64_t currentEpochMillis()
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

std::string currentIsoTimestamp()
{
    using clock = std::chrono::system_clock;
    auto now = clock::now();
    auto time = clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&time, &tm);
    auto fractional = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setw(3) << std::setfill('0') << fractional.count() << "Z";
    return oss.str();
}

} // namespace hemascan
