#include "core/pixel_conversion.hpp"
#include <opencv2/imgproc.hpp>
#include <stdexcept>

cv::Mat PixelConversion::toDepth8(const cv::Mat &pixels)
{
    switch (pixels.depth())
    {
    case CV_8U:
        return pixels;
    case CV_16U:
    {
        cv::Mat converted;
        pixels.convertTo(converted, CV_8U, 1.0 / 257.0);
        return converted;
    }
    case CV_32F:
    case CV_64F:
    {
        cv::Mat converted;
        pixels.convertTo(converted, CV_8U, 255.0);
        return converted;
    }
    default:
    {
        cv::Mat converted;
        cv::normalize(pixels, converted, 0, 255, cv::NORM_MINMAX, CV_8U);
        return converted;
    }
    }
}

cv::Mat PixelConversion::toBgr8(const cv::Mat &pixels)
{
    cv::Mat depth8 = toDepth8(pixels);
    cv::Mat bgr;
    switch (depth8.channels())
    {
    case 1:
        cv::cvtColor(depth8, bgr, cv::COLOR_GRAY2BGR);
        break;
    case 2:
    {
        cv::Mat gray;
        cv::extractChannel(depth8, gray, 0);
        cv::cvtColor(gray, bgr, cv::COLOR_GRAY2BGR);
        break;
    }
    case 3:
        bgr = depth8;
        break;
    case 4:
        cv::cvtColor(depth8, bgr, cv::COLOR_BGRA2BGR);
        break;
    default:
        throw std::invalid_argument("Unsupported channel count: " + std::to_string(depth8.channels()));
    }
    return bgr;
}

cv::Mat PixelConversion::toGray8(const cv::Mat &pixels)
{
    cv::Mat depth8 = toDepth8(pixels);
    if (depth8.channels() == 1)
    {
        return depth8;
    }
    if (depth8.channels() == 2)
    {
        cv::Mat gray;
        cv::extractChannel(depth8, gray, 0);
        return gray;
    }

    cv::Mat gray;
    cv::cvtColor(toBgr8(depth8), gray, cv::COLOR_BGR2GRAY);
    return gray;
}
