#include "core/color_analyzer.hpp"
#include "core/metadata_error.hpp"
#include "core/pixel_conversion.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <unordered_map>
#include <opencv2/imgproc.hpp>

namespace
{
    constexpr int kExactFloatCount = 1 << 24;

    void requireUsableGeometry(const DecodedImage &image, const std::string &operation)
    {
        if (image.isDegenerate())
        {
            throw MetadataError(MetadataErrorKind::DEGENERATE_GEOMETRY,
                                "Cannot compute " + operation + " for a " + std::to_string(image.width()) + "x" +
                                    std::to_string(image.height()) + " image");
        }
    }

    nlohmann::json triple(const std::array<double, 3> &values)
    {
        return nlohmann::json::array({values[0], values[1], values[2]});
    }
}

nlohmann::json ColorStats::toJson() const
{
    return {
        {"mean", triple(mean)},
        {"median", triple(median)},
        {"stddev", triple(stddev)},
        {"rms", triple(rms)},
        {"histogram", histogram}};
}

std::string DominantColor::hex() const
{
    std::stringstream ss;
    ss << '#' << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(red) << std::setw(2)
       << static_cast<int>(green) << std::setw(2) << static_cast<int>(blue);
    return ss.str();
}

nlohmann::json DominantColor::toJson() const
{
    return {
        {"color", hex()},
        {"rgb", {red, green, blue}},
        {"count", count}};
}

ColorStats ColorAnalyzer::computeStats(const DecodedImage &image)
{
    requireUsableGeometry(image, "histogram");

    cv::Mat bgr = PixelConversion::toBgr8(image.pixels);
    std::vector<cv::Mat> planes;
    cv::split(bgr, planes);

    ColorStats stats;
    const int hist_channels[] = {0};
    const int hist_size = 256;
    const float range[] = {0.0f, 256.0f};
    const float *ranges[] = {range};
    // calcHist counts in float; strips of at most 2^24 pixels keep every bin exact
    const int strip_rows = std::max(1, kExactFloatCount / std::max(1, bgr.cols));

    for (int channel = 0; channel < 3; channel++)
    {
        // OpenCV planes are B, G, R
        const cv::Mat &plane = planes[2 - channel];
        uint64_t *bins = stats.histogram.data() + channel * 256;

        for (int row = 0; row < plane.rows; row += strip_rows)
        {
            cv::Mat strip = plane.rowRange(row, std::min(plane.rows, row + strip_rows));
            cv::Mat hist;
            cv::calcHist(&strip, 1, hist_channels, cv::Mat(), hist, 1, &hist_size, ranges);
            for (int value = 0; value < 256; value++)
            {
                bins[value] += static_cast<uint64_t>(cvRound(hist.at<float>(value)));
            }
        }

        // First bin whose cumulative count passes half the samples
        const uint64_t half = static_cast<uint64_t>(plane.total()) / 2;
        uint64_t cumulative = 0;
        int median_value = 255;
        for (int value = 0; value < 256; value++)
        {
            cumulative += bins[value];
            if (cumulative > half)
            {
                median_value = value;
                break;
            }
        }
        stats.median[channel] = median_value;
    }

    cv::Scalar mean;
    cv::Scalar stddev;
    cv::meanStdDev(bgr, mean, stddev);
    for (int channel = 0; channel < 3; channel++)
    {
        stats.mean[channel] = mean[2 - channel];
        stats.stddev[channel] = stddev[2 - channel];
        stats.rms[channel] = std::sqrt(mean[2 - channel] * mean[2 - channel] + stddev[2 - channel] * stddev[2 - channel]);
    }

    Logger::debug("Color stats computed over " + std::to_string(bgr.total()) + " pixels");
    return stats;
}

std::vector<DominantColor> ColorAnalyzer::dominantColors(const DecodedImage &image, int top_k, int grid_size)
{
    if (top_k < 1 || grid_size < 1)
    {
        throw std::invalid_argument("top_k and grid_size must be positive");
    }
    requireUsableGeometry(image, "dominant colors");

    cv::Mat bgr = PixelConversion::toBgr8(image.pixels);
    cv::Mat grid;
    cv::resize(bgr, grid, cv::Size(grid_size, grid_size), 0, 0, cv::INTER_NEAREST);

    std::vector<DominantColor> colors;
    std::unordered_map<uint32_t, size_t> index_of;
    for (int y = 0; y < grid.rows; y++)
    {
        const cv::Vec3b *row = grid.ptr<cv::Vec3b>(y);
        for (int x = 0; x < grid.cols; x++)
        {
            const uint8_t r = row[x][2];
            const uint8_t g = row[x][1];
            const uint8_t b = row[x][0];
            const uint32_t key = (static_cast<uint32_t>(r) << 16) | (static_cast<uint32_t>(g) << 8) | b;

            auto it = index_of.find(key);
            if (it == index_of.end())
            {
                index_of.emplace(key, colors.size());
                colors.emplace_back(r, g, b, 1);
            }
            else
            {
                colors[it->second].count++;
            }
        }
    }

    // stable_sort keeps first-encountered order among equal counts
    std::stable_sort(colors.begin(), colors.end(),
                     [](const DominantColor &a, const DominantColor &b)
                     { return a.count > b.count; });
    if (colors.size() > static_cast<size_t>(top_k))
    {
        colors.resize(top_k);
    }

    Logger::debug("Dominant colors: " + std::to_string(index_of.size()) + " distinct in a " +
                  std::to_string(grid_size) + "x" + std::to_string(grid_size) + " sample");
    return colors;
}

int ColorAnalyzer::greatestCommonDivisor(int a, int b)
{
    while (b != 0)
    {
        int remainder = a % b;
        a = b;
        b = remainder;
    }
    return a;
}

std::string ColorAnalyzer::aspectRatio(int width, int height)
{
    if (width <= 0 || height <= 0)
    {
        throw MetadataError(MetadataErrorKind::DEGENERATE_GEOMETRY,
                            "No aspect ratio for a " + std::to_string(width) + "x" + std::to_string(height) + " image");
    }
    const int divisor = greatestCommonDivisor(width, height);
    return std::to_string(width / divisor) + ":" + std::to_string(height / divisor);
}

double ColorAnalyzer::megapixels(int width, int height)
{
    const double pixels = static_cast<double>(width) * static_cast<double>(height);
    return std::round(pixels / 1000000.0 * 100.0) / 100.0;
}
