#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/decoded_image.hpp"

/**
 * @brief Per-channel statistics of the RGB view of an image
 *
 * Channel order is R, G, B everywhere. histogram holds 768 bins:
 * 256 for R, then G, then B.
 */
struct ColorStats
{
    std::array<double, 3> mean;
    std::array<double, 3> median;
    std::array<double, 3> stddev;
    std::array<double, 3> rms;
    std::vector<uint64_t> histogram;

    ColorStats() : mean{}, median{}, stddev{}, rms{}, histogram(768, 0) {}

    nlohmann::json toJson() const;
};

struct DominantColor
{
    uint8_t red;
    uint8_t green;
    uint8_t blue;
    uint64_t count;

    DominantColor() : red(0), green(0), blue(0), count(0) {}
    DominantColor(uint8_t r, uint8_t g, uint8_t b, uint64_t c) : red(r), green(g), blue(b), count(c) {}

    /**
     * @brief "#rrggbb"
     */
    std::string hex() const;
    nlohmann::json toJson() const;
};

class ColorAnalyzer
{
public:
    static constexpr int DEFAULT_TOP_K = 5;
    static constexpr int DEFAULT_GRID_SIZE = 100;

    /**
     * @brief Histogram, mean, median, standard deviation and RMS per channel
     * @throws MetadataError(DEGENERATE_GEOMETRY) for zero-area or single-pixel images
     */
    static ColorStats computeStats(const DecodedImage &image);

    /**
     * @brief Most frequent exact colors of a grid_size x grid_size
     * nearest-neighbour downsample, most frequent first, ties in first-seen order
     * @throws MetadataError(DEGENERATE_GEOMETRY) for zero-area or single-pixel images
     * @throws std::invalid_argument for a non-positive top_k or grid_size
     */
    static std::vector<DominantColor> dominantColors(const DecodedImage &image, int top_k = DEFAULT_TOP_K,
                                                     int grid_size = DEFAULT_GRID_SIZE);

    /**
     * @brief width:height reduced by their greatest common divisor, e.g. "16:9"
     * @throws MetadataError(DEGENERATE_GEOMETRY) when either side is zero
     */
    static std::string aspectRatio(int width, int height);

    /**
     * @brief width * height / 1e6 rounded to two decimals
     */
    static double megapixels(int width, int height);

    static int greatestCommonDivisor(int a, int b);
};
