#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <opencv2/core.hpp>

/**
 * @brief One decoded raster plus the raw metadata blocks still attached to
 * its container. Borrowed read-only by every analyzer for one extraction call.
 *
 * pixels keeps OpenCV channel order (BGR / BGRA) and the decoded bit depth.
 */
struct DecodedImage
{
    cv::Mat pixels;
    std::string format;   // Container format: JPEG, PNG, WEBP, TIFF
    std::string mode;     // Pixel layout: L, LA, RGB, RGBA, I;16, ...
    std::string filename;
    uint64_t file_size_bytes;
    std::vector<uint8_t> exif; // TIFF-structured EXIF block, empty when absent
    std::vector<uint8_t> icc;  // ICC profile, empty when absent

    DecodedImage() : file_size_bytes(0) {}

    int width() const { return pixels.cols; }
    int height() const { return pixels.rows; }
    int channels() const { return pixels.channels(); }

    /**
     * @brief Zero-area or single-pixel rasters cannot be hashed or histogrammed
     */
    bool isDegenerate() const
    {
        return width() <= 0 || height() <= 0 || (width() == 1 && height() == 1);
    }
};
