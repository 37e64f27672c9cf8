#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "core/decoded_image.hpp"

/**
 * @brief Raw metadata segments located inside an image container
 */
struct MetadataBlocks
{
    std::vector<uint8_t> exif;
    std::vector<uint8_t> icc;
};

/**
 * @brief Container-level decoding: pixel grid through OpenCV, EXIF/ICC
 * segments through Exiv2
 */
class ImageDecoder
{
public:
    /**
     * @brief Read and decode an image file
     * @throws std::runtime_error when the file cannot be read
     * @throws MetadataError(MALFORMED_CONTAINER) when no pixel grid can be decoded
     */
    static DecodedImage decodeFile(const std::string &file_path);

    /**
     * @brief Decode an in-memory image
     * @throws MetadataError(MALFORMED_CONTAINER) when no pixel grid can be decoded
     */
    static DecodedImage decodeBuffer(const std::vector<uint8_t> &bytes, const std::string &filename);

    /**
     * @brief Container format from magic bytes: JPEG, PNG, WEBP, TIFF or UNKNOWN
     */
    static std::string detectFormat(const std::vector<uint8_t> &bytes);

    static std::string modeName(const cv::Mat &pixels);

    /**
     * @brief Locate the EXIF and ICC blocks of a container.
     *
     * A TIFF file is its own EXIF block. Other containers hand their parsed
     * Exif data back as a freshly serialized TIFF block in the original byte
     * order. Containers Exiv2 cannot read yield empty blocks.
     */
    static MetadataBlocks extractMetadataBlocks(const std::vector<uint8_t> &bytes, const std::string &format);

private:
    static void routeExiv2Logging();
};
