#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "core/gps_converter.hpp"
#include "core/tag_dictionary.hpp"
#include "core/tag_value.hpp"

/**
 * @brief Outcome of decoding one EXIF block
 *
 * Tags decoded before an IFD-level problem are retained; each problem is
 * appended to errors. A GPS problem only affects gps/gps_error.
 */
struct ExifDecodeResult
{
    TagTable tags;
    std::vector<std::string> errors;
    bool has_gps_ifd;
    std::optional<GpsCoordinate> gps;
    std::string gps_error;

    ExifDecodeResult() : has_gps_ifd(false) {}

    bool ok() const { return errors.empty(); }
    std::string errorSummary() const;
};

/**
 * @brief TIFF-structured EXIF block decoder
 *
 * Walks IFD0, then the Exif, GPS and Interoperability sub-IFDs it points to.
 * Accepts blocks with or without the JPEG "Exif\0\0" preamble.
 */
class ExifDecoder
{
public:
    static ExifDecodeResult decode(const std::vector<uint8_t> &exif_block);

    /**
     * @brief Size in bytes of one value of a TIFF field type, 0 when unsupported
     */
    static uint32_t typeSize(uint16_t type);

    static constexpr size_t MAX_IFD_ENTRIES = 4096;
};
