#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/color_analyzer.hpp"
#include "core/gps_converter.hpp"
#include "core/icc_extractor.hpp"
#include "core/perceptual_hasher.hpp"
#include "core/processing_result.hpp"
#include "core/tag_value.hpp"

/**
 * @brief Camera-facing subset of the tag table
 */
struct ExifSummary
{
    TagTable tags;           // Full normalized table
    nlohmann::json summary;  // camera_make, camera_model, iso, ...
    std::vector<std::string> warnings; // IFD problems hit after some tags decoded
};

/**
 * @brief The normalized output of one extraction call
 *
 * format, dimensions and file size are always populated; every other
 * field carries its own FieldResult.
 */
struct MetadataRecord
{
    std::string filename;
    std::string format;
    std::string mode;
    int width;
    int height;
    uint64_t file_size_bytes;
    std::string sha256;

    IccDescription icc_profile;
    FieldResult<ExifSummary> exif;
    FieldResult<GpsCoordinate> gps;
    FieldResult<HashSet> hashes;
    FieldResult<ColorStats> color_stats;
    FieldResult<std::vector<DominantColor>> dominant_colors;
    FieldResult<std::string> aspect_ratio;
    FieldResult<double> megapixels;

    MetadataRecord() : width(0), height(0), file_size_bytes(0) {}

    /**
     * @brief Category name -> error message for every failed field
     */
    nlohmann::json errors() const;

    nlohmann::json toJson() const;
};
