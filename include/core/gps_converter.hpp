#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/tag_value.hpp"

/**
 * @brief Signed decimal-degree position derived from the GPS IFD
 *
 * latitude is within [-90, 90], longitude within [-180, 180].
 */
struct GpsCoordinate
{
    double latitude;
    double longitude;
    std::optional<double> altitude; // meters, negative below sea level

    GpsCoordinate() : latitude(0.0), longitude(0.0) {}

    std::string googleMapsUrl() const;
    nlohmann::json toJson() const;
};

class GpsConverter
{
public:
    /**
     * @brief Convert a (degrees, minutes, seconds) rational triple to decimal degrees
     * @param dms Exactly three rationals
     * @param ref Hemisphere reference; "S" and "W" negate the result
     * @throws MetadataError(MALFORMED_METADATA) on a zero denominator or a
     *         triple of the wrong length
     */
    static double toDecimalDegrees(const std::vector<Rational> &dms, const std::string &ref);

    /**
     * @brief Derive a coordinate from a decoded tag table
     * @return std::nullopt when neither GPSLatitude nor GPSLongitude is present
     * @throws MetadataError(MALFORMED_METADATA) for a half-present, unparsable
     *         or out-of-range position
     */
    static std::optional<GpsCoordinate> fromTags(const TagTable &tags);
};
