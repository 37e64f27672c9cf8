#include "core/gps_converter.hpp"
#include "core/metadata_error.hpp"
#include "core/text_encoding.hpp"
#include "logging/logger.hpp"
#include <iomanip>
#include <sstream>

namespace
{
    std::string formatDegrees(double value)
    {
        std::ostringstream ss;
        ss << std::setprecision(15) << value;
        return ss.str();
    }

    std::string refOf(const TagTable &tags, const std::string &key)
    {
        const std::string *ref = TagValues::asString(tags, key);
        return ref ? TextEncoding::trimTrailing(*ref) : std::string();
    }
}

std::string GpsCoordinate::googleMapsUrl() const
{
    return "https://www.google.com/maps/search/?api=1&query=" + formatDegrees(latitude) + "," + formatDegrees(longitude);
}

nlohmann::json GpsCoordinate::toJson() const
{
    nlohmann::json out;
    out["latitude"] = latitude;
    out["longitude"] = longitude;
    out["altitude"] = altitude ? nlohmann::json(*altitude) : nlohmann::json(nullptr);
    out["google_maps"] = googleMapsUrl();
    return out;
}

double GpsConverter::toDecimalDegrees(const std::vector<Rational> &dms, const std::string &ref)
{
    if (dms.size() != 3)
    {
        throw MetadataError(MetadataErrorKind::MALFORMED_METADATA,
                            "GPS coordinate must have 3 rationals, got " + std::to_string(dms.size()));
    }

    double degrees = dms[0].toDouble() + dms[1].toDouble() / 60.0 + dms[2].toDouble() / 3600.0;
    if (ref == "S" || ref == "W")
    {
        degrees = -degrees;
    }
    return degrees;
}

std::optional<GpsCoordinate> GpsConverter::fromTags(const TagTable &tags)
{
    const auto *latitude = TagValues::asRationals(tags, "GPSLatitude");
    const auto *longitude = TagValues::asRationals(tags, "GPSLongitude");
    if (!latitude && !longitude)
    {
        if (tags.count("GPSLatitude") || tags.count("GPSLongitude"))
        {
            throw MetadataError(MetadataErrorKind::MALFORMED_METADATA, "GPS coordinates are not rational triples");
        }
        return std::nullopt;
    }
    if (!latitude || !longitude)
    {
        throw MetadataError(MetadataErrorKind::MALFORMED_METADATA,
                            std::string("GPS IFD is missing ") + (latitude ? "GPSLongitude" : "GPSLatitude"));
    }

    GpsCoordinate coordinate;
    coordinate.latitude = toDecimalDegrees(*latitude, refOf(tags, "GPSLatitudeRef"));
    coordinate.longitude = toDecimalDegrees(*longitude, refOf(tags, "GPSLongitudeRef"));

    if (coordinate.latitude < -90.0 || coordinate.latitude > 90.0)
    {
        throw MetadataError(MetadataErrorKind::MALFORMED_METADATA,
                            "GPS latitude out of range: " + formatDegrees(coordinate.latitude));
    }
    if (coordinate.longitude < -180.0 || coordinate.longitude > 180.0)
    {
        throw MetadataError(MetadataErrorKind::MALFORMED_METADATA,
                            "GPS longitude out of range: " + formatDegrees(coordinate.longitude));
    }

    const auto *altitude = TagValues::asRationals(tags, "GPSAltitude");
    if (altitude && !altitude->empty())
    {
        double meters = (*altitude)[0].toDouble();
        // GPSAltitudeRef 1 means below sea level
        const auto *altitude_ref = TagValues::asIntegers(tags, "GPSAltitudeRef");
        if (altitude_ref && !altitude_ref->empty() && (*altitude_ref)[0] == 1)
        {
            meters = -meters;
        }
        coordinate.altitude = meters;
    }

    Logger::debug("GPS position decoded: " + formatDegrees(coordinate.latitude) + ", " + formatDegrees(coordinate.longitude));
    return coordinate;
}
