#include "core/metadata_record.hpp"

namespace
{
    nlohmann::json tripleOrNull(const FieldResult<ColorStats> &stats, const std::array<double, 3> ColorStats::*member)
    {
        if (!stats.isPresent())
            return nullptr;
        const auto &values = stats.value.*member;
        return nlohmann::json::array({values[0], values[1], values[2]});
    }
}

nlohmann::json MetadataRecord::errors() const
{
    nlohmann::json out = nlohmann::json::object();
    if (icc_profile.status == IccStatus::UNPARSABLE)
        out["icc_profile"] = icc_profile.error;

    if (exif.isFailed())
    {
        out["exif"] = exif.error_message;
    }
    else if (exif.isPresent() && !exif.value.warnings.empty())
    {
        std::string joined;
        for (const auto &warning : exif.value.warnings)
        {
            joined += (joined.empty() ? "" : "; ") + warning;
        }
        out["exif"] = joined;
    }

    if (gps.isFailed())
        out["gps"] = gps.error_message;
    if (hashes.isFailed())
        out["hashes"] = hashes.error_message;
    if (color_stats.isFailed())
        out["histogram"] = color_stats.error_message;
    if (dominant_colors.isFailed())
        out["dominant_colors"] = dominant_colors.error_message;
    if (aspect_ratio.isFailed())
        out["aspect_ratio"] = aspect_ratio.error_message;
    if (megapixels.isFailed())
        out["megapixels"] = megapixels.error_message;
    return out;
}

nlohmann::json MetadataRecord::toJson() const
{
    nlohmann::json out;
    out["filename"] = filename;
    out["format"] = format;
    out["mode"] = mode;
    out["size"] = {width, height};
    out["width"] = width;
    out["height"] = height;
    out["file_size_bytes"] = file_size_bytes;
    out["sha256"] = sha256.empty() ? nlohmann::json(nullptr) : nlohmann::json(sha256);

    out["icc_profile"] = icc_profile.toJson();

    out["exif"] = exif.toJson([](const ExifSummary &e)
                              { return e.summary; });
    out["exif_tags"] = exif.toJson([](const ExifSummary &e)
                                   { return TagValues::toJson(e.tags); });
    out["gps"] = gps.toJson([](const GpsCoordinate &g)
                            { return g.toJson(); });

    out["hashes"] = hashes.toJson([](const HashSet &h)
                                  { return h.toJson(); });

    out["histogram"] = color_stats.toJson([](const ColorStats &s)
                                          { return s.toJson(); });
    out["histogram_mean"] = tripleOrNull(color_stats, &ColorStats::mean);
    out["histogram_median"] = tripleOrNull(color_stats, &ColorStats::median);
    out["histogram_stddev"] = tripleOrNull(color_stats, &ColorStats::stddev);

    out["dominant_colors"] = dominant_colors.toJson([](const std::vector<DominantColor> &colors)
                                                    {
        nlohmann::json list = nlohmann::json::array();
        for (const auto &color : colors)
        {
            list.push_back(color.toJson());
        }
        return list; });

    out["aspect_ratio"] = aspect_ratio.toJson([](const std::string &ratio)
                                              { return nlohmann::json(ratio); });
    out["megapixels"] = megapixels.toJson([](double mp)
                                          { return nlohmann::json(mp); });

    out["errors"] = errors();
    return out;
}
