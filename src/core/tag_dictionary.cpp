#include "core/tag_dictionary.hpp"

namespace
{
    constexpr TagValueKind I = TagValueKind::INTEGER;
    constexpr TagValueKind R = TagValueKind::RATIONAL;
    constexpr TagValueKind S = TagValueKind::STRING;
    constexpr TagValueKind B = TagValueKind::BYTES;
}

const std::unordered_map<uint16_t, TagDefinition> TagDictionary::image_tags_ = {
    {0x0100, {"ImageWidth", I}},
    {0x0101, {"ImageLength", I}},
    {0x0102, {"BitsPerSample", I}},
    {0x0103, {"Compression", I}},
    {0x0106, {"PhotometricInterpretation", I}},
    {0x010E, {"ImageDescription", S}},
    {0x010F, {"Make", S}},
    {0x0110, {"Model", S}},
    {0x0111, {"StripOffsets", I}},
    {0x0112, {"Orientation", I}},
    {0x0115, {"SamplesPerPixel", I}},
    {0x0116, {"RowsPerStrip", I}},
    {0x0117, {"StripByteCounts", I}},
    {0x011A, {"XResolution", R}},
    {0x011B, {"YResolution", R}},
    {0x011C, {"PlanarConfiguration", I}},
    {0x0128, {"ResolutionUnit", I}},
    {0x0131, {"Software", S}},
    {0x0132, {"DateTime", S}},
    {0x013B, {"Artist", S}},
    {0x013E, {"WhitePoint", R}},
    {0x013F, {"PrimaryChromaticities", R}},
    {0x0201, {"JPEGInterchangeFormat", I}},
    {0x0202, {"JPEGInterchangeFormatLength", I}},
    {0x0211, {"YCbCrCoefficients", R}},
    {0x0213, {"YCbCrPositioning", I}},
    {0x8298, {"Copyright", S}},
    {0x8773, {"InterColorProfile", B}},
};

const std::unordered_map<uint16_t, TagDefinition> TagDictionary::exif_tags_ = {
    {0x829A, {"ExposureTime", R}},
    {0x829D, {"FNumber", R}},
    {0x8822, {"ExposureProgram", I}},
    {0x8827, {"ISOSpeedRatings", I}},
    {0x8830, {"SensitivityType", I}},
    {0x9000, {"ExifVersion", S}},
    {0x9003, {"DateTimeOriginal", S}},
    {0x9004, {"DateTimeDigitized", S}},
    {0x9010, {"OffsetTime", S}},
    {0x9011, {"OffsetTimeOriginal", S}},
    {0x9101, {"ComponentsConfiguration", B}},
    {0x9102, {"CompressedBitsPerPixel", R}},
    {0x9201, {"ShutterSpeedValue", R}},
    {0x9202, {"ApertureValue", R}},
    {0x9203, {"BrightnessValue", R}},
    {0x9204, {"ExposureBiasValue", R}},
    {0x9205, {"MaxApertureValue", R}},
    {0x9206, {"SubjectDistance", R}},
    {0x9207, {"MeteringMode", I}},
    {0x9208, {"LightSource", I}},
    {0x9209, {"Flash", I}},
    {0x920A, {"FocalLength", R}},
    {0x9214, {"SubjectArea", I}},
    {0x927C, {"MakerNote", B}},
    {0x9286, {"UserComment", S}},
    {0x9290, {"SubsecTime", S}},
    {0x9291, {"SubsecTimeOriginal", S}},
    {0x9292, {"SubsecTimeDigitized", S}},
    {0xA000, {"FlashPixVersion", S}},
    {0xA001, {"ColorSpace", I}},
    {0xA002, {"ExifImageWidth", I}},
    {0xA003, {"ExifImageHeight", I}},
    {0xA20E, {"FocalPlaneXResolution", R}},
    {0xA20F, {"FocalPlaneYResolution", R}},
    {0xA210, {"FocalPlaneResolutionUnit", I}},
    {0xA217, {"SensingMethod", I}},
    {0xA300, {"FileSource", B}},
    {0xA301, {"SceneType", B}},
    {0xA401, {"CustomRendered", I}},
    {0xA402, {"ExposureMode", I}},
    {0xA403, {"WhiteBalance", I}},
    {0xA404, {"DigitalZoomRatio", R}},
    {0xA405, {"FocalLengthIn35mmFilm", I}},
    {0xA406, {"SceneCaptureType", I}},
    {0xA408, {"Contrast", I}},
    {0xA409, {"Saturation", I}},
    {0xA40A, {"Sharpness", I}},
    {0xA40C, {"SubjectDistanceRange", I}},
    {0xA420, {"ImageUniqueID", S}},
    {0xA430, {"CameraOwnerName", S}},
    {0xA431, {"BodySerialNumber", S}},
    {0xA432, {"LensSpecification", R}},
    {0xA433, {"LensMake", S}},
    {0xA434, {"LensModel", S}},
    {0xA435, {"LensSerialNumber", S}},
};

const std::unordered_map<uint16_t, TagDefinition> TagDictionary::gps_tags_ = {
    {0, {"GPSVersionID", B}},
    {1, {"GPSLatitudeRef", S}},
    {2, {"GPSLatitude", R}},
    {3, {"GPSLongitudeRef", S}},
    {4, {"GPSLongitude", R}},
    {5, {"GPSAltitudeRef", I}},
    {6, {"GPSAltitude", R}},
    {7, {"GPSTimeStamp", R}},
    {8, {"GPSSatellites", S}},
    {9, {"GPSStatus", S}},
    {10, {"GPSMeasureMode", S}},
    {11, {"GPSDOP", R}},
    {12, {"GPSSpeedRef", S}},
    {13, {"GPSSpeed", R}},
    {14, {"GPSTrackRef", S}},
    {15, {"GPSTrack", R}},
    {16, {"GPSImgDirectionRef", S}},
    {17, {"GPSImgDirection", R}},
    {18, {"GPSMapDatum", S}},
    {23, {"GPSDestBearingRef", S}},
    {24, {"GPSDestBearing", R}},
    {27, {"GPSProcessingMethod", S}},
    {28, {"GPSAreaInformation", S}},
    {29, {"GPSDateStamp", S}},
    {30, {"GPSDifferential", I}},
    {31, {"GPSHPositioningError", R}},
};

const std::unordered_map<uint16_t, TagDefinition> TagDictionary::interop_tags_ = {
    {1, {"InteroperabilityIndex", S}},
    {2, {"InteroperabilityVersion", S}},
};

const std::unordered_map<uint16_t, TagDefinition> &TagDictionary::table(TagNamespace ns)
{
    switch (ns)
    {
    case TagNamespace::IMAGE:
        return image_tags_;
    case TagNamespace::EXIF:
        return exif_tags_;
    case TagNamespace::GPS:
        return gps_tags_;
    default:
        return interop_tags_;
    }
}

const TagDefinition *TagDictionary::find(TagNamespace ns, uint16_t tag_id)
{
    const auto &tags = table(ns);
    auto it = tags.find(tag_id);
    if (it == tags.end())
    {
        // The 0th IFD and the Exif sub-IFD share one numbering space in practice
        // (writers occasionally place Exif tags in IFD0 and vice versa).
        if (ns == TagNamespace::IMAGE)
        {
            it = exif_tags_.find(tag_id);
            return it == exif_tags_.end() ? nullptr : &it->second;
        }
        if (ns == TagNamespace::EXIF)
        {
            it = image_tags_.find(tag_id);
            return it == image_tags_.end() ? nullptr : &it->second;
        }
        return nullptr;
    }
    return &it->second;
}

bool TagDictionary::hasCharacterCode(TagNamespace ns, uint16_t tag_id)
{
    if (ns == TagNamespace::GPS)
        return tag_id == GPS_PROCESSING_METHOD || tag_id == GPS_AREA_INFORMATION;
    return (ns == TagNamespace::EXIF || ns == TagNamespace::IMAGE) && tag_id == USER_COMMENT;
}

std::string TagDictionary::nameFor(TagNamespace ns, uint16_t tag_id)
{
    const TagDefinition *definition = find(ns, tag_id);
    if (definition)
    {
        return definition->name;
    }

    switch (ns)
    {
    case TagNamespace::GPS:
        return "GPS." + std::to_string(tag_id);
    case TagNamespace::INTEROP:
        return "Interop." + std::to_string(tag_id);
    default:
        return std::to_string(tag_id);
    }
}

std::string TagDictionary::namespaceName(TagNamespace ns)
{
    switch (ns)
    {
    case TagNamespace::IMAGE:
        return "0th";
    case TagNamespace::EXIF:
        return "Exif";
    case TagNamespace::GPS:
        return "GPS";
    case TagNamespace::INTEROP:
        return "Interop";
    default:
        return "unknown";
    }
}

size_t TagDictionary::size(TagNamespace ns)
{
    return table(ns).size();
}
