#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include "core/tag_value.hpp"

/**
 * @brief IFD namespaces a tag ID is resolved in. IDs overlap between
 * namespaces, so every lookup is namespaced.
 */
enum class TagNamespace
{
    IMAGE,   // 0th IFD
    EXIF,    // Exif sub-IFD
    GPS,     // GPS sub-IFD
    INTEROP  // Interoperability sub-IFD
};

struct TagDefinition
{
    std::string name;
    TagValueKind kind;
};

/**
 * @brief Static, read-only mapping from numeric EXIF/GPS tag IDs to
 * canonical names and declared value kinds
 */
class TagDictionary
{
public:
    // Sub-IFD pointer tags
    static constexpr uint16_t EXIF_IFD_POINTER = 0x8769;
    static constexpr uint16_t GPS_IFD_POINTER = 0x8825;
    static constexpr uint16_t INTEROP_IFD_POINTER = 0xA005;

    // UNDEFINED tags carrying an 8-byte character code before their text
    static constexpr uint16_t USER_COMMENT = 0x9286;
    static constexpr uint16_t GPS_PROCESSING_METHOD = 27;
    static constexpr uint16_t GPS_AREA_INFORMATION = 28;

    static bool hasCharacterCode(TagNamespace ns, uint16_t tag_id);

    /**
     * @brief Look up a tag definition
     * @return Definition, or nullptr for an unknown ID
     */
    static const TagDefinition *find(TagNamespace ns, uint16_t tag_id);

    /**
     * @brief Canonical name for a tag. Unknown IDs keep their numeric ID:
     * "37500" in the image/Exif namespaces, "GPS.31" / "Interop.4" in the others.
     */
    static std::string nameFor(TagNamespace ns, uint16_t tag_id);

    static std::string namespaceName(TagNamespace ns);

    static size_t size(TagNamespace ns);

private:
    static const std::unordered_map<uint16_t, TagDefinition> &table(TagNamespace ns);

    static const std::unordered_map<uint16_t, TagDefinition> image_tags_;
    static const std::unordered_map<uint16_t, TagDefinition> exif_tags_;
    static const std::unordered_map<uint16_t, TagDefinition> gps_tags_;
    static const std::unordered_map<uint16_t, TagDefinition> interop_tags_;
};
