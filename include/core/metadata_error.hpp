#pragma once

#include <stdexcept>
#include <string>

/**
 * @brief Failure categories of a metadata extraction call
 */
enum class MetadataErrorKind
{
    MALFORMED_CONTAINER, // Pixel grid could not be decoded, fatal for the call
    MALFORMED_METADATA,  // EXIF/ICC bytes present but unparsable
    DEGENERATE_GEOMETRY, // Zero-area or single-pixel image
    UNSUPPORTED_INPUT    // Extension outside the accepted set
};

class MetadataError : public std::runtime_error
{
public:
    MetadataError(MetadataErrorKind kind, const std::string &message)
        : std::runtime_error(message), kind_(kind) {}

    MetadataErrorKind kind() const { return kind_; }

    static std::string kindName(MetadataErrorKind kind)
    {
        switch (kind)
        {
        case MetadataErrorKind::MALFORMED_CONTAINER:
            return "malformed-container";
        case MetadataErrorKind::MALFORMED_METADATA:
            return "malformed-metadata-block";
        case MetadataErrorKind::DEGENERATE_GEOMETRY:
            return "degenerate-geometry";
        case MetadataErrorKind::UNSUPPORTED_INPUT:
            return "unsupported-input-type";
        default:
            return "unknown";
        }
    }

private:
    MetadataErrorKind kind_;
};
