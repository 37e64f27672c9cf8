#include "core/icc_extractor.hpp"
#include "core/metadata_error.hpp"
#include "core/text_encoding.hpp"
#include "logging/logger.hpp"
#include <cstring>

namespace
{
    constexpr size_t kHeaderSize = 128;
    constexpr size_t kTagEntrySize = 12;

    uint32_t readU32be(const uint8_t *p)
    {
        return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
               (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
    }

    void require(bool condition, const std::string &message)
    {
        if (!condition)
        {
            throw MetadataError(MetadataErrorKind::MALFORMED_METADATA, message);
        }
    }
}

const char *const IccExtractor::UNPARSABLE_SENTINEL = "Embedded ICC profile found, could not parse description";

nlohmann::json IccDescription::toJson() const
{
    switch (status)
    {
    case IccStatus::PRESENT:
        return description;
    case IccStatus::UNPARSABLE:
        return IccExtractor::UNPARSABLE_SENTINEL;
    default:
        return nullptr;
    }
}

std::string IccExtractor::decodeTextDescription(const uint8_t *tag, size_t size)
{
    // 'desc': sig, reserved, ASCII count, ASCII, Unicode language, Unicode count, UTF-16BE
    require(size >= 12, "textDescriptionType tag truncated");
    const uint32_t ascii_count = readU32be(tag + 8);
    require(ascii_count <= size - 12, "textDescriptionType ASCII length exceeds tag");

    std::string ascii = TextEncoding::utf8Lossy(tag + 12, ascii_count);
    ascii = TextEncoding::trimTrailing(TextEncoding::cutAtNul(ascii));
    if (!ascii.empty())
    {
        return ascii;
    }

    const size_t unicode_header = 12 + static_cast<size_t>(ascii_count);
    if (size - unicode_header < 8)
    {
        return ascii;
    }
    const uint32_t unicode_chars = readU32be(tag + unicode_header + 4);
    const size_t unicode_bytes = static_cast<size_t>(unicode_chars) * 2;
    require(unicode_bytes <= size - unicode_header - 8, "textDescriptionType Unicode length exceeds tag");

    std::string unicode = TextEncoding::utf16beToUtf8(tag + unicode_header + 8, unicode_bytes);
    return TextEncoding::trimTrailing(TextEncoding::cutAtNul(unicode));
}

std::string IccExtractor::decodeMultiLocalizedUnicode(const uint8_t *tag, size_t size)
{
    // 'mluc': sig, reserved, record count, record size, records of
    // (language, country, byte length, offset from tag start)
    require(size >= 16, "multiLocalizedUnicodeType tag truncated");
    const uint32_t record_count = readU32be(tag + 8);
    const uint32_t record_size = readU32be(tag + 12);
    require(record_size >= 12, "multiLocalizedUnicodeType record size " + std::to_string(record_size) + " too small");

    for (uint32_t i = 0; i < record_count; i++)
    {
        const uint64_t record = 16 + static_cast<uint64_t>(i) * record_size;
        require(record + 12 <= size, "multiLocalizedUnicodeType record table exceeds tag");

        const uint32_t length = readU32be(tag + record + 4);
        const uint32_t offset = readU32be(tag + record + 8);
        require(static_cast<uint64_t>(offset) + length <= size, "multiLocalizedUnicodeType string exceeds tag");

        std::string text = TextEncoding::trimTrailing(TextEncoding::cutAtNul(TextEncoding::utf16beToUtf8(tag + offset, length)));
        if (!text.empty())
        {
            return text;
        }
    }
    return std::string();
}

IccDescription IccExtractor::extract(const std::vector<uint8_t> &icc_profile)
{
    IccDescription result;
    if (icc_profile.empty())
    {
        return result;
    }

    try
    {
        const uint8_t *data = icc_profile.data();
        const size_t size = icc_profile.size();

        require(size >= kHeaderSize + 4, "ICC profile truncated: " + std::to_string(size) + " bytes");
        require(std::memcmp(data + 36, "acsp", 4) == 0, "ICC profile signature 'acsp' missing");

        const uint32_t tag_count = readU32be(data + kHeaderSize);
        require(static_cast<uint64_t>(tag_count) * kTagEntrySize <= size - kHeaderSize - 4,
                "ICC tag table exceeds profile");

        result.status = IccStatus::PRESENT;
        for (uint32_t i = 0; i < tag_count; i++)
        {
            const uint8_t *entry = data + kHeaderSize + 4 + static_cast<size_t>(i) * kTagEntrySize;
            if (std::memcmp(entry, "desc", 4) != 0)
            {
                continue;
            }

            const uint32_t offset = readU32be(entry + 4);
            const uint32_t length = readU32be(entry + 8);
            require(static_cast<uint64_t>(offset) + length <= size, "ICC 'desc' tag exceeds profile");
            require(length >= 4, "ICC 'desc' tag too short");

            const uint8_t *tag = data + offset;
            if (std::memcmp(tag, "desc", 4) == 0)
            {
                result.description = decodeTextDescription(tag, length);
            }
            else if (std::memcmp(tag, "mluc", 4) == 0)
            {
                result.description = decodeMultiLocalizedUnicode(tag, length);
            }
            else
            {
                require(false, "ICC 'desc' tag has unsupported type 0x" + TextEncoding::hexBytes(tag, 4));
            }
            break;
        }

        Logger::debug("ICC profile description: '" + result.description + "'");
    }
    catch (const MetadataError &e)
    {
        result.status = IccStatus::UNPARSABLE;
        result.description.clear();
        result.error = e.what();
        Logger::warn("ICC profile could not be parsed: " + result.error);
    }
    return result;
}
