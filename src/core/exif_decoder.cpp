#include "core/exif_decoder.hpp"
#include "core/metadata_error.hpp"
#include "core/text_encoding.hpp"
#include "logging/logger.hpp"
#include <cstring>
#include <set>
#include <sstream>

namespace
{
    enum FieldType : uint16_t
    {
        TYPE_BYTE = 1,
        TYPE_ASCII = 2,
        TYPE_SHORT = 3,
        TYPE_LONG = 4,
        TYPE_RATIONAL = 5,
        TYPE_SBYTE = 6,
        TYPE_UNDEFINED = 7,
        TYPE_SSHORT = 8,
        TYPE_SLONG = 9,
        TYPE_SRATIONAL = 10,
        TYPE_IFD = 13
    };

    /**
     * @brief Bounds-checked reader over a TIFF byte range with a fixed byte order
     */
    class TiffReader
    {
    public:
        TiffReader(const uint8_t *data, size_t size, bool little_endian)
            : data_(data), size_(size), little_endian_(little_endian) {}

        size_t size() const { return size_; }
        bool littleEndian() const { return little_endian_; }

        bool inBounds(uint64_t offset, uint64_t length) const
        {
            return offset <= size_ && length <= size_ - offset;
        }

        uint16_t u16(uint64_t offset) const
        {
            const uint8_t *p = data_ + offset;
            if (little_endian_)
                return static_cast<uint16_t>(p[0] | (p[1] << 8));
            return static_cast<uint16_t>((p[0] << 8) | p[1]);
        }

        uint32_t u32(uint64_t offset) const
        {
            const uint8_t *p = data_ + offset;
            if (little_endian_)
                return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
                       (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
            return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
                   (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
        }

        const uint8_t *at(uint64_t offset) const { return data_ + offset; }

    private:
        const uint8_t *data_;
        size_t size_;
        bool little_endian_;
    };

    struct PendingIfd
    {
        TagNamespace ns;
        uint32_t offset;
    };

    std::string stringFromBytes(const uint8_t *data, size_t size)
    {
        std::string text = TextEncoding::utf8Lossy(data, size);
        return TextEncoding::cutAtNul(text);
    }

    TagValue decodeValue(const TiffReader &reader, TagNamespace ns, uint16_t tag, uint16_t type, uint32_t count,
                         uint64_t offset, const TagDefinition *definition)
    {
        const uint8_t *p = reader.at(offset);
        switch (type)
        {
        case TYPE_ASCII:
            return stringFromBytes(p, count);
        case TYPE_BYTE:
        case TYPE_UNDEFINED:
        {
            if (TagDictionary::hasCharacterCode(ns, tag))
            {
                return TextEncoding::decodeUserComment(p, count, reader.littleEndian());
            }
            if (definition && definition->kind == TagValueKind::STRING)
            {
                return stringFromBytes(p, count);
            }
            if (definition && definition->kind == TagValueKind::INTEGER)
            {
                std::vector<int64_t> values(p, p + count);
                return values;
            }
            return std::vector<uint8_t>(p, p + count);
        }
        case TYPE_SBYTE:
        {
            std::vector<int64_t> values;
            values.reserve(count);
            for (uint32_t i = 0; i < count; i++)
                values.push_back(static_cast<int8_t>(p[i]));
            return values;
        }
        case TYPE_SHORT:
        case TYPE_SSHORT:
        {
            std::vector<int64_t> values;
            values.reserve(count);
            for (uint32_t i = 0; i < count; i++)
            {
                uint16_t raw = reader.u16(offset + i * 2);
                values.push_back(type == TYPE_SSHORT ? static_cast<int64_t>(static_cast<int16_t>(raw)) : raw);
            }
            return values;
        }
        case TYPE_LONG:
        case TYPE_SLONG:
        case TYPE_IFD:
        {
            std::vector<int64_t> values;
            values.reserve(count);
            for (uint32_t i = 0; i < count; i++)
            {
                uint32_t raw = reader.u32(offset + i * 4);
                values.push_back(type == TYPE_SLONG ? static_cast<int64_t>(static_cast<int32_t>(raw)) : raw);
            }
            return values;
        }
        default:
        {
            std::vector<Rational> values;
            values.reserve(count);
            for (uint32_t i = 0; i < count; i++)
            {
                uint32_t num = reader.u32(offset + i * 8);
                uint32_t den = reader.u32(offset + i * 8 + 4);
                if (type == TYPE_SRATIONAL)
                    values.emplace_back(static_cast<int32_t>(num), static_cast<int32_t>(den));
                else
                    values.emplace_back(num, den);
            }
            return values;
        }
        }
    }

    bool isPointerTag(TagNamespace ns, uint16_t tag, TagNamespace &target)
    {
        if (ns == TagNamespace::IMAGE && tag == TagDictionary::EXIF_IFD_POINTER)
        {
            target = TagNamespace::EXIF;
            return true;
        }
        if (ns == TagNamespace::IMAGE && tag == TagDictionary::GPS_IFD_POINTER)
        {
            target = TagNamespace::GPS;
            return true;
        }
        if (ns == TagNamespace::EXIF && tag == TagDictionary::INTEROP_IFD_POINTER)
        {
            target = TagNamespace::INTEROP;
            return true;
        }
        return false;
    }

    std::string hexTag(uint16_t tag)
    {
        std::ostringstream ss;
        ss << "0x" << std::hex << tag;
        return ss.str();
    }

    /**
     * @brief Decode one IFD into tags, queueing sub-IFD pointers.
     * Stops at the first malformed entry; entries decoded so far are kept.
     */
    void walkIfd(const TiffReader &reader, const PendingIfd &ifd, ExifDecodeResult &result,
                 std::vector<PendingIfd> &pending)
    {
        const std::string ifd_name = TagDictionary::namespaceName(ifd.ns) + " IFD";
        if (!reader.inBounds(ifd.offset, 2))
        {
            result.errors.push_back(ifd_name + " offset " + std::to_string(ifd.offset) + " is out of bounds");
            return;
        }

        const uint16_t entry_count = reader.u16(ifd.offset);
        if (entry_count > ExifDecoder::MAX_IFD_ENTRIES)
        {
            result.errors.push_back(ifd_name + " declares " + std::to_string(entry_count) + " entries");
            return;
        }

        for (uint16_t i = 0; i < entry_count; i++)
        {
            const uint64_t entry = static_cast<uint64_t>(ifd.offset) + 2 + static_cast<uint64_t>(i) * 12;
            if (!reader.inBounds(entry, 12))
            {
                result.errors.push_back(ifd_name + " entry " + std::to_string(i) + " is truncated");
                return;
            }

            const uint16_t tag = reader.u16(entry);
            const uint16_t type = reader.u16(entry + 2);
            const uint32_t count = reader.u32(entry + 4);

            TagNamespace target;
            if (isPointerTag(ifd.ns, tag, target))
            {
                pending.push_back({target, reader.u32(entry + 8)});
                if (target == TagNamespace::GPS)
                    result.has_gps_ifd = true;
                continue;
            }

            const uint32_t type_size = ExifDecoder::typeSize(type);
            if (type_size == 0)
            {
                result.errors.push_back(ifd_name + " tag " + hexTag(tag) + " has unsupported type code " + std::to_string(type));
                return;
            }

            const uint64_t byte_count = static_cast<uint64_t>(type_size) * count;
            uint64_t value_offset = entry + 8;
            if (byte_count > 4)
            {
                value_offset = reader.u32(entry + 8);
            }
            if (!reader.inBounds(value_offset, byte_count))
            {
                result.errors.push_back(ifd_name + " tag " + hexTag(tag) + " value at offset " +
                                        std::to_string(value_offset) + " is out of bounds");
                return;
            }

            const TagDefinition *definition = TagDictionary::find(ifd.ns, tag);
            result.tags[TagDictionary::nameFor(ifd.ns, tag)] = decodeValue(reader, ifd.ns, tag, type, count, value_offset, definition);
        }
    }
}

std::string ExifDecodeResult::errorSummary() const
{
    std::string summary;
    for (const auto &error : errors)
    {
        if (!summary.empty())
            summary += "; ";
        summary += error;
    }
    return summary;
}

uint32_t ExifDecoder::typeSize(uint16_t type)
{
    switch (type)
    {
    case TYPE_BYTE:
    case TYPE_ASCII:
    case TYPE_SBYTE:
    case TYPE_UNDEFINED:
        return 1;
    case TYPE_SHORT:
    case TYPE_SSHORT:
        return 2;
    case TYPE_LONG:
    case TYPE_SLONG:
    case TYPE_IFD:
        return 4;
    case TYPE_RATIONAL:
    case TYPE_SRATIONAL:
        return 8;
    default:
        return 0;
    }
}

ExifDecodeResult ExifDecoder::decode(const std::vector<uint8_t> &exif_block)
{
    ExifDecodeResult result;
    if (exif_block.empty())
    {
        return result;
    }

    const uint8_t *data = exif_block.data();
    size_t size = exif_block.size();
    if (size >= 6 && std::memcmp(data, "Exif\0\0", 6) == 0)
    {
        data += 6;
        size -= 6;
    }

    if (size < 8)
    {
        result.errors.push_back("EXIF block truncated: " + std::to_string(size) + " bytes");
        Logger::warn("EXIF decode failed: " + result.errorSummary());
        return result;
    }

    bool little_endian;
    if (data[0] == 'I' && data[1] == 'I')
        little_endian = true;
    else if (data[0] == 'M' && data[1] == 'M')
        little_endian = false;
    else
    {
        result.errors.push_back("Invalid TIFF byte order marker");
        Logger::warn("EXIF decode failed: " + result.errorSummary());
        return result;
    }

    TiffReader reader(data, size, little_endian);
    if (reader.u16(2) != 42)
    {
        result.errors.push_back("Invalid TIFF magic number " + std::to_string(reader.u16(2)));
        Logger::warn("EXIF decode failed: " + result.errorSummary());
        return result;
    }

    std::vector<PendingIfd> pending;
    pending.push_back({TagNamespace::IMAGE, reader.u32(4)});
    std::set<uint32_t> visited;

    while (!pending.empty())
    {
        PendingIfd ifd = pending.front();
        pending.erase(pending.begin());

        if (!visited.insert(ifd.offset).second)
        {
            result.errors.push_back(TagDictionary::namespaceName(ifd.ns) + " IFD offset " +
                                    std::to_string(ifd.offset) + " loops back to a visited IFD");
            continue;
        }
        walkIfd(reader, ifd, result, pending);
    }

    if (result.has_gps_ifd)
    {
        try
        {
            result.gps = GpsConverter::fromTags(result.tags);
        }
        catch (const MetadataError &e)
        {
            result.gps_error = e.what();
            Logger::warn("GPS conversion failed: " + result.gps_error);
        }
    }

    if (result.ok())
        Logger::debug("EXIF decoded: " + std::to_string(result.tags.size()) + " tags");
    else
        Logger::warn("EXIF decoded with errors (" + std::to_string(result.tags.size()) + " tags kept): " + result.errorSummary());

    return result;
}
