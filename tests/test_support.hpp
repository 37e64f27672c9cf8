#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

/**
 * @brief Builds TIFF-structured EXIF blocks (IFD0 + Exif + GPS sub-IFDs) for tests
 */
class TiffBuilder
{
public:
    enum Ifd
    {
        IFD0 = 0,
        EXIF = 1,
        GPS = 2
    };

    explicit TiffBuilder(bool little_endian = true) : little_endian_(little_endian) {}

    TiffBuilder &ascii(Ifd ifd, uint16_t tag, const std::string &text)
    {
        std::vector<uint8_t> payload(text.begin(), text.end());
        payload.push_back(0);
        const uint32_t count = static_cast<uint32_t>(payload.size());
        return raw(ifd, tag, 2, count, payload);
    }

    TiffBuilder &shorts(Ifd ifd, uint16_t tag, const std::vector<uint16_t> &values)
    {
        std::vector<uint8_t> payload;
        for (uint16_t v : values)
            append16(payload, v);
        return raw(ifd, tag, 3, static_cast<uint32_t>(values.size()), payload);
    }

    TiffBuilder &longValue(Ifd ifd, uint16_t tag, uint32_t value)
    {
        std::vector<uint8_t> payload;
        append32(payload, value);
        return raw(ifd, tag, 4, 1, payload);
    }

    TiffBuilder &rationals(Ifd ifd, uint16_t tag, const std::vector<std::pair<uint32_t, uint32_t>> &values)
    {
        std::vector<uint8_t> payload;
        for (const auto &v : values)
        {
            append32(payload, v.first);
            append32(payload, v.second);
        }
        return raw(ifd, tag, 5, static_cast<uint32_t>(values.size()), payload);
    }

    TiffBuilder &bytes(Ifd ifd, uint16_t tag, uint16_t type, const std::vector<uint8_t> &payload)
    {
        return raw(ifd, tag, type, static_cast<uint32_t>(payload.size()), payload);
    }

    /**
     * @brief Append an entry verbatim; payload is already in the builder's byte order
     */
    TiffBuilder &raw(Ifd ifd, uint16_t tag, uint16_t type, uint32_t count, const std::vector<uint8_t> &payload)
    {
        ifds_[ifd].push_back(Entry{tag, type, count, payload});
        return *this;
    }

    std::vector<uint8_t> encode32(uint32_t value) const
    {
        std::vector<uint8_t> out;
        append32(out, value);
        return out;
    }

    static uint32_t ifd0Offset() { return 8; }

    std::vector<uint8_t> build() const
    {
        std::vector<Entry> ifd0 = ifds_[IFD0];
        const bool has_exif = !ifds_[EXIF].empty();
        const bool has_gps = !ifds_[GPS].empty();

        const size_t ifd0_entries = ifd0.size() + (has_exif ? 1 : 0) + (has_gps ? 1 : 0);
        uint32_t offset = 8 + ifdSize(ifd0_entries);
        const uint32_t exif_offset = offset;
        if (has_exif)
            offset += ifdSize(ifds_[EXIF].size());
        const uint32_t gps_offset = offset;
        if (has_gps)
            offset += ifdSize(ifds_[GPS].size());

        if (has_exif)
            ifd0.push_back(Entry{0x8769, 4, 1, encode32(exif_offset)});
        if (has_gps)
            ifd0.push_back(Entry{0x8825, 4, 1, encode32(gps_offset)});

        std::vector<uint8_t> out(offset, 0);
        out[0] = out[1] = little_endian_ ? 'I' : 'M';
        put16(out, 2, 42);
        put32(out, 4, 8);

        writeIfd(out, 8, ifd0);
        if (has_exif)
            writeIfd(out, exif_offset, ifds_[EXIF]);
        if (has_gps)
            writeIfd(out, gps_offset, ifds_[GPS]);
        return out;
    }

    std::vector<uint8_t> buildWithPreamble() const
    {
        std::vector<uint8_t> out = {'E', 'x', 'i', 'f', 0, 0};
        std::vector<uint8_t> tiff = build();
        out.insert(out.end(), tiff.begin(), tiff.end());
        return out;
    }

private:
    struct Entry
    {
        uint16_t tag;
        uint16_t type;
        uint32_t count;
        std::vector<uint8_t> payload;
    };

    static uint32_t ifdSize(size_t entries)
    {
        return static_cast<uint32_t>(2 + entries * 12 + 4);
    }

    void writeIfd(std::vector<uint8_t> &out, uint32_t ifd_offset, const std::vector<Entry> &entries) const
    {
        put16(out, ifd_offset, static_cast<uint16_t>(entries.size()));
        for (size_t i = 0; i < entries.size(); i++)
        {
            const Entry &e = entries[i];
            const size_t at = ifd_offset + 2 + i * 12;
            put16(out, at, e.tag);
            put16(out, at + 2, e.type);
            put32(out, at + 4, e.count);
            if (e.payload.size() <= 4)
            {
                for (size_t b = 0; b < e.payload.size(); b++)
                    out[at + 8 + b] = e.payload[b];
            }
            else
            {
                put32(out, at + 8, static_cast<uint32_t>(out.size()));
                out.insert(out.end(), e.payload.begin(), e.payload.end());
                if (out.size() % 2 != 0)
                    out.push_back(0);
            }
        }
        put32(out, ifd_offset + 2 + entries.size() * 12, 0);
    }

    void append16(std::vector<uint8_t> &out, uint16_t v) const
    {
        out.resize(out.size() + 2);
        put16(out, out.size() - 2, v);
    }

    void append32(std::vector<uint8_t> &out, uint32_t v) const
    {
        out.resize(out.size() + 4);
        put32(out, out.size() - 4, v);
    }

    void put16(std::vector<uint8_t> &out, size_t at, uint16_t v) const
    {
        if (little_endian_)
        {
            out[at] = static_cast<uint8_t>(v & 0xFF);
            out[at + 1] = static_cast<uint8_t>(v >> 8);
        }
        else
        {
            out[at] = static_cast<uint8_t>(v >> 8);
            out[at + 1] = static_cast<uint8_t>(v & 0xFF);
        }
    }

    void put32(std::vector<uint8_t> &out, size_t at, uint32_t v) const
    {
        if (little_endian_)
        {
            for (int i = 0; i < 4; i++)
                out[at + i] = static_cast<uint8_t>((v >> (8 * i)) & 0xFF);
        }
        else
        {
            for (int i = 0; i < 4; i++)
                out[at + i] = static_cast<uint8_t>((v >> (8 * (3 - i))) & 0xFF);
        }
    }

    bool little_endian_;
    std::vector<Entry> ifds_[3];
};

namespace test_support
{
    inline void appendU32be(std::vector<uint8_t> &out, uint32_t v)
    {
        for (int i = 3; i >= 0; i--)
            out.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xFF));
    }

    inline void appendTag(std::vector<uint8_t> &out, const char *sig)
    {
        out.insert(out.end(), sig, sig + 4);
    }

    /**
     * @brief Minimal ICC profile: 128-byte header, one-entry tag table, one 'desc' tag body
     */
    inline std::vector<uint8_t> iccProfileWithDescTag(const std::vector<uint8_t> &tag_body)
    {
        std::vector<uint8_t> profile(128, 0);
        profile[36] = 'a';
        profile[37] = 'c';
        profile[38] = 's';
        profile[39] = 'p';
        appendU32be(profile, 1);
        appendTag(profile, "desc");
        appendU32be(profile, 128 + 4 + 12);
        appendU32be(profile, static_cast<uint32_t>(tag_body.size()));
        profile.insert(profile.end(), tag_body.begin(), tag_body.end());

        const uint32_t size = static_cast<uint32_t>(profile.size());
        for (int i = 0; i < 4; i++)
            profile[i] = static_cast<uint8_t>((size >> (8 * (3 - i))) & 0xFF);
        return profile;
    }

    /**
     * @brief textDescriptionType body carrying an ASCII description
     */
    inline std::vector<uint8_t> textDescriptionTag(const std::string &ascii)
    {
        std::vector<uint8_t> tag;
        appendTag(tag, "desc");
        appendU32be(tag, 0);
        appendU32be(tag, static_cast<uint32_t>(ascii.size() + 1));
        tag.insert(tag.end(), ascii.begin(), ascii.end());
        tag.push_back(0);
        // Empty Unicode and ScriptCode sections
        appendU32be(tag, 0);
        appendU32be(tag, 0);
        tag.insert(tag.end(), 70, 0);
        return tag;
    }

    /**
     * @brief multiLocalizedUnicodeType body with a single en-US record (ASCII input)
     */
    inline std::vector<uint8_t> multiLocalizedTag(const std::string &text)
    {
        std::vector<uint8_t> tag;
        appendTag(tag, "mluc");
        appendU32be(tag, 0);
        appendU32be(tag, 1);
        appendU32be(tag, 12);
        tag.push_back('e');
        tag.push_back('n');
        tag.push_back('U');
        tag.push_back('S');
        appendU32be(tag, static_cast<uint32_t>(text.size() * 2));
        appendU32be(tag, 28);
        for (char c : text)
        {
            tag.push_back(0);
            tag.push_back(static_cast<uint8_t>(c));
        }
        return tag;
    }

    /**
     * @brief Insert an APP1 Exif segment right after the SOI marker of a JPEG stream
     */
    inline std::vector<uint8_t> spliceJpegApp1(const std::vector<uint8_t> &jpeg, const std::vector<uint8_t> &exif_with_preamble)
    {
        std::vector<uint8_t> out(jpeg.begin(), jpeg.begin() + 2);
        const size_t length = exif_with_preamble.size() + 2;
        out.push_back(0xFF);
        out.push_back(0xE1);
        out.push_back(static_cast<uint8_t>((length >> 8) & 0xFF));
        out.push_back(static_cast<uint8_t>(length & 0xFF));
        out.insert(out.end(), exif_with_preamble.begin(), exif_with_preamble.end());
        out.insert(out.end(), jpeg.begin() + 2, jpeg.end());
        return out;
    }

    /**
     * @brief Insert APP2 ICC_PROFILE segments (one per chunk) right after SOI, in the given order
     */
    inline std::vector<uint8_t> spliceJpegIcc(const std::vector<uint8_t> &jpeg,
                                              const std::vector<std::pair<uint8_t, std::vector<uint8_t>>> &chunks,
                                              uint8_t total)
    {
        std::vector<uint8_t> out(jpeg.begin(), jpeg.begin() + 2);
        const char marker[] = "ICC_PROFILE";
        for (const auto &chunk : chunks)
        {
            const size_t length = 2 + 12 + 2 + chunk.second.size();
            out.push_back(0xFF);
            out.push_back(0xE2);
            out.push_back(static_cast<uint8_t>((length >> 8) & 0xFF));
            out.push_back(static_cast<uint8_t>(length & 0xFF));
            out.insert(out.end(), marker, marker + 12);
            out.push_back(chunk.first);
            out.push_back(total);
            out.insert(out.end(), chunk.second.begin(), chunk.second.end());
        }
        out.insert(out.end(), jpeg.begin() + 2, jpeg.end());
        return out;
    }
}
