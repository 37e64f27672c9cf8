#include "core/text_encoding.hpp"
#include <cstring>

namespace
{
    const char kReplacement[] = "\xEF\xBF\xBD";
    constexpr size_t kCharacterCodeSize = 8;
}

void TextEncoding::appendCodePoint(std::string &out, uint32_t cp)
{
    if (cp < 0x80)
    {
        out.push_back(static_cast<char>(cp));
    }
    else if (cp < 0x800)
    {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else if (cp < 0x10000)
    {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else
    {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

std::string TextEncoding::utf8Lossy(const uint8_t *data, size_t size)
{
    std::string out;
    out.reserve(size);

    size_t i = 0;
    while (i < size)
    {
        const uint8_t lead = data[i];
        if (lead < 0x80)
        {
            out.push_back(static_cast<char>(lead));
            ++i;
            continue;
        }

        size_t length = 0;
        uint32_t cp = 0;
        uint32_t min_cp = 0;
        if ((lead & 0xE0) == 0xC0)
        {
            length = 2;
            cp = lead & 0x1F;
            min_cp = 0x80;
        }
        else if ((lead & 0xF0) == 0xE0)
        {
            length = 3;
            cp = lead & 0x0F;
            min_cp = 0x800;
        }
        else if ((lead & 0xF8) == 0xF0)
        {
            length = 4;
            cp = lead & 0x07;
            min_cp = 0x10000;
        }
        else
        {
            out += kReplacement;
            ++i;
            continue;
        }

        size_t consumed = 1;
        bool valid = true;
        while (consumed < length)
        {
            if (i + consumed >= size || (data[i + consumed] & 0xC0) != 0x80)
            {
                valid = false;
                break;
            }
            cp = (cp << 6) | (data[i + consumed] & 0x3F);
            ++consumed;
        }

        // Overlong forms, surrogates and values past U+10FFFF are invalid
        if (valid && (cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)))
        {
            valid = false;
        }

        if (valid)
        {
            out.append(reinterpret_cast<const char *>(data + i), length);
        }
        else
        {
            out += kReplacement;
        }
        i += consumed;
    }
    return out;
}

std::string TextEncoding::utf16beToUtf8(const uint8_t *data, size_t size)
{
    return utf16ToUtf8(data, size, true);
}

std::string TextEncoding::utf16leToUtf8(const uint8_t *data, size_t size)
{
    return utf16ToUtf8(data, size, false);
}

std::string TextEncoding::utf16ToUtf8(const uint8_t *data, size_t size, bool big_endian)
{
    std::string out;
    out.reserve(size);

    auto unitAt = [data, big_endian](size_t at) -> uint32_t
    {
        if (big_endian)
            return (static_cast<uint32_t>(data[at]) << 8) | data[at + 1];
        return (static_cast<uint32_t>(data[at + 1]) << 8) | data[at];
    };

    size_t i = 0;
    while (i + 1 < size)
    {
        uint32_t unit = unitAt(i);
        i += 2;

        if (unit >= 0xD800 && unit <= 0xDBFF)
        {
            if (i + 1 < size)
            {
                uint32_t low = unitAt(i);
                if (low >= 0xDC00 && low <= 0xDFFF)
                {
                    i += 2;
                    appendCodePoint(out, 0x10000 + ((unit - 0xD800) << 10) + (low - 0xDC00));
                    continue;
                }
            }
            out += kReplacement;
            continue;
        }
        if (unit >= 0xDC00 && unit <= 0xDFFF)
        {
            out += kReplacement;
            continue;
        }
        appendCodePoint(out, unit);
    }
    return out;
}

std::string TextEncoding::decodeUserComment(const uint8_t *data, size_t size, bool little_endian)
{
    if (size < kCharacterCodeSize)
    {
        return trimTrailing(cutAtNul(utf8Lossy(data, size)));
    }

    const uint8_t *text = data + kCharacterCodeSize;
    const size_t text_size = size - kCharacterCodeSize;

    if (std::memcmp(data, "UNICODE\0", kCharacterCodeSize) == 0)
    {
        bool big_endian = !little_endian;
        size_t skip = 0;
        if (text_size >= 2 && text[0] == 0xFE && text[1] == 0xFF)
        {
            big_endian = true;
            skip = 2;
        }
        else if (text_size >= 2 && text[0] == 0xFF && text[1] == 0xFE)
        {
            big_endian = false;
            skip = 2;
        }
        return trimTrailing(cutAtNul(utf16ToUtf8(text + skip, text_size - skip, big_endian)));
    }

    const bool known_code = std::memcmp(data, "ASCII\0\0\0", kCharacterCodeSize) == 0 ||
                            std::memcmp(data, "JIS\0\0\0\0\0", kCharacterCodeSize) == 0 ||
                            std::memcmp(data, "\0\0\0\0\0\0\0\0", kCharacterCodeSize) == 0;
    if (known_code)
    {
        return trimTrailing(cutAtNul(utf8Lossy(text, text_size)));
    }
    return trimTrailing(cutAtNul(utf8Lossy(data, size)));
}

std::string TextEncoding::hexBytes(const uint8_t *data, size_t size)
{
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(size * 2);
    for (size_t i = 0; i < size; i++)
    {
        out.push_back(digits[data[i] >> 4]);
        out.push_back(digits[data[i] & 0x0F]);
    }
    return out;
}

std::string TextEncoding::trimTrailing(const std::string &text)
{
    size_t end = text.size();
    while (end > 0)
    {
        char c = text[end - 1];
        if (c != '\0' && c != ' ' && c != '\t' && c != '\r' && c != '\n')
            break;
        --end;
    }
    return text.substr(0, end);
}

std::string TextEncoding::cutAtNul(const std::string &text)
{
    size_t nul = text.find('\0');
    if (nul == std::string::npos)
        return text;
    return text.substr(0, nul);
}
