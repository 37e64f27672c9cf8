#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

/**
 * @brief Byte-string to UTF-8 conversions used by the EXIF and ICC decoders
 */
class TextEncoding
{
public:
    /**
     * @brief Decode bytes as UTF-8, replacing every invalid sequence with U+FFFD
     */
    static std::string utf8Lossy(const uint8_t *data, size_t size);

    /**
     * @brief Decode big-endian UTF-16 (surrogate pairs honoured), replacing
     * unpaired surrogates with U+FFFD
     */
    static std::string utf16beToUtf8(const uint8_t *data, size_t size);

    static std::string utf16leToUtf8(const uint8_t *data, size_t size);

    /**
     * @brief Decode an EXIF UserComment: an 8-byte character code
     * ("ASCII", "UNICODE", "JIS" or all NUL) followed by the text.
     * UNICODE text is UCS-2 in the TIFF byte order unless a BOM says otherwise.
     * JIS text is kept as lossy UTF-8; unknown codes decode the whole value.
     */
    static std::string decodeUserComment(const uint8_t *data, size_t size, bool little_endian);

    /**
     * @brief Lowercase hex rendering of raw bytes, e.g. "ff00"
     */
    static std::string hexBytes(const uint8_t *data, size_t size);

    /**
     * @brief Drop trailing NUL and whitespace characters
     */
    static std::string trimTrailing(const std::string &text);

    /**
     * @brief Cut at the first NUL byte
     */
    static std::string cutAtNul(const std::string &text);

private:
    static void appendCodePoint(std::string &out, uint32_t cp);
    static std::string utf16ToUtf8(const uint8_t *data, size_t size, bool big_endian);
};
