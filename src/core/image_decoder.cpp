#include "core/image_decoder.hpp"
#include "core/file_utils.hpp"
#include "core/metadata_error.hpp"
#include "core/text_encoding.hpp"
#include "logging/logger.hpp"
#include <cstring>
#include <mutex>
#include <exiv2/exiv2.hpp>
#include <opencv2/imgcodecs.hpp>

namespace
{
    bool startsWith(const uint8_t *p, size_t size, const char *prefix, size_t prefix_size)
    {
        return size >= prefix_size && std::memcmp(p, prefix, prefix_size) == 0;
    }

    void forwardExiv2Message(int level, const char *message)
    {
        const std::string text = "Exiv2: " + TextEncoding::trimTrailing(message ? message : "");
        if (level >= Exiv2::LogMsg::error)
            Logger::error(text);
        else if (level == Exiv2::LogMsg::warn)
            Logger::warn(text);
        else
            Logger::debug(text);
    }
}

DecodedImage ImageDecoder::decodeFile(const std::string &file_path)
{
    std::vector<uint8_t> bytes = FileUtils::readFileBytes(file_path);
    return decodeBuffer(bytes, FileUtils::getFileName(file_path));
}

DecodedImage ImageDecoder::decodeBuffer(const std::vector<uint8_t> &bytes, const std::string &filename)
{
    DecodedImage image;
    image.filename = TextEncoding::utf8Lossy(reinterpret_cast<const uint8_t *>(filename.data()), filename.size());
    image.file_size_bytes = bytes.size();
    image.format = detectFormat(bytes);

    try
    {
        // IMREAD_UNCHANGED keeps bit depth and alpha, and ignores EXIF orientation
        image.pixels = cv::imdecode(bytes, cv::IMREAD_UNCHANGED);
    }
    catch (const cv::Exception &e)
    {
        throw MetadataError(MetadataErrorKind::MALFORMED_CONTAINER,
                            "Failed to decode image " + image.filename + ": " + std::string(e.what()));
    }
    if (image.pixels.empty())
    {
        throw MetadataError(MetadataErrorKind::MALFORMED_CONTAINER, "Failed to decode image: " + image.filename);
    }
    image.mode = modeName(image.pixels);

    MetadataBlocks blocks = extractMetadataBlocks(bytes, image.format);
    image.exif = std::move(blocks.exif);
    image.icc = std::move(blocks.icc);

    Logger::info("Image decoded: " + image.filename + " (" + image.format + ", " + image.mode + ", " +
                 std::to_string(image.width()) + "x" + std::to_string(image.height()) + ", exif " +
                 std::to_string(image.exif.size()) + " bytes, icc " + std::to_string(image.icc.size()) + " bytes)");
    return image;
}

std::string ImageDecoder::detectFormat(const std::vector<uint8_t> &bytes)
{
    const uint8_t *p = bytes.data();
    const size_t size = bytes.size();

    if (size >= 3 && p[0] == 0xFF && p[1] == 0xD8 && p[2] == 0xFF)
        return "JPEG";
    if (startsWith(p, size, "\x89PNG\r\n\x1a\n", 8))
        return "PNG";
    if (size >= 12 && std::memcmp(p, "RIFF", 4) == 0 && std::memcmp(p + 8, "WEBP", 4) == 0)
        return "WEBP";
    if (startsWith(p, size, "II\x2A\x00", 4) || startsWith(p, size, "MM\x00\x2A", 4))
        return "TIFF";
    return "UNKNOWN";
}

std::string ImageDecoder::modeName(const cv::Mat &pixels)
{
    const int channels = pixels.channels();
    switch (pixels.depth())
    {
    case CV_8U:
        switch (channels)
        {
        case 1:
            return "L";
        case 2:
            return "LA";
        case 3:
            return "RGB";
        case 4:
            return "RGBA";
        }
        break;
    case CV_16U:
        switch (channels)
        {
        case 1:
            return "I;16";
        case 3:
            return "RGB;16";
        case 4:
            return "RGBA;16";
        }
        break;
    case CV_32F:
        if (channels == 1)
            return "F";
        break;
    }
    return std::to_string(channels) + "x" + std::to_string(pixels.elemSize1() * 8) + "bit";
}

void ImageDecoder::routeExiv2Logging()
{
    static std::once_flag once;
    std::call_once(once, []()
                   {
        if (!Exiv2::XmpParser::initialize())
            Logger::warn("Exiv2 XMP parser failed to initialize");
        Exiv2::LogMsg::setLevel(Exiv2::LogMsg::warn);
        Exiv2::LogMsg::setHandler(forwardExiv2Message); });
}

MetadataBlocks ImageDecoder::extractMetadataBlocks(const std::vector<uint8_t> &bytes, const std::string &format)
{
    MetadataBlocks blocks;
    if (format == "TIFF")
    {
        blocks.exif = bytes;
    }
    if (bytes.empty())
    {
        return blocks;
    }

    routeExiv2Logging();
    try
    {
        auto image = Exiv2::ImageFactory::open(bytes.data(), bytes.size());
        image->readMetadata();

        if (image->iccProfileDefined())
        {
            const Exiv2::DataBuf &profile = image->iccProfile();
            if (!profile.empty())
            {
                blocks.icc.assign(profile.c_data(), profile.c_data() + profile.size());
            }
        }

        Exiv2::ExifData &exif_data = image->exifData();
        if (format != "TIFF" && !exif_data.empty())
        {
            Exiv2::ByteOrder order = image->byteOrder();
            if (order == Exiv2::invalidByteOrder)
                order = Exiv2::littleEndian;

            Exiv2::Blob blob;
            Exiv2::ExifParser::encode(blob, order, exif_data);
            blocks.exif.assign(blob.begin(), blob.end());
        }
    }
    catch (const Exiv2::Error &e)
    {
        Logger::warn("Metadata segments of " + format + " container could not be read: " + std::string(e.what()));
    }
    catch (const std::exception &e)
    {
        Logger::error("Metadata scan of " + format + " container failed: " + std::string(e.what()));
    }
    return blocks;
}
