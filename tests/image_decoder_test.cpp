#include <gtest/gtest.h>
#include "core/exif_decoder.hpp"
#include "core/image_decoder.hpp"
#include "core/metadata_error.hpp"
#include "logging/logger.hpp"
#include "test_support.hpp"
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <opencv2/imgcodecs.hpp>
#include <zlib.h>

class ImageDecoderTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        Logger::init("ERROR");
        pixels_ = cv::Mat(48, 64, CV_8UC3, cv::Scalar(40, 120, 200));
    }

    std::vector<uint8_t> encode(const std::string &ext, const cv::Mat &pixels) const
    {
        std::vector<uint8_t> out;
        EXPECT_TRUE(cv::imencode(ext, pixels, out));
        return out;
    }

    static std::vector<uint8_t> pngChunk(const char *type, const std::vector<uint8_t> &data)
    {
        std::vector<uint8_t> chunk;
        test_support::appendU32be(chunk, static_cast<uint32_t>(data.size()));
        chunk.insert(chunk.end(), type, type + 4);
        chunk.insert(chunk.end(), data.begin(), data.end());
        uLong crc = crc32(0L, Z_NULL, 0);
        crc = crc32(crc, chunk.data() + 4, static_cast<uInt>(data.size() + 4));
        test_support::appendU32be(chunk, static_cast<uint32_t>(crc));
        return chunk;
    }

    // Insert right after IHDR (8-byte signature + 25-byte IHDR chunk)
    static std::vector<uint8_t> insertAfterIhdr(const std::vector<uint8_t> &png, const std::vector<uint8_t> &chunk)
    {
        std::vector<uint8_t> out(png.begin(), png.begin() + 33);
        out.insert(out.end(), chunk.begin(), chunk.end());
        out.insert(out.end(), png.begin() + 33, png.end());
        return out;
    }

    static TiffBuilder exifBlock()
    {
        TiffBuilder builder;
        builder.ascii(TiffBuilder::IFD0, 0x010F, "FUJIFILM").ascii(TiffBuilder::IFD0, 0x0110, "X-T4");
        return builder;
    }

    static std::vector<uint8_t> srgbProfile()
    {
        return test_support::iccProfileWithDescTag(test_support::textDescriptionTag("sRGB IEC61966-2.1"));
    }

    static void expectFujifilmTags(const std::vector<uint8_t> &exif)
    {
        ExifDecodeResult decoded = ExifDecoder::decode(exif);
        ASSERT_NE(TagValues::asString(decoded.tags, "Make"), nullptr);
        ASSERT_NE(TagValues::asString(decoded.tags, "Model"), nullptr);
        EXPECT_EQ(*TagValues::asString(decoded.tags, "Make"), "FUJIFILM");
        EXPECT_EQ(*TagValues::asString(decoded.tags, "Model"), "X-T4");
        EXPECT_TRUE(decoded.ok()) << decoded.errorSummary();
    }

    cv::Mat pixels_;
};

TEST_F(ImageDecoderTest, DetectsFormatsByMagicBytes)
{
    EXPECT_EQ(ImageDecoder::detectFormat(encode(".jpg", pixels_)), "JPEG");
    EXPECT_EQ(ImageDecoder::detectFormat(encode(".png", pixels_)), "PNG");
    EXPECT_EQ(ImageDecoder::detectFormat({'R', 'I', 'F', 'F', 0, 0, 0, 0, 'W', 'E', 'B', 'P'}), "WEBP");
    EXPECT_EQ(ImageDecoder::detectFormat({'I', 'I', 0x2A, 0x00}), "TIFF");
    EXPECT_EQ(ImageDecoder::detectFormat({'M', 'M', 0x00, 0x2A}), "TIFF");
    EXPECT_EQ(ImageDecoder::detectFormat({'G', 'I', 'F', '8'}), "UNKNOWN");
}

TEST_F(ImageDecoderTest, DecodesPlainJpeg)
{
    DecodedImage image = ImageDecoder::decodeBuffer(encode(".jpg", pixels_), "plain.jpg");

    EXPECT_EQ(image.format, "JPEG");
    EXPECT_EQ(image.mode, "RGB");
    EXPECT_EQ(image.width(), 64);
    EXPECT_EQ(image.height(), 48);
    EXPECT_EQ(image.filename, "plain.jpg");
    EXPECT_TRUE(image.exif.empty());
    EXPECT_TRUE(image.icc.empty());
}

TEST_F(ImageDecoderTest, ExtractsJpegApp1Exif)
{
    auto jpeg = test_support::spliceJpegApp1(encode(".jpg", pixels_), exifBlock().buildWithPreamble());

    DecodedImage image = ImageDecoder::decodeBuffer(jpeg, "camera.jpg");

    EXPECT_EQ(image.file_size_bytes, jpeg.size());
    expectFujifilmTags(image.exif);
}

TEST_F(ImageDecoderTest, ReassemblesJpegIccChunks)
{
    const std::vector<uint8_t> profile = srgbProfile();
    const size_t split = profile.size() / 2;
    std::vector<uint8_t> first(profile.begin(), profile.begin() + split);
    std::vector<uint8_t> second(profile.begin() + split, profile.end());
    auto jpeg = test_support::spliceJpegIcc(encode(".jpg", pixels_), {{1, first}, {2, second}}, 2);

    MetadataBlocks blocks = ImageDecoder::extractMetadataBlocks(jpeg, "JPEG");

    EXPECT_EQ(blocks.icc, profile);
    EXPECT_TRUE(blocks.exif.empty());
}

TEST_F(ImageDecoderTest, PngModes)
{
    cv::Mat gray(10, 12, CV_8UC1, cv::Scalar(90));
    cv::Mat rgba(10, 12, CV_8UC4, cv::Scalar(1, 2, 3, 128));
    cv::Mat deep(10, 12, CV_16UC1, cv::Scalar(40000));

    EXPECT_EQ(ImageDecoder::decodeBuffer(encode(".png", gray), "g.png").mode, "L");
    EXPECT_EQ(ImageDecoder::decodeBuffer(encode(".png", rgba), "a.png").mode, "RGBA");
    EXPECT_EQ(ImageDecoder::decodeBuffer(encode(".png", deep), "d.png").mode, "I;16");
    EXPECT_EQ(ImageDecoder::decodeBuffer(encode(".png", pixels_), "c.png").mode, "RGB");
}

TEST_F(ImageDecoderTest, ExtractsPngExifChunk)
{
    const std::vector<uint8_t> tiff = exifBlock().build();
    auto png = insertAfterIhdr(encode(".png", pixels_), pngChunk("eXIf", tiff));

    DecodedImage image = ImageDecoder::decodeBuffer(png, "shot.png");

    EXPECT_EQ(image.format, "PNG");
    expectFujifilmTags(image.exif);
}

TEST_F(ImageDecoderTest, InflatesPngIccpChunk)
{
    auto profile = srgbProfile();

    uLongf compressed_size = compressBound(static_cast<uLong>(profile.size()));
    std::vector<uint8_t> compressed(compressed_size);
    ASSERT_EQ(compress(compressed.data(), &compressed_size, profile.data(), static_cast<uLong>(profile.size())), Z_OK);
    compressed.resize(compressed_size);

    std::vector<uint8_t> iccp = {'s', 'R', 'G', 'B', 0, 0};
    iccp.insert(iccp.end(), compressed.begin(), compressed.end());

    MetadataBlocks blocks = ImageDecoder::extractMetadataBlocks(insertAfterIhdr(encode(".png", pixels_), pngChunk("iCCP", iccp)), "PNG");

    EXPECT_EQ(blocks.icc, profile);
}

TEST_F(ImageDecoderTest, ExtractsWebpChunks)
{
    std::vector<uint8_t> exif_payload = exifBlock().buildWithPreamble();
    const std::vector<uint8_t> icc = srgbProfile();

    std::vector<uint8_t> riff = {'R', 'I', 'F', 'F', 0, 0, 0, 0, 'W', 'E', 'B', 'P'};
    auto appendChunk = [&riff](const char *fourcc, const std::vector<uint8_t> &data)
    {
        riff.insert(riff.end(), fourcc, fourcc + 4);
        const uint32_t size = static_cast<uint32_t>(data.size());
        for (int i = 0; i < 4; i++)
            riff.push_back(static_cast<uint8_t>((size >> (8 * i)) & 0xFF));
        riff.insert(riff.end(), data.begin(), data.end());
        if (data.size() % 2 != 0)
            riff.push_back(0);
    };
    appendChunk("ICCP", icc);
    appendChunk("EXIF", exif_payload);
    const uint32_t riff_size = static_cast<uint32_t>(riff.size() - 8);
    for (int i = 0; i < 4; i++)
        riff[4 + i] = static_cast<uint8_t>((riff_size >> (8 * i)) & 0xFF);

    MetadataBlocks blocks = ImageDecoder::extractMetadataBlocks(riff, "WEBP");

    EXPECT_EQ(blocks.icc, icc);
    expectFujifilmTags(blocks.exif);
}

TEST_F(ImageDecoderTest, TiffUsesWholeFileAndInterColorProfile)
{
    const std::vector<uint8_t> profile = srgbProfile();
    TiffBuilder builder = exifBlock();
    builder.bytes(TiffBuilder::IFD0, 0x8773, 7, profile);
    const std::vector<uint8_t> tiff = builder.build();

    MetadataBlocks blocks = ImageDecoder::extractMetadataBlocks(tiff, "TIFF");

    EXPECT_EQ(blocks.exif, tiff);
    EXPECT_EQ(blocks.icc, profile);
}

TEST_F(ImageDecoderTest, UnreadableContainerYieldsNoBlocks)
{
    std::vector<uint8_t> garbage(64, 0x33);

    MetadataBlocks blocks = ImageDecoder::extractMetadataBlocks(garbage, "UNKNOWN");

    EXPECT_TRUE(blocks.exif.empty());
    EXPECT_TRUE(blocks.icc.empty());
}

TEST_F(ImageDecoderTest, GarbageIsMalformedContainer)
{
    std::vector<uint8_t> garbage(512, 0x5A);
    try
    {
        ImageDecoder::decodeBuffer(garbage, "broken.jpg");
        FAIL() << "Expected MetadataError";
    }
    catch (const MetadataError &e)
    {
        EXPECT_EQ(e.kind(), MetadataErrorKind::MALFORMED_CONTAINER);
    }
}

TEST_F(ImageDecoderTest, DecodeFileUsesFileNameAndSize)
{
    const std::string path = (std::filesystem::temp_directory_path() / "img_metadata_decoder_test.png").string();
    auto png = encode(".png", pixels_);
    {
        std::ofstream out(path, std::ios::binary);
        out.write(reinterpret_cast<const char *>(png.data()), static_cast<std::streamsize>(png.size()));
    }

    DecodedImage image = ImageDecoder::decodeFile(path);
    std::filesystem::remove(path);

    EXPECT_EQ(image.filename, "img_metadata_decoder_test.png");
    EXPECT_EQ(image.file_size_bytes, png.size());
    EXPECT_EQ(image.format, "PNG");
}

TEST_F(ImageDecoderTest, UploadNameWithInvalidUtf8IsSanitized)
{
    const std::string name = std::string("caf") + '\xE9' + ".png";

    DecodedImage image = ImageDecoder::decodeBuffer(encode(".png", pixels_), name);

    EXPECT_EQ(image.filename, "caf\xEF\xBF\xBD.png");
    nlohmann::json j = {{"filename", image.filename}};
    EXPECT_NO_THROW(j.dump());
}
