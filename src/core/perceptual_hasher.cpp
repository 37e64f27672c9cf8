#include "core/perceptual_hasher.hpp"
#include "core/metadata_error.hpp"
#include "core/pixel_conversion.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <opencv2/imgproc.hpp>

std::string ImageHash::toHex() const
{
    std::stringstream ss;
    for (uint8_t byte : data)
    {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
    }
    return ss.str();
}

ImageHash ImageHash::fromHex(HashAlgorithm algorithm, const std::string &hex)
{
    if (hex.size() % 2 != 0)
    {
        throw std::invalid_argument("Hash hex string has odd length: " + hex);
    }

    std::vector<uint8_t> bytes;
    bytes.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2)
    {
        const std::string pair = hex.substr(i, 2);
        if (!std::isxdigit(static_cast<unsigned char>(pair[0])) || !std::isxdigit(static_cast<unsigned char>(pair[1])))
        {
            throw std::invalid_argument("Hash hex string has non-hex characters: " + hex);
        }
        bytes.push_back(static_cast<uint8_t>(std::stoi(pair, nullptr, 16)));
    }
    return ImageHash(algorithm, bytes);
}

nlohmann::json HashSet::toJson() const
{
    return {
        {"average", average.toHex()},
        {"difference", difference.toHex()},
        {"wavelet", wavelet.toHex()},
        {"perceptual", perceptual.toHex()}};
}

HashSet PerceptualHasher::computeAll(const DecodedImage &image, int wavelet_image_size)
{
    if (image.isDegenerate())
    {
        throw MetadataError(MetadataErrorKind::DEGENERATE_GEOMETRY,
                            "Cannot hash a " + std::to_string(image.width()) + "x" + std::to_string(image.height()) + " image");
    }

    cv::Mat gray = PixelConversion::toGray8(image.pixels);

    HashSet hashes;
    hashes.average = averageHash(gray);
    hashes.difference = differenceHash(gray);
    hashes.wavelet = waveletHash(gray, wavelet_image_size);
    hashes.perceptual = perceptualHash(gray);

    Logger::debug("Hashes computed: aHash=" + hashes.average.toHex() + " dHash=" + hashes.difference.toHex() +
                  " wHash=" + hashes.wavelet.toHex() + " pHash=" + hashes.perceptual.toHex());
    return hashes;
}

ImageHash PerceptualHasher::averageHash(const cv::Mat &gray)
{
    cv::Mat resized;
    cv::resize(gray, resized, cv::Size(HASH_SIZE, HASH_SIZE), 0, 0, cv::INTER_AREA);

    const double mean = cv::mean(resized)[0];

    std::vector<bool> bits;
    bits.reserve(HASH_SIZE * HASH_SIZE);
    for (int y = 0; y < HASH_SIZE; y++)
    {
        for (int x = 0; x < HASH_SIZE; x++)
        {
            bits.push_back(resized.at<uint8_t>(y, x) >= mean);
        }
    }
    return ImageHash(HashAlgorithm::AVERAGE, packBits(bits));
}

ImageHash PerceptualHasher::differenceHash(const cv::Mat &gray)
{
    // One extra column so every row yields HASH_SIZE neighbour comparisons
    cv::Mat resized;
    cv::resize(gray, resized, cv::Size(HASH_SIZE + 1, HASH_SIZE), 0, 0, cv::INTER_AREA);

    std::vector<bool> bits;
    bits.reserve(HASH_SIZE * HASH_SIZE);
    for (int y = 0; y < HASH_SIZE; y++)
    {
        for (int x = 0; x < HASH_SIZE; x++)
        {
            bits.push_back(resized.at<uint8_t>(y, x) >= resized.at<uint8_t>(y, x + 1));
        }
    }
    return ImageHash(HashAlgorithm::DIFFERENCE, packBits(bits));
}

ImageHash PerceptualHasher::waveletHash(const cv::Mat &gray, int image_size)
{
    if (image_size < HASH_SIZE || (image_size & (image_size - 1)) != 0)
    {
        throw std::invalid_argument("Wavelet image size must be a power of two >= " + std::to_string(HASH_SIZE) +
                                    ", got " + std::to_string(image_size));
    }

    cv::Mat resized;
    cv::resize(gray, resized, cv::Size(image_size, image_size), 0, 0, cv::INTER_AREA);

    cv::Mat coefficients;
    resized.convertTo(coefficients, CV_32F, 1.0 / 255.0);

    int levels = 0;
    for (int size = image_size; size > HASH_SIZE; size /= 2)
    {
        levels++;
    }
    haarDecompose(coefficients, levels);

    cv::Mat low_band = coefficients(cv::Rect(0, 0, HASH_SIZE, HASH_SIZE));
    std::vector<float> values;
    values.reserve(HASH_SIZE * HASH_SIZE);
    for (int y = 0; y < HASH_SIZE; y++)
    {
        for (int x = 0; x < HASH_SIZE; x++)
        {
            values.push_back(low_band.at<float>(y, x));
        }
    }
    const double band_median = median(values);

    std::vector<bool> bits;
    bits.reserve(values.size());
    for (float value : values)
    {
        bits.push_back(value > band_median);
    }
    return ImageHash(HashAlgorithm::WAVELET, packBits(bits));
}

ImageHash PerceptualHasher::perceptualHash(const cv::Mat &gray)
{
    cv::Mat resized;
    cv::resize(gray, resized, cv::Size(DCT_IMAGE_SIZE, DCT_IMAGE_SIZE), 0, 0, cv::INTER_AREA);

    cv::Mat float_image;
    resized.convertTo(float_image, CV_32F);

    cv::Mat dct_image;
    cv::dct(float_image, dct_image);

    // Top-left low-frequency block; the DC term is excluded from the median
    cv::Mat low_freq = dct_image(cv::Rect(0, 0, HASH_SIZE, HASH_SIZE));
    std::vector<float> ac_values;
    ac_values.reserve(HASH_SIZE * HASH_SIZE - 1);
    for (int y = 0; y < HASH_SIZE; y++)
    {
        for (int x = 0; x < HASH_SIZE; x++)
        {
            if (x == 0 && y == 0)
                continue;
            ac_values.push_back(low_freq.at<float>(y, x));
        }
    }
    const double ac_median = median(ac_values);

    std::vector<bool> bits;
    bits.reserve(HASH_SIZE * HASH_SIZE);
    for (int y = 0; y < HASH_SIZE; y++)
    {
        for (int x = 0; x < HASH_SIZE; x++)
        {
            bits.push_back(low_freq.at<float>(y, x) > ac_median);
        }
    }
    return ImageHash(HashAlgorithm::PERCEPTUAL, packBits(bits));
}

void PerceptualHasher::haarDecompose(cv::Mat &coefficients, int levels)
{
    CV_Assert(coefficients.type() == CV_32F && coefficients.rows == coefficients.cols);

    int size = coefficients.rows;
    cv::Mat scratch(coefficients.size(), CV_32F);
    for (int level = 0; level < levels && size >= 2; level++)
    {
        const int half = size / 2;
        for (int y = 0; y < half; y++)
        {
            for (int x = 0; x < half; x++)
            {
                const float a = coefficients.at<float>(2 * y, 2 * x);
                const float b = coefficients.at<float>(2 * y, 2 * x + 1);
                const float c = coefficients.at<float>(2 * y + 1, 2 * x);
                const float d = coefficients.at<float>(2 * y + 1, 2 * x + 1);

                // Orthonormal Haar: every sub-band is scaled by 1/2
                scratch.at<float>(y, x) = (a + b + c + d) / 2.0f;
                scratch.at<float>(y, x + half) = (a - b + c - d) / 2.0f;
                scratch.at<float>(y + half, x) = (a + b - c - d) / 2.0f;
                scratch.at<float>(y + half, x + half) = (a - b - c + d) / 2.0f;
            }
        }
        scratch(cv::Rect(0, 0, size, size)).copyTo(coefficients(cv::Rect(0, 0, size, size)));
        size = half;
    }
}

int PerceptualHasher::hammingDistance(const ImageHash &a, const ImageHash &b)
{
    if (a.algorithm != b.algorithm)
    {
        throw std::invalid_argument("Cannot compare a " + algorithmName(a.algorithm) + " hash with a " +
                                    algorithmName(b.algorithm) + " hash");
    }
    if (a.data.size() != b.data.size())
    {
        throw std::invalid_argument("Cannot compare hashes of " + std::to_string(a.bitCount()) + " and " +
                                    std::to_string(b.bitCount()) + " bits");
    }

    int distance = 0;
    for (size_t i = 0; i < a.data.size(); i++)
    {
        uint8_t diff = a.data[i] ^ b.data[i];
        while (diff)
        {
            distance += diff & 1;
            diff >>= 1;
        }
    }
    return distance;
}

std::string PerceptualHasher::algorithmName(HashAlgorithm algorithm)
{
    switch (algorithm)
    {
    case HashAlgorithm::AVERAGE:
        return "average";
    case HashAlgorithm::DIFFERENCE:
        return "difference";
    case HashAlgorithm::WAVELET:
        return "wavelet";
    case HashAlgorithm::PERCEPTUAL:
        return "perceptual";
    default:
        return "unknown";
    }
}

std::vector<uint8_t> PerceptualHasher::packBits(const std::vector<bool> &bits)
{
    std::vector<uint8_t> packed((bits.size() + 7) / 8, 0);
    for (size_t i = 0; i < bits.size(); i++)
    {
        if (bits[i])
        {
            packed[i / 8] |= static_cast<uint8_t>(1 << (7 - (i % 8)));
        }
    }
    return packed;
}

double PerceptualHasher::median(std::vector<float> values)
{
    std::sort(values.begin(), values.end());
    const size_t n = values.size();
    if (n % 2 == 1)
    {
        return values[n / 2];
    }
    return (static_cast<double>(values[n / 2 - 1]) + values[n / 2]) / 2.0;
}
