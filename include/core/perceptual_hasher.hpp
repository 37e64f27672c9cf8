#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include <nlohmann/json.hpp>
#include "core/decoded_image.hpp"

enum class HashAlgorithm
{
    AVERAGE,    // aHash, 8x8 mean threshold
    DIFFERENCE, // dHash, 9x8 horizontal gradient
    WAVELET,    // wHash, Haar LL band median threshold
    PERCEPTUAL  // pHash, 32x32 DCT low-frequency median threshold
};

/**
 * @brief Fixed-length bit fingerprint tagged with the algorithm that produced it
 *
 * Bits are row-major, packed most-significant bit first.
 */
struct ImageHash
{
    HashAlgorithm algorithm;
    std::vector<uint8_t> data;

    ImageHash() : algorithm(HashAlgorithm::AVERAGE) {}
    ImageHash(HashAlgorithm a, const std::vector<uint8_t> &d) : algorithm(a), data(d) {}

    size_t bitCount() const { return data.size() * 8; }
    std::string toHex() const;

    /**
     * @throws std::invalid_argument for odd-length or non-hex input
     */
    static ImageHash fromHex(HashAlgorithm algorithm, const std::string &hex);

    bool operator==(const ImageHash &other) const
    {
        return algorithm == other.algorithm && data == other.data;
    }
};

/**
 * @brief The four independent fingerprints of one image
 */
struct HashSet
{
    ImageHash average;
    ImageHash difference;
    ImageHash wavelet;
    ImageHash perceptual;

    nlohmann::json toJson() const;
};

class PerceptualHasher
{
public:
    static constexpr int HASH_SIZE = 8;
    static constexpr int DCT_IMAGE_SIZE = 32;
    static constexpr int DEFAULT_WAVELET_IMAGE_SIZE = 64;

    /**
     * @brief Compute all four hashes
     * @param image Decoded image
     * @param wavelet_image_size Power-of-two edge the wavelet hash downscales to
     * @throws MetadataError(DEGENERATE_GEOMETRY) for zero-area or single-pixel images
     */
    static HashSet computeAll(const DecodedImage &image, int wavelet_image_size = DEFAULT_WAVELET_IMAGE_SIZE);

    // Each takes an 8-bit single-channel image
    static ImageHash averageHash(const cv::Mat &gray);
    static ImageHash differenceHash(const cv::Mat &gray);
    static ImageHash waveletHash(const cv::Mat &gray, int image_size = DEFAULT_WAVELET_IMAGE_SIZE);
    static ImageHash perceptualHash(const cv::Mat &gray);

    /**
     * @brief In-place multi-level 2D Haar decomposition of a square
     * power-of-two CV_32F matrix; after the call the top-left
     * (size >> levels) square holds the lowest-frequency band
     */
    static void haarDecompose(cv::Mat &coefficients, int levels);

    /**
     * @brief Number of differing bits between two hashes of the same algorithm
     * @throws std::invalid_argument when algorithms or lengths differ
     */
    static int hammingDistance(const ImageHash &a, const ImageHash &b);

    static std::string algorithmName(HashAlgorithm algorithm);

private:
    static std::vector<uint8_t> packBits(const std::vector<bool> &bits);
    static double median(std::vector<float> values);
};
