#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "core/decoded_image.hpp"
#include "core/exif_decoder.hpp"
#include "core/metadata_error.hpp"
#include "core/metadata_record.hpp"
#include "logging/logger.hpp"

/**
 * @brief Tunables of one extraction call
 */
struct AnalysisOptions
{
    int dominant_color_top_k;
    int dominant_color_grid_size;
    int wavelet_image_size;
    bool parallel;

    AnalysisOptions()
        : dominant_color_top_k(ColorAnalyzer::DEFAULT_TOP_K),
          dominant_color_grid_size(ColorAnalyzer::DEFAULT_GRID_SIZE),
          wavelet_image_size(PerceptualHasher::DEFAULT_WAVELET_IMAGE_SIZE),
          parallel(true) {}
};

/**
 * @brief Runs every analyzer against one DecodedImage and merges the results
 *
 * Analyzers are independent: each failure is confined to its own field, and
 * the record always carries format, dimensions and file size.
 */
class MetadataAssembler
{
public:
    static MetadataRecord assemble(const DecodedImage &image, const AnalysisOptions &options = AnalysisOptions());

    /**
     * @brief Decode a file from disk and assemble its record
     * @throws MetadataError when the container cannot be decoded
     * @throws std::runtime_error when the file cannot be read
     */
    static MetadataRecord extractFile(const std::string &file_path, const AnalysisOptions &options = AnalysisOptions());

    /**
     * @brief Decode uploaded bytes and assemble their record
     *
     * An empty accepted list disables the extension check.
     * @throws MetadataError UNSUPPORTED_INPUT for a rejected extension,
     * MALFORMED_CONTAINER when the bytes cannot be decoded
     */
    static MetadataRecord extractBuffer(const std::vector<uint8_t> &bytes, const std::string &filename,
                                        const std::vector<std::string> &accepted_extensions,
                                        const AnalysisOptions &options = AnalysisOptions());

    /**
     * @brief Camera-facing summary fields; missing tags map to null
     */
    static nlohmann::json summarizeExif(const TagTable &tags);

    /**
     * @brief Run one analyzer, turning any exception it throws into a FAILED field
     */
    template <typename T, typename Analyzer>
    static FieldResult<T> guard(const std::string &category, Analyzer analyzer)
    {
        try
        {
            return FieldResult<T>::present(analyzer());
        }
        catch (const MetadataError &e)
        {
            Logger::warn(category + " skipped (" + MetadataError::kindName(e.kind()) + "): " + e.what());
            return FieldResult<T>::failed(e.what());
        }
        catch (const cv::Exception &e)
        {
            Logger::error("OpenCV error during " + category + ": " + std::string(e.what()));
            return FieldResult<T>::failed("OpenCV processing error: " + std::string(e.what()));
        }
        catch (const std::exception &e)
        {
            Logger::error("Error during " + category + ": " + std::string(e.what()));
            return FieldResult<T>::failed(e.what());
        }
    }

private:
    static void extractExif(const DecodedImage &image, MetadataRecord &record);
    static void extractIcc(const DecodedImage &image, MetadataRecord &record);
    static void extractHashes(const DecodedImage &image, const AnalysisOptions &options, MetadataRecord &record);
    static void extractColors(const DecodedImage &image, const AnalysisOptions &options, MetadataRecord &record);
    static void extractGeometry(const DecodedImage &image, MetadataRecord &record);
};
