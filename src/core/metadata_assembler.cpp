#include "core/metadata_assembler.hpp"
#include "core/color_analyzer.hpp"
#include "core/file_utils.hpp"
#include "core/image_decoder.hpp"
#include "core/icc_extractor.hpp"
#include "core/metadata_error.hpp"
#include "core/perceptual_hasher.hpp"
#include "logging/logger.hpp"
#include <chrono>
#include <utility>
#include <opencv2/core.hpp>
#include <tbb/parallel_invoke.h>

namespace
{
    const std::pair<const char *, const char *> kSummaryFields[] = {
        {"camera_make", "Make"},
        {"camera_model", "Model"},
        {"iso", "ISOSpeedRatings"},
        {"exposure_time", "ExposureTime"},
        {"aperture", "FNumber"},
        {"focal_length", "FocalLength"},
        {"date_taken", "DateTimeOriginal"},
        {"shutter_speed", "ShutterSpeedValue"},
        {"brightness", "BrightnessValue"},
        {"white_balance", "WhiteBalance"},
        {"metering_mode", "MeteringMode"},
        {"lens_model", "LensModel"},
        {"exposure_program", "ExposureProgram"},
        {"flash", "Flash"},
        {"software", "Software"},
        {"orientation", "Orientation"},
    };
}

nlohmann::json MetadataAssembler::summarizeExif(const TagTable &tags)
{
    nlohmann::json summary = nlohmann::json::object();
    for (const auto &field : kSummaryFields)
    {
        auto it = tags.find(field.second);
        summary[field.first] = it == tags.end() ? nlohmann::json(nullptr) : TagValues::toSummaryJson(it->second);
    }
    return summary;
}

void MetadataAssembler::extractExif(const DecodedImage &image, MetadataRecord &record)
{
    if (image.exif.empty())
    {
        record.exif = FieldResult<ExifSummary>::absent();
        record.gps = FieldResult<GpsCoordinate>::absent();
        return;
    }

    ExifDecodeResult decoded;
    try
    {
        decoded = ExifDecoder::decode(image.exif);
    }
    catch (const std::exception &e)
    {
        Logger::error("EXIF decoder error: " + std::string(e.what()));
        record.exif = FieldResult<ExifSummary>::failed(e.what());
        record.gps = FieldResult<GpsCoordinate>::absent();
        return;
    }

    if (decoded.tags.empty() && !decoded.ok())
    {
        record.exif = FieldResult<ExifSummary>::failed(decoded.errorSummary());
    }
    else
    {
        ExifSummary summary;
        summary.summary = summarizeExif(decoded.tags);
        summary.warnings = decoded.errors;
        summary.tags = std::move(decoded.tags);
        record.exif = FieldResult<ExifSummary>::present(std::move(summary));
    }

    if (!decoded.gps_error.empty())
        record.gps = FieldResult<GpsCoordinate>::failed(decoded.gps_error);
    else if (decoded.gps)
        record.gps = FieldResult<GpsCoordinate>::present(*decoded.gps);
    else
        record.gps = FieldResult<GpsCoordinate>::absent();
}

void MetadataAssembler::extractIcc(const DecodedImage &image, MetadataRecord &record)
{
    FieldResult<IccDescription> result = guard<IccDescription>("ICC profile", [&]()
                                                               { return IccExtractor::extract(image.icc); });
    if (result.isFailed())
    {
        // A profile was embedded but reading it blew up: same outcome as an unparsable one
        IccDescription unparsable;
        unparsable.status = IccStatus::UNPARSABLE;
        unparsable.error = result.error_message;
        record.icc_profile = unparsable;
        return;
    }
    record.icc_profile = std::move(result.value);
}

void MetadataAssembler::extractHashes(const DecodedImage &image, const AnalysisOptions &options, MetadataRecord &record)
{
    record.hashes = guard<HashSet>("hashing", [&]()
                                   { return PerceptualHasher::computeAll(image, options.wavelet_image_size); });
}

void MetadataAssembler::extractColors(const DecodedImage &image, const AnalysisOptions &options, MetadataRecord &record)
{
    record.color_stats = guard<ColorStats>("histogram", [&]()
                                           { return ColorAnalyzer::computeStats(image); });
    record.dominant_colors = guard<std::vector<DominantColor>>("dominant colors", [&]()
                                                               { return ColorAnalyzer::dominantColors(image, options.dominant_color_top_k,
                                                                                                      options.dominant_color_grid_size); });
}

void MetadataAssembler::extractGeometry(const DecodedImage &image, MetadataRecord &record)
{
    record.aspect_ratio = guard<std::string>("aspect ratio", [&]()
                                             { return ColorAnalyzer::aspectRatio(image.width(), image.height()); });
    record.megapixels = guard<double>("megapixels", [&]()
                                      { return ColorAnalyzer::megapixels(image.width(), image.height()); });
}

MetadataRecord MetadataAssembler::assemble(const DecodedImage &image, const AnalysisOptions &options)
{
    auto start = std::chrono::steady_clock::now();

    MetadataRecord record;
    record.filename = image.filename;
    record.format = image.format;
    record.mode = image.mode;
    record.width = image.width();
    record.height = image.height();
    record.file_size_bytes = image.file_size_bytes;

    // Each task writes only its own fields of the record
    auto exif_task = [&]()
    { extractExif(image, record); };
    auto icc_task = [&]()
    { extractIcc(image, record); };
    auto hash_task = [&]()
    { extractHashes(image, options, record); };
    auto color_task = [&]()
    { extractColors(image, options, record); };
    auto geometry_task = [&]()
    { extractGeometry(image, record); };

    if (options.parallel)
    {
        tbb::parallel_invoke(exif_task, icc_task, hash_task, color_task, geometry_task);
    }
    else
    {
        exif_task();
        icc_task();
        hash_task();
        color_task();
        geometry_task();
    }

    auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();
    Logger::info("Metadata assembled for " + image.filename + " in " + std::to_string(elapsed_ms) + " ms (" +
                 std::to_string(record.errors().size()) + " failed fields)");
    return record;
}

MetadataRecord MetadataAssembler::extractFile(const std::string &file_path, const AnalysisOptions &options)
{
    Logger::debug("Extracting metadata from file: " + file_path);
    std::vector<uint8_t> bytes = FileUtils::readFileBytes(file_path);
    DecodedImage image = ImageDecoder::decodeBuffer(bytes, FileUtils::getFileName(file_path));
    MetadataRecord record = assemble(image, options);
    record.sha256 = FileUtils::computeBufferHash(bytes);
    return record;
}

MetadataRecord MetadataAssembler::extractBuffer(const std::vector<uint8_t> &bytes, const std::string &filename,
                                                const std::vector<std::string> &accepted_extensions,
                                                const AnalysisOptions &options)
{
    if (!accepted_extensions.empty() && !FileUtils::hasAcceptedExtension(filename, accepted_extensions))
    {
        Logger::warn("Rejected upload with unsupported extension: " + filename);
        throw MetadataError(MetadataErrorKind::UNSUPPORTED_INPUT, "Unsupported file type.");
    }

    DecodedImage image = ImageDecoder::decodeBuffer(bytes, filename);
    MetadataRecord record = assemble(image, options);
    record.sha256 = FileUtils::computeBufferHash(bytes);
    return record;
}
