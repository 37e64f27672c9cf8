#pragma once

#include "core/metadata_assembler.hpp"
#include "core/metadata_error.hpp"
#include "core/poco_config_manager.hpp"
#include "logging/logger.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

using json = nlohmann::json;

class RouteHandlers
{
public:
    static void setupRoutes(httplib::Server &svr)
    {
        auto &config = PocoConfigManager::getInstance();
        // Leave headroom for the multipart envelope, the file part itself is checked in handleExtract
        svr.set_payload_max_length(config.getUploadMaxBytes() + MULTIPART_OVERHEAD_BYTES);

        svr.Get("/health", [](const httplib::Request &req, httplib::Response &res)
                { handleHealth(req, res); });

        svr.Post("/extract", [](const httplib::Request &req, httplib::Response &res)
                 { handleExtract(req, res); });

        Logger::info("Routes registered: GET /health, POST /extract");
    }

    static void handleHealth(const httplib::Request &, httplib::Response &res)
    {
        res.set_content(json{{"status", "ok"}}.dump(), "application/json");
    }

    static void handleExtract(const httplib::Request &req, httplib::Response &res)
    {
        Logger::trace("Received extract request");

        if (!req.has_file("file"))
        {
            sendDetail(res, 400, "No file uploaded.");
            return;
        }

        const auto file = req.get_file_value("file");
        auto &config = PocoConfigManager::getInstance();

        if (file.content.size() > config.getUploadMaxBytes())
        {
            Logger::warn("Upload too large: " + file.filename + " (" + std::to_string(file.content.size()) + " bytes)");
            sendDetail(res, 413, "File too large.");
            return;
        }

        try
        {
            AnalysisOptions options;
            options.dominant_color_top_k = config.getDominantColorTopK();
            options.dominant_color_grid_size = config.getDominantColorGridSize();
            options.wavelet_image_size = config.getWaveletImageSize();
            options.parallel = config.getParallelAnalysis();

            std::vector<uint8_t> bytes(file.content.begin(), file.content.end());
            MetadataRecord record = MetadataAssembler::extractBuffer(bytes, file.filename,
                                                                     config.getEnabledImageExtensions(), options);
            res.status = 200;
            res.set_content(record.toJson().dump(-1, ' ', false, json::error_handler_t::replace), "application/json");
            Logger::info("Extract request completed: " + record.filename);
        }
        catch (const MetadataError &e)
        {
            if (e.kind() == MetadataErrorKind::UNSUPPORTED_INPUT)
            {
                sendDetail(res, 400, "Unsupported file type.");
            }
            else
            {
                Logger::warn("Extract request rejected (" + MetadataError::kindName(e.kind()) + "): " + e.what());
                sendDetail(res, 422, e.what());
            }
        }
        catch (const std::exception &e)
        {
            Logger::error("Extract error: " + std::string(e.what()));
            sendDetail(res, 500, "Internal server error");
        }
    }

private:
    static constexpr size_t MULTIPART_OVERHEAD_BYTES = 64 * 1024;

    static void sendDetail(httplib::Response &res, int status, const std::string &detail)
    {
        res.status = status;
        res.set_content(json{{"detail", detail}}.dump(-1, ' ', false, json::error_handler_t::replace), "application/json");
    }
};
