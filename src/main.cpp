#include "core/file_utils.hpp"
#include "core/http_server_manager.hpp"
#include "core/image_decoder.hpp"
#include "core/metadata_assembler.hpp"
#include "core/metadata_error.hpp"
#include "core/perceptual_hasher.hpp"
#include "core/poco_config_manager.hpp"
#include "core/shutdown_signal.hpp"
#include "logging/logger.hpp"
#include "web/route_handlers.hpp"
#include <iostream>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace
{
    const char *const kDefaultConfigPath = "config.json";

    void printUsage(const char *program)
    {
        std::cout << "Image Metadata Extractor" << std::endl;
        std::cout << "Usage: " << program << " [options] <image_path>" << std::endl;
        std::cout << "       " << program << " --compare <image_a> <image_b>" << std::endl;
        std::cout << "       " << program << " --serve" << std::endl;
        std::cout << "Options:" << std::endl;
        std::cout << "  --config <path>   Load configuration from path (default: config.json)" << std::endl;
        std::cout << "  --serve           Run the HTTP extraction service" << std::endl;
        std::cout << "  --compare a b     Print Hamming distances between the hashes of two images" << std::endl;
        std::cout << "  --help, -h        Show this help message" << std::endl;
    }

    AnalysisOptions optionsFromConfig(const PocoConfigManager &config)
    {
        AnalysisOptions options;
        options.dominant_color_top_k = config.getDominantColorTopK();
        options.dominant_color_grid_size = config.getDominantColorGridSize();
        options.wavelet_image_size = config.getWaveletImageSize();
        options.parallel = config.getParallelAnalysis();
        return options;
    }

    bool checkInputFile(const std::string &path, const PocoConfigManager &config)
    {
        if (!FileUtils::fileExists(path))
        {
            std::cerr << "Error: file not found: " << path << std::endl;
            return false;
        }
        if (!FileUtils::hasAcceptedExtension(path, config.getEnabledImageExtensions()))
        {
            std::cerr << "Error: unsupported file type: " << path << std::endl;
            return false;
        }
        return true;
    }

    int runExtract(const std::string &path, const PocoConfigManager &config)
    {
        if (!checkInputFile(path, config))
            return 1;

        MetadataRecord record = MetadataAssembler::extractFile(path, optionsFromConfig(config));
        std::cout << record.toJson().dump(4, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
        return 0;
    }

    int runCompare(const std::string &path_a, const std::string &path_b, const PocoConfigManager &config)
    {
        if (!checkInputFile(path_a, config) || !checkInputFile(path_b, config))
            return 1;

        int wavelet_size = config.getWaveletImageSize();
        HashSet a = PerceptualHasher::computeAll(ImageDecoder::decodeFile(path_a), wavelet_size);
        HashSet b = PerceptualHasher::computeAll(ImageDecoder::decodeFile(path_b), wavelet_size);

        nlohmann::json distances = {
            {"average", PerceptualHasher::hammingDistance(a.average, b.average)},
            {"difference", PerceptualHasher::hammingDistance(a.difference, b.difference)},
            {"wavelet", PerceptualHasher::hammingDistance(a.wavelet, b.wavelet)},
            {"perceptual", PerceptualHasher::hammingDistance(a.perceptual, b.perceptual)}};
        nlohmann::json output = {
            {"image_a", FileUtils::getFileName(path_a)},
            {"image_b", FileUtils::getFileName(path_b)},
            {"hamming_distance", distances}};
        std::cout << output.dump(4, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
        return 0;
    }

    int runServer(const PocoConfigManager &config)
    {
        auto &shutdown = ShutdownSignal::getInstance();
        shutdown.install();

        auto &server_manager = HttpServerManager::getInstance();
        server_manager.setRouteSetupCallback([](httplib::Server &svr)
                                             { RouteHandlers::setupRoutes(svr); });
        server_manager.start(config.getServerHost(), config.getServerPort());

        shutdown.wait();
        Logger::info("Shutting down (" + shutdown.reason() + ")");
        server_manager.stop();
        return 0;
    }
}

int main(int argc, char *argv[])
{
    std::string config_path = kDefaultConfigPath;
    bool explicit_config = false;
    bool serve = false;
    std::vector<std::string> positional;
    std::vector<std::string> compare_paths;

    for (int i = 1; i < argc; i++)
    {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h")
        {
            printUsage(argv[0]);
            return 0;
        }
        else if (arg == "--config")
        {
            if (i + 1 >= argc)
            {
                std::cerr << "Error: --config requires a path" << std::endl;
                return 1;
            }
            config_path = argv[++i];
            explicit_config = true;
        }
        else if (arg == "--serve")
        {
            serve = true;
        }
        else if (arg == "--compare")
        {
            if (i + 2 >= argc)
            {
                std::cerr << "Error: --compare requires two image paths" << std::endl;
                return 1;
            }
            compare_paths.push_back(argv[++i]);
            compare_paths.push_back(argv[++i]);
        }
        else if (!arg.empty() && arg[0] == '-')
        {
            std::cerr << "Error: unknown option " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        }
        else
        {
            positional.push_back(arg);
        }
    }

    auto &config = PocoConfigManager::getInstance();
    if (FileUtils::fileExists(config_path))
    {
        if (!config.load(config_path))
        {
            std::cerr << "Error: could not load configuration from " << config_path << std::endl;
            return 1;
        }
    }
    else if (explicit_config)
    {
        std::cerr << "Error: configuration file not found: " << config_path << std::endl;
        return 1;
    }

    Logger::init(config.getLogLevel());
    if (!config.validateConfig())
    {
        std::cerr << "Error: invalid configuration" << std::endl;
        return 1;
    }

    try
    {
        if (serve)
            return runServer(config);
        if (!compare_paths.empty())
            return runCompare(compare_paths[0], compare_paths[1], config);
        if (positional.size() != 1)
        {
            printUsage(argv[0]);
            return 1;
        }
        return runExtract(positional[0], config);
    }
    catch (const MetadataError &e)
    {
        Logger::error("Extraction failed (" + MetadataError::kindName(e.kind()) + "): " + e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    catch (const std::exception &e)
    {
        Logger::error(std::string("Fatal error: ") + e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
