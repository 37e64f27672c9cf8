#include "core/poco_config_manager.hpp"
#include "logging/logger.hpp"
#include <Poco/Exception.h>
#include <fstream>
#include <functional>
#include <sstream>

using Poco::AutoPtr;
using Poco::Util::JSONConfiguration;

PocoConfigManager::PocoConfigManager()
{
    cfg_ = new JSONConfiguration();
    setDefaults();
}

bool PocoConfigManager::load(const std::string &path)
{
    std::ifstream in(path);
    if (!in.good())
    {
        Logger::warn("Config file not found: " + path);
        return false;
    }

    nlohmann::json patch;
    try
    {
        in >> patch;
    }
    catch (const nlohmann::json::parse_error &e)
    {
        Logger::error("Invalid JSON in config file " + path + ": " + std::string(e.what()));
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    cfg_ = new JSONConfiguration();
    setDefaults();
    applyPatch(patch);
    return true;
}

bool PocoConfigManager::save(const std::string &path) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::ofstream out(path);
    if (!out.is_open())
        return false;
    cfg_->save(out);
    return true;
}

nlohmann::json PocoConfigManager::getAll() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::stringstream ss;
    cfg_->save(ss);
    return nlohmann::json::parse(ss.str());
}

void PocoConfigManager::update(const nlohmann::json &patch)
{
    std::lock_guard<std::mutex> lock(mutex_);
    applyPatch(patch);
}

void PocoConfigManager::applyPatch(const nlohmann::json &patch)
{
    // Flatten and set values
    std::function<void(const std::string &, const nlohmann::json &)> apply;
    apply = [&](const std::string &prefix, const nlohmann::json &node)
    {
        if (node.is_object())
        {
            for (auto it = node.begin(); it != node.end(); ++it)
            {
                std::string key = prefix.empty() ? it.key() : (prefix + "." + it.key());
                apply(key, it.value());
            }
        }
        else if (!node.is_null())
        {
            if (node.is_boolean())
                cfg_->setBool(prefix, node.get<bool>());
            else if (node.is_number_integer())
                cfg_->setInt(prefix, node.get<int>());
            else if (node.is_number_float())
                cfg_->setDouble(prefix, node.get<double>());
            else if (node.is_string())
                cfg_->setString(prefix, node.get<std::string>());
            else
                cfg_->setString(prefix, node.dump());
        }
    };
    apply("", patch);
}

// Basic configuration getters
std::string PocoConfigManager::getString(const std::string &key, const std::string &def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getString(key, def);
}

int PocoConfigManager::getInt(const std::string &key, int def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getInt(key, def);
}

bool PocoConfigManager::getBool(const std::string &key, bool def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getBool(key, def);
}

// Server configuration getters
std::string PocoConfigManager::getLogLevel() const
{
    return getString("log_level", "INFO");
}

int PocoConfigManager::getServerPort() const
{
    return getInt("server_port", 8000);
}

std::string PocoConfigManager::getServerHost() const
{
    return getString("server_host", "0.0.0.0");
}

size_t PocoConfigManager::getUploadMaxBytes() const
{
    int max_bytes = getInt("upload.max_bytes", 52428800);
    return max_bytes > 0 ? static_cast<size_t>(max_bytes) : 0;
}

// Analysis configuration getters
int PocoConfigManager::getDominantColorTopK() const
{
    return getInt("analysis.dominant_colors.top_k", 5);
}

int PocoConfigManager::getDominantColorGridSize() const
{
    return getInt("analysis.dominant_colors.grid_size", 100);
}

int PocoConfigManager::getWaveletImageSize() const
{
    return getInt("analysis.hash.wavelet_image_size", 64);
}

bool PocoConfigManager::getParallelAnalysis() const
{
    return getBool("analysis.parallel", true);
}

std::vector<std::string> PocoConfigManager::getEnabledImageExtensions() const
{
    std::vector<std::string> enabled_extensions;
    std::lock_guard<std::mutex> lock(mutex_);

    Poco::Util::AbstractConfiguration::Keys keys;
    cfg_->keys("categories.images", keys);
    for (const auto &ext : keys)
    {
        if (cfg_->getBool("categories.images." + ext, false))
            enabled_extensions.push_back(ext);
    }
    return enabled_extensions;
}

// Configuration validation
bool PocoConfigManager::validateConfig() const
{
    int port = getServerPort();
    if (port <= 0 || port > 65535)
    {
        Logger::error("Invalid server port: " + std::to_string(port));
        return false;
    }

    std::string log_level = getLogLevel();
    if (log_level != "TRACE" && log_level != "DEBUG" && log_level != "INFO" &&
        log_level != "WARN" && log_level != "ERROR")
    {
        Logger::error("Invalid log level: " + log_level);
        return false;
    }

    if (getInt("upload.max_bytes", 52428800) <= 0)
    {
        Logger::error("Invalid upload.max_bytes: must be positive");
        return false;
    }

    int top_k = getDominantColorTopK();
    int grid_size = getDominantColorGridSize();
    if (top_k < 1 || grid_size < 1)
    {
        Logger::error("Invalid dominant color settings: top_k=" + std::to_string(top_k) +
                      ", grid_size=" + std::to_string(grid_size));
        return false;
    }

    int wavelet_size = getWaveletImageSize();
    if (wavelet_size < 8 || (wavelet_size & (wavelet_size - 1)) != 0)
    {
        Logger::error("Invalid wavelet image size: " + std::to_string(wavelet_size) + " (power of two >= 8 required)");
        return false;
    }

    if (getEnabledImageExtensions().empty())
    {
        Logger::error("No image extensions enabled under categories.images");
        return false;
    }

    return true;
}

void PocoConfigManager::initializeDefaultConfig()
{
    std::lock_guard<std::mutex> lock(mutex_);
    cfg_ = new JSONConfiguration();
    setDefaults();
}

void PocoConfigManager::setDefaults()
{
    cfg_->setString("log_level", "INFO");
    cfg_->setString("server_host", "0.0.0.0");
    cfg_->setInt("server_port", 8000);

    cfg_->setInt("upload.max_bytes", 52428800);

    cfg_->setInt("analysis.dominant_colors.top_k", 5);
    cfg_->setInt("analysis.dominant_colors.grid_size", 100);
    cfg_->setInt("analysis.hash.wavelet_image_size", 64);
    cfg_->setBool("analysis.parallel", true);

    cfg_->setBool("categories.images.jpg", true);
    cfg_->setBool("categories.images.jpeg", true);
    cfg_->setBool("categories.images.png", true);
    cfg_->setBool("categories.images.webp", true);
    cfg_->setBool("categories.images.tiff", true);
    cfg_->setBool("categories.images.tif", true);
}

bool PocoConfigManager::hasKey(const std::string &key) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->hasProperty(key);
}
