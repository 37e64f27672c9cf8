#pragma once

#include <Poco/Util/JSONConfiguration.h>
#include <Poco/AutoPtr.h>
#include <cstddef>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

class PocoConfigManager
{
public:
    static PocoConfigManager &getInstance()
    {
        static PocoConfigManager instance;
        return instance;
    }

    // Core file operations
    /**
     * @brief Reset to defaults, then overlay the JSON file at path
     * @return false if the file is missing or not valid JSON
     */
    bool load(const std::string &path);
    bool save(const std::string &path) const;
    void update(const nlohmann::json &patch);
    nlohmann::json getAll() const;

    // Basic configuration getters
    std::string getString(const std::string &key, const std::string &def = "") const;
    int getInt(const std::string &key, int def = 0) const;
    bool getBool(const std::string &key, bool def = false) const;

    // Server configuration getters
    std::string getLogLevel() const;
    int getServerPort() const;
    std::string getServerHost() const;
    size_t getUploadMaxBytes() const;

    // Analysis configuration getters
    int getDominantColorTopK() const;
    int getDominantColorGridSize() const;
    int getWaveletImageSize() const;
    bool getParallelAnalysis() const;

    // File type configuration getters
    std::vector<std::string> getEnabledImageExtensions() const;

    // Configuration validation
    bool validateConfig() const;

    void initializeDefaultConfig();
    bool hasKey(const std::string &key) const;

private:
    PocoConfigManager();
    ~PocoConfigManager() = default;
    PocoConfigManager(const PocoConfigManager &) = delete;
    PocoConfigManager &operator=(const PocoConfigManager &) = delete;

    void applyPatch(const nlohmann::json &patch);
    void setDefaults();

    mutable std::mutex mutex_;
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg_;
};
