#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <openssl/sha.h>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

std::vector<uint8_t> FileUtils::readFileBytes(const std::string &file_path)
{
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open())
    {
        throw std::runtime_error("Could not open file: " + file_path);
    }

    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad())
    {
        throw std::runtime_error("Error reading file: " + file_path);
    }

    Logger::debug("Read " + std::to_string(bytes.size()) + " bytes from " + file_path);
    return bytes;
}

std::string FileUtils::getFileExtension(const std::string &file_path)
{
    std::string name = getFileName(file_path);
    size_t dot_pos = name.find_last_of('.');
    if (dot_pos == std::string::npos)
    {
        return "";
    }

    std::string extension = name.substr(dot_pos + 1);
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char c)
                   { return static_cast<char>(std::tolower(c)); });
    return extension;
}

std::string FileUtils::getFileName(const std::string &file_path)
{
    return fs::path(file_path).filename().string();
}

bool FileUtils::hasAcceptedExtension(const std::string &file_path, const std::vector<std::string> &accepted_extensions)
{
    std::string ext = getFileExtension(file_path);
    if (ext.empty())
    {
        return false;
    }
    return std::find(accepted_extensions.begin(), accepted_extensions.end(), ext) != accepted_extensions.end();
}

bool FileUtils::fileExists(const std::string &file_path)
{
    std::error_code ec;
    return fs::is_regular_file(file_path, ec);
}

std::string FileUtils::computeBufferHash(const std::vector<uint8_t> &data)
{
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(data.data(), data.size(), hash);

    std::stringstream ss;
    for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i)
    {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return ss.str();
}
