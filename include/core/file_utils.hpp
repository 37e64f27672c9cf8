#pragma once

#include <cstdint>
#include <string>
#include <vector>

/**
 * @brief File helpers for the CLI and upload boundary
 */
class FileUtils
{
public:
    /**
     * @brief Read a whole file into memory
     * @param file_path Path to the file
     * @return File contents
     * @throws std::runtime_error if the file cannot be opened or read
     */
    static std::vector<uint8_t> readFileBytes(const std::string &file_path);

    /**
     * @brief Lowercased extension without the dot, empty when there is none
     */
    static std::string getFileExtension(const std::string &file_path);

    /**
     * @brief Final path component
     */
    static std::string getFileName(const std::string &file_path);

    /**
     * @brief Check a filename against a list of accepted extensions
     * @param file_path Filename or path
     * @param accepted_extensions Lowercase extensions without dots
     */
    static bool hasAcceptedExtension(const std::string &file_path, const std::vector<std::string> &accepted_extensions);

    static bool fileExists(const std::string &file_path);

    /**
     * @brief SHA-256 of an in-memory buffer as lowercase hex
     */
    static std::string computeBufferHash(const std::vector<uint8_t> &data);
};
