#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

enum class IccStatus
{
    ABSENT,     // No profile embedded
    PRESENT,    // Profile parsed; description may still be empty
    UNPARSABLE  // Profile embedded but its description could not be recovered
};

struct IccDescription
{
    IccStatus status;
    std::string description;
    std::string error;

    IccDescription() : status(IccStatus::ABSENT) {}

    /**
     * @brief null when absent, the description when present, the
     * UNPARSABLE_SENTINEL string otherwise
     */
    nlohmann::json toJson() const;
};

/**
 * @brief Recovers the human-readable description ('desc' tag) of an ICC profile
 */
class IccExtractor
{
public:
    static const char *const UNPARSABLE_SENTINEL;

    static IccDescription extract(const std::vector<uint8_t> &icc_profile);

private:
    static std::string decodeTextDescription(const uint8_t *tag, size_t size);
    static std::string decodeMultiLocalizedUnicode(const uint8_t *tag, size_t size);
};
