#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

/**
 * @brief Unreduced EXIF rational, numerator over denominator
 */
struct Rational
{
    int64_t numerator;
    int64_t denominator;

    Rational() : numerator(0), denominator(1) {}
    Rational(int64_t n, int64_t d) : numerator(n), denominator(d) {}

    bool isValid() const { return denominator != 0; }

    /**
     * @brief Reduce to a double
     * @throws MetadataError(MALFORMED_METADATA) when the denominator is zero
     */
    double toDouble() const;

    bool operator==(const Rational &other) const
    {
        return numerator == other.numerator && denominator == other.denominator;
    }
};

/**
 * @brief One decoded tag value. Integer and rational entries keep their
 * declared count, so a 3-rational GPS triple stays a 3-element vector.
 */
using TagValue = std::variant<std::vector<int64_t>, std::vector<Rational>, std::string, std::vector<uint8_t>>;

enum class TagValueKind
{
    INTEGER,
    RATIONAL,
    STRING,
    BYTES
};

/**
 * @brief Canonical tag name -> value. Built fresh per extraction call.
 */
using TagTable = std::map<std::string, TagValue>;

class TagValues
{
public:
    static TagValueKind kindOf(const TagValue &value);

    static const std::string *asString(const TagTable &table, const std::string &key);
    static const std::vector<int64_t> *asIntegers(const TagTable &table, const std::string &key);
    static const std::vector<Rational> *asRationals(const TagTable &table, const std::string &key);
    static const std::vector<uint8_t> *asBytes(const TagTable &table, const std::string &key);

    /**
     * @brief Single-count values become scalars, rationals become [num, den]
     * pairs, byte arrays become lowercase hex
     */
    static nlohmann::json toJson(const TagValue &value);
    static nlohmann::json toJson(const TagTable &table);

    /**
     * @brief Summary rendering: rationals reduced to decimals, zero
     * denominators rendered as null
     */
    static nlohmann::json toSummaryJson(const TagValue &value);
};
