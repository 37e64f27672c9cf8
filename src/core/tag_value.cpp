#include "core/tag_value.hpp"
#include "core/metadata_error.hpp"
#include <iomanip>
#include <sstream>

double Rational::toDouble() const
{
    if (denominator == 0)
    {
        throw MetadataError(MetadataErrorKind::MALFORMED_METADATA,
                            "Rational " + std::to_string(numerator) + "/0 has a zero denominator");
    }
    return static_cast<double>(numerator) / static_cast<double>(denominator);
}

TagValueKind TagValues::kindOf(const TagValue &value)
{
    switch (value.index())
    {
    case 0:
        return TagValueKind::INTEGER;
    case 1:
        return TagValueKind::RATIONAL;
    case 2:
        return TagValueKind::STRING;
    default:
        return TagValueKind::BYTES;
    }
}

const std::string *TagValues::asString(const TagTable &table, const std::string &key)
{
    auto it = table.find(key);
    if (it == table.end())
        return nullptr;
    return std::get_if<std::string>(&it->second);
}

const std::vector<int64_t> *TagValues::asIntegers(const TagTable &table, const std::string &key)
{
    auto it = table.find(key);
    if (it == table.end())
        return nullptr;
    return std::get_if<std::vector<int64_t>>(&it->second);
}

const std::vector<Rational> *TagValues::asRationals(const TagTable &table, const std::string &key)
{
    auto it = table.find(key);
    if (it == table.end())
        return nullptr;
    return std::get_if<std::vector<Rational>>(&it->second);
}

const std::vector<uint8_t> *TagValues::asBytes(const TagTable &table, const std::string &key)
{
    auto it = table.find(key);
    if (it == table.end())
        return nullptr;
    return std::get_if<std::vector<uint8_t>>(&it->second);
}

nlohmann::json TagValues::toJson(const TagValue &value)
{
    if (const auto *ints = std::get_if<std::vector<int64_t>>(&value))
    {
        if (ints->size() == 1)
            return (*ints)[0];
        return nlohmann::json(*ints);
    }
    if (const auto *rationals = std::get_if<std::vector<Rational>>(&value))
    {
        nlohmann::json pairs = nlohmann::json::array();
        for (const auto &r : *rationals)
        {
            pairs.push_back({r.numerator, r.denominator});
        }
        if (rationals->size() == 1)
            return pairs[0];
        return pairs;
    }
    if (const auto *text = std::get_if<std::string>(&value))
    {
        return *text;
    }

    const auto &bytes = std::get<std::vector<uint8_t>>(value);
    std::stringstream ss;
    for (uint8_t b : bytes)
    {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(b);
    }
    return ss.str();
}

nlohmann::json TagValues::toJson(const TagTable &table)
{
    nlohmann::json out = nlohmann::json::object();
    for (const auto &entry : table)
    {
        out[entry.first] = toJson(entry.second);
    }
    return out;
}

nlohmann::json TagValues::toSummaryJson(const TagValue &value)
{
    const auto *rationals = std::get_if<std::vector<Rational>>(&value);
    if (!rationals)
    {
        return toJson(value);
    }

    nlohmann::json reduced = nlohmann::json::array();
    for (const auto &r : *rationals)
    {
        if (r.isValid())
            reduced.push_back(r.toDouble());
        else
            reduced.push_back(nullptr);
    }
    if (reduced.size() == 1)
        return reduced[0];
    return reduced;
}
