#pragma once

#include <string>
#include <utility>
#include <nlohmann/json.hpp>

enum class FieldStatus
{
    PRESENT, // Extracted
    ABSENT,  // Not present in the source
    FAILED   // Present in the source but extraction failed
};

/**
 * @brief Tagged outcome of one analyzer for one optional record field
 */
template <typename T>
struct FieldResult
{
    FieldStatus status;
    std::string error_message;
    T value;

    FieldResult() : status(FieldStatus::ABSENT), value() {}

    static FieldResult present(T v)
    {
        FieldResult result;
        result.status = FieldStatus::PRESENT;
        result.value = std::move(v);
        return result;
    }

    static FieldResult absent()
    {
        return FieldResult();
    }

    static FieldResult failed(const std::string &message)
    {
        FieldResult result;
        result.status = FieldStatus::FAILED;
        result.error_message = message;
        return result;
    }

    bool isPresent() const { return status == FieldStatus::PRESENT; }
    bool isFailed() const { return status == FieldStatus::FAILED; }

    /**
     * @brief null when absent, {"error": message} when failed,
     * render(value) when present
     */
    template <typename Render>
    nlohmann::json toJson(Render render) const
    {
        switch (status)
        {
        case FieldStatus::PRESENT:
            return render(value);
        case FieldStatus::FAILED:
            return nlohmann::json{{"error", error_message}};
        default:
            return nullptr;
        }
    }
};
