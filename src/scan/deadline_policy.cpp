#include "scan/deadline_policy.hpp"

#include <cctype>
#include <cstddef>
#include <stdexcept>

namespace scanbound::scan {

long long ResolveTimeoutMs(std::optional<long long> per_job_override,
                           std::optional<long long> configured_default,
                           long long fallback) {
    if (per_job_override.has_value() && *per_job_override > 0) {
        return *per_job_override;
    }
    if (configured_default.has_value() && *configured_default > 0) {
        return *configured_default;
    }
    return fallback > 0 ? fallback : kFallbackTimeoutMs;
}

std::optional<long long> ParseTimeoutMs(const std::string& value) {
    std::size_t begin = 0;
    std::size_t end = value.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(value[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
        --end;
    }
    if (begin == end) {
        return std::nullopt;
    }
    const auto trimmed = value.substr(begin, end - begin);
    try {
        std::size_t consumed = 0;
        const auto parsed = std::stoll(trimmed, &consumed);
        if (consumed != trimmed.size() || parsed <= 0) {
            return std::nullopt;
        }
        return parsed;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

}  // namespace scanbound::scan
