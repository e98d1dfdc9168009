#pragma once

#include <optional>
#include <string>

namespace scanbound::scan {

constexpr long long kFallbackTimeoutMs = 30000;

// Picks the effective timeout for a job: a positive per-job override wins,
// then a positive configured default, then the fallback. Non-positive values
// fall through to the next tier instead of failing the job.
long long ResolveTimeoutMs(std::optional<long long> per_job_override,
                           std::optional<long long> configured_default,
                           long long fallback = kFallbackTimeoutMs);

// Returns nullopt for anything that is not a positive integer.
std::optional<long long> ParseTimeoutMs(const std::string& value);

}  // namespace scanbound::scan
