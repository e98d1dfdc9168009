#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace scanbound::config {

constexpr std::size_t kDefaultMaxMessageBytes = 16 * 1024 * 1024;

struct ScanConfig {
    // Process-wide default; unset or non-positive means the built-in fallback.
    std::optional<long long> max_execution_time_ms;
    std::string worker_path = "scanbound-worker";
    std::vector<std::string> worker_args;
    int grace_period_ms = 2000;
    int poll_interval_ms = 50;
    int simulated_delay_ms = 100;
    // Longest single line a worker may write before the job is faulted.
    std::size_t max_message_bytes = kDefaultMaxMessageBytes;
};

struct Config {
    ScanConfig scan;
};

}  // namespace scanbound::config
