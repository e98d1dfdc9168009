#include "config/config_loader.hpp"

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>

#include "nlohmann/json.hpp"
#include "scan/deadline_policy.hpp"

namespace scanbound::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary);
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

int ParseInt(const std::string& value, int fallback) {
    try {
        return std::stoi(value);
    } catch (const std::invalid_argument&) {
        return fallback;
    } catch (const std::out_of_range&) {
        return fallback;
    }
}

std::vector<std::string> SplitArgs(const std::string& value) {
    std::vector<std::string> items;
    std::istringstream stream(value);
    std::string item;
    while (stream >> item) {
        items.push_back(item);
    }
    return items;
}

// Out-of-range values keep the current setting instead of being narrowed.
void ReadIntSetting(const nlohmann::json& scan, const char* key, int& target) {
    if (!scan.contains(key) || !scan[key].is_number_integer()) {
        return;
    }
    const auto& value = scan[key];
    bool in_range = false;
    if (value.is_number_unsigned()) {
        in_range = value.get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<int>::max());
    } else {
        const auto parsed = value.get<std::int64_t>();
        in_range = parsed >= std::numeric_limits<int>::min() && parsed <= std::numeric_limits<int>::max();
    }
    if (!in_range) {
        std::cerr << "[config] ignoring out-of-range scan." << key << std::endl;
        return;
    }
    target = value.get<int>();
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }
    if (!data.contains("scan") || !data["scan"].is_object()) {
        return;
    }
    const auto& scan = data["scan"];
    if (scan.contains("maxExecutionTimeMs")) {
        const auto& value = scan["maxExecutionTimeMs"];
        if (value.is_number_integer() && value.get<long long>() > 0) {
            config.scan.max_execution_time_ms = value.get<long long>();
        } else if (value.is_string()) {
            config.scan.max_execution_time_ms = scanbound::scan::ParseTimeoutMs(value.get<std::string>());
        }
    }
    if (scan.contains("workerPath") && scan["workerPath"].is_string()) {
        config.scan.worker_path = scan["workerPath"].get<std::string>();
    }
    if (scan.contains("workerArgs") && scan["workerArgs"].is_array()) {
        config.scan.worker_args.clear();
        for (const auto& item : scan["workerArgs"]) {
            if (item.is_string()) {
                config.scan.worker_args.push_back(item.get<std::string>());
            }
        }
    }
    ReadIntSetting(scan, "gracePeriodMs", config.scan.grace_period_ms);
    ReadIntSetting(scan, "pollIntervalMs", config.scan.poll_interval_ms);
    ReadIntSetting(scan, "simulatedDelayMs", config.scan.simulated_delay_ms);
    if (scan.contains("maxMessageBytes") && scan["maxMessageBytes"].is_number_unsigned() &&
        scan["maxMessageBytes"].get<std::uint64_t>() > 0 &&
        scan["maxMessageBytes"].get<std::uint64_t>() <= std::numeric_limits<std::size_t>::max()) {
        config.scan.max_message_bytes = scan["maxMessageBytes"].get<std::size_t>();
    }
}

}  // namespace

std::filesystem::path DefaultConfigPath() {
    return GetHomePath() / ".scanbound" / "config.json";
}

Config LoadConfigFrom(const std::filesystem::path& path) {
    Config config{};
    if (std::filesystem::exists(path)) {
        try {
            std::ifstream input(path);
            nlohmann::json data;
            input >> data;
            ApplyConfigFromJson(config, data);
        } catch (const nlohmann::json::exception& ex) {
            std::cerr << "[config] ignoring " << path.string() << ": " << ex.what() << std::endl;
        }
    }
    ApplyEnvironment(config);
    return config;
}

Config LoadConfig() {
    return LoadConfigFrom(DefaultConfigPath());
}

void ApplyEnvironment(Config& config) {
    const auto max_execution_time = GetEnvFallback(
        "SCAN_MAX_EXECUTION_TIME_MS",
        "SCANBOUND_SCAN__MAX_EXECUTION_TIME_MS");
    if (!max_execution_time.empty()) {
        // A malformed value leaves the default unset so the fallback applies.
        config.scan.max_execution_time_ms = scanbound::scan::ParseTimeoutMs(max_execution_time);
    }

    const auto worker_path = GetEnv("SCANBOUND_SCAN__WORKER_PATH");
    if (!worker_path.empty()) {
        config.scan.worker_path = worker_path;
    }

    const auto worker_args = GetEnv("SCANBOUND_SCAN__WORKER_ARGS");
    if (!worker_args.empty()) {
        config.scan.worker_args = SplitArgs(worker_args);
    }

    const auto grace_period = GetEnv("SCANBOUND_SCAN__GRACE_PERIOD_MS");
    if (!grace_period.empty()) {
        config.scan.grace_period_ms = ParseInt(grace_period, config.scan.grace_period_ms);
    }

    const auto poll_interval = GetEnv("SCANBOUND_SCAN__POLL_INTERVAL_MS");
    if (!poll_interval.empty()) {
        config.scan.poll_interval_ms = ParseInt(poll_interval, config.scan.poll_interval_ms);
    }

    const auto simulated_delay = GetEnv("SCANBOUND_SCAN__SIMULATED_DELAY_MS");
    if (!simulated_delay.empty()) {
        config.scan.simulated_delay_ms = ParseInt(simulated_delay, config.scan.simulated_delay_ms);
    }
}

}  // namespace scanbound::config
