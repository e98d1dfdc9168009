#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "cli/scan_command.hpp"
#include "config/config_loader.hpp"
#include "nlohmann/json.hpp"
#include "scan/deadline_policy.hpp"

namespace {

constexpr const char* kVersion = "0.1.0";

void PrintUsage() {
    std::cout << "Usage: scanbound scan [--isolated] [--timeout-ms N] [--scan-id ID] <file|->\n"
              << "       scanbound config\n"
              << "       scanbound version" << std::endl;
}

int RunScan(int argc, char** argv) {
    const auto command = scanbound::cli::ParseScanCommand(std::vector<std::string>(argv + 2, argv + argc));
    if (!command) {
        PrintUsage();
        return 1;
    }
    return scanbound::cli::RunScan(*command, scanbound::config::LoadConfig(), argv[0], std::cin, std::cout);
}

int PrintConfig() {
    const auto config = scanbound::config::LoadConfig();
    nlohmann::json scan = {
        {"maxExecutionTimeMs", scanbound::scan::ResolveTimeoutMs(std::nullopt, config.scan.max_execution_time_ms)},
        {"workerPath", config.scan.worker_path},
        {"workerArgs", config.scan.worker_args},
        {"gracePeriodMs", config.scan.grace_period_ms},
        {"pollIntervalMs", config.scan.poll_interval_ms},
        {"simulatedDelayMs", config.scan.simulated_delay_ms},
        {"maxMessageBytes", config.scan.max_message_bytes}
    };
    std::cout << nlohmann::json{{"configPath", scanbound::config::DefaultConfigPath().string()},
                                {"scan", scan}}.dump(2)
              << std::endl;
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc >= 2 && std::string(argv[1]) == "scan") {
        return RunScan(argc, argv);
    }
    if (argc >= 2 && std::string(argv[1]) == "config") {
        return PrintConfig();
    }
    if (argc >= 2 && std::string(argv[1]) == "version") {
        std::cout << "scanbound " << kVersion << std::endl;
        return 0;
    }
    PrintUsage();
    return 1;
}
