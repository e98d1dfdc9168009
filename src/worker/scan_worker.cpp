// Execution unit for WorkerScanService: reads the contract code on stdin,
// runs the analyzer and writes exactly one JSON message line on stdout.

#include <chrono>
#include <iostream>
#include <iterator>
#include <string>

#include "config/config_loader.hpp"
#include "scan/analyzer.hpp"
#include "scan/scan_json.hpp"

namespace {

std::string ReadAll(std::istream& input) {
    return std::string(std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>());
}

}  // namespace

int main(int argc, char** argv) {
    std::string scan_id;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--scan-id" && i + 1 < argc) {
            scan_id = argv[++i];
        }
    }
    if (scan_id.empty()) {
        std::cerr << "usage: scanbound-worker --scan-id <id> < contract" << std::endl;
        scanbound::scan::ScanError error{};
        error.message = "Worker started without a scan id";
        std::cout << scanbound::scan::EncodeWorkerError(error) << std::endl;
        return 2;
    }

    const auto config = scanbound::config::LoadConfig();
    const auto contract_code = ReadAll(std::cin);

    const auto analyzer = scanbound::scan::MakePlaceholderAnalyzer(
        std::chrono::milliseconds(config.scan.simulated_delay_ms));
    const auto outcome = scanbound::scan::RunAnalyzer(analyzer, contract_code, scan_id);

    if (outcome.Ok()) {
        std::cout << scanbound::scan::EncodeWorkerResult(outcome.result) << std::endl;
    } else {
        std::cerr << "[worker] scan " << scan_id << " failed: " << outcome.error.message << std::endl;
        std::cout << scanbound::scan::EncodeWorkerError(outcome.error) << std::endl;
    }
    return 0;
}
