#include "cli/scan_command.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>

#include "nlohmann/json.hpp"
#include "scan/analyzer.hpp"
#include "scan/deadline_policy.hpp"
#include "scan/scan_json.hpp"
#include "scan/scan_service.hpp"
#include "scan/worker_scan_service.hpp"

namespace scanbound::cli {
namespace {

// A bare worker name prefers the binary installed next to this one.
std::string ResolveWorkerPath(const std::string& configured, const char* argv0) {
    if (configured.find('/') != std::string::npos || argv0 == nullptr) {
        return configured;
    }
    std::error_code ec;
    const auto self = std::filesystem::canonical(argv0, ec);
    if (ec) {
        return configured;
    }
    const auto sibling = self.parent_path() / configured;
    if (std::filesystem::exists(sibling, ec)) {
        return sibling.string();
    }
    return configured;
}

int PrintInvalidInput(const std::string& message, std::ostream& out) {
    scanbound::scan::ScanError error{};
    error.code = scanbound::scan::ScanErrorCode::InvalidInput;
    error.message = message;
    out << nlohmann::json{{"error", scanbound::scan::BuildErrorJson(error)}}.dump(2) << std::endl;
    return 1;
}

}  // namespace

std::optional<ScanCommand> ParseScanCommand(const std::vector<std::string>& args) {
    ScanCommand command{};
    for (std::size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];
        if (arg == "--isolated") {
            command.isolated = true;
        } else if (arg == "--timeout-ms" && i + 1 < args.size()) {
            command.timeout_ms = scanbound::scan::ParseTimeoutMs(args[++i]);
        } else if (arg == "--scan-id" && i + 1 < args.size()) {
            command.scan_id = args[++i];
        } else if (command.source.empty() && (arg == "-" || arg.rfind("--", 0) != 0)) {
            command.source = arg;
        } else {
            std::cerr << "Unknown argument: " << arg << std::endl;
            return std::nullopt;
        }
    }
    if (command.source.empty()) {
        return std::nullopt;
    }
    return command;
}

std::optional<std::string> ReadSource(const std::string& source, std::istream& input) {
    if (source == "-") {
        return std::string(std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>());
    }
    std::ifstream file(source, std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

int ExitCodeFor(scanbound::scan::OutcomeKind kind) {
    switch (kind) {
        case scanbound::scan::OutcomeKind::Completed:
            return 0;
        case scanbound::scan::OutcomeKind::TimedOut:
            return 2;
        case scanbound::scan::OutcomeKind::Faulted:
            return 1;
    }
    return 1;
}

int RunScan(const ScanCommand& command,
            scanbound::config::Config config,
            const char* argv0,
            std::istream& input,
            std::ostream& out) {
    const auto contract_code = ReadSource(command.source, input);
    if (!contract_code) {
        return PrintInvalidInput("Unable to read contract code from " + command.source, out);
    }
    if (contract_code->empty()) {
        return PrintInvalidInput("contractCode cannot be empty", out);
    }

    std::cerr << "[cli] Received scan request (code length: " << contract_code->size() << " chars)" << std::endl;

    scanbound::scan::ScanOptions options{};
    options.timeout_ms = command.timeout_ms;
    options.scan_id = command.scan_id;

    scanbound::scan::ScanOutcome outcome{};
    if (command.isolated) {
        config.scan.worker_path = ResolveWorkerPath(config.scan.worker_path, argv0);
        scanbound::scan::WorkerScanService service(config.scan);
        outcome = service.ExecuteScanInWorker(*contract_code, options).get();
    } else {
        scanbound::scan::ScanService service(
            config.scan,
            scanbound::scan::MakePlaceholderAnalyzer(std::chrono::milliseconds(config.scan.simulated_delay_ms)));
        outcome = service.ExecuteScan(*contract_code, options).get();
    }

    out << scanbound::scan::BuildOutcomeJson(outcome).dump(2) << std::endl;
    return ExitCodeFor(outcome.kind);
}

}  // namespace scanbound::cli
