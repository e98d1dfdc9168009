#pragma once

#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "config/config_schema.hpp"
#include "scan/scan_types.hpp"

namespace scanbound::cli {

struct ScanCommand {
    bool isolated = false;
    std::optional<long long> timeout_ms;
    std::string scan_id;
    std::string source;
};

// Arguments after "scan". A malformed --timeout-ms is dropped so the
// configured default applies.
std::optional<ScanCommand> ParseScanCommand(const std::vector<std::string>& args);

// "-" reads `input`; anything else is a file path.
std::optional<std::string> ReadSource(const std::string& source, std::istream& input);

// 0 completed, 2 timed out, 1 faulted.
int ExitCodeFor(scanbound::scan::OutcomeKind kind);

// Validates the source, runs the scan and prints the outcome JSON to `out`.
// Invalid input prints an INVALID_INPUT error and returns 1.
int RunScan(const ScanCommand& command,
            scanbound::config::Config config,
            const char* argv0,
            std::istream& input,
            std::ostream& out);

}  // namespace scanbound::cli
