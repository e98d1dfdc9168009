#pragma once

#include <chrono>
#include <functional>
#include <string>

#include "scan/scan_types.hpp"

namespace scanbound::scan {

// The analysis engine, treated as a black box. It may block for as long as it
// likes and may throw; it is never asked to cooperate with cancellation.
using Analyzer = std::function<ScanResult(const std::string& contract_code,
                                          const std::string& scan_id)>;

// Stand-in engine until the rule engine is wired in: waits `simulated_delay`
// and reports a clean scan.
Analyzer MakePlaceholderAnalyzer(std::chrono::milliseconds simulated_delay);

// Invokes the analyzer and folds whatever it throws into an outcome. A
// ScanException coded SCAN_TIMEOUT comes back as TimedOut, unchanged.
ScanOutcome RunAnalyzer(const Analyzer& analyzer,
                        const std::string& contract_code,
                        const std::string& scan_id);

}  // namespace scanbound::scan
