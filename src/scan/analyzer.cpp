#include "scan/analyzer.hpp"

#include <chrono>
#include <exception>
#include <thread>
#include <utility>

namespace scanbound::scan {

Analyzer MakePlaceholderAnalyzer(std::chrono::milliseconds simulated_delay) {
    return [simulated_delay](const std::string& contract_code, const std::string& scan_id) {
        const auto started = std::chrono::steady_clock::now();
        if (simulated_delay.count() > 0) {
            std::this_thread::sleep_for(simulated_delay);
        }
        ScanResult result{};
        result.scan_id = scan_id;
        result.status = ScanStatus::Completed;
        result.execution_time_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started).count();
        ScanMetadata metadata{};
        metadata.contract_size = contract_code.size();
        result.metadata = metadata;
        return result;
    };
}

ScanOutcome RunAnalyzer(const Analyzer& analyzer,
                        const std::string& contract_code,
                        const std::string& scan_id) {
    if (!analyzer) {
        return ScanOutcome::Faulted(scan_id, "No analyzer configured");
    }
    try {
        return ScanOutcome::Completed(analyzer(contract_code, scan_id));
    } catch (const ScanException& ex) {
        auto error = ex.Error();
        if (error.scan_id.empty()) {
            error.scan_id = scan_id;
        }
        if (error.code == ScanErrorCode::Timeout) {
            return ScanOutcome::TimedOut(std::move(error));
        }
        return ScanOutcome::Faulted(scan_id, error.message);
    } catch (const std::exception& ex) {
        return ScanOutcome::Faulted(scan_id, ex.what());
    } catch (...) {
        return ScanOutcome::Faulted(scan_id, "Unknown scan error");
    }
}

}  // namespace scanbound::scan
