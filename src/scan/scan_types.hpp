#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace scanbound::scan {

enum class FindingSeverity {
    Error,
    Warning,
    Info
};

struct FindingLocation {
    int line = 0;
    int column = 0;
    std::string file;
};

struct ScanFinding {
    std::string rule_id;
    FindingSeverity severity = FindingSeverity::Info;
    std::string message;
    std::optional<FindingLocation> location;
    std::string suggestion;
};

struct ScanMetadata {
    std::optional<std::size_t> contract_size;
    std::vector<std::string> rules_applied;
};

enum class ScanStatus {
    Completed,
    Failed,
    Timeout
};

// What the analysis engine hands back for one contract.
struct ScanResult {
    std::string scan_id;
    ScanStatus status = ScanStatus::Completed;
    std::vector<ScanFinding> findings;
    long long execution_time_ms = 0;
    std::optional<ScanMetadata> metadata;
};

enum class ScanErrorCode {
    Timeout,
    Error,
    InvalidInput
};

struct ScanError {
    ScanErrorCode code = ScanErrorCode::Error;
    std::string message;
    std::string scan_id;
    std::optional<long long> timeout_ms;
};

// Thrown by work functions that want to report an already classified error.
class ScanException : public std::runtime_error {
public:
    explicit ScanException(ScanError error);

    const ScanError& Error() const { return error_; }

private:
    ScanError error_;
};

// Per-call knobs; both fields are optional.
struct ScanOptions {
    std::optional<long long> timeout_ms;
    std::string scan_id;
};

enum class OutcomeKind {
    Completed,
    TimedOut,
    Faulted
};

// Terminal result of one job. Exactly one of `result` / `error` is meaningful,
// selected by `kind`.
struct ScanOutcome {
    OutcomeKind kind = OutcomeKind::Faulted;
    ScanResult result;
    ScanError error;

    bool Ok() const { return kind == OutcomeKind::Completed; }

    static ScanOutcome Completed(ScanResult result);
    static ScanOutcome TimedOut(ScanError error);
    static ScanOutcome TimedOut(const std::string& scan_id,
                                long long timeout_ms,
                                const std::string& message);
    static ScanOutcome Faulted(const std::string& scan_id, const std::string& message);
};

const char* ScanErrorCodeToString(ScanErrorCode code);
std::optional<ScanErrorCode> ScanErrorCodeFromString(const std::string& value);
const char* ScanStatusToString(ScanStatus status);
ScanStatus ScanStatusFromString(const std::string& value);
const char* FindingSeverityToString(FindingSeverity severity);
FindingSeverity FindingSeverityFromString(const std::string& value);
const char* OutcomeKindToString(OutcomeKind kind);

}  // namespace scanbound::scan
