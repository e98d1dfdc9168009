#include "scan/scan_types.hpp"

#include <utility>

namespace scanbound::scan {

ScanException::ScanException(ScanError error)
    : std::runtime_error(error.message), error_(std::move(error)) {}

ScanOutcome ScanOutcome::Completed(ScanResult result) {
    ScanOutcome outcome{};
    outcome.kind = OutcomeKind::Completed;
    outcome.result = std::move(result);
    return outcome;
}

ScanOutcome ScanOutcome::TimedOut(ScanError error) {
    ScanOutcome outcome{};
    outcome.kind = OutcomeKind::TimedOut;
    outcome.error = std::move(error);
    outcome.error.code = ScanErrorCode::Timeout;
    return outcome;
}

ScanOutcome ScanOutcome::TimedOut(const std::string& scan_id,
                                  long long timeout_ms,
                                  const std::string& message) {
    ScanError error{};
    error.code = ScanErrorCode::Timeout;
    error.message = message;
    error.scan_id = scan_id;
    error.timeout_ms = timeout_ms;
    return TimedOut(std::move(error));
}

ScanOutcome ScanOutcome::Faulted(const std::string& scan_id, const std::string& message) {
    ScanOutcome outcome{};
    outcome.kind = OutcomeKind::Faulted;
    outcome.error.code = ScanErrorCode::Error;
    outcome.error.message = message;
    outcome.error.scan_id = scan_id;
    return outcome;
}

const char* ScanErrorCodeToString(ScanErrorCode code) {
    switch (code) {
        case ScanErrorCode::Timeout:
            return "SCAN_TIMEOUT";
        case ScanErrorCode::Error:
            return "SCAN_ERROR";
        case ScanErrorCode::InvalidInput:
            return "INVALID_INPUT";
    }
    return "SCAN_ERROR";
}

std::optional<ScanErrorCode> ScanErrorCodeFromString(const std::string& value) {
    if (value == "SCAN_TIMEOUT") {
        return ScanErrorCode::Timeout;
    }
    if (value == "SCAN_ERROR") {
        return ScanErrorCode::Error;
    }
    if (value == "INVALID_INPUT") {
        return ScanErrorCode::InvalidInput;
    }
    return std::nullopt;
}

const char* ScanStatusToString(ScanStatus status) {
    switch (status) {
        case ScanStatus::Completed:
            return "completed";
        case ScanStatus::Failed:
            return "failed";
        case ScanStatus::Timeout:
            return "timeout";
    }
    return "completed";
}

ScanStatus ScanStatusFromString(const std::string& value) {
    if (value == "failed") {
        return ScanStatus::Failed;
    }
    if (value == "timeout") {
        return ScanStatus::Timeout;
    }
    return ScanStatus::Completed;
}

const char* FindingSeverityToString(FindingSeverity severity) {
    switch (severity) {
        case FindingSeverity::Error:
            return "error";
        case FindingSeverity::Warning:
            return "warning";
        case FindingSeverity::Info:
            return "info";
    }
    return "info";
}

FindingSeverity FindingSeverityFromString(const std::string& value) {
    if (value == "error") {
        return FindingSeverity::Error;
    }
    if (value == "warning") {
        return FindingSeverity::Warning;
    }
    return FindingSeverity::Info;
}

const char* OutcomeKindToString(OutcomeKind kind) {
    switch (kind) {
        case OutcomeKind::Completed:
            return "completed";
        case OutcomeKind::TimedOut:
            return "timed_out";
        case OutcomeKind::Faulted:
            return "faulted";
    }
    return "faulted";
}

}  // namespace scanbound::scan
