#pragma once

#include <optional>
#include <string>

#include "nlohmann/json.hpp"
#include "scan/scan_types.hpp"

namespace scanbound::scan {

nlohmann::json BuildResultJson(const ScanResult& result);
nlohmann::json BuildErrorJson(const ScanError& error);
nlohmann::json BuildOutcomeJson(const ScanOutcome& outcome);

ScanResult ParseResultJson(const nlohmann::json& json);

// Messages a worker process writes on stdout, one JSON object per line.
enum class WorkerMessageType {
    Result,
    Error
};

struct WorkerMessage {
    WorkerMessageType type = WorkerMessageType::Error;
    ScanResult result;
    // Carries the worker's own classification; SCAN_ERROR when it sent none.
    ScanError error;
};

std::string EncodeWorkerResult(const ScanResult& result);
std::string EncodeWorkerError(const ScanError& error);
std::optional<WorkerMessage> DecodeWorkerMessage(const std::string& line);

}  // namespace scanbound::scan
