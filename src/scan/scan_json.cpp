#include "scan/scan_json.hpp"

namespace scanbound::scan {
namespace {

nlohmann::json BuildFindingJson(const ScanFinding& finding) {
    nlohmann::json json = {
        {"ruleId", finding.rule_id},
        {"severity", FindingSeverityToString(finding.severity)},
        {"message", finding.message}
    };
    if (finding.location.has_value()) {
        nlohmann::json location = {
            {"line", finding.location->line},
            {"column", finding.location->column}
        };
        if (!finding.location->file.empty()) {
            location["file"] = finding.location->file;
        }
        json["location"] = location;
    }
    if (!finding.suggestion.empty()) {
        json["suggestion"] = finding.suggestion;
    }
    return json;
}

ScanFinding ParseFindingJson(const nlohmann::json& json) {
    ScanFinding finding{};
    if (!json.is_object()) {
        return finding;
    }
    if (json.contains("ruleId") && json["ruleId"].is_string()) {
        finding.rule_id = json["ruleId"].get<std::string>();
    }
    if (json.contains("severity") && json["severity"].is_string()) {
        finding.severity = FindingSeverityFromString(json["severity"].get<std::string>());
    }
    if (json.contains("message") && json["message"].is_string()) {
        finding.message = json["message"].get<std::string>();
    }
    if (json.contains("location") && json["location"].is_object()) {
        const auto& location = json["location"];
        FindingLocation parsed{};
        if (location.contains("line") && location["line"].is_number_integer()) {
            parsed.line = location["line"].get<int>();
        }
        if (location.contains("column") && location["column"].is_number_integer()) {
            parsed.column = location["column"].get<int>();
        }
        if (location.contains("file") && location["file"].is_string()) {
            parsed.file = location["file"].get<std::string>();
        }
        finding.location = parsed;
    }
    if (json.contains("suggestion") && json["suggestion"].is_string()) {
        finding.suggestion = json["suggestion"].get<std::string>();
    }
    return finding;
}

}  // namespace

nlohmann::json BuildResultJson(const ScanResult& result) {
    nlohmann::json findings = nlohmann::json::array();
    for (const auto& finding : result.findings) {
        findings.push_back(BuildFindingJson(finding));
    }
    nlohmann::json json = {
        {"scanId", result.scan_id},
        {"status", ScanStatusToString(result.status)},
        {"findings", findings},
        {"executionTime", result.execution_time_ms}
    };
    if (result.metadata.has_value()) {
        nlohmann::json metadata = nlohmann::json::object();
        if (result.metadata->contract_size.has_value()) {
            metadata["contractSize"] = *result.metadata->contract_size;
        }
        if (!result.metadata->rules_applied.empty()) {
            metadata["rulesApplied"] = result.metadata->rules_applied;
        }
        json["metadata"] = metadata;
    }
    return json;
}

nlohmann::json BuildErrorJson(const ScanError& error) {
    nlohmann::json json = {
        {"code", ScanErrorCodeToString(error.code)},
        {"message", error.message}
    };
    if (!error.scan_id.empty()) {
        json["scanId"] = error.scan_id;
    }
    if (error.timeout_ms.has_value()) {
        json["timeoutMs"] = *error.timeout_ms;
    }
    return json;
}

nlohmann::json BuildOutcomeJson(const ScanOutcome& outcome) {
    nlohmann::json json = {{"outcome", OutcomeKindToString(outcome.kind)}};
    if (outcome.Ok()) {
        json["result"] = BuildResultJson(outcome.result);
    } else {
        json["error"] = BuildErrorJson(outcome.error);
    }
    return json;
}

ScanResult ParseResultJson(const nlohmann::json& json) {
    ScanResult result{};
    if (!json.is_object()) {
        return result;
    }
    if (json.contains("scanId") && json["scanId"].is_string()) {
        result.scan_id = json["scanId"].get<std::string>();
    }
    if (json.contains("status") && json["status"].is_string()) {
        result.status = ScanStatusFromString(json["status"].get<std::string>());
    }
    if (json.contains("findings") && json["findings"].is_array()) {
        for (const auto& item : json["findings"]) {
            result.findings.push_back(ParseFindingJson(item));
        }
    }
    if (json.contains("executionTime") && json["executionTime"].is_number_integer()) {
        result.execution_time_ms = json["executionTime"].get<long long>();
    }
    if (json.contains("metadata") && json["metadata"].is_object()) {
        const auto& metadata = json["metadata"];
        ScanMetadata parsed{};
        if (metadata.contains("contractSize") && metadata["contractSize"].is_number_unsigned()) {
            parsed.contract_size = metadata["contractSize"].get<std::size_t>();
        }
        if (metadata.contains("rulesApplied") && metadata["rulesApplied"].is_array()) {
            for (const auto& rule : metadata["rulesApplied"]) {
                if (rule.is_string()) {
                    parsed.rules_applied.push_back(rule.get<std::string>());
                }
            }
        }
        result.metadata = parsed;
    }
    return result;
}

std::string EncodeWorkerResult(const ScanResult& result) {
    const nlohmann::json json = {
        {"type", "result"},
        {"result", BuildResultJson(result)}
    };
    return json.dump();
}

// {"type":"error","code":...,"message":...,"scanId":...,"timeoutMs":...}
std::string EncodeWorkerError(const ScanError& error) {
    nlohmann::json json = BuildErrorJson(error);
    json["type"] = "error";
    return json.dump();
}

std::optional<WorkerMessage> DecodeWorkerMessage(const std::string& line) {
    const auto data = nlohmann::json::parse(line, nullptr, false);
    if (data.is_discarded() || !data.is_object()) {
        return std::nullopt;
    }
    if (!data.contains("type") || !data["type"].is_string()) {
        return std::nullopt;
    }
    const auto type = data["type"].get<std::string>();
    WorkerMessage message{};
    if (type == "result") {
        if (!data.contains("result") || !data["result"].is_object()) {
            return std::nullopt;
        }
        message.type = WorkerMessageType::Result;
        message.result = ParseResultJson(data["result"]);
        return message;
    }
    if (type == "error") {
        message.type = WorkerMessageType::Error;
        if (data.contains("message") && data["message"].is_string()) {
            message.error.message = data["message"].get<std::string>();
        } else {
            message.error.message = "Unknown error in worker";
        }
        if (data.contains("code") && data["code"].is_string()) {
            const auto code = ScanErrorCodeFromString(data["code"].get<std::string>());
            if (code.has_value()) {
                message.error.code = *code;
            }
        }
        if (data.contains("scanId") && data["scanId"].is_string()) {
            message.error.scan_id = data["scanId"].get<std::string>();
        }
        if (data.contains("timeoutMs") && data["timeoutMs"].is_number_integer()) {
            message.error.timeout_ms = data["timeoutMs"].get<long long>();
        }
        return message;
    }
    return std::nullopt;
}

}  // namespace scanbound::scan
