#include "infrastructure/JsonCodec.hpp"

namespace shipwright::infrastructure {

using json = nlohmann::json;
using namespace shipwright::domain;

json JsonCodec::ToJson(const ExportLog& log) {
    json j;
    j["level"] = LogLevelToString(log.level);
    j["message"] = log.message;
    if (log.detail) {
        j["detail"] = *log.detail;
    }
    return j;
}

json JsonCodec::ToJson(const ExportError& error) {
    json j;
    j["code"] = ErrorCodeToString(error.code);
    j["message"] = error.message;
    if (error.detail) {
        j["detail"] = *error.detail;
    }
    return j;
}

json JsonCodec::ToJson(const ExportResponse& response) {
    json j;
    j["ok"] = response.ok;
    j["summary"] = response.summary;
    j["logs"] = json::array();
    for (const auto& log : response.logs) {
        j["logs"].push_back(ToJson(log));
    }
    if (response.error) {
        j["error"] = ToJson(*response.error);
    }
    return j;
}

json JsonCodec::ToJson(const ExportProgress& progress) {
    return {
        {"jobId", progress.jobId},
        {"sentBytes", progress.sentBytes},
        {"totalBytes", progress.totalBytes},
        {"percent", progress.percent}
    };
}

json JsonCodec::ToJson(const ExportFinished& finished) {
    return {
        {"jobId", finished.jobId},
        {"response", ToJson(finished.response)}
    };
}

json JsonCodec::ToJson(const PublishResponse& response) {
    return {
        {"ok", response.ok},
        {"summary", response.summary},
        {"warnings", response.warnings}
    };
}

json JsonCodec::ToJson(const DeployResponse& response) {
    return {
        {"ok", response.ok},
        {"summary", response.summary},
        {"logs", response.logs}
    };
}

std::string JsonCodec::EventLine(const std::string& name, const json& payload) {
    json j;
    j["event"] = name;
    j["payload"] = payload;
    return j.dump();
}

} // namespace shipwright::infrastructure
