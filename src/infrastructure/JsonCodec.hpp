/**
 * @file JsonCodec.hpp
 * @brief camelCase JSON encoding of export events and publish/deploy results.
 *
 * Absent optionals are omitted rather than written as null.
 */

#pragma once

#include <nlohmann/json.hpp>
#include "domain/ExportTypes.hpp"
#include "domain/PublishTypes.hpp"

namespace shipwright::infrastructure {

class JsonCodec {
public:
    static nlohmann::json ToJson(const domain::ExportLog& log);
    static nlohmann::json ToJson(const domain::ExportError& error);
    static nlohmann::json ToJson(const domain::ExportResponse& response);
    static nlohmann::json ToJson(const domain::ExportProgress& progress);
    static nlohmann::json ToJson(const domain::ExportFinished& finished);
    static nlohmann::json ToJson(const domain::PublishResponse& response);
    static nlohmann::json ToJson(const domain::DeployResponse& response);

    /** @brief {"event": name, "payload": payload} as one line. */
    static std::string EventLine(const std::string& name, const nlohmann::json& payload);
};

} // namespace shipwright::infrastructure
