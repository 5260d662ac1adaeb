#include "application/export/VercelExportAdapter.hpp"
#include "domain/ExportFailure.hpp"
#include "infrastructure/TextUtils.hpp"

namespace shipwright::application {

using namespace shipwright::domain;
using infrastructure::TextUtils;
using infrastructure::WebhookError;

VercelExportAdapter::VercelExportAdapter(infrastructure::WebhookClient client)
    : m_client(std::move(client)) {}

std::string VercelExportAdapter::run(const ProjectConfig& config, ExportContext& context) {
    if (!config.vercel || !config.vercel->enabled) {
        throw ExportFailure(ErrorCode::TargetDisabled, "Vercel export is disabled");
    }
    const VercelSection& section = *config.vercel;

    std::string hookUrl = TextUtils::Trim(section.deployHookUrl.value_or(""));
    if (hookUrl.empty()) {
        throw ExportFailure(ErrorCode::ConfigInvalid, "Invalid Vercel configuration",
                            std::string("deploy_hook_url missing"));
    }

    context.checkpoint();

    std::string environment = VercelEnvironmentToString(section.environment);
    std::string projectName = section.projectName.value_or("vercel");
    context.info("Triggering Vercel deploy", projectName + " (" + environment + ")");

    infrastructure::WebhookResponse response;
    try {
        response = m_client.post(hookUrl, {{kEnvironmentHeader, environment}});
    } catch (const WebhookError& e) {
        throw ExportFailure(ErrorCode::VercelFailed, "Vercel deploy failed", std::string(e.what()));
    }
    if (!response.isSuccess()) {
        throw ExportFailure(ErrorCode::VercelFailed, "Vercel deploy failed", response.failureDetail());
    }
    return "Vercel deploy triggered";
}

} // namespace shipwright::application
