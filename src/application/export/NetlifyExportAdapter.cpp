#include "application/export/NetlifyExportAdapter.hpp"
#include "domain/ExportFailure.hpp"
#include "infrastructure/TextUtils.hpp"

namespace shipwright::application {

using namespace shipwright::domain;
using infrastructure::TextUtils;
using infrastructure::WebhookError;

NetlifyExportAdapter::NetlifyExportAdapter(const CredentialService& credentials,
                                           std::string apiBase,
                                           infrastructure::WebhookClient client)
    : m_credentials(credentials), m_apiBase(std::move(apiBase)), m_client(std::move(client)) {
    while (!m_apiBase.empty() && m_apiBase.back() == '/') {
        m_apiBase.pop_back();
    }
}

std::string NetlifyExportAdapter::run(const ProjectConfig& config, ExportContext& context) {
    if (!config.netlify || !config.netlify->enabled) {
        throw ExportFailure(ErrorCode::TargetDisabled, "Netlify export is disabled");
    }
    const NetlifySection& section = *config.netlify;
    if (!section.triggerDeploy) {
        throw ExportFailure(ErrorCode::TargetDisabled, "Netlify deploy trigger disabled");
    }

    context.checkpoint();

    std::string siteId = TextUtils::Trim(section.siteId.value_or(""));
    if (siteId.empty()) {
        throw ExportFailure(ErrorCode::ConfigInvalid, "Invalid Netlify configuration", std::string("site_id missing"));
    }
    if (siteId.find_first_of("/?#% \t") != std::string::npos) {
        throw ExportFailure(ErrorCode::ConfigInvalid, "Invalid Netlify configuration",
                            "site_id contains reserved URL characters: " + siteId);
    }

    std::optional<std::string> token;
    try {
        token = m_credentials.get(context.request().filePath, CredentialTarget::Netlify,
                                  context.request().profile, CredentialKind::Token);
    } catch (const CredentialError& e) {
        throw ExportFailure(ErrorCode::NetlifyFailed, "Unable to access credential storage", std::string(e.what()));
    }
    if (!token) {
        throw ExportFailure(ErrorCode::NetlifyMissingToken, "Netlify token missing (set in app)");
    }

    context.checkpoint();

    std::string url = m_apiBase + "/api/v1/sites/" + siteId + "/builds";
    context.info("Triggering Netlify deploy", siteId);

    infrastructure::WebhookResponse response;
    try {
        response = m_client.post(url, {{"Authorization", "Bearer " + *token}});
    } catch (const WebhookError& e) {
        throw ExportFailure(ErrorCode::NetlifyFailed, "Netlify deploy failed", std::string(e.what()));
    }
    if (!response.isSuccess()) {
        throw ExportFailure(ErrorCode::NetlifyFailed, "Netlify deploy failed", response.failureDetail());
    }
    return "Netlify deploy triggered";
}

} // namespace shipwright::application
