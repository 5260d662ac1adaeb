/**
 * @file NetlifyExportAdapter.hpp
 * @brief Triggers a Netlify site build with a stored bearer token.
 */

#pragma once

#include <string>
#include "application/CredentialService.hpp"
#include "application/export/ExportAdapter.hpp"
#include "infrastructure/WebhookClient.hpp"

namespace shipwright::application {

inline constexpr const char* kNetlifyApiBase = "https://api.netlify.com";

class NetlifyExportAdapter : public ExportAdapter {
public:
    /** @param apiBase Scheme, host and optional port of the Netlify API. */
    NetlifyExportAdapter(const CredentialService& credentials,
                         std::string apiBase = kNetlifyApiBase,
                         infrastructure::WebhookClient client = infrastructure::WebhookClient());

    domain::ExportTarget target() const override { return domain::ExportTarget::Netlify; }
    domain::ErrorCode failureCode() const override { return domain::ErrorCode::NetlifyFailed; }

    std::string run(const domain::ProjectConfig& config, ExportContext& context) override;

private:
    const CredentialService& m_credentials;
    std::string m_apiBase;
    infrastructure::WebhookClient m_client;
};

} // namespace shipwright::application
