/**
 * @file VercelExportAdapter.hpp
 * @brief Triggers a Vercel deploy hook.
 */

#pragma once

#include "application/export/ExportAdapter.hpp"
#include "infrastructure/WebhookClient.hpp"

namespace shipwright::application {

inline constexpr const char* kEnvironmentHeader = "X-Shipwright-Environment";

/**
 * @class VercelExportAdapter
 * @brief POSTs to the configured deploy hook URL. The hook URL itself is the secret,
 *        so no stored credential is needed.
 */
class VercelExportAdapter : public ExportAdapter {
public:
    explicit VercelExportAdapter(infrastructure::WebhookClient client = infrastructure::WebhookClient());

    domain::ExportTarget target() const override { return domain::ExportTarget::Vercel; }
    domain::ErrorCode failureCode() const override { return domain::ErrorCode::VercelFailed; }

    std::string run(const domain::ProjectConfig& config, ExportContext& context) override;

private:
    infrastructure::WebhookClient m_client;
};

} // namespace shipwright::application
