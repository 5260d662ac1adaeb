/**
 * @file AppServices.hpp
 * @brief Container for application-level services to facilitate dependency injection.
 */

#pragma once

#include <memory>
#include "application/CredentialService.hpp"
#include "application/ExportJobManager.hpp"
#include "application/ExportJobRegistry.hpp"
#include "application/ExportPipeline.hpp"
#include "application/PublishService.hpp"
#include "domain/SecretStore.hpp"

namespace shipwright::application {

/**
 * Destruction order matters: the job manager references the registry and the pipeline,
 * and the adapters reference the credential service.
 */
struct AppServices {
    std::shared_ptr<domain::SecretStore> secretStore;
    std::unique_ptr<CredentialService> credentialService;
    std::unique_ptr<ExportJobRegistry> jobRegistry;
    std::unique_ptr<ExportPipeline> exportPipeline;
    std::unique_ptr<ExportJobManager> jobManager;
    std::unique_ptr<PublishService> publishService;
};

} // namespace shipwright::application
