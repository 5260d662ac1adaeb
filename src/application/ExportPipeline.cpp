#include "application/ExportPipeline.hpp"
#include "domain/ExportFailure.hpp"
#include "infrastructure/ExportConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"
#include <iostream>

namespace shipwright::application {

namespace fs = std::filesystem;
using namespace shipwright::domain;
using infrastructure::ExportConfigLoader;
using infrastructure::PathUtils;

namespace {

ExportResponse Failure(const ExportError& error, std::vector<ExportLog> logs) {
    ExportResponse response;
    response.ok = false;
    response.summary = error.message;
    response.logs = std::move(logs);
    response.error = error;
    return response;
}

} // namespace

ExportPipeline::ExportPipeline(std::vector<std::unique_ptr<ExportAdapter>> adapters) {
    for (auto& adapter : adapters) {
        ExportTarget target = adapter->target();
        m_adapters[target] = std::move(adapter);
    }
}

std::string ExportPipeline::execute(ExportContext& context) const {
    context.checkpoint();

    std::error_code ec;
    if (!fs::exists(context.documentPath(), ec)) {
        throw ExportFailure(ErrorCode::FileMissing, "File does not exist");
    }

    auto root = PathUtils::FindProjectRoot(context.documentPath());
    if (!root) {
        throw ExportFailure(ErrorCode::ConfigMissing, "No .export.toml found in parent folders");
    }
    context.setProjectRoot(*root);

    context.info("Loading export configuration", (*root / kConfigFileName).string());
    ProjectConfig config = ExportConfigLoader::LoadFromRoot(*root);

    context.checkpoint();

    auto it = m_adapters.find(context.request().target);
    if (it == m_adapters.end()) {
        throw ExportFailure(ErrorCode::TargetDisabled,
                            "No exporter registered for " + TargetToString(context.request().target));
    }
    return it->second->run(config, context);
}

ExportResponse ExportPipeline::run(ExportContext& context) const {
    try {
        std::string summary = execute(context);
        ExportResponse response;
        response.ok = true;
        response.summary = std::move(summary);
        response.logs = context.takeLogs();
        return response;
    } catch (const ExportFailure& failure) {
        if (failure.code() == ErrorCode::ExportCancelled) {
            context.warn("Export cancelled");
        }
        return Failure(failure.toError(), context.takeLogs());
    } catch (const std::exception& e) {
        auto it = m_adapters.find(context.request().target);
        ErrorCode code = it != m_adapters.end() ? it->second->failureCode() : ErrorCode::ConfigInvalid;
        std::cerr << "[ExportPipeline] Unexpected error in job " << context.jobId() << ": " << e.what() << std::endl;
        return Failure(ExportError{code, "Export failed", std::string(e.what())}, context.takeLogs());
    }
}

} // namespace shipwright::application
