#include "application/ExportJobManager.hpp"
#include <iostream>
#include <thread>
#include <uuid/uuid.h>

namespace shipwright::application {

using namespace shipwright::domain;

ExportJobManager::ExportJobManager(ExportJobRegistry& registry,
                                   const ExportPipeline& pipeline,
                                   ExportEventSink& sink,
                                   TaskLauncher launcher)
    : m_registry(registry), m_pipeline(pipeline), m_sink(sink), m_launcher(std::move(launcher)) {}

ExportJobManager::TaskLauncher ExportJobManager::DetachedThreadLauncher() {
    return [](Task task) {
        std::thread(std::move(task)).detach();
    };
}

std::string ExportJobManager::NewJobId() {
    uuid_t uuid;
    uuid_generate_random(uuid);
    char text[37];
    uuid_unparse_lower(uuid, text);
    return std::string(text);
}

std::string ExportJobManager::submit(const ExportRequest& request) {
    std::string jobId = NewJobId();
    auto cancel = std::make_shared<std::atomic<bool>>(false);
    m_registry.insert(jobId, cancel);

    std::cout << "[ExportJobManager] Job " << jobId << " submitted (" << TargetToString(request.target)
              << ", " << request.filePath << ")" << std::endl;

    m_launcher([this, jobId, request, cancel]() {
        runJob(jobId, request, cancel);
    });
    return jobId;
}

void ExportJobManager::runJob(const std::string& jobId,
                              const ExportRequest& request,
                              const ExportJobRegistry::CancelFlag& cancel) {
    ExportContext context(jobId, request, *cancel, [this](const ExportProgress& progress) {
        try {
            m_sink.onProgress(progress);
        } catch (const std::exception& e) {
            std::cerr << "[ExportJobManager] Progress sink failed: " << e.what() << std::endl;
        }
    });

    ExportFinished finished{jobId, m_pipeline.run(context)};

    if (finished.response.ok) {
        std::cout << "[ExportJobManager] Job " << jobId << " finished (ok): " << finished.response.summary << std::endl;
    } else {
        std::cerr << "[ExportJobManager] Job " << jobId << " finished (failed): " << finished.response.summary << std::endl;
    }

    try {
        m_sink.onFinished(finished);
    } catch (const std::exception& e) {
        std::cerr << "[ExportJobManager] Finished sink failed: " << e.what() << std::endl;
    }
}

void ExportJobManager::cancel(const std::string& jobId) {
    m_registry.cancel(jobId);
    std::cout << "[ExportJobManager] Job " << jobId << " cancellation requested" << std::endl;
}

void ExportJobManager::cleanup(const std::string& jobId) {
    m_registry.remove(jobId);
}

} // namespace shipwright::application
