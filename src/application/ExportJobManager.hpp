/**
 * @file ExportJobManager.hpp
 * @brief Submits exports as background jobs and brokers cancel/cleanup requests.
 */

#pragma once

#include <functional>
#include <string>
#include "application/ExportJobRegistry.hpp"
#include "application/ExportPipeline.hpp"
#include "domain/ExportEventSink.hpp"

namespace shipwright::application {

/**
 * @class ExportJobManager
 * @brief Job lifecycle: Running -> {Completed, Cancelled}.
 *
 * submit() registers the job and returns its id without waiting for the export.
 * Each job emits zero or more progress events and then exactly one finished event.
 * Finished jobs stay registered until cleanup().
 */
class ExportJobManager {
public:
    using Task = std::function<void()>;
    using TaskLauncher = std::function<void(Task)>;

    ExportJobManager(ExportJobRegistry& registry,
                     const ExportPipeline& pipeline,
                     domain::ExportEventSink& sink,
                     TaskLauncher launcher = DetachedThreadLauncher());

    /** @return The new job id (UUID v4). */
    std::string submit(const domain::ExportRequest& request);

    /** @throws UnknownJobError for an unregistered id. */
    void cancel(const std::string& jobId);

    /** @brief Forgets the job. Safe to repeat and on unknown ids. */
    void cleanup(const std::string& jobId);

    /** @brief Runs each task on its own detached std::thread. */
    static TaskLauncher DetachedThreadLauncher();

    static std::string NewJobId();

private:
    void runJob(const std::string& jobId,
                const domain::ExportRequest& request,
                const ExportJobRegistry::CancelFlag& cancel);

    ExportJobRegistry& m_registry;
    const ExportPipeline& m_pipeline;
    domain::ExportEventSink& m_sink;
    TaskLauncher m_launcher;
};

} // namespace shipwright::application
