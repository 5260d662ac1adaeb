/**
 * @file ExportContext.hpp
 * @brief Per-job state threaded through the export pipeline and its adapters.
 */

#pragma once

#include <atomic>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "domain/ExportTypes.hpp"

namespace shipwright::application {

/**
 * @class ExportContext
 * @brief Request, cancellation flag, accumulated log trail and progress channel of one job.
 *
 * The cancellation flag is observed, not owned. Logs only ever grow.
 */
class ExportContext {
public:
    using ProgressFn = std::function<void(const domain::ExportProgress&)>;

    ExportContext(std::string jobId,
                  domain::ExportRequest request,
                  const std::atomic<bool>& cancel,
                  ProgressFn onProgress = nullptr);

    const std::string& jobId() const { return m_jobId; }
    const domain::ExportRequest& request() const { return m_request; }
    const std::filesystem::path& documentPath() const { return m_documentPath; }

    const std::filesystem::path& projectRoot() const { return m_projectRoot; }
    void setProjectRoot(const std::filesystem::path& root) { m_projectRoot = root; }

    const std::atomic<bool>& cancelFlag() const { return m_cancel; }
    bool isCancelled() const { return m_cancel.load(); }

    /** @brief Cancellation checkpoint. @throws domain::ExportFailure (ExportCancelled) */
    void checkpoint() const;

    void info(const std::string& message, std::optional<std::string> detail = std::nullopt);
    void warn(const std::string& message, std::optional<std::string> detail = std::nullopt);

    /** @brief Forwards a transfer progress sample, tagged with this job's id. */
    void reportProgress(std::uint64_t sentBytes, std::uint64_t totalBytes) const;

    std::vector<domain::ExportLog> takeLogs() { return std::move(m_logs); }

private:
    std::string m_jobId;
    domain::ExportRequest m_request;
    std::filesystem::path m_documentPath;
    std::filesystem::path m_projectRoot;
    const std::atomic<bool>& m_cancel;
    ProgressFn m_onProgress;
    std::vector<domain::ExportLog> m_logs;
};

} // namespace shipwright::application
