#include "application/export/ExportContext.hpp"
#include "domain/ExportFailure.hpp"

namespace shipwright::application {

using namespace shipwright::domain;

ExportContext::ExportContext(std::string jobId,
                             ExportRequest request,
                             const std::atomic<bool>& cancel,
                             ProgressFn onProgress)
    : m_jobId(std::move(jobId)),
      m_request(std::move(request)),
      m_documentPath(m_request.filePath),
      m_cancel(cancel),
      m_onProgress(std::move(onProgress)) {}

void ExportContext::checkpoint() const {
    if (isCancelled()) {
        throw ExportFailure(ErrorCode::ExportCancelled, "Export cancelled");
    }
}

void ExportContext::info(const std::string& message, std::optional<std::string> detail) {
    m_logs.push_back(ExportLog{LogLevel::Info, message, std::move(detail)});
}

void ExportContext::warn(const std::string& message, std::optional<std::string> detail) {
    m_logs.push_back(ExportLog{LogLevel::Warn, message, std::move(detail)});
}

void ExportContext::reportProgress(std::uint64_t sentBytes, std::uint64_t totalBytes) const {
    if (!m_onProgress) {
        return;
    }
    m_onProgress(ExportProgress{m_jobId, sentBytes, totalBytes, ComputePercent(sentBytes, totalBytes)});
}

} // namespace shipwright::application
