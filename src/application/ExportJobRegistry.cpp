#include "application/ExportJobRegistry.hpp"

namespace shipwright::application {

void ExportJobRegistry::insert(const std::string& jobId, CancelFlag cancel) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_jobs[jobId] = std::move(cancel);
}

void ExportJobRegistry::cancel(const std::string& jobId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_jobs.find(jobId);
    if (it == m_jobs.end()) {
        throw UnknownJobError("Unknown export job");
    }
    it->second->store(true);
}

void ExportJobRegistry::remove(const std::string& jobId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_jobs.erase(jobId);
}

bool ExportJobRegistry::contains(const std::string& jobId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_jobs.count(jobId) > 0;
}

std::size_t ExportJobRegistry::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_jobs.size();
}

} // namespace shipwright::application
