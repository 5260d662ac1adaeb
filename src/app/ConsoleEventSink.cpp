#include "app/ConsoleEventSink.hpp"
#include "infrastructure/JsonCodec.hpp"

namespace shipwright::app {

using infrastructure::JsonCodec;

ConsoleEventSink::ConsoleEventSink(std::ostream& out)
    : m_out(out) {}

void ConsoleEventSink::onProgress(const domain::ExportProgress& progress) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_out << JsonCodec::EventLine("export:progress", JsonCodec::ToJson(progress)) << std::endl;
}

void ConsoleEventSink::onFinished(const domain::ExportFinished& finished) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_out << JsonCodec::EventLine("export:finished", JsonCodec::ToJson(finished)) << std::endl;
    m_finished[finished.jobId] = finished;
    // Notify under the lock: the waiter may destroy this sink as soon as it sees the entry.
    m_cv.notify_all();
}

std::optional<domain::ExportFinished> ConsoleEventSink::waitFor(const std::string& jobId,
                                                                std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(m_mutex);
    if (!m_cv.wait_for(lock, timeout, [&] { return m_finished.count(jobId) > 0; })) {
        return std::nullopt;
    }
    return m_finished[jobId];
}

} // namespace shipwright::app
