// ExportEventSink that records everything it receives.
#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <vector>
#include "domain/ExportEventSink.hpp"

namespace shipwright::test {

class RecordingEventSink : public domain::ExportEventSink {
public:
    void onProgress(const domain::ExportProgress& progress) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_progress.push_back(progress);
    }

    void onFinished(const domain::ExportFinished& finished) override {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_finished.push_back(finished);
        }
        m_cv.notify_all();
    }

    std::optional<domain::ExportFinished> waitFinished(const std::string& jobId,
                                                       std::chrono::milliseconds timeout = std::chrono::seconds(10)) {
        std::unique_lock<std::mutex> lock(m_mutex);
        std::optional<domain::ExportFinished> found;
        m_cv.wait_for(lock, timeout, [&] {
            for (const auto& f : m_finished) {
                if (f.jobId == jobId) {
                    found = f;
                    return true;
                }
            }
            return false;
        });
        return found;
    }

    std::vector<domain::ExportProgress> progress() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_progress;
    }

    std::size_t finishedCount(const std::string& jobId) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::size_t count = 0;
        for (const auto& f : m_finished) {
            if (f.jobId == jobId) ++count;
        }
        return count;
    }

private:
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::vector<domain::ExportProgress> m_progress;
    std::vector<domain::ExportFinished> m_finished;
};

} // namespace shipwright::test
