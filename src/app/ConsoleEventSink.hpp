/**
 * @file ConsoleEventSink.hpp
 * @brief Prints export events as JSON lines and lets the host wait for completion.
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <optional>
#include <ostream>
#include "domain/ExportEventSink.hpp"

namespace shipwright::app {

class ConsoleEventSink : public domain::ExportEventSink {
public:
    explicit ConsoleEventSink(std::ostream& out);

    void onProgress(const domain::ExportProgress& progress) override;
    void onFinished(const domain::ExportFinished& finished) override;

    /** @brief Blocks until the job finishes or the timeout expires. */
    std::optional<domain::ExportFinished> waitFor(const std::string& jobId, std::chrono::milliseconds timeout);

private:
    std::ostream& m_out;
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::map<std::string, domain::ExportFinished> m_finished;
};

} // namespace shipwright::app
