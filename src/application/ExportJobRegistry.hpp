/**
 * @file ExportJobRegistry.hpp
 * @brief Process-wide table of in-flight export jobs and their cancellation flags.
 */

#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

namespace shipwright::application {

class UnknownJobError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @class ExportJobRegistry
 * @brief Owned by the composition root and shared by reference.
 *
 * One mutex guards the map; every critical section is a single map operation and
 * no I/O happens while it is held. Entries are removed only by remove().
 */
class ExportJobRegistry {
public:
    using CancelFlag = std::shared_ptr<std::atomic<bool>>;

    void insert(const std::string& jobId, CancelFlag cancel);

    /** @throws UnknownJobError when the id is not registered. */
    void cancel(const std::string& jobId);

    /** @brief Removes the entry if present. */
    void remove(const std::string& jobId);

    bool contains(const std::string& jobId) const;
    std::size_t size() const;

private:
    mutable std::mutex m_mutex;
    std::map<std::string, CancelFlag> m_jobs;
};

} // namespace shipwright::application
