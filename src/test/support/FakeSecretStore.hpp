// In-memory SecretStore for tests.
#pragma once

#include <atomic>
#include <map>
#include <mutex>
#include <utility>
#include <vector>
#include "domain/SecretStore.hpp"

namespace shipwright::test {

class FakeSecretStore : public domain::SecretStore {
public:
    std::optional<std::string> read(const std::string& service, const std::string& key) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        failIfBroken();
        auto it = m_entries.find({service, key});
        if (it == m_entries.end()) return std::nullopt;
        return it->second;
    }

    void write(const std::string& service, const std::string& key, const std::string& value) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        failIfBroken();
        m_entries[{service, key}] = value;
    }

    bool erase(const std::string& service, const std::string& key) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        failIfBroken();
        return m_entries.erase({service, key}) > 0;
    }

    void setBroken(bool broken) { m_broken = broken; }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_entries.size();
    }

    /** @brief Keys stored under a service, in order. */
    std::vector<std::string> keys(const std::string& service) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<std::string> out;
        for (const auto& [id, value] : m_entries) {
            if (id.first == service) out.push_back(id.second);
        }
        return out;
    }

private:
    void failIfBroken() const {
        if (m_broken) throw domain::SecretStoreError("secret service unavailable");
    }

    mutable std::mutex m_mutex;
    std::map<std::pair<std::string, std::string>, std::string> m_entries;
    std::atomic<bool> m_broken{false};
};

} // namespace shipwright::test
