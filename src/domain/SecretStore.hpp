/**
 * @file SecretStore.hpp
 * @brief Port to the host OS secret store (opaque key-value by service namespace + key).
 */

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace shipwright::domain {

class SecretStoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @class SecretStore
 * @brief Abstract secret store. Each call must be individually atomic.
 */
class SecretStore {
public:
    virtual ~SecretStore() = default;

    /**
     * @brief Looks up a secret.
     * @return std::nullopt when there is no entry.
     * @throws SecretStoreError on backend failure.
     */
    virtual std::optional<std::string> read(const std::string& service, const std::string& key) = 0;

    /** @brief Creates or replaces a secret. @throws SecretStoreError */
    virtual void write(const std::string& service, const std::string& key, const std::string& value) = 0;

    /**
     * @brief Removes a secret.
     * @return false when there was nothing to remove.
     * @throws SecretStoreError on backend failure.
     */
    virtual bool erase(const std::string& service, const std::string& key) = 0;
};

} // namespace shipwright::domain
