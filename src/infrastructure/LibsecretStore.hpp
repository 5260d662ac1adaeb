/**
 * @file LibsecretStore.hpp
 * @brief SecretStore backed by the freedesktop Secret Service (libsecret).
 */

#pragma once

#include "domain/SecretStore.hpp"

namespace shipwright::infrastructure {

/**
 * @class LibsecretStore
 * @brief Stores each secret as a password item with attributes {service, key}.
 *
 * Every call is a single synchronous D-Bus round trip, so individual operations are atomic
 * from the caller's point of view.
 */
class LibsecretStore : public domain::SecretStore {
public:
    std::optional<std::string> read(const std::string& service, const std::string& key) override;
    void write(const std::string& service, const std::string& key, const std::string& value) override;
    bool erase(const std::string& service, const std::string& key) override;
};

} // namespace shipwright::infrastructure
