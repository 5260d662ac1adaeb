/**
 * @file CredentialService.hpp
 * @brief Per-project, per-profile credential vault on top of the OS secret store.
 */

#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include "domain/CredentialTypes.hpp"
#include "domain/SecretStore.hpp"

namespace shipwright::application {

/**
 * @class CredentialService
 * @brief Derives credential keys from the project identity and delegates storage.
 *
 * Keys have the form `target:kind:profile|default:sha256(projectRoot)`. The project root is
 * re-derived from the document path on every call, so a moved project gets new keys.
 */
class CredentialService {
public:
    static constexpr const char* kServiceName = "shipwright";

    explicit CredentialService(std::shared_ptr<domain::SecretStore> store);

    /**
     * @return The stored value, or std::nullopt when there is no entry.
     * @throws domain::CredentialError if the project cannot be located or the store fails.
     */
    std::optional<std::string> get(const std::string& documentPath,
                                   domain::CredentialTarget target,
                                   const std::optional<std::string>& profile,
                                   domain::CredentialKind kind) const;

    /**
     * @brief Stores the trimmed value.
     * @throws domain::CredentialError on blank value, missing project or store failure.
     */
    void set(const std::string& documentPath,
             domain::CredentialTarget target,
             const std::optional<std::string>& profile,
             domain::CredentialKind kind,
             const std::string& value);

    /** @brief Deletes the entry. Deleting a missing entry succeeds. */
    void remove(const std::string& documentPath,
                domain::CredentialTarget target,
                const std::optional<std::string>& profile,
                domain::CredentialKind kind);

    /** @brief Pure key derivation. */
    static std::string CredentialKey(const std::filesystem::path& projectRoot,
                                     domain::CredentialTarget target,
                                     const std::optional<std::string>& profile,
                                     domain::CredentialKind kind);

private:
    std::string keyFor(const std::string& documentPath,
                       domain::CredentialTarget target,
                       const std::optional<std::string>& profile,
                       domain::CredentialKind kind) const;

    std::shared_ptr<domain::SecretStore> m_store;
};

} // namespace shipwright::application
