#include "application/CredentialService.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/Sha256.hpp"
#include "infrastructure/TextUtils.hpp"
#include <iostream>

namespace shipwright::application {

using namespace shipwright::domain;
using infrastructure::PathUtils;
using infrastructure::TextUtils;

CredentialService::CredentialService(std::shared_ptr<SecretStore> store)
    : m_store(std::move(store)) {}

std::string CredentialService::CredentialKey(const std::filesystem::path& projectRoot,
                                             CredentialTarget target,
                                             const std::optional<std::string>& profile,
                                             CredentialKind kind) {
    std::string hash = infrastructure::Sha256::HexDigest(projectRoot.string());
    return CredentialTargetToString(target) + ":" + CredentialKindToString(kind) + ":" +
           profile.value_or("default") + ":" + hash;
}

std::string CredentialService::keyFor(const std::string& documentPath,
                                      CredentialTarget target,
                                      const std::optional<std::string>& profile,
                                      CredentialKind kind) const {
    auto root = PathUtils::FindProjectRoot(documentPath);
    if (!root) {
        throw CredentialError("No .export.toml found in parent folders");
    }
    return CredentialKey(*root, target, profile, kind);
}

std::optional<std::string> CredentialService::get(const std::string& documentPath,
                                                  CredentialTarget target,
                                                  const std::optional<std::string>& profile,
                                                  CredentialKind kind) const {
    std::string key = keyFor(documentPath, target, profile, kind);
    try {
        return m_store->read(kServiceName, key);
    } catch (const SecretStoreError& e) {
        throw CredentialError(e.what());
    }
}

void CredentialService::set(const std::string& documentPath,
                            CredentialTarget target,
                            const std::optional<std::string>& profile,
                            CredentialKind kind,
                            const std::string& value) {
    if (TextUtils::IsBlank(value)) {
        throw CredentialError("Credential value is empty");
    }
    std::string key = keyFor(documentPath, target, profile, kind);
    try {
        m_store->write(kServiceName, key, TextUtils::Trim(value));
    } catch (const SecretStoreError& e) {
        throw CredentialError(e.what());
    }
    std::cout << "[CredentialService] Stored credential " << key << std::endl;
}

void CredentialService::remove(const std::string& documentPath,
                               CredentialTarget target,
                               const std::optional<std::string>& profile,
                               CredentialKind kind) {
    std::string key = keyFor(documentPath, target, profile, kind);
    bool removed = false;
    try {
        removed = m_store->erase(kServiceName, key);
    } catch (const SecretStoreError& e) {
        throw CredentialError(e.what());
    }
    if (removed) {
        std::cout << "[CredentialService] Deleted credential " << key << std::endl;
    }
}

} // namespace shipwright::application
