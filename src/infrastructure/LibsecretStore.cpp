#include "infrastructure/LibsecretStore.hpp"
#include <libsecret/secret.h>

namespace shipwright::infrastructure {

namespace {

const SecretSchema* CredentialSchema() {
    static const SecretSchema schema = {"io.shipwright.Credential", SECRET_SCHEMA_NONE,
                                        {{"service", SECRET_SCHEMA_ATTRIBUTE_STRING},
                                         {"key", SECRET_SCHEMA_ATTRIBUTE_STRING},
                                         {nullptr, SECRET_SCHEMA_ATTRIBUTE_STRING}}};
    return &schema;
}

[[noreturn]] void Fail(const char* operation, GError* error) {
    std::string message = std::string(operation) + ": " + (error && error->message ? error->message : "unknown error");
    if (error) {
        g_error_free(error);
    }
    throw domain::SecretStoreError(message);
}

} // namespace

std::optional<std::string> LibsecretStore::read(const std::string& service, const std::string& key) {
    GError* error = nullptr;
    gchar* secret = secret_password_lookup_sync(CredentialSchema(), nullptr, &error,
                                                "service", service.c_str(),
                                                "key", key.c_str(), nullptr);
    if (error) {
        Fail("Secret lookup failed", error);
    }
    if (!secret) {
        return std::nullopt;
    }
    std::string value(secret);
    secret_password_free(secret);
    return value;
}

void LibsecretStore::write(const std::string& service, const std::string& key, const std::string& value) {
    GError* error = nullptr;
    std::string label = service + " " + key;
    secret_password_store_sync(CredentialSchema(), SECRET_COLLECTION_DEFAULT, label.c_str(),
                               value.c_str(), nullptr, &error,
                               "service", service.c_str(),
                               "key", key.c_str(), nullptr);
    if (error) {
        Fail("Secret store failed", error);
    }
}

bool LibsecretStore::erase(const std::string& service, const std::string& key) {
    GError* error = nullptr;
    gboolean removed = secret_password_clear_sync(CredentialSchema(), nullptr, &error,
                                                  "service", service.c_str(),
                                                  "key", key.c_str(), nullptr);
    if (error) {
        Fail("Secret clear failed", error);
    }
    return removed == TRUE;
}

} // namespace shipwright::infrastructure
