/**
 * @file CredentialTypes.hpp
 * @brief Addressing vocabulary for stored credentials.
 */

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace shipwright::domain {

enum class CredentialTarget {
    Ftp,
    Netlify,
    Vercel,
    Git
};

enum class CredentialKind {
    Password,
    Token
};

/**
 * @class CredentialError
 * @brief Raised when a credential cannot be addressed or the backing store fails.
 *        A missing entry is not an error.
 */
class CredentialError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

inline std::string CredentialTargetToString(CredentialTarget target) {
    switch (target) {
        case CredentialTarget::Ftp: return "ftp";
        case CredentialTarget::Netlify: return "netlify";
        case CredentialTarget::Vercel: return "vercel";
        case CredentialTarget::Git: return "git";
    }
    return "ftp";
}

inline std::string CredentialKindToString(CredentialKind kind) {
    return kind == CredentialKind::Token ? "token" : "password";
}

inline std::optional<CredentialTarget> CredentialTargetFromString(const std::string& value) {
    if (value == "ftp") return CredentialTarget::Ftp;
    if (value == "netlify") return CredentialTarget::Netlify;
    if (value == "vercel") return CredentialTarget::Vercel;
    if (value == "git") return CredentialTarget::Git;
    return std::nullopt;
}

inline std::optional<CredentialKind> CredentialKindFromString(const std::string& value) {
    if (value == "password") return CredentialKind::Password;
    if (value == "token") return CredentialKind::Token;
    return std::nullopt;
}

} // namespace shipwright::domain
