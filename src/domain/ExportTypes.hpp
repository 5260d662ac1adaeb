/**
 * @file ExportTypes.hpp
 * @brief Value objects exchanged between the export engine and its collaborators.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace shipwright::domain {

/**
 * @enum ExportTarget
 * @brief Delivery backends an export can be dispatched to.
 */
enum class ExportTarget {
    Git,
    Ftp,
    Netlify,
    Vercel
};

/**
 * @enum ErrorCode
 * @brief Closed set of terminal failure codes reported by an export.
 */
enum class ErrorCode {
    ExportCancelled,
    ConfigMissing,
    ConfigInvalid,
    UnsupportedConfigVersion,
    TargetDisabled,
    ProfileMissing,
    ProfileDisabled,
    ProfileRequired,
    FileMissing,
    FileNotInRepo,
    GitRepoMissing,
    GitDirty,
    GitFailed,
    FtpFailed,
    FtpMissingUsername,
    FtpMissingPassword,
    NetlifyMissingToken,
    NetlifyFailed,
    VercelFailed
};

enum class LogLevel {
    Info,
    Warn,
    Error
};

/**
 * @struct ExportRequest
 * @brief What the collaborator asks for: one document, one target, optional profile.
 */
struct ExportRequest {
    std::string filePath;
    ExportTarget target = ExportTarget::Git;
    std::optional<std::string> profile;
};

struct ExportLog {
    LogLevel level = LogLevel::Info;
    std::string message;
    std::optional<std::string> detail;
};

struct ExportError {
    ErrorCode code = ErrorCode::ConfigInvalid;
    std::string message;
    std::optional<std::string> detail;
};

/**
 * @struct ExportResponse
 * @brief Terminal result of an export. Logs are returned in full on failure too.
 */
struct ExportResponse {
    bool ok = false;
    std::string summary;
    std::vector<ExportLog> logs;
    std::optional<ExportError> error;
};

/**
 * @struct ExportProgress
 * @brief Streaming progress of a transfer; percent is 0 when totalBytes is 0.
 */
struct ExportProgress {
    std::string jobId;
    std::uint64_t sentBytes = 0;
    std::uint64_t totalBytes = 0;
    float percent = 0.0f;
};

struct ExportFinished {
    std::string jobId;
    ExportResponse response;
};

inline float ComputePercent(std::uint64_t sentBytes, std::uint64_t totalBytes) {
    if (totalBytes == 0) {
        return 0.0f;
    }
    return static_cast<float>(static_cast<double>(sentBytes) / static_cast<double>(totalBytes) * 100.0);
}

inline std::string TargetToString(ExportTarget target) {
    switch (target) {
        case ExportTarget::Git: return "git";
        case ExportTarget::Ftp: return "ftp";
        case ExportTarget::Netlify: return "netlify";
        case ExportTarget::Vercel: return "vercel";
    }
    return "git";
}

/**
 * @brief Parses the lowercase target name used on the command surface.
 */
inline std::optional<ExportTarget> TargetFromString(const std::string& value) {
    if (value == "git") return ExportTarget::Git;
    if (value == "ftp") return ExportTarget::Ftp;
    if (value == "netlify") return ExportTarget::Netlify;
    if (value == "vercel") return ExportTarget::Vercel;
    return std::nullopt;
}

inline std::string LogLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
    }
    return "info";
}

inline std::string ErrorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::ExportCancelled: return "export_cancelled";
        case ErrorCode::ConfigMissing: return "config_missing";
        case ErrorCode::ConfigInvalid: return "config_invalid";
        case ErrorCode::UnsupportedConfigVersion: return "unsupported_config_version";
        case ErrorCode::TargetDisabled: return "target_disabled";
        case ErrorCode::ProfileMissing: return "profile_missing";
        case ErrorCode::ProfileDisabled: return "profile_disabled";
        case ErrorCode::ProfileRequired: return "profile_required";
        case ErrorCode::FileMissing: return "file_missing";
        case ErrorCode::FileNotInRepo: return "file_not_in_repo";
        case ErrorCode::GitRepoMissing: return "git_repo_missing";
        case ErrorCode::GitDirty: return "git_dirty";
        case ErrorCode::GitFailed: return "git_failed";
        case ErrorCode::FtpFailed: return "ftp_failed";
        case ErrorCode::FtpMissingUsername: return "ftp_missing_username";
        case ErrorCode::FtpMissingPassword: return "ftp_missing_password";
        case ErrorCode::NetlifyMissingToken: return "netlify_missing_token";
        case ErrorCode::NetlifyFailed: return "netlify_failed";
        case ErrorCode::VercelFailed: return "vercel_failed";
    }
    return "config_invalid";
}

} // namespace shipwright::domain
