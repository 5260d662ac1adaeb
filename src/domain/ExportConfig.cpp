/**
 * @file ExportConfig.cpp
 * @brief Validation and profile merge rules for ProjectConfig.
 */

#include "domain/ExportConfig.hpp"
#include "domain/ExportFailure.hpp"
#include <algorithm>

namespace shipwright::domain {

bool ResolvedGitConfig::has(GitCheck check) const {
    return std::find(checks.begin(), checks.end(), check) != checks.end();
}

ResolvedGitConfig GitSection::resolve(const GitProfile* profile) const {
    ResolvedGitConfig resolved;

    if (profile && profile->mode) {
        resolved.mode = *profile->mode;
    } else if (mode) {
        resolved.mode = *mode;
    } else {
        resolved.mode = GitMode::AddOnly;
    }

    resolved.checks = (profile && profile->checks) ? *profile->checks : checks;
    resolved.repoPath = (profile && profile->repoPath) ? *profile->repoPath : std::string(".");
    return resolved;
}

ResolvedFtpConfig FtpSection::resolve(const FtpProfile& profile) const {
    ResolvedFtpConfig resolved;
    resolved.protocol = protocol.value_or(FtpProtocol::Sftp);

    if (!profile.host) {
        throw ExportFailure(ErrorCode::ConfigInvalid, "Invalid FTP profile", std::string("Missing FTP host"));
    }
    if (!profile.remotePath) {
        throw ExportFailure(ErrorCode::ConfigInvalid, "Invalid FTP profile", std::string("Missing remote path"));
    }

    resolved.host = *profile.host;
    resolved.port = profile.port.value_or(DefaultPort(resolved.protocol));
    resolved.username = profile.username.value_or("");
    resolved.remotePath = *profile.remotePath;
    return resolved;
}

void ProjectConfig::validate() const {
    if (version != kSupportedConfigVersion) {
        throw ExportFailure(ErrorCode::UnsupportedConfigVersion, "Invalid export configuration",
                            "unsupported config version: " + std::to_string(version));
    }

    if (netlify && netlify->enabled && !netlify->siteId) {
        throw ExportFailure(ErrorCode::ConfigInvalid, "Invalid export configuration",
                            std::string("netlify enabled but site_id is missing"));
    }

    if (vercel && vercel->enabled) {
        if (!vercel->projectName) {
            throw ExportFailure(ErrorCode::ConfigInvalid, "Invalid export configuration",
                                std::string("vercel enabled but project_name is missing"));
        }
        if (!vercel->deployHookUrl) {
            throw ExportFailure(ErrorCode::ConfigInvalid, "Invalid export configuration",
                                std::string("vercel enabled but deploy_hook_url is missing"));
        }
    }

    if (ftp) {
        for (const auto& [name, profile] : ftp->profiles) {
            if (profile.enabled && !profile.host) {
                throw ExportFailure(ErrorCode::ConfigInvalid, "Invalid export configuration",
                                    "ftp profile '" + name + "' is enabled but host is missing");
            }
        }
    }
}

const GitProfile* SelectGitProfile(const GitSection& section, const std::optional<std::string>& name) {
    if (!name) {
        return nullptr;
    }
    auto it = section.profiles.find(*name);
    if (it == section.profiles.end()) {
        throw ExportFailure(ErrorCode::ProfileMissing, "Git profile not found", *name);
    }
    if (!it->second.enabled) {
        throw ExportFailure(ErrorCode::ProfileDisabled, "Git profile is disabled", *name);
    }
    return &it->second;
}

const FtpProfile& SelectFtpProfile(const FtpSection& section, const std::optional<std::string>& name) {
    if (!name) {
        throw ExportFailure(ErrorCode::ProfileRequired, "FTP export requires a profile");
    }
    auto it = section.profiles.find(*name);
    if (it == section.profiles.end()) {
        throw ExportFailure(ErrorCode::ProfileMissing, "FTP profile not found", *name);
    }
    if (!it->second.enabled) {
        throw ExportFailure(ErrorCode::ProfileDisabled, "FTP profile is disabled", *name);
    }
    return it->second;
}

ResolvedGitConfig ResolveGit(const GitSection& section, const std::optional<std::string>& profileName) {
    return section.resolve(SelectGitProfile(section, profileName));
}

ResolvedFtpConfig ResolveFtp(const FtpSection& section, const std::optional<std::string>& profileName) {
    return section.resolve(SelectFtpProfile(section, profileName));
}

std::uint16_t DefaultPort(FtpProtocol protocol) {
    return protocol == FtpProtocol::Ftp ? 21 : 22;
}

std::optional<GitMode> GitModeFromString(const std::string& value) {
    if (value == "add-only") return GitMode::AddOnly;
    if (value == "add-and-commit") return GitMode::AddAndCommit;
    return std::nullopt;
}

std::optional<GitCheck> GitCheckFromString(const std::string& value) {
    if (value == "repo") return GitCheck::Repo;
    if (value == "status") return GitCheck::Status;
    if (value == "clean") return GitCheck::Clean;
    return std::nullopt;
}

std::optional<FtpProtocol> FtpProtocolFromString(const std::string& value) {
    if (value == "ftp") return FtpProtocol::Ftp;
    if (value == "sftp") return FtpProtocol::Sftp;
    return std::nullopt;
}

std::optional<VercelEnvironment> VercelEnvironmentFromString(const std::string& value) {
    if (value == "production") return VercelEnvironment::Production;
    if (value == "preview") return VercelEnvironment::Preview;
    return std::nullopt;
}

std::string VercelEnvironmentToString(VercelEnvironment environment) {
    return environment == VercelEnvironment::Preview ? "preview" : "production";
}

} // namespace shipwright::domain
