/**
 * @file ExportConfig.hpp
 * @brief Per-project export configuration (.export.toml) and its profile resolution rules.
 *
 * Each target section has its own merge function. A profile value wins over the section
 * value, which wins over the builtin default.
 */

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace shipwright::domain {

inline constexpr std::uint32_t kSupportedConfigVersion = 1;
inline constexpr const char* kConfigFileName = ".export.toml";

enum class GitMode {
    AddOnly,
    AddAndCommit
};

enum class GitCheck {
    Repo,
    Status,
    Clean
};

struct GitProfile {
    bool enabled = false;
    std::optional<std::string> repoPath;
    std::optional<GitMode> mode;
    std::optional<std::vector<GitCheck>> checks;
};

struct ResolvedGitConfig {
    std::string repoPath;
    GitMode mode = GitMode::AddOnly;
    std::vector<GitCheck> checks;

    bool has(GitCheck check) const;
};

struct GitSection {
    bool enabled = false;
    std::optional<GitMode> mode;
    std::vector<GitCheck> checks{GitCheck::Repo};
    std::map<std::string, GitProfile> profiles;

    /** @brief Merges section defaults with an (already validated) profile. */
    ResolvedGitConfig resolve(const GitProfile* profile) const;
};

enum class FtpProtocol {
    Ftp,
    Sftp
};

struct FtpProfile {
    bool enabled = false;
    std::optional<std::string> host;
    std::optional<std::uint16_t> port;
    std::optional<std::string> username;
    std::optional<std::string> remotePath;
};

struct ResolvedFtpConfig {
    FtpProtocol protocol = FtpProtocol::Sftp;
    std::string host;
    std::uint16_t port = 22;
    std::string username;
    std::string remotePath;
};

struct FtpSection {
    bool enabled = false;
    std::optional<FtpProtocol> protocol;
    std::map<std::string, FtpProfile> profiles;

    /**
     * @brief Merges the section with a profile.
     * @throws ExportFailure (ConfigInvalid) when host or remote path is missing.
     */
    ResolvedFtpConfig resolve(const FtpProfile& profile) const;
};

struct NetlifySection {
    bool enabled = false;
    std::optional<std::string> siteId;
    bool triggerDeploy = false;
};

enum class VercelEnvironment {
    Production,
    Preview
};

struct VercelSection {
    bool enabled = false;
    std::optional<std::string> projectName;
    std::optional<std::string> deployHookUrl;
    VercelEnvironment environment = VercelEnvironment::Production;
};

/**
 * @struct ProjectConfig
 * @brief Parsed .export.toml. Loaded fresh for every export, never cached.
 */
struct ProjectConfig {
    std::uint32_t version = 0;
    std::optional<GitSection> git;
    std::optional<FtpSection> ftp;
    std::optional<NetlifySection> netlify;
    std::optional<VercelSection> vercel;

    /**
     * @brief Semantic validation; first failure wins.
     * @throws ExportFailure with UnsupportedConfigVersion or ConfigInvalid.
     */
    void validate() const;
};

/**
 * @brief Picks the named Git profile, if any.
 * @return nullptr when no name is given (section defaults apply).
 * @throws ExportFailure ProfileMissing / ProfileDisabled.
 */
const GitProfile* SelectGitProfile(const GitSection& section, const std::optional<std::string>& name);

/**
 * @brief Picks the named transfer profile. A name is mandatory for transfers.
 * @throws ExportFailure ProfileRequired / ProfileMissing / ProfileDisabled.
 */
const FtpProfile& SelectFtpProfile(const FtpSection& section, const std::optional<std::string>& name);

ResolvedGitConfig ResolveGit(const GitSection& section, const std::optional<std::string>& profileName);
ResolvedFtpConfig ResolveFtp(const FtpSection& section, const std::optional<std::string>& profileName);

std::uint16_t DefaultPort(FtpProtocol protocol);

std::optional<GitMode> GitModeFromString(const std::string& value);
std::optional<GitCheck> GitCheckFromString(const std::string& value);
std::optional<FtpProtocol> FtpProtocolFromString(const std::string& value);
std::optional<VercelEnvironment> VercelEnvironmentFromString(const std::string& value);
std::string VercelEnvironmentToString(VercelEnvironment environment);

} // namespace shipwright::domain
