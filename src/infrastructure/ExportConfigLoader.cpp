/**
 * @file ExportConfigLoader.cpp
 * @brief Implementation of ExportConfigLoader.
 */

#include "infrastructure/ExportConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/TomlReader.hpp"
#include "domain/ExportFailure.hpp"
#include <cerrno>
#include <cstring>
#include <fstream>
#include <limits>
#include <sstream>
#include <nlohmann/json.hpp>

namespace shipwright::infrastructure {

using json = nlohmann::json;
using namespace shipwright::domain;

namespace {

/** @brief Shape error in an otherwise well-formed TOML document. */
class FieldError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

const json* Find(const json& table, const char* key) {
    auto it = table.find(key);
    return it == table.end() ? nullptr : &*it;
}

std::string Path(const std::string& scope, const char* key) {
    return scope.empty() ? std::string(key) : scope + "." + key;
}

bool RequireBool(const json& table, const std::string& scope, const char* key) {
    const json* value = Find(table, key);
    if (!value) {
        throw FieldError("missing field `" + Path(scope, key) + "`");
    }
    if (!value->is_boolean()) {
        throw FieldError("`" + Path(scope, key) + "` must be a boolean");
    }
    return value->get<bool>();
}

bool BoolOr(const json& table, const std::string& scope, const char* key, bool fallback) {
    const json* value = Find(table, key);
    if (!value) {
        return fallback;
    }
    if (!value->is_boolean()) {
        throw FieldError("`" + Path(scope, key) + "` must be a boolean");
    }
    return value->get<bool>();
}

std::optional<std::string> OptString(const json& table, const std::string& scope, const char* key) {
    const json* value = Find(table, key);
    if (!value) {
        return std::nullopt;
    }
    if (!value->is_string()) {
        throw FieldError("`" + Path(scope, key) + "` must be a string");
    }
    return value->get<std::string>();
}

std::optional<std::uint16_t> OptPort(const json& table, const std::string& scope, const char* key) {
    const json* value = Find(table, key);
    if (!value) {
        return std::nullopt;
    }
    if (!value->is_number_integer()) {
        throw FieldError("`" + Path(scope, key) + "` must be an integer");
    }
    auto port = value->get<std::int64_t>();
    if (port < 0 || port > std::numeric_limits<std::uint16_t>::max()) {
        throw FieldError("`" + Path(scope, key) + "` is out of range");
    }
    return static_cast<std::uint16_t>(port);
}

template <typename Enum, typename Parser>
std::optional<Enum> OptEnum(const json& table, const std::string& scope, const char* key,
                            Parser parse, const char* expected) {
    auto text = OptString(table, scope, key);
    if (!text) {
        return std::nullopt;
    }
    auto parsed = parse(*text);
    if (!parsed) {
        throw FieldError("unknown variant `" + *text + "` for `" + Path(scope, key) + "`, expected " + expected);
    }
    return parsed;
}

std::optional<std::vector<GitCheck>> OptChecks(const json& table, const std::string& scope) {
    const json* value = Find(table, "checks");
    if (!value) {
        return std::nullopt;
    }
    if (!value->is_array()) {
        throw FieldError("`" + Path(scope, "checks") + "` must be an array");
    }
    std::vector<GitCheck> checks;
    for (const auto& item : *value) {
        if (!item.is_string()) {
            throw FieldError("`" + Path(scope, "checks") + "` entries must be strings");
        }
        auto check = GitCheckFromString(item.get<std::string>());
        if (!check) {
            throw FieldError("unknown variant `" + item.get<std::string>() + "` for `" + Path(scope, "checks") +
                             "`, expected one of `repo`, `status`, `clean`");
        }
        checks.push_back(*check);
    }
    return checks;
}

const json& RequireTable(const json& value, const std::string& scope) {
    if (!value.is_object()) {
        throw FieldError("`" + scope + "` must be a table");
    }
    return value;
}

template <typename Profile, typename ReadProfile>
std::map<std::string, Profile> ReadProfiles(const json& section, const std::string& scope, ReadProfile read) {
    std::map<std::string, Profile> profiles;
    const json* table = Find(section, "profiles");
    if (!table) {
        return profiles;
    }
    const std::string profilesScope = Path(scope, "profiles");
    RequireTable(*table, profilesScope);
    for (auto it = table->begin(); it != table->end(); ++it) {
        const std::string profileScope = profilesScope + "." + it.key();
        profiles.emplace(it.key(), read(RequireTable(it.value(), profileScope), profileScope));
    }
    return profiles;
}

GitSection ReadGit(const json& table) {
    const std::string scope = "git";
    GitSection section;
    section.enabled = RequireBool(table, scope, "enabled");
    section.mode = OptEnum<GitMode>(table, scope, "mode", GitModeFromString, "`add-only` or `add-and-commit`");
    if (auto checks = OptChecks(table, scope)) {
        section.checks = *checks;
    }
    section.profiles = ReadProfiles<GitProfile>(table, scope, [](const json& p, const std::string& s) {
        GitProfile profile;
        profile.enabled = RequireBool(p, s, "enabled");
        profile.repoPath = OptString(p, s, "repo_path");
        profile.mode = OptEnum<GitMode>(p, s, "mode", GitModeFromString, "`add-only` or `add-and-commit`");
        profile.checks = OptChecks(p, s);
        return profile;
    });
    return section;
}

FtpSection ReadFtp(const json& table) {
    const std::string scope = "ftp";
    FtpSection section;
    section.enabled = RequireBool(table, scope, "enabled");
    section.protocol = OptEnum<FtpProtocol>(table, scope, "protocol", FtpProtocolFromString, "`ftp` or `sftp`");
    section.profiles = ReadProfiles<FtpProfile>(table, scope, [](const json& p, const std::string& s) {
        FtpProfile profile;
        profile.enabled = RequireBool(p, s, "enabled");
        profile.host = OptString(p, s, "host");
        profile.port = OptPort(p, s, "port");
        profile.username = OptString(p, s, "username");
        profile.remotePath = OptString(p, s, "remote_path");
        return profile;
    });
    return section;
}

NetlifySection ReadNetlify(const json& table) {
    const std::string scope = "netlify";
    NetlifySection section;
    section.enabled = RequireBool(table, scope, "enabled");
    section.siteId = OptString(table, scope, "site_id");
    section.triggerDeploy = BoolOr(table, scope, "trigger_deploy", false);
    return section;
}

VercelSection ReadVercel(const json& table) {
    const std::string scope = "vercel";
    VercelSection section;
    section.enabled = RequireBool(table, scope, "enabled");
    section.projectName = OptString(table, scope, "project_name");
    section.deployHookUrl = OptString(table, scope, "deploy_hook_url");
    section.environment = OptEnum<VercelEnvironment>(table, scope, "environment", VercelEnvironmentFromString,
                                                     "`production` or `preview`")
                              .value_or(VercelEnvironment::Production);
    return section;
}

} // namespace

ProjectConfig ExportConfigLoader::Parse(const std::string& text) {
    json document;
    try {
        document = TomlReader::Parse(text);
    } catch (const TomlParseError& e) {
        throw ExportFailure(ErrorCode::ConfigInvalid, "Invalid .export.toml", std::string(e.what()));
    }

    try {
        ProjectConfig config;
        const json* version = Find(document, "version");
        if (!version) {
            throw FieldError("missing field `version`");
        }
        if (!version->is_number_integer()) {
            throw FieldError("`version` must be an integer");
        }
        auto raw = version->get<std::int64_t>();
        if (raw < 0 || raw > std::numeric_limits<std::uint32_t>::max()) {
            throw FieldError("`version` is out of range");
        }
        config.version = static_cast<std::uint32_t>(raw);

        if (const json* git = Find(document, "git")) {
            config.git = ReadGit(RequireTable(*git, "git"));
        }
        if (const json* ftp = Find(document, "ftp")) {
            config.ftp = ReadFtp(RequireTable(*ftp, "ftp"));
        }
        if (const json* netlify = Find(document, "netlify")) {
            config.netlify = ReadNetlify(RequireTable(*netlify, "netlify"));
        }
        if (const json* vercel = Find(document, "vercel")) {
            config.vercel = ReadVercel(RequireTable(*vercel, "vercel"));
        }
        return config;
    } catch (const FieldError& e) {
        throw ExportFailure(ErrorCode::ConfigInvalid, "Invalid .export.toml", std::string(e.what()));
    }
}

ProjectConfig ExportConfigLoader::LoadFromRoot(const std::filesystem::path& projectRoot) {
    std::filesystem::path configPath = projectRoot / kConfigFileName;

    std::ifstream f(configPath);
    if (!f.is_open()) {
        throw ExportFailure(ErrorCode::ConfigMissing, "Unable to read .export.toml", std::string(std::strerror(errno)));
    }
    std::stringstream buffer;
    buffer << f.rdbuf();
    if (f.bad()) {
        throw ExportFailure(ErrorCode::ConfigMissing, "Unable to read .export.toml", std::string(std::strerror(errno)));
    }

    ProjectConfig config = Parse(buffer.str());
    config.validate();
    return config;
}

ProjectConfig ExportConfigLoader::Load(const std::filesystem::path& documentPath) {
    auto root = PathUtils::FindProjectRoot(documentPath);
    if (!root) {
        throw ExportFailure(ErrorCode::ConfigMissing, "No .export.toml found in parent folders");
    }
    return LoadFromRoot(*root);
}

} // namespace shipwright::infrastructure
