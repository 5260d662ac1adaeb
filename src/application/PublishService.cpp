#include "application/PublishService.hpp"
#include "infrastructure/DeployLog.hpp"
#include "infrastructure/GitCli.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/TextUtils.hpp"
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <set>
#include <sstream>
#include <system_error>

namespace shipwright::application {

namespace fs = std::filesystem;
using namespace shipwright::domain;
using infrastructure::DeployLog;
using infrastructure::GitCli;
using infrastructure::PathUtils;
using infrastructure::TextUtils;

namespace {

fs::path Canonical(const fs::path& path) {
    std::error_code ec;
    fs::path canonical = fs::canonical(path, ec);
    if (ec) {
        throw PublishError(ec.message() + ": " + path.string());
    }
    return canonical;
}

void CopyInto(const fs::path& source, const fs::path& target) {
    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
        throw PublishError(ec.message() + ": " + target.parent_path().string());
    }
    fs::copy_file(source, target, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        throw PublishError(ec.message() + ": " + source.string());
    }
}

std::string ReadText(const fs::path& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) return "";
    std::stringstream buffer;
    buffer << f.rdbuf();
    return buffer.str();
}

std::optional<fs::path> ResolveAsset(const fs::path& projectRoot, const fs::path& document, const std::string& asset) {
    std::string trimmed = TextUtils::Trim(asset);
    if (trimmed.empty()) {
        return std::nullopt;
    }
    if (trimmed.front() == '/') {
        auto rest = trimmed.find_first_not_of('/');
        return (projectRoot / (rest == std::string::npos ? "" : trimmed.substr(rest))).lexically_normal();
    }
    return (document.parent_path() / trimmed).lexically_normal();
}

/** @brief Runs git in dir, records "git <args>" and throws PublishError on failure. */
std::string RunGitLogged(const fs::path& dir, std::vector<std::string>& logs, const std::vector<std::string>& args) {
    auto result = GitCli::Run(dir, args);
    std::string line = "git";
    for (const auto& arg : args) {
        line += " " + arg;
    }
    logs.push_back(line);
    if (!result.succeeded()) {
        std::string output = TextUtils::Trim(result.output);
        throw PublishError(output.empty() ? line + " failed" : output);
    }
    return result.output;
}

} // namespace

fs::path PublishService::ResolveOutputDir(const fs::path& projectRoot, const std::optional<std::string>& outputDir) {
    std::string value = TextUtils::Trim(outputDir.value_or(kDefaultPublishDir));
    if (value.empty()) {
        throw PublishError("Publish directory cannot be empty");
    }
    return PathUtils::ResolveAgainst(projectRoot, value);
}

bool PublishService::IsSshUrl(const std::string& url) {
    return TextUtils::StartsWith(url, "git@") || TextUtils::StartsWith(url, "ssh://");
}

std::vector<std::string> PublishService::ExtractLocalAssets(const std::string& content) {
    std::vector<std::string> results;
    std::size_t cursor = 0;
    while (true) {
        auto pos = content.find("](", cursor);
        if (pos == std::string::npos) break;
        std::size_t start = pos + 2;
        auto end = content.find(')', start);
        if (end == std::string::npos) break;

        std::string target = TextUtils::Trim(content.substr(start, end - start));
        while (!target.empty() && (target.front() == '<' || target.front() == '>')) target.erase(0, 1);
        while (!target.empty() && (target.back() == '<' || target.back() == '>')) target.pop_back();
        std::istringstream tokens(target);
        std::string first;
        tokens >> first;

        bool remote = TextUtils::StartsWith(first, "http://") || TextUtils::StartsWith(first, "https://") ||
                      TextUtils::StartsWith(first, "mailto:") || TextUtils::StartsWith(first, "tel:") ||
                      TextUtils::StartsWith(first, "#");
        if (!first.empty() && !remote) {
            results.push_back(first);
        }
        cursor = end + 1;
    }
    return results;
}

PublishResponse PublishService::Publish(const PublishRequest& request) {
    fs::path projectRoot(request.projectRoot);
    std::error_code ec;
    if (request.projectRoot.empty() || !fs::is_directory(projectRoot, ec)) {
        throw PublishError("Project root is missing");
    }
    if (request.files.empty()) {
        throw PublishError("No files selected for publish");
    }

    fs::path outputDir = ResolveOutputDir(projectRoot, request.outputDir);
    fs::create_directories(outputDir, ec);
    if (ec) {
        throw PublishError(ec.message() + ": " + outputDir.string());
    }

    fs::path rootCanon = Canonical(projectRoot);
    fs::path outputCanon = Canonical(outputDir);
    if (!PathUtils::IsWithin(outputCanon, rootCanon)) {
        throw PublishError("Publish directory must stay inside the project root");
    }

    PublishResponse response;
    std::size_t copiedFiles = 0;
    std::size_t copiedAssets = 0;
    std::set<fs::path> assetsSeen;

    for (const auto& file : request.files) {
        fs::path filePath(file);
        if (!fs::exists(filePath, ec)) {
            response.warnings.push_back("File not found: " + file);
            continue;
        }
        fs::path fileCanon = Canonical(filePath);
        if (!PathUtils::IsWithin(fileCanon, rootCanon)) {
            response.warnings.push_back("Skipped file outside project: " + file);
            continue;
        }

        CopyInto(fileCanon, outputCanon / fileCanon.lexically_relative(rootCanon));
        ++copiedFiles;

        for (const auto& asset : ExtractLocalAssets(ReadText(fileCanon))) {
            auto assetPath = ResolveAsset(rootCanon, fileCanon, asset);
            if (!assetPath) continue;
            if (!fs::exists(*assetPath, ec)) {
                response.warnings.push_back("Missing asset: " + asset);
                continue;
            }
            if (!fs::is_regular_file(*assetPath, ec)) {
                continue;
            }
            fs::path assetCanon = Canonical(*assetPath);
            if (!PathUtils::IsWithin(assetCanon, rootCanon)) {
                response.warnings.push_back("Skipped asset outside project: " + asset);
                continue;
            }
            if (assetsSeen.insert(assetCanon).second) {
                CopyInto(assetCanon, outputCanon / assetCanon.lexically_relative(rootCanon));
                ++copiedAssets;
            }
        }
    }

    DeployLog::Append(outputCanon / kDeployLogName, "PUBLISH",
                      "Published " + std::to_string(copiedFiles) + " file(s), " +
                      std::to_string(copiedAssets) + " asset(s)");

    response.ok = true;
    response.summary = "Published " + std::to_string(copiedFiles) + " file(s) and " +
                       std::to_string(copiedAssets) + " asset(s)";
    std::cout << "[PublishService] " << response.summary << " into " << outputCanon << std::endl;
    return response;
}

DeployResponse PublishService::Deploy(const DeployRequest& request) {
    fs::path projectRoot(request.projectRoot);
    std::error_code ec;
    if (request.projectRoot.empty() || !fs::is_directory(projectRoot, ec)) {
        throw PublishError("Project root is missing");
    }
    std::string remote = TextUtils::Trim(request.remote);
    if (remote.empty()) {
        throw PublishError("Deploy remote is missing");
    }

    fs::path outputDir = ResolveOutputDir(projectRoot, request.outputDir);
    if (!fs::exists(outputDir, ec)) {
        throw PublishError("Publish directory does not exist. Run Publish first.");
    }

    const char* agent = std::getenv("SSH_AUTH_SOCK");
    if (!agent || TextUtils::IsBlank(agent)) {
        throw PublishError("SSH agent not detected. Start ssh-agent first.");
    }

    DeployResponse response;
    fs::path dir = Canonical(outputDir);

    if (!fs::exists(dir / ".git", ec)) {
        RunGitLogged(dir, response.logs, {"init"});
    }

    bool looksLikeUrl = remote.find("://") != std::string::npos || TextUtils::StartsWith(remote, "git@");
    std::string remoteName = looksLikeUrl ? "origin" : remote;
    if (looksLikeUrl) {
        bool exists = GitCli::Run(dir, {"remote", "get-url", remoteName}).succeeded();
        RunGitLogged(dir, response.logs, {"remote", exists ? "set-url" : "add", remoteName, remote});
    }
    std::string remoteUrl = TextUtils::Trim(RunGitLogged(dir, response.logs, {"remote", "get-url", remoteName}));
    if (!IsSshUrl(remoteUrl)) {
        throw PublishError("Deploy requires an SSH remote (git@ or ssh://)");
    }

    std::string branch = TextUtils::Trim(request.branch.value_or(""));
    if (branch.empty()) {
        branch = kDefaultDeployBranch;
    }

    RunGitLogged(dir, response.logs, {"checkout", "-B", branch});
    RunGitLogged(dir, response.logs, {"add", "-A"});
    std::string status = RunGitLogged(dir, response.logs, {"status", "--porcelain"});

    if (TextUtils::IsBlank(status)) {
        DeployLog::Append(dir / kDeployLogName, "DEPLOY", "No changes to deploy");
        response.ok = true;
        response.summary = "No changes to deploy";
        return response;
    }

    RunGitLogged(dir, response.logs, {"commit", "-m", "Publish snapshot @ " + DeployLog::Timestamp()});
    RunGitLogged(dir, response.logs, {"push", "-u", remoteName, branch});

    DeployLog::Append(dir / kDeployLogName, "DEPLOY", "Pushed to " + remoteName + " (" + branch + ")");

    response.ok = true;
    response.summary = "Deployed to " + remoteName + " (" + branch + ")";
    std::cout << "[PublishService] " << response.summary << std::endl;
    return response;
}

} // namespace shipwright::application
