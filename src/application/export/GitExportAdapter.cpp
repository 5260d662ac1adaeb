#include "application/export/GitExportAdapter.hpp"
#include "domain/ExportFailure.hpp"
#include "infrastructure/GitCli.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/TextUtils.hpp"

namespace shipwright::application {

namespace fs = std::filesystem;
using namespace shipwright::domain;
using infrastructure::GitCli;
using infrastructure::PathUtils;
using infrastructure::TextUtils;

namespace {
constexpr const char* kNothingToCommit = "nothing to commit";
}

std::string GitExportAdapter::run(const ProjectConfig& config, ExportContext& context) {
    if (!config.git || !config.git->enabled) {
        throw ExportFailure(ErrorCode::TargetDisabled, "Git export is disabled");
    }
    const GitSection& section = *config.git;

    const GitProfile* profile = SelectGitProfile(section, context.request().profile);
    ResolvedGitConfig resolved = section.resolve(profile);
    fs::path repoPath = PathUtils::ResolveAgainst(context.projectRoot(), resolved.repoPath);

    context.checkpoint();
    context.info("Running Git checks", repoPath.string());

    if (resolved.has(GitCheck::Repo) && !GitCli::IsWorkTree(repoPath)) {
        throw ExportFailure(ErrorCode::GitRepoMissing, "Not a git repository");
    }

    std::string status;
    if (resolved.has(GitCheck::Status) || resolved.has(GitCheck::Clean)) {
        auto result = GitCli::Status(repoPath);
        if (!result.succeeded()) {
            throw ExportFailure(ErrorCode::GitFailed, "Unable to read git status", TextUtils::Trim(result.output));
        }
        status = TextUtils::Trim(result.output);
        if (!status.empty()) {
            context.warn("Git status is not clean", status);
        } else {
            context.info("Git status clean");
        }
    }

    if (resolved.has(GitCheck::Clean) && !status.empty()) {
        throw ExportFailure(ErrorCode::GitDirty, "Git working tree is not clean");
    }

    auto topLevel = GitCli::TopLevel(repoPath);
    if (!topLevel) {
        throw ExportFailure(ErrorCode::GitRepoMissing, "Unable to resolve repository root", repoPath.string());
    }
    fs::path repoRoot = *topLevel;

    if (!PathUtils::IsWithin(context.documentPath(), repoRoot)) {
        throw ExportFailure(ErrorCode::FileNotInRepo, "File is outside the git repository", repoRoot.string());
    }

    context.checkpoint();

    std::error_code ec;
    fs::path document = fs::weakly_canonical(context.documentPath(), ec);
    if (ec) {
        document = fs::absolute(context.documentPath()).lexically_normal();
    }

    context.info("Git add", document.string());
    auto add = GitCli::Run(repoRoot, {"add", "--", document.string()});
    if (!add.succeeded()) {
        throw ExportFailure(ErrorCode::GitFailed, "git add failed", TextUtils::Trim(add.output));
    }

    if (resolved.mode == GitMode::AddAndCommit) {
        // Exit 0 means the index matches HEAD; untracked or unstaged files elsewhere do not count.
        auto staged = GitCli::Run(repoRoot, {"diff", "--cached", "--quiet"});
        if (staged.exitCode == 0) {
            context.warn("Nothing to commit");
            return "No changes to commit";
        }
        if (staged.exitCode != 1) {
            throw ExportFailure(ErrorCode::GitFailed, "Unable to inspect staged changes", TextUtils::Trim(staged.output));
        }

        std::string message = "Export " + PathUtils::FileNameOr(document, "file");
        context.info("Git commit", message);
        auto commit = GitCli::Run(repoRoot, {"commit", "-m", message});
        if (commit.output.find(kNothingToCommit) != std::string::npos) {
            std::optional<std::string> detail;
            if (!commit.succeeded()) {
                detail = TextUtils::Trim(commit.output);
            }
            context.warn("Nothing to commit", detail);
            return "No changes to commit";
        }
        if (!commit.succeeded()) {
            throw ExportFailure(ErrorCode::GitFailed, "git commit failed", TextUtils::Trim(commit.output));
        }
    }

    return "Git export completed";
}

} // namespace shipwright::application
