#include <algorithm>
#include <cassert>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>

#include "application/PublishService.hpp"
#include "infrastructure/GitCli.hpp"
#include "infrastructure/TextUtils.hpp"
#include "support/TestProject.hpp"

using namespace shipwright::domain;
using shipwright::application::PublishService;
using shipwright::infrastructure::GitCli;
using shipwright::infrastructure::TextUtils;
using shipwright::test::TestProject;

namespace fs = std::filesystem;

namespace {

std::string Slurp(const fs::path& path) {
    std::ifstream in(path);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

bool Contains(const std::vector<std::string>& values, const std::string& value) {
    return std::find(values.begin(), values.end(), value) != values.end();
}

template <typename F>
std::string PublishErrorOf(F&& f) {
    try {
        f();
    } catch (const PublishError& e) {
        return e.what();
    }
    assert(false && "expected PublishError");
    return "";
}

void TestHelpers() {
    auto assets = PublishService::ExtractLocalAssets(
        "![a](img/x.png \"title\") [b](<spaced.md>) [c](http://x.org) [d](#top) [e](mailto:a@b.c) [f]( ) [g](docs/g.pdf)");
    assert(assets.size() == 3);
    assert(assets[0] == "img/x.png");
    assert(assets[1] == "spaced.md");
    assert(assets[2] == "docs/g.pdf");
    assert(PublishService::ExtractLocalAssets("no links [here] (either)").empty());

    fs::path root("/srv/site");
    assert(PublishService::ResolveOutputDir(root, std::nullopt) == fs::path("/srv/site/_publish"));
    assert(PublishService::ResolveOutputDir(root, std::string("out/www")) == fs::path("/srv/site/out/www"));
    assert(PublishService::ResolveOutputDir(root, std::string("/var/www")) == fs::path("/var/www"));
    assert(PublishErrorOf([&] { PublishService::ResolveOutputDir(root, std::string("  ")); }) ==
           "Publish directory cannot be empty");

    assert(PublishService::IsSshUrl("git@github.com:me/site.git"));
    assert(PublishService::IsSshUrl("ssh://git@host/site.git"));
    assert(!PublishService::IsSshUrl("https://github.com/me/site.git"));
    std::cout << "[PASS] publish helpers" << std::endl;
}

void TestPublishCopiesFilesAndAssets() {
    TestProject project("publish");
    TestProject elsewhere("publish_elsewhere");
    auto a = project.write("posts/a.md",
                           "![pic](../img/pic.png)\n[logo](/assets/logo.svg)\n[gone](nope.png)\n"
                           "[web](https://example.org)\n[top](#top)\n");
    auto b = project.write("posts/b.md", "again ![pic](../img/pic.png)\n");
    project.write("img/pic.png", "PNG");
    project.write("assets/logo.svg", "<svg/>");
    auto stray = elsewhere.write("stray.md", "stray");

    PublishService service;
    PublishRequest request{project.root().string(),
                           {a.string(), b.string(), (project.root() / "ghost.md").string(), stray.string()},
                           std::nullopt};
    PublishResponse response = service.Publish(request);

    assert(response.ok);
    assert(response.summary == "Published 2 file(s) and 2 asset(s)");
    assert(Contains(response.warnings, "Missing asset: nope.png"));
    assert(Contains(response.warnings, "File not found: " + (project.root() / "ghost.md").string()));
    assert(Contains(response.warnings, "Skipped file outside project: " + stray.string()));
    assert(response.warnings.size() == 3);

    fs::path out = project.root() / kDefaultPublishDir;
    assert(Slurp(out / "posts/a.md") == Slurp(a));
    assert(fs::exists(out / "posts/b.md"));
    assert(Slurp(out / "img/pic.png") == "PNG");
    assert(Slurp(out / "assets/logo.svg") == "<svg/>");

    std::string log = Slurp(out / kDeployLogName);
    assert(log.find("[PUBLISH] Published 2 file(s), 2 asset(s)") != std::string::npos);
    assert(log.back() == '\n');

    service.Publish(request);
    std::string twice = Slurp(out / kDeployLogName);
    assert(std::count(twice.begin(), twice.end(), '\n') == 2 && "deploy log is append-only");
    std::cout << "[PASS] publish copies files and assets" << std::endl;
}

void TestPublishRejections() {
    TestProject project("publish_reject");
    TestProject other("publish_other");
    auto doc = project.write("a.md", "a");
    PublishService service;

    assert(PublishErrorOf([&] {
        service.Publish(PublishRequest{project.root().string(), {}, std::nullopt});
    }) == "No files selected for publish");

    assert(PublishErrorOf([&] {
        service.Publish(PublishRequest{(project.root() / "missing").string(), {doc.string()}, std::nullopt});
    }) == "Project root is missing");

    assert(PublishErrorOf([&] {
        service.Publish(PublishRequest{project.root().string(), {doc.string()}, (other.root() / "out").string()});
    }) == "Publish directory must stay inside the project root");

    auto custom = service.Publish(PublishRequest{project.root().string(), {doc.string()}, std::string("site/www")});
    assert(custom.ok && fs::exists(project.root() / "site/www/a.md"));
    std::cout << "[PASS] publish rejections and custom output" << std::endl;
}

/** @brief Sets or clears an environment variable for the lifetime of the guard. */
class EnvGuard {
public:
    EnvGuard(const char* name, const char* value) : m_name(name) {
        const char* previous = std::getenv(name);
        if (previous) m_previous = previous;
        if (value) {
            setenv(name, value, 1);
        } else {
            unsetenv(name);
        }
    }
    ~EnvGuard() {
        if (m_previous) {
            setenv(m_name.c_str(), m_previous->c_str(), 1);
        } else {
            unsetenv(m_name.c_str());
        }
    }

private:
    std::string m_name;
    std::optional<std::string> m_previous;
};

void TestDeployPreconditions() {
    TestProject project("deploy_pre");
    PublishService service;

    assert(PublishErrorOf([&] {
        service.Deploy(DeployRequest{project.root().string(), std::nullopt, "git@example.com:site.git", std::nullopt});
    }) == "Publish directory does not exist. Run Publish first.");

    fs::create_directories(project.root() / kDefaultPublishDir);
    assert(PublishErrorOf([&] {
        service.Deploy(DeployRequest{project.root().string(), std::nullopt, "  ", std::nullopt});
    }) == "Deploy remote is missing");

    {
        EnvGuard noAgent("SSH_AUTH_SOCK", nullptr);
        assert(PublishErrorOf([&] {
            service.Deploy(DeployRequest{project.root().string(), std::nullopt, "git@example.com:site.git",
                                         std::nullopt});
        }) == "SSH agent not detected. Start ssh-agent first.");
    }
    std::cout << "[PASS] deploy preconditions" << std::endl;
}

void TestDeployWithGit() {
    EnvGuard agent("SSH_AUTH_SOCK", "/tmp/shipwright-test-agent.sock");
    PublishService service;

    TestProject https("deploy_https");
    fs::create_directories(https.root() / kDefaultPublishDir);
    assert(PublishErrorOf([&] {
        service.Deploy(DeployRequest{https.root().string(), std::nullopt, "https://example.com/site.git",
                                     std::nullopt});
    }) == "Deploy requires an SSH remote (git@ or ssh://)");

    TestProject project("deploy_clean");
    auto doc = project.write("index.md", "# home\n");
    service.Publish(PublishRequest{project.root().string(), {doc.string()}, std::nullopt});
    fs::path out = project.root() / kDefaultPublishDir;
    project.initGit(out);
    GitCli::Run(out, {"add", "-A"});
    GitCli::Run(out, {"commit", "-q", "-m", "snapshot"});
    GitCli::Run(out, {"remote", "add", "origin", "git@example.com:site.git"});

    DeployResponse response = service.Deploy(DeployRequest{project.root().string(), std::nullopt, "origin",
                                                           std::nullopt});
    assert(response.ok);
    assert(response.summary == "No changes to deploy");
    assert(Contains(response.logs, "git remote get-url origin"));
    assert(Contains(response.logs, "git checkout -B main"));
    assert(Contains(response.logs, "git status --porcelain"));
    assert(!Contains(response.logs, "git init") && "existing repository is reused");
    assert(TextUtils::Trim(GitCli::Run(out, {"rev-parse", "--abbrev-ref", "HEAD"}).output) == "main");
    assert(Slurp(out / kDeployLogName).find("[DEPLOY] No changes to deploy") != std::string::npos);
    std::cout << "[PASS] deploy with nothing to push" << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting PublishService Test..." << std::endl;
    TestHelpers();
    TestPublishCopiesFilesAndAssets();
    TestPublishRejections();
    TestDeployPreconditions();
    if (shipwright::test::GitAvailableOrSkip("deploy")) {
        TestDeployWithGit();
    }
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
