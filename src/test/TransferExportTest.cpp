#include <atomic>
#include <cassert>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <sstream>
#include <vector>

#include "application/CredentialService.hpp"
#include "application/ExportPipeline.hpp"
#include "application/export/FileTransferExportAdapter.hpp"
#include "infrastructure/ChunkedUpload.hpp"
#include "support/FakeSecretStore.hpp"
#include "support/ScriptedTransferSession.hpp"
#include "support/TestProject.hpp"

using namespace shipwright::domain;
using namespace shipwright::application;
using shipwright::infrastructure::ChunkedUpload;
using shipwright::test::FakeSecretStore;
using shipwright::test::ScriptedTransferSession;
using shipwright::test::TestProject;
using shipwright::test::TransferScript;

namespace {

const char* kSftpConfig = R"(version = 1
[ftp]
enabled = true
protocol = "sftp"

[ftp.profiles.prod]
enabled = true
host = "files.example.org"
username = "deploy"
remote_path = "/var/www/"

[ftp.profiles.anon]
enabled = true
host = "files.example.org"
username = "  "
remote_path = "/var/www/fixed.md"
)";

const char* kFtpConfig = R"(version = 1
[ftp]
enabled = true
protocol = "ftp"

[ftp.profiles.legacy]
enabled = true
host = "ftp.example.org"
port = 2121
username = "web"
remote_path = "htdocs/"
)";

/** @brief One project, one fake vault, one scripted server. */
struct Harness {
    explicit Harness(const std::string& name, const char* config)
        : project(name),
          store(std::make_shared<FakeSecretStore>()),
          credentials(store),
          script(std::make_shared<TransferScript>()) {
        project.writeConfig(config);
        document = project.write("posts/launch.md", "0123456789");
    }

    ExportResponse run(const std::string& profile) {
        std::vector<std::unique_ptr<ExportAdapter>> adapters;
        adapters.push_back(std::make_unique<FileTransferExportAdapter>(credentials,
                                                                        ScriptedTransferSession::Factory(script)));
        ExportPipeline pipeline(std::move(adapters));
        ExportContext context("ftp-test", ExportRequest{document.string(), ExportTarget::Ftp, profile}, cancel,
                              [this](const ExportProgress& p) { progress.push_back(p); });
        return pipeline.run(context);
    }

    void storePassword(const std::string& profile, const std::string& password) {
        credentials.set(document.string(), CredentialTarget::Ftp, profile, CredentialKind::Password, password);
    }

    TestProject project;
    std::shared_ptr<FakeSecretStore> store;
    CredentialService credentials;
    std::shared_ptr<TransferScript> script;
    std::filesystem::path document;
    std::atomic<bool> cancel{false};
    std::vector<ExportProgress> progress;
};

bool HasWarn(const ExportResponse& response, const std::string& message) {
    for (const auto& log : response.logs) {
        if (log.level == LogLevel::Warn && log.message == message) return true;
    }
    return false;
}

void TestChunkedProgress() {
    const std::string payload(10, 'x');
    for (std::size_t chunk : {1u, 3u, 4u, 5u, 10u, 64u}) {
        std::istringstream source(payload);
        std::atomic<bool> cancel{false};
        std::string sink;
        std::vector<std::uint64_t> sent;
        auto total = ChunkedUpload::StreamInChunks(
            source, payload.size(), cancel,
            [&](const char* data, std::size_t size) { sink.append(data, size); },
            [&](std::uint64_t s, std::uint64_t t) {
                assert(t == payload.size());
                sent.push_back(s);
            },
            chunk);
        assert(total == payload.size());
        assert(sink == payload);
        assert(!sent.empty() && sent.back() == payload.size());
        assert(sent.size() <= (payload.size() + chunk - 1) / chunk);
        for (std::size_t i = 1; i < sent.size(); ++i) {
            assert(sent[i] > sent[i - 1] && "progress is strictly increasing");
        }
    }

    std::istringstream empty("");
    std::atomic<bool> cancel{false};
    int events = 0;
    auto total = ChunkedUpload::StreamInChunks(empty, 0, cancel, [](const char*, std::size_t) {},
                                               [&](std::uint64_t, std::uint64_t) { ++events; });
    assert(total == 0 && events == 0);
    assert(ComputePercent(0, 0) == 0.0f);
    assert(ComputePercent(5, 10) == 50.0f);
    std::cout << "[PASS] chunked streaming progress" << std::endl;
}

void TestPathAndUserResolution() {
    assert(FileTransferExportAdapter::ResolveRemotePath("/srv/", "/a/b/post.md") == "/srv/post.md");
    assert(FileTransferExportAdapter::ResolveRemotePath("/srv/index.md", "/a/b/post.md") == "/srv/index.md");
    assert(FileTransferExportAdapter::ResolveUsername(" alice ") == "alice");
    std::cout << "[PASS] remote path and username resolution" << std::endl;
}

void TestSftpAgentUpload() {
    Harness h("sftp_agent", kSftpConfig);
    h.script->acceptAgent = true;

    ExportResponse response = h.run("prod");
    assert(response.ok);
    assert(response.summary == "SFTP export completed");
    assert(h.script->protocol == FtpProtocol::Sftp);
    assert(h.script->host == "files.example.org" && h.script->port == 22);
    assert(h.script->username == "deploy");
    assert(!h.script->passwordSeen && "no stored password offered");
    assert(h.script->remotePath == "/var/www/launch.md");
    assert(h.script->uploaded == "0123456789");

    assert(h.progress.size() == 3);
    assert(h.progress.back().sentBytes == 10 && h.progress.back().totalBytes == 10);
    assert(h.progress.back().percent == 100.0f);
    for (std::size_t i = 1; i < h.progress.size(); ++i) {
        assert(h.progress[i].percent > h.progress[i - 1].percent);
        assert(h.progress[i].jobId == "ftp-test");
    }
    std::cout << "[PASS] sftp upload through agent" << std::endl;
}

void TestSftpPasswordFallback() {
    Harness h("sftp_password", kSftpConfig);

    ExportResponse missing = h.run("prod");
    assert(missing.error && missing.error->code == ErrorCode::FtpMissingPassword);
    assert(missing.summary == "SFTP password missing (set in app or use SSH agent)");
    assert(!h.script->uploadCalled);

    h.storePassword("prod", "wrong");
    h.script->acceptedPassword = "right";
    ExportResponse rejected = h.run("prod");
    assert(rejected.error && rejected.error->code == ErrorCode::FtpFailed);
    assert(rejected.error->detail == std::optional<std::string>("Authentication failed"));

    h.storePassword("prod", " right ");
    ExportResponse accepted = h.run("prod");
    assert(accepted.ok);
    assert(h.script->passwordSeen == std::optional<std::string>("right"));
    std::cout << "[PASS] sftp password fallback" << std::endl;
}

void TestMissingUsername() {
    Harness h("sftp_user", kSftpConfig);
    h.script->acceptAgent = true;

    const char* previous = std::getenv("USER");
    std::string saved = previous ? previous : "";
    unsetenv("USER");
    ExportResponse response = h.run("anon");
    if (previous) setenv("USER", saved.c_str(), 1);

    assert(response.error && response.error->code == ErrorCode::FtpMissingUsername);
    assert(h.script->sessionsOpened == 0);

    if (previous) {
        ExportResponse fromEnv = h.run("anon");
        assert(fromEnv.ok);
        assert(h.script->username == saved);
        assert(h.script->remotePath == "/var/www/fixed.md");
    }
    std::cout << "[PASS] username falls back to $USER" << std::endl;
}

void TestPlainFtp() {
    Harness h("ftp_plain", kFtpConfig);
    h.script->acceptedPassword = "envpass";

    unsetenv(kFtpPasswordEnv);
    ExportResponse missing = h.run("legacy");
    assert(missing.error && missing.error->code == ErrorCode::FtpMissingPassword);
    assert(missing.summary == "FTP password missing (set in app)");
    assert(h.script->sessionsOpened == 0);

    setenv(kFtpPasswordEnv, "envpass", 1);
    ExportResponse viaEnv = h.run("legacy");
    unsetenv(kFtpPasswordEnv);
    assert(viaEnv.ok && viaEnv.summary == "FTP export completed");
    assert(HasWarn(viaEnv, "Using FTP password from environment"));
    assert(h.script->protocol == FtpProtocol::Ftp);
    assert(h.script->port == 2121);
    assert(h.script->remotePath == "htdocs/launch.md");

    h.storePassword("legacy", "stale");
    ExportResponse rejected = h.run("legacy");
    assert(rejected.error && rejected.error->code == ErrorCode::FtpFailed);
    assert(rejected.summary == "FTP export failed");
    assert(rejected.error->detail == std::optional<std::string>("Login rejected"));
    std::cout << "[PASS] plain ftp credentials" << std::endl;
}

void TestCancelMidStream() {
    Harness h("sftp_cancel", kSftpConfig);
    h.script->acceptAgent = true;
    h.script->cancelAfterFirstChunk = true;
    h.script->cancelToTrip = &h.cancel;

    ExportResponse response = h.run("prod");
    assert(!response.ok);
    assert(response.error->code == ErrorCode::ExportCancelled);
    assert(HasWarn(response, "Export cancelled"));
    assert(h.script->uploaded == "0123" && "no chunk after cancellation");
    assert(h.progress.size() == 1);
    std::cout << "[PASS] cancellation between chunks" << std::endl;
}

void TestTransportAndVaultFailures() {
    Harness h("sftp_fail", kSftpConfig);
    h.script->connectError = "Connection refused";
    ExportResponse refused = h.run("prod");
    assert(refused.error && refused.error->code == ErrorCode::FtpFailed);
    assert(refused.summary == "SFTP export failed");
    assert(refused.error->detail == std::optional<std::string>("Connection refused"));

    h.store->setBroken(true);
    ExportResponse vault = h.run("prod");
    assert(vault.error && vault.error->code == ErrorCode::FtpFailed);
    assert(vault.summary == "Unable to access credential storage");

    ExportResponse noProfile = h.run("");
    assert(noProfile.error && noProfile.error->code == ErrorCode::ProfileMissing);
    std::cout << "[PASS] transport and vault failures" << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting Transfer Export Test..." << std::endl;
    TestChunkedProgress();
    TestPathAndUserResolution();
    TestSftpAgentUpload();
    TestSftpPasswordFallback();
    TestMissingUsername();
    TestPlainFtp();
    TestCancelMidStream();
    TestTransportAndVaultFailures();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
