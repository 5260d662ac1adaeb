#include "application/export/FileTransferExportAdapter.hpp"
#include "domain/ExportFailure.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/TextUtils.hpp"
#include <cstdlib>

namespace shipwright::application {

namespace fs = std::filesystem;
using namespace shipwright::domain;
using infrastructure::PathUtils;
using infrastructure::TextUtils;

FileTransferExportAdapter::FileTransferExportAdapter(const CredentialService& credentials,
                                                     TransferSessionFactory sessionFactory)
    : m_credentials(credentials), m_sessionFactory(std::move(sessionFactory)) {}

std::string FileTransferExportAdapter::ResolveUsername(const std::string& configured) {
    std::string trimmed = TextUtils::Trim(configured);
    if (!trimmed.empty()) {
        return trimmed;
    }
    const char* user = std::getenv("USER");
    return user ? std::string(user) : std::string();
}

std::string FileTransferExportAdapter::ResolveRemotePath(const std::string& remotePath, const fs::path& document) {
    if (!remotePath.empty() && remotePath.back() == '/') {
        return remotePath + PathUtils::FileNameOr(document, "export.md");
    }
    return remotePath;
}

std::unique_ptr<TransferSession> FileTransferExportAdapter::openSession(FtpProtocol protocol) const {
    auto session = m_sessionFactory ? m_sessionFactory(protocol) : nullptr;
    if (!session) {
        throw TransferError("No transfer session available");
    }
    return session;
}

std::string FileTransferExportAdapter::run(const ProjectConfig& config, ExportContext& context) {
    if (!config.ftp || !config.ftp->enabled) {
        throw ExportFailure(ErrorCode::TargetDisabled, "FTP export is disabled");
    }
    const FtpSection& section = *config.ftp;
    const FtpProfile& profile = SelectFtpProfile(section, context.request().profile);
    ResolvedFtpConfig resolved = section.resolve(profile);

    context.checkpoint();

    std::optional<std::string> storedPassword;
    try {
        storedPassword = m_credentials.get(context.request().filePath, CredentialTarget::Ftp,
                                           context.request().profile, CredentialKind::Password);
    } catch (const CredentialError& e) {
        throw ExportFailure(ErrorCode::FtpFailed, "Unable to access credential storage", std::string(e.what()));
    }

    std::string username = ResolveUsername(resolved.username);
    if (username.empty()) {
        throw ExportFailure(ErrorCode::FtpMissingUsername, "FTP username is missing");
    }

    std::string remotePath = ResolveRemotePath(resolved.remotePath, context.documentPath());

    std::error_code ec;
    std::uintmax_t size = fs::file_size(context.documentPath(), ec);
    if (ec) {
        throw ExportFailure(ErrorCode::FtpFailed, "Unable to read file metadata", ec.message());
    }
    auto totalBytes = static_cast<std::uint64_t>(size);

    if (resolved.protocol == FtpProtocol::Sftp) {
        return runSecure(resolved, username, remotePath, totalBytes, storedPassword, context);
    }
    return runPlain(resolved, username, remotePath, totalBytes, storedPassword, context);
}

std::string FileTransferExportAdapter::runSecure(const ResolvedFtpConfig& resolved,
                                                 const std::string& username,
                                                 const std::string& remotePath,
                                                 std::uint64_t totalBytes,
                                                 const std::optional<std::string>& storedPassword,
                                                 ExportContext& context) {
    context.info("Connecting via SFTP", resolved.host);
    context.checkpoint();
    try {
        auto session = openSession(FtpProtocol::Sftp);
        session->connect(resolved.host, resolved.port);
        if (!session->authenticate(username, storedPassword)) {
            if (!storedPassword) {
                throw ExportFailure(ErrorCode::FtpMissingPassword,
                                    "SFTP password missing (set in app or use SSH agent)");
            }
            throw ExportFailure(ErrorCode::FtpFailed, "SFTP export failed", std::string("Authentication failed"));
        }
        context.checkpoint();
        session->upload(context.documentPath(), remotePath, totalBytes, context.cancelFlag(),
                        [&context](std::uint64_t sent, std::uint64_t total) {
                            context.reportProgress(sent, total);
                        });
    } catch (const TransferError& e) {
        throw ExportFailure(ErrorCode::FtpFailed, "SFTP export failed", std::string(e.what()));
    }
    return "SFTP export completed";
}

std::string FileTransferExportAdapter::runPlain(const ResolvedFtpConfig& resolved,
                                                const std::string& username,
                                                const std::string& remotePath,
                                                std::uint64_t totalBytes,
                                                const std::optional<std::string>& storedPassword,
                                                ExportContext& context) {
    std::string password = storedPassword.value_or("");
    if (password.empty()) {
        const char* fromEnv = std::getenv(kFtpPasswordEnv);
        if (fromEnv && *fromEnv) {
            password = fromEnv;
            context.warn("Using FTP password from environment", std::string(kFtpPasswordEnv));
        }
    }
    if (password.empty()) {
        throw ExportFailure(ErrorCode::FtpMissingPassword, "FTP password missing (set in app)");
    }

    context.info("Connecting via FTP", resolved.host);
    context.checkpoint();
    try {
        auto session = openSession(FtpProtocol::Ftp);
        session->connect(resolved.host, resolved.port);
        if (!session->authenticate(username, password)) {
            throw ExportFailure(ErrorCode::FtpFailed, "FTP export failed", std::string("Login rejected"));
        }
        context.checkpoint();
        session->upload(context.documentPath(), remotePath, totalBytes, context.cancelFlag(),
                        [&context](std::uint64_t sent, std::uint64_t total) {
                            context.reportProgress(sent, total);
                        });
    } catch (const TransferError& e) {
        throw ExportFailure(ErrorCode::FtpFailed, "FTP export failed", std::string(e.what()));
    }
    return "FTP export completed";
}

} // namespace shipwright::application
