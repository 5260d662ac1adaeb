/**
 * @file FileTransferExportAdapter.hpp
 * @brief Uploads the document over SFTP (agent first, then password) or plain FTP.
 */

#pragma once

#include <filesystem>
#include <string>
#include "application/CredentialService.hpp"
#include "application/export/ExportAdapter.hpp"
#include "domain/TransferSession.hpp"

namespace shipwright::application {

inline constexpr const char* kFtpPasswordEnv = "SHIPWRIGHT_FTP_PASSWORD";

class FileTransferExportAdapter : public ExportAdapter {
public:
    FileTransferExportAdapter(const CredentialService& credentials, domain::TransferSessionFactory sessionFactory);

    domain::ExportTarget target() const override { return domain::ExportTarget::Ftp; }
    domain::ErrorCode failureCode() const override { return domain::ErrorCode::FtpFailed; }

    std::string run(const domain::ProjectConfig& config, ExportContext& context) override;

    /** @brief Configured username if not blank, else $USER, else empty. */
    static std::string ResolveUsername(const std::string& configured);

    /** @brief Appends the document's file name when the remote path ends with '/'. */
    static std::string ResolveRemotePath(const std::string& remotePath, const std::filesystem::path& document);

private:
    std::string runSecure(const domain::ResolvedFtpConfig& resolved,
                          const std::string& username,
                          const std::string& remotePath,
                          std::uint64_t totalBytes,
                          const std::optional<std::string>& storedPassword,
                          ExportContext& context);

    std::string runPlain(const domain::ResolvedFtpConfig& resolved,
                         const std::string& username,
                         const std::string& remotePath,
                         std::uint64_t totalBytes,
                         const std::optional<std::string>& storedPassword,
                         ExportContext& context);

    std::unique_ptr<domain::TransferSession> openSession(domain::FtpProtocol protocol) const;

    const CredentialService& m_credentials;
    domain::TransferSessionFactory m_sessionFactory;
};

} // namespace shipwright::application
