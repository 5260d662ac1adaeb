/**
 * @file SftpSession.hpp
 * @brief Secure file transfer over SSH using libssh.
 */

#pragma once

#include <memory>
#include "domain/TransferSession.hpp"

struct ssh_session_struct;

namespace shipwright::infrastructure {

/**
 * @class SftpSession
 * @brief Agent-first SSH authentication and chunked SFTP upload with progress.
 */
class SftpSession : public domain::TransferSession {
public:
    SftpSession();
    ~SftpSession() override;

    SftpSession(const SftpSession&) = delete;
    SftpSession& operator=(const SftpSession&) = delete;

    void connect(const std::string& host, std::uint16_t port) override;
    bool authenticate(const std::string& username, const std::optional<std::string>& password) override;
    void upload(const std::filesystem::path& localFile,
                const std::string& remotePath,
                std::uint64_t totalBytes,
                const std::atomic<bool>& cancel,
                const ProgressCallback& onProgress) override;

private:
    std::string lastError() const;

    ssh_session_struct* m_session = nullptr;
    bool m_connected = false;
    bool m_authenticated = false;
};

} // namespace shipwright::infrastructure
