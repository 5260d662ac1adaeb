/**
 * @file FtpSession.hpp
 * @brief Plain FTP upload using libcurl.
 */

#pragma once

#include "domain/TransferSession.hpp"

namespace shipwright::infrastructure {

/**
 * @class FtpSession
 * @brief Password login and single-shot put. No per-chunk progress is reported.
 */
class FtpSession : public domain::TransferSession {
public:
    FtpSession();

    void connect(const std::string& host, std::uint16_t port) override;
    bool authenticate(const std::string& username, const std::optional<std::string>& password) override;
    void upload(const std::filesystem::path& localFile,
                const std::string& remotePath,
                std::uint64_t totalBytes,
                const std::atomic<bool>& cancel,
                const ProgressCallback& onProgress) override;

private:
    std::string baseUrl() const;

    std::string m_host;
    std::uint16_t m_port = 21;
    std::string m_username;
    std::string m_password;
};

} // namespace shipwright::infrastructure
