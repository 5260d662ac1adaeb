/**
 * @file TransferSession.hpp
 * @brief Port for a single file-transfer connection (secure or plain).
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include "domain/ExportConfig.hpp"

namespace shipwright::domain {

/** @brief Transport or protocol failure; the message is kept verbatim as diagnostic detail. */
class TransferError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @class TransferSession
 * @brief One connection to a remote file server. Not shared between jobs.
 */
class TransferSession {
public:
    using ProgressCallback = std::function<void(std::uint64_t sentBytes, std::uint64_t totalBytes)>;

    virtual ~TransferSession() = default;

    /** @throws TransferError */
    virtual void connect(const std::string& host, std::uint16_t port) = 0;

    /**
     * @brief Authenticates the session.
     *
     * Secure sessions try the SSH agent first and fall back to the password when one is given.
     * Plain sessions log in with the password.
     * @return false when the server rejected every attempted method.
     * @throws TransferError on transport failure.
     */
    virtual bool authenticate(const std::string& username, const std::optional<std::string>& password) = 0;

    /**
     * @brief Uploads a local file. Cancellation is polled between chunks where the protocol streams.
     * @throws TransferError, or ExportFailure(ExportCancelled) when the flag is observed.
     */
    virtual void upload(const std::filesystem::path& localFile,
                        const std::string& remotePath,
                        std::uint64_t totalBytes,
                        const std::atomic<bool>& cancel,
                        const ProgressCallback& onProgress) = 0;
};

using TransferSessionFactory = std::function<std::unique_ptr<TransferSession>(FtpProtocol)>;

} // namespace shipwright::domain
