// TransferSession double: scripted outcomes, upload lands in memory.
#pragma once

#include <fstream>
#include <memory>
#include <string>
#include "domain/TransferSession.hpp"
#include "infrastructure/ChunkedUpload.hpp"

namespace shipwright::test {

/** @brief Shared between the test and the sessions the adapter creates. */
struct TransferScript {
    // Script
    bool acceptAgent = false;
    std::optional<std::string> acceptedPassword;
    std::optional<std::string> connectError;
    std::size_t chunkSize = 4;
    bool cancelAfterFirstChunk = false;
    std::atomic<bool>* cancelToTrip = nullptr;

    // Observations
    int sessionsOpened = 0;
    std::optional<domain::FtpProtocol> protocol;
    std::string host;
    std::uint16_t port = 0;
    std::string username;
    std::optional<std::string> passwordSeen;
    std::string remotePath;
    std::string uploaded;
    bool uploadCalled = false;
};

class ScriptedTransferSession : public domain::TransferSession {
public:
    explicit ScriptedTransferSession(std::shared_ptr<TransferScript> script)
        : m_script(std::move(script)) {}

    void connect(const std::string& host, std::uint16_t port) override {
        m_script->host = host;
        m_script->port = port;
        if (m_script->connectError) {
            throw domain::TransferError(*m_script->connectError);
        }
    }

    bool authenticate(const std::string& username, const std::optional<std::string>& password) override {
        m_script->username = username;
        m_script->passwordSeen = password;
        if (m_script->acceptAgent) return true;
        return password && m_script->acceptedPassword && *password == *m_script->acceptedPassword;
    }

    void upload(const std::filesystem::path& localFile,
                const std::string& remotePath,
                std::uint64_t totalBytes,
                const std::atomic<bool>& cancel,
                const ProgressCallback& onProgress) override {
        m_script->uploadCalled = true;
        m_script->remotePath = remotePath;
        std::ifstream in(localFile, std::ios::binary);
        auto script = m_script;
        infrastructure::ChunkedUpload::StreamInChunks(in, totalBytes, cancel,
            [script](const char* data, std::size_t size) {
                script->uploaded.append(data, size);
                if (script->cancelAfterFirstChunk && script->cancelToTrip) {
                    script->cancelToTrip->store(true);
                }
            },
            onProgress, m_script->chunkSize);
    }

    static domain::TransferSessionFactory Factory(std::shared_ptr<TransferScript> script) {
        return [script](domain::FtpProtocol protocol) -> std::unique_ptr<domain::TransferSession> {
            script->sessionsOpened++;
            script->protocol = protocol;
            return std::make_unique<ScriptedTransferSession>(script);
        };
    }

private:
    std::shared_ptr<TransferScript> m_script;
};

} // namespace shipwright::test
