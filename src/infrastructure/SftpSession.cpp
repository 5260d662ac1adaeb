#include "infrastructure/SftpSession.hpp"
#include "infrastructure/ChunkedUpload.hpp"
#include <fcntl.h>
#include <fstream>
#include <iostream>
#include <sys/stat.h>
#include <libssh/libssh.h>
#include <libssh/sftp.h>

namespace shipwright::infrastructure {

using domain::TransferError;

namespace {

struct SftpDeleter {
    void operator()(sftp_session_struct* sftp) const { sftp_free(sftp); }
};

struct SftpFileDeleter {
    void operator()(sftp_file_struct* file) const { sftp_close(file); }
};

using SftpPtr = std::unique_ptr<sftp_session_struct, SftpDeleter>;
using SftpFilePtr = std::unique_ptr<sftp_file_struct, SftpFileDeleter>;

} // namespace

SftpSession::SftpSession() {
    m_session = ssh_new();
    if (!m_session) {
        throw TransferError("ssh_new failed");
    }
}

SftpSession::~SftpSession() {
    if (m_connected) {
        ssh_disconnect(m_session);
    }
    ssh_free(m_session);
}

std::string SftpSession::lastError() const {
    const char* message = ssh_get_error(m_session);
    return message ? std::string(message) : std::string("unknown SSH error");
}

void SftpSession::connect(const std::string& host, std::uint16_t port) {
    unsigned int sshPort = port;
    ssh_options_set(m_session, SSH_OPTIONS_HOST, host.c_str());
    ssh_options_set(m_session, SSH_OPTIONS_PORT, &sshPort);

    if (ssh_connect(m_session) != SSH_OK) {
        throw TransferError(lastError());
    }
    m_connected = true;

    // A changed host key means a possible man in the middle; unknown hosts are accepted.
    switch (ssh_session_is_known_server(m_session)) {
        case SSH_KNOWN_HOSTS_CHANGED:
        case SSH_KNOWN_HOSTS_OTHER:
            throw TransferError("Host key for " + host + " does not match known_hosts");
        case SSH_KNOWN_HOSTS_ERROR:
            throw TransferError(lastError());
        default:
            break;
    }
}

bool SftpSession::authenticate(const std::string& username, const std::optional<std::string>& password) {
    ssh_options_set(m_session, SSH_OPTIONS_USER, username.c_str());

    if (ssh_userauth_agent(m_session, username.c_str()) == SSH_AUTH_SUCCESS) {
        m_authenticated = true;
        return true;
    }
    std::cout << "[SftpSession] Agent authentication unavailable for " << username << std::endl;

    if (password) {
        int rc = ssh_userauth_password(m_session, username.c_str(), password->c_str());
        if (rc == SSH_AUTH_ERROR) {
            throw TransferError(lastError());
        }
        m_authenticated = (rc == SSH_AUTH_SUCCESS);
    }
    return m_authenticated;
}

void SftpSession::upload(const std::filesystem::path& localFile,
                         const std::string& remotePath,
                         std::uint64_t totalBytes,
                         const std::atomic<bool>& cancel,
                         const ProgressCallback& onProgress) {
    if (!m_authenticated) {
        throw TransferError("SSH session is not authenticated");
    }

    SftpPtr sftp(sftp_new(m_session));
    if (!sftp) {
        throw TransferError(lastError());
    }
    if (sftp_init(sftp.get()) != SSH_OK) {
        throw TransferError("sftp_init failed: " + lastError());
    }

    SftpFilePtr remote(sftp_open(sftp.get(), remotePath.c_str(), O_WRONLY | O_CREAT | O_TRUNC,
                                 S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH));
    if (!remote) {
        throw TransferError("Unable to open remote file " + remotePath + ": " + lastError());
    }

    std::ifstream local(localFile, std::ios::binary);
    if (!local.is_open()) {
        throw TransferError("Unable to open " + localFile.string());
    }

    ChunkedUpload::StreamInChunks(local, totalBytes, cancel,
        [this, &remote](const char* data, std::size_t size) {
            std::size_t written = 0;
            while (written < size) {
                ssize_t n = sftp_write(remote.get(), data + written, size - written);
                if (n < 0) {
                    throw TransferError("sftp_write failed: " + lastError());
                }
                written += static_cast<std::size_t>(n);
            }
        },
        onProgress);
}

} // namespace shipwright::infrastructure
