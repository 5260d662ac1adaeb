#include "infrastructure/FtpSession.hpp"
#include "domain/ExportFailure.hpp"
#include <cstdio>
#include <memory>
#include <mutex>
#include <curl/curl.h>

namespace shipwright::infrastructure {

using domain::TransferError;

namespace {

struct CurlDeleter {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

struct FileCloser {
    void operator()(std::FILE* file) const { std::fclose(file); }
};

using CurlPtr = std::unique_ptr<CURL, CurlDeleter>;

CurlPtr NewHandle() {
    static std::once_flag initOnce;
    std::call_once(initOnce, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });

    CurlPtr curl(curl_easy_init());
    if (!curl) {
        throw TransferError("curl_easy_init failed");
    }
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, 30L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    return curl;
}

} // namespace

FtpSession::FtpSession() = default;

std::string FtpSession::baseUrl() const {
    return "ftp://" + m_host + ":" + std::to_string(m_port) + "/";
}

void FtpSession::connect(const std::string& host, std::uint16_t port) {
    if (host.empty()) {
        throw TransferError("FTP host is empty");
    }
    // libcurl opens the control connection lazily; login and transfer happen per request.
    m_host = host;
    m_port = port;
}

bool FtpSession::authenticate(const std::string& username, const std::optional<std::string>& password) {
    m_username = username;
    m_password = password.value_or("");

    CurlPtr curl = NewHandle();
    std::string url = baseUrl();
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_USERNAME, m_username.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_PASSWORD, m_password.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);

    CURLcode rc = curl_easy_perform(curl.get());
    if (rc == CURLE_LOGIN_DENIED) {
        return false;
    }
    if (rc != CURLE_OK) {
        throw TransferError(curl_easy_strerror(rc));
    }
    return true;
}

void FtpSession::upload(const std::filesystem::path& localFile,
                        const std::string& remotePath,
                        std::uint64_t totalBytes,
                        const std::atomic<bool>& cancel,
                        const ProgressCallback& /*onProgress*/) {
    if (cancel.load()) {
        throw domain::ExportFailure(domain::ErrorCode::ExportCancelled, "Export cancelled");
    }

    std::unique_ptr<std::FILE, FileCloser> file(std::fopen(localFile.c_str(), "rb"));
    if (!file) {
        throw TransferError("Unable to open " + localFile.string());
    }

    // Absolute remote paths are sent as %2F so the server does not resolve them from the login directory.
    std::string url = baseUrl();
    if (!remotePath.empty() && remotePath.front() == '/') {
        url += "%2F" + remotePath.substr(1);
    } else {
        url += remotePath;
    }

    CurlPtr curl = NewHandle();
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_USERNAME, m_username.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_PASSWORD, m_password.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_UPLOAD, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_READDATA, file.get());
    curl_easy_setopt(curl.get(), CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(totalBytes));

    CURLcode rc = curl_easy_perform(curl.get());
    if (rc != CURLE_OK) {
        throw TransferError(curl_easy_strerror(rc));
    }
}

} // namespace shipwright::infrastructure
