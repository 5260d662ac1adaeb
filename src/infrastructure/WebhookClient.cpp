#include "infrastructure/WebhookClient.hpp"
#include <httplib.h>
#include <iostream>

namespace shipwright::infrastructure {

WebhookClient::WebhookClient(int timeoutSeconds)
    : m_timeoutSeconds(timeoutSeconds) {}

std::pair<std::string, std::string> WebhookClient::SplitUrl(const std::string& url) {
    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos || schemeEnd == 0) {
        throw WebhookError("Invalid URL: " + url);
    }
    std::string scheme = url.substr(0, schemeEnd);
    if (scheme != "http" && scheme != "https") {
        throw WebhookError("Unsupported URL scheme: " + scheme);
    }

    auto hostStart = schemeEnd + 3;
    auto pathStart = url.find_first_of("/?", hostStart);
    std::string authority = url.substr(hostStart, pathStart == std::string::npos ? std::string::npos : pathStart - hostStart);
    if (authority.empty()) {
        throw WebhookError("Invalid URL: " + url);
    }

    std::string path = pathStart == std::string::npos ? "/" : url.substr(pathStart);
    if (path.front() == '?') {
        path = "/" + path;
    }
    return {scheme + "://" + authority, path};
}

WebhookResponse WebhookClient::post(const std::string& url, const Headers& headers) const {
    auto [base, path] = SplitUrl(url);

    httplib::Client cli(base);
    cli.set_connection_timeout(m_timeoutSeconds);
    cli.set_read_timeout(m_timeoutSeconds);

    httplib::Headers requestHeaders;
    for (const auto& [name, value] : headers) {
        requestHeaders.emplace(name, value);
    }

    auto res = cli.Post(path, requestHeaders, std::string(), "application/json");
    if (!res) {
        std::string reason = httplib::to_string(res.error());
        std::cerr << "[WebhookClient] Connection failed: " << static_cast<int>(res.error())
                  << " (" << reason << ")" << std::endl;
        throw WebhookError(reason);
    }

    if (res->status < 200 || res->status >= 300) {
        std::cerr << "[WebhookClient] HTTP Error " << res->status << std::endl;
    }
    return WebhookResponse{res->status, res->body};
}

} // namespace shipwright::infrastructure
