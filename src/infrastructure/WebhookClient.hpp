/**
 * @file WebhookClient.hpp
 * @brief Minimal HTTP(S) POST client used to trigger platform deploys.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace shipwright::infrastructure {

/** @brief Bad URL or transport failure (no HTTP status was received). */
class WebhookError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct WebhookResponse {
    int status = 0;
    std::string body;

    bool isSuccess() const { return status >= 200 && status < 300; }

    /** @brief Response body when it has content, otherwise "HTTP <status>". */
    std::string failureDetail() const {
        if (body.find_first_not_of(" \t\r\n") != std::string::npos) {
            return body;
        }
        return "HTTP " + std::to_string(status);
    }
};

class WebhookClient {
public:
    using Headers = std::vector<std::pair<std::string, std::string>>;

    explicit WebhookClient(int timeoutSeconds = 30);

    /**
     * @brief POSTs an empty body to url.
     * @throws WebhookError when the URL is malformed or the request could not be sent.
     */
    WebhookResponse post(const std::string& url, const Headers& headers) const;

    /** @brief Splits "scheme://host[:port]/path?q" into ("scheme://host[:port]", "/path?q"). */
    static std::pair<std::string, std::string> SplitUrl(const std::string& url);

private:
    int m_timeoutSeconds;
};

} // namespace shipwright::infrastructure
