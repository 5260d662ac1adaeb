/**
 * @file PublishTypes.hpp
 * @brief Requests and results of the static snapshot publisher.
 */

#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace shipwright::domain {

inline constexpr const char* kDefaultPublishDir = "_publish";
inline constexpr const char* kDeployLogName = ".deploy.log";
inline constexpr const char* kDefaultDeployBranch = "main";

/** @brief Fatal precondition failure of publish or deploy. */
class PublishError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct PublishRequest {
    std::string projectRoot;
    std::vector<std::string> files;
    std::optional<std::string> outputDir;
};

struct PublishResponse {
    bool ok = false;
    std::string summary;
    std::vector<std::string> warnings;
};

struct DeployRequest {
    std::string projectRoot;
    std::optional<std::string> outputDir;
    std::string remote;
    std::optional<std::string> branch;
};

struct DeployResponse {
    bool ok = false;
    std::string summary;
    std::vector<std::string> logs;   ///< Each git invocation as "git <args>".
};

} // namespace shipwright::domain
