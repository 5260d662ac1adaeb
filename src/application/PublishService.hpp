/**
 * @file PublishService.hpp
 * @brief Static snapshot publisher: copies selected files and their local assets, then
 *        optionally commits and pushes the snapshot over SSH.
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "domain/PublishTypes.hpp"

namespace shipwright::application {

class PublishService {
public:
    /**
     * @brief Copies files (keeping their project-relative layout) plus referenced local assets.
     * @throws domain::PublishError on a fatal precondition or I/O failure.
     */
    domain::PublishResponse Publish(const domain::PublishRequest& request);

    /**
     * @brief Commits the publish directory and pushes it to an SSH remote.
     * @throws domain::PublishError on a fatal precondition or a failing git step.
     */
    domain::DeployResponse Deploy(const domain::DeployRequest& request);

    /** @brief Local link targets of Markdown links `](target)`, in document order. */
    static std::vector<std::string> ExtractLocalAssets(const std::string& content);

    /** @brief `_publish` by default; relative values are joined to the project root. */
    static std::filesystem::path ResolveOutputDir(const std::filesystem::path& projectRoot,
                                                  const std::optional<std::string>& outputDir);

    static bool IsSshUrl(const std::string& url);
};

} // namespace shipwright::application
