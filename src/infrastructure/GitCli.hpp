/**
 * @file GitCli.hpp
 * @brief Thin wrapper over the installed git executable.
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "infrastructure/ProcessRunner.hpp"

namespace shipwright::infrastructure {

/**
 * @class GitCli
 * @brief Runs git with explicit arguments in a working directory.
 *
 * Output is forced to the C locale so that messages such as "nothing to commit"
 * can be matched regardless of the user's language.
 */
class GitCli {
public:
    static ProcessResult Run(const std::filesystem::path& workingDirectory,
                             const std::vector<std::string>& args);

    /** @brief True when `git --version` runs successfully. */
    static bool IsAvailable();

    static bool IsWorkTree(const std::filesystem::path& path);

    /** @brief `git rev-parse --show-toplevel`, trimmed. */
    static std::optional<std::filesystem::path> TopLevel(const std::filesystem::path& path);

    /** @brief `git status --porcelain`. */
    static ProcessResult Status(const std::filesystem::path& path);
};

} // namespace shipwright::infrastructure
