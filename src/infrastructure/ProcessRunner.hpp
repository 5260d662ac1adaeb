/**
 * @file ProcessRunner.hpp
 * @brief Runs an external program through the shell and captures its combined output.
 */

#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace shipwright::infrastructure {

struct ProcessResult {
    int exitCode = -1;      ///< -1 when the process could not be started or did not exit normally.
    std::string output;     ///< stdout and stderr, interleaved as produced.

    bool succeeded() const { return exitCode == 0; }
};

class ProcessRunner {
public:
    /**
     * @brief Runs `program args...` inside workingDirectory. Arguments are shell-quoted.
     * @param environment Extra variables set only for this invocation.
     */
    static ProcessResult Run(const std::string& program,
                             const std::vector<std::string>& args,
                             const std::filesystem::path& workingDirectory,
                             const std::map<std::string, std::string>& environment = {});

    /** @brief POSIX single-quote escaping. */
    static std::string Quote(const std::string& value);
};

} // namespace shipwright::infrastructure
