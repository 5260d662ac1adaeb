#include "infrastructure/ProcessRunner.hpp"
#include <cstdio>
#include <sstream>
#include <sys/wait.h>

namespace shipwright::infrastructure {

std::string ProcessRunner::Quote(const std::string& value) {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted.push_back(c);
        }
    }
    quoted += "'";
    return quoted;
}

ProcessResult ProcessRunner::Run(const std::string& program,
                                 const std::vector<std::string>& args,
                                 const std::filesystem::path& workingDirectory,
                                 const std::map<std::string, std::string>& environment) {
    std::stringstream cmd;
    if (!workingDirectory.empty()) {
        cmd << "cd " << Quote(workingDirectory.string()) << " && ";
    }
    for (const auto& [name, value] : environment) {
        cmd << name << "=" << Quote(value) << " ";
    }
    cmd << Quote(program);
    for (const auto& arg : args) {
        cmd << " " << Quote(arg);
    }
    cmd << " 2>&1";

    ProcessResult result;
    FILE* pipe = popen(cmd.str().c_str(), "r");
    if (!pipe) {
        result.output = "popen failed to start command";
        return result;
    }

    char buffer[256];
    while (fgets(buffer, sizeof(buffer), pipe) != nullptr) {
        result.output.append(buffer);
    }

    int status = pclose(pipe);
    if (status != -1 && WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    }
    return result;
}

} // namespace shipwright::infrastructure
