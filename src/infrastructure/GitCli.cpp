#include "infrastructure/GitCli.hpp"
#include "infrastructure/TextUtils.hpp"

namespace shipwright::infrastructure {

ProcessResult GitCli::Run(const std::filesystem::path& workingDirectory,
                          const std::vector<std::string>& args) {
    return ProcessRunner::Run("git", args, workingDirectory, {{"LC_ALL", "C"}});
}

bool GitCli::IsAvailable() {
    return Run({}, {"--version"}).succeeded();
}

bool GitCli::IsWorkTree(const std::filesystem::path& path) {
    auto result = Run(path, {"rev-parse", "--is-inside-work-tree"});
    return result.succeeded() && TextUtils::Trim(result.output) == "true";
}

std::optional<std::filesystem::path> GitCli::TopLevel(const std::filesystem::path& path) {
    auto result = Run(path, {"rev-parse", "--show-toplevel"});
    if (!result.succeeded()) {
        return std::nullopt;
    }
    std::string top = TextUtils::Trim(result.output);
    if (top.empty()) {
        return std::nullopt;
    }
    return std::filesystem::path(top);
}

ProcessResult GitCli::Status(const std::filesystem::path& path) {
    return Run(path, {"status", "--porcelain"});
}

} // namespace shipwright::infrastructure
