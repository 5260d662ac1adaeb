// DeployLog Header
#pragma once
#include <filesystem>
#include <string>

namespace shipwright::infrastructure {

class DeployLog {
public:
    /**
     * @brief Appends "YYYY-mm-dd HH:MM:SS [LABEL] message" to the log file, creating it if needed.
     * @throws domain::PublishError if the file cannot be written.
     */
    static void Append(const std::filesystem::path& logPath, const std::string& label, const std::string& message);

    /** @brief Local time formatted as YYYY-mm-dd HH:MM:SS. */
    static std::string Timestamp();
};

} // namespace shipwright::infrastructure
