#include "infrastructure/DeployLog.hpp"
#include "domain/PublishTypes.hpp"
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace shipwright::infrastructure {

std::string DeployLog::Timestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm localTime{};
    localtime_r(&t, &localTime);
    std::stringstream ss;
    ss << std::put_time(&localTime, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

void DeployLog::Append(const std::filesystem::path& logPath, const std::string& label, const std::string& message) {
    std::ofstream file(logPath, std::ios::app);
    if (!file.is_open()) {
        throw domain::PublishError("Unable to open " + logPath.string());
    }
    file << Timestamp() << " [" << label << "] " << message << "\n";
    if (!file) {
        throw domain::PublishError("Unable to write " + logPath.string());
    }
}

} // namespace shipwright::infrastructure
