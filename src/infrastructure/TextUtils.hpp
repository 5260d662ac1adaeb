// TextUtils Header
#pragma once
#include <string>

namespace shipwright::infrastructure {

class TextUtils {
public:
    static std::string Trim(const std::string& s) {
        const char* ws = " \t\r\n";
        auto first = s.find_first_not_of(ws);
        if (first == std::string::npos) {
            return "";
        }
        auto last = s.find_last_not_of(ws);
        return s.substr(first, last - first + 1);
    }

    static bool IsBlank(const std::string& s) {
        return s.find_first_not_of(" \t\r\n") == std::string::npos;
    }

    static bool StartsWith(const std::string& s, const std::string& prefix) {
        return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
    }
};

} // namespace shipwright::infrastructure
