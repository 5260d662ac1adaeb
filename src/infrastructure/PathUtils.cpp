#include "infrastructure/PathUtils.hpp"
#include "domain/ExportConfig.hpp"
#include <algorithm>
#include <system_error>

namespace shipwright::infrastructure {

namespace fs = std::filesystem;

std::optional<fs::path> PathUtils::FindProjectRoot(const fs::path& documentPath) {
    std::error_code ec;
    fs::path absolute = fs::absolute(documentPath, ec);
    if (ec) {
        return std::nullopt;
    }
    absolute = absolute.lexically_normal();

    fs::path start = fs::is_directory(absolute, ec) ? absolute : absolute.parent_path();
    if (start.empty()) {
        return std::nullopt;
    }

    for (fs::path dir = start;; dir = dir.parent_path()) {
        if (fs::exists(dir / domain::kConfigFileName, ec)) {
            return dir;
        }
        if (dir == dir.root_path() || !dir.has_parent_path() || dir.parent_path() == dir) {
            break;
        }
    }
    return std::nullopt;
}

fs::path PathUtils::ResolveAgainst(const fs::path& base, const std::string& value) {
    fs::path path(value);
    if (path.is_absolute()) {
        return path.lexically_normal();
    }
    return (base / path).lexically_normal();
}

bool PathUtils::IsWithin(const fs::path& child, const fs::path& parent) {
    std::error_code ec;
    fs::path c = fs::weakly_canonical(child, ec);
    if (ec) c = fs::absolute(child).lexically_normal();
    fs::path p = fs::weakly_canonical(parent, ec);
    if (ec) p = fs::absolute(parent).lexically_normal();

    // weakly_canonical keeps a trailing separator as an empty last element
    if (!p.empty() && p.filename().empty()) {
        p = p.parent_path();
    }

    auto pit = p.begin();
    auto cit = c.begin();
    for (; pit != p.end(); ++pit, ++cit) {
        if (cit == c.end() || *pit != *cit) {
            return false;
        }
    }
    return true;
}

std::string PathUtils::FileNameOr(const fs::path& path, const std::string& fallback) {
    std::string name = path.filename().string();
    return name.empty() ? fallback : name;
}

} // namespace shipwright::infrastructure
