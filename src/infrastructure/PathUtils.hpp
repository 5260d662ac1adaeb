// PathUtils Header
#pragma once
#include <filesystem>
#include <optional>
#include <string>

namespace shipwright::infrastructure {

class PathUtils {
public:
    /**
     * @brief Nearest ancestor directory (starting at the document's folder) holding .export.toml.
     * @return Absolute, lexically normal project root, or nullopt.
     */
    static std::optional<std::filesystem::path> FindProjectRoot(const std::filesystem::path& documentPath);

    /** @brief Absolute paths are kept, relative ones are joined to base. */
    static std::filesystem::path ResolveAgainst(const std::filesystem::path& base, const std::string& value);

    /** @brief Component-wise containment check on canonical paths (child may equal parent). */
    static bool IsWithin(const std::filesystem::path& child, const std::filesystem::path& parent);

    static std::string FileNameOr(const std::filesystem::path& path, const std::string& fallback);
};

} // namespace shipwright::infrastructure
