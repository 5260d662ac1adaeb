/**
 * @file ExportConfigLoader.hpp
 * @brief Static utility that discovers, reads, parses and validates .export.toml.
 *
 * The configuration is read fresh on every call; nothing is cached.
 */

#pragma once

#include <filesystem>
#include <string>
#include "domain/ExportConfig.hpp"

namespace shipwright::infrastructure {

class ExportConfigLoader {
public:
    /**
     * @brief Loads the configuration governing a document.
     * @param documentPath Path of the exported document.
     * @throws domain::ExportFailure ConfigMissing / ConfigInvalid / UnsupportedConfigVersion.
     */
    static domain::ProjectConfig Load(const std::filesystem::path& documentPath);

    /** @brief Reads <projectRoot>/.export.toml, then parses and validates it. */
    static domain::ProjectConfig LoadFromRoot(const std::filesystem::path& projectRoot);

    /**
     * @brief Parses TOML text into a ProjectConfig without semantic validation.
     * @throws domain::ExportFailure ConfigInvalid.
     */
    static domain::ProjectConfig Parse(const std::string& text);
};

} // namespace shipwright::infrastructure
