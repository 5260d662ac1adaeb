/**
 * @file GitExportAdapter.hpp
 * @brief Stages (and optionally commits) the exported document with the installed git.
 */

#pragma once

#include "application/export/ExportAdapter.hpp"

namespace shipwright::application {

/**
 * @class GitExportAdapter
 * @brief Runs the configured repository checks, then `git add` and, in add-and-commit mode,
 *        `git commit -m "Export <filename>"`. A commit with nothing to record is a success.
 */
class GitExportAdapter : public ExportAdapter {
public:
    domain::ExportTarget target() const override { return domain::ExportTarget::Git; }
    domain::ErrorCode failureCode() const override { return domain::ErrorCode::GitFailed; }

    std::string run(const domain::ProjectConfig& config, ExportContext& context) override;
};

} // namespace shipwright::application
