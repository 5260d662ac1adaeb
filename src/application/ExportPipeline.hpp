/**
 * @file ExportPipeline.hpp
 * @brief Sequential export steps shared by all targets: checks, config load, adapter dispatch.
 */

#pragma once

#include <map>
#include <memory>
#include <vector>
#include "application/export/ExportAdapter.hpp"
#include "application/export/ExportContext.hpp"
#include "domain/ExportTypes.hpp"

namespace shipwright::application {

/**
 * @class ExportPipeline
 * @brief Turns one ExportContext into exactly one terminal ExportResponse. Never throws.
 *
 * Cancellation checkpoints: before anything runs, after the configuration is loaded,
 * and whatever the adapter polls itself.
 */
class ExportPipeline {
public:
    explicit ExportPipeline(std::vector<std::unique_ptr<ExportAdapter>> adapters);

    domain::ExportResponse run(ExportContext& context) const;

private:
    std::string execute(ExportContext& context) const;

    std::map<domain::ExportTarget, std::unique_ptr<ExportAdapter>> m_adapters;
};

} // namespace shipwright::application
