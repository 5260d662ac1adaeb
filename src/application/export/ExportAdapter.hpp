/**
 * @file ExportAdapter.hpp
 * @brief Interface implemented by every delivery backend.
 */

#pragma once

#include <string>
#include "application/export/ExportContext.hpp"
#include "domain/ExportConfig.hpp"

namespace shipwright::application {

class ExportAdapter {
public:
    virtual ~ExportAdapter() = default;

    virtual domain::ExportTarget target() const = 0;

    /** @brief Code reported when an unexpected exception escapes run(). */
    virtual domain::ErrorCode failureCode() const = 0;

    /**
     * @brief Executes the delivery steps in order.
     * @return Success summary.
     * @throws domain::ExportFailure on the first failing step, including cancellation.
     */
    virtual std::string run(const domain::ProjectConfig& config, ExportContext& context) = 0;
};

} // namespace shipwright::application
