/**
 * @file ExportFailure.hpp
 * @brief Exception used inside the export pipeline to short-circuit a step sequence.
 */

#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include "domain/ExportTypes.hpp"

namespace shipwright::domain {

/**
 * @class ExportFailure
 * @brief Carries a terminal error code up to the pipeline, which turns it into an ExportResponse.
 */
class ExportFailure : public std::runtime_error {
public:
    ExportFailure(ErrorCode code, const std::string& message, std::optional<std::string> detail = std::nullopt)
        : std::runtime_error(message), m_code(code), m_detail(std::move(detail)) {}

    ErrorCode code() const { return m_code; }
    const std::optional<std::string>& detail() const { return m_detail; }

    ExportError toError() const {
        return ExportError{m_code, what(), m_detail};
    }

private:
    ErrorCode m_code;
    std::optional<std::string> m_detail;
};

} // namespace shipwright::domain
