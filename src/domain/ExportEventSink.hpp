/**
 * @file ExportEventSink.hpp
 * @brief One-way event channel from export workers to the requesting surface.
 */

#pragma once

#include "domain/ExportTypes.hpp"

namespace shipwright::domain {

/**
 * @class ExportEventSink
 * @brief Receives progress and completion events. Called from worker threads.
 *
 * Per job: zero or more onProgress calls with non-decreasing sentBytes, then exactly one onFinished.
 */
class ExportEventSink {
public:
    virtual ~ExportEventSink() = default;

    virtual void onProgress(const ExportProgress& progress) = 0;
    virtual void onFinished(const ExportFinished& finished) = 0;
};

} // namespace shipwright::domain
