/**
 * @file ChunkedUpload.hpp
 * @brief Streams a local source to a remote writer in fixed-size chunks.
 */

#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <istream>
#include "domain/TransferSession.hpp"

namespace shipwright::infrastructure {

inline constexpr std::size_t kUploadChunkSize = 8192;

class ChunkedUpload {
public:
    /** @brief Writes the whole buffer or throws domain::TransferError. */
    using ChunkWriter = std::function<void(const char* data, std::size_t size)>;

    /**
     * @brief Copies source into writer.
     *
     * The cancel flag is checked before every read. onProgress fires once after every
     * successful write, so a source of N bytes yields at most ceil(N / chunkSize) events
     * and the last one reports sentBytes == N.
     *
     * @return Number of bytes written.
     * @throws domain::ExportFailure (ExportCancelled) when cancellation is observed.
     * @throws domain::TransferError on read or write failure.
     */
    static std::uint64_t StreamInChunks(std::istream& source,
                                        std::uint64_t totalBytes,
                                        const std::atomic<bool>& cancel,
                                        const ChunkWriter& writer,
                                        const domain::TransferSession::ProgressCallback& onProgress,
                                        std::size_t chunkSize = kUploadChunkSize);
};

} // namespace shipwright::infrastructure
