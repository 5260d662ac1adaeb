#include "infrastructure/ChunkedUpload.hpp"
#include "domain/ExportFailure.hpp"
#include <vector>

namespace shipwright::infrastructure {

std::uint64_t ChunkedUpload::StreamInChunks(std::istream& source,
                                            std::uint64_t totalBytes,
                                            const std::atomic<bool>& cancel,
                                            const ChunkWriter& writer,
                                            const domain::TransferSession::ProgressCallback& onProgress,
                                            std::size_t chunkSize) {
    if (chunkSize == 0) {
        chunkSize = kUploadChunkSize;
    }
    std::vector<char> buffer(chunkSize);
    std::uint64_t sentBytes = 0;

    for (;;) {
        if (cancel.load()) {
            throw domain::ExportFailure(domain::ErrorCode::ExportCancelled, "Export cancelled");
        }

        source.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize readBytes = source.gcount();
        if (source.bad()) {
            throw domain::TransferError("Failed to read local file");
        }
        if (readBytes <= 0) {
            break;
        }

        writer(buffer.data(), static_cast<std::size_t>(readBytes));
        sentBytes += static_cast<std::uint64_t>(readBytes);

        if (onProgress) {
            onProgress(sentBytes, totalBytes);
        }
        if (source.eof()) {
            break;
        }
    }
    return sentBytes;
}

} // namespace shipwright::infrastructure
