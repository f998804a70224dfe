#pragma once

#include "transfer/PathGuard.hpp"
#include "types/Chunk.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace sm::transfer {

struct WriteResult {
    uint64_t bytesWritten{0};
    uint64_t fileSize{0};       // size of the destination file after the write
};

class ChunkTransport {
public:
    ChunkTransport(const PathGuard& guard, uint64_t chunkSize) : guard_(guard), chunkSize_(chunkSize) {}

    // Source side. end == 0 means start + chunkSize; the range is clamped to the file size.
    [[nodiscard]] types::Chunk readChunk(const std::string& path, uint64_t start, uint64_t end) const;

    // Destination side. The checksum is verified before the file is touched.
    // offset 0 creates or truncates; otherwise the bytes land at end-of-file, which must
    // be at offset (a longer file is cut back to offset, so a replayed chunk is harmless).
    WriteResult writeChunk(const std::string& path, uint64_t offset, std::string_view bytes,
                           std::string_view md5) const;

    [[nodiscard]] uint64_t chunkSize() const noexcept { return chunkSize_; }

private:
    const PathGuard& guard_;
    uint64_t chunkSize_;
};

}
