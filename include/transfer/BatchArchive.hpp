#pragma once

#include "transfer/PathGuard.hpp"
#include "types/Chunk.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace sm::transfer {

struct SkippedEntry {
    std::string path;
    std::string reason;
};

struct ExtractResult {
    unsigned int extracted{0};
    uint64_t bytesWritten{0};
    std::vector<std::string> extractedPaths;
    std::vector<SkippedEntry> skipped;
};

// Small files travel as one zip archive per batch.
class BatchArchive {
public:
    explicit BatchArchive(const PathGuard& guard) : guard_(guard) {}

    // Paths that are missing or not regular files are left out of the archive.
    [[nodiscard]] types::ArchiveBatch build(const std::vector<std::string>& paths) const;

    // Verifies the archive checksum first (ChecksumMismatch), then writes each entry
    // under the root. Unsafe, duplicate and non-regular entries are skipped and reported.
    [[nodiscard]] ExtractResult extract(std::string_view archive, std::string_view md5) const;

private:
    const PathGuard& guard_;
};

}
