#pragma once

#include <cstdint>
#include <ctime>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace sm::types {

struct FileManifestEntry {
    std::string relativePath;       // forward slashes, relative to the content root
    uint64_t sizeBytes{0};
    std::time_t mtime{0};
    bool isLarge{false};            // sizeBytes > chunk threshold
};

struct Manifest {
    std::vector<FileManifestEntry> entries;

    uint64_t totalSize{0};
    uint64_t totalCount{0};
    uint64_t largeFiles{0};
    uint64_t smallFiles{0};
    uint64_t batches{0};            // archive batches the small files will need
    uint64_t totalChunks{0};        // chunk requests the large files will need

    void computeAggregates(uint64_t chunkSize, uint64_t maxBatchBytes, unsigned int maxBatchFiles);
};

void to_json(nlohmann::json& j, const FileManifestEntry& e);
void from_json(const nlohmann::json& j, FileManifestEntry& e);
void to_json(nlohmann::json& j, const Manifest& m);
void from_json(const nlohmann::json& j, Manifest& m);

}
