#include "types/Manifest.hpp"

#include <nlohmann/json.hpp>

namespace sm::types {

void Manifest::computeAggregates(const uint64_t chunkSize, const uint64_t maxBatchBytes,
                                 const unsigned int maxBatchFiles) {
    totalSize = totalCount = largeFiles = smallFiles = batches = totalChunks = 0;

    uint64_t batchBytes = 0;
    unsigned int batchFiles = 0;

    for (const auto& e : entries) {
        totalSize += e.sizeBytes;
        ++totalCount;

        if (e.isLarge) {
            ++largeFiles;
            totalChunks += chunkSize ? (e.sizeBytes + chunkSize - 1) / chunkSize : 1;
            continue;
        }

        ++smallFiles;
        if (batchFiles > 0 && (batchBytes + e.sizeBytes > maxBatchBytes || batchFiles >= maxBatchFiles)) {
            ++batches;
            batchBytes = 0;
            batchFiles = 0;
        }
        batchBytes += e.sizeBytes;
        ++batchFiles;
    }

    if (batchFiles > 0) ++batches;
}

void to_json(nlohmann::json& j, const FileManifestEntry& e) {
    j = {
        {"path", e.relativePath},
        {"size", e.sizeBytes},
        {"mtime", e.mtime},
        {"is_large", e.isLarge}
    };
}

void from_json(const nlohmann::json& j, FileManifestEntry& e) {
    e.relativePath = j.at("path").get<std::string>();
    e.sizeBytes = j.at("size").get<uint64_t>();
    e.mtime = j.value("mtime", static_cast<std::time_t>(0));
    e.isLarge = j.value("is_large", false);
}

void to_json(nlohmann::json& j, const Manifest& m) {
    j = {
        {"files", m.entries},
        {"total_size", m.totalSize},
        {"total_count", m.totalCount},
        {"large_files", m.largeFiles},
        {"small_files", m.smallFiles},
        {"batches", m.batches},
        {"total_chunks", m.totalChunks}
    };
}

void from_json(const nlohmann::json& j, Manifest& m) {
    j.at("files").get_to(m.entries);
    m.totalSize = j.value("total_size", uint64_t{0});
    m.totalCount = j.value("total_count", static_cast<uint64_t>(m.entries.size()));
    m.largeFiles = j.value("large_files", uint64_t{0});
    m.smallFiles = j.value("small_files", uint64_t{0});
    m.batches = j.value("batches", uint64_t{0});
    m.totalChunks = j.value("total_chunks", uint64_t{0});
}

}
