#pragma once

#include <cstdint>
#include <string>

#include <nlohmann/json_fwd.hpp>

namespace sm::types {

struct Chunk {
    std::string path;
    uint64_t startOffset{0};
    uint64_t endOffsetExclusive{0};
    std::string payloadBase64;
    std::string md5Checksum;        // md5 of the decoded payload
    uint64_t bytesRead{0};
    uint64_t fileSize{0};
};

// A zip archive of small files, fetched in one request.
struct ArchiveBatch {
    std::string dataBase64;
    std::string md5Checksum;        // md5 of the archive bytes
    uint64_t size{0};
    unsigned int fileCount{0};
};

void to_json(nlohmann::json& j, const Chunk& c);
void from_json(const nlohmann::json& j, Chunk& c);
void to_json(nlohmann::json& j, const ArchiveBatch& b);
void from_json(const nlohmann::json& j, ArchiveBatch& b);

}
