#include "types/Chunk.hpp"

#include <nlohmann/json.hpp>

namespace sm::types {

void to_json(nlohmann::json& j, const Chunk& c) {
    j = {
        {"path", c.path},
        {"offset", c.startOffset},
        {"end", c.endOffsetExclusive},
        {"data", c.payloadBase64},
        {"checksum", c.md5Checksum},
        {"bytes_read", c.bytesRead},
        {"file_size", c.fileSize}
    };
}

void from_json(const nlohmann::json& j, Chunk& c) {
    c.path = j.value("path", std::string{});
    c.startOffset = j.at("offset").get<uint64_t>();
    c.endOffsetExclusive = j.value("end", c.startOffset + j.at("bytes_read").get<uint64_t>());
    c.payloadBase64 = j.at("data").get<std::string>();
    c.md5Checksum = j.at("checksum").get<std::string>();
    c.bytesRead = j.at("bytes_read").get<uint64_t>();
    c.fileSize = j.at("file_size").get<uint64_t>();
}

void to_json(nlohmann::json& j, const ArchiveBatch& b) {
    j = {
        {"data", b.dataBase64},
        {"checksum", b.md5Checksum},
        {"size", b.size},
        {"file_count", b.fileCount}
    };
}

void from_json(const nlohmann::json& j, ArchiveBatch& b) {
    b.dataBase64 = j.at("data").get<std::string>();
    b.md5Checksum = j.at("checksum").get<std::string>();
    b.size = j.at("size").get<uint64_t>();
    b.fileCount = j.at("file_count").get<unsigned int>();
}

}
