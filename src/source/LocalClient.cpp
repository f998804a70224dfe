#include "source/LocalClient.hpp"
#include "source/Provider.hpp"

#include <nlohmann/json.hpp>

namespace sm::source {

namespace {

template <typename T>
T wire(const T& value) {
    return nlohmann::json::parse(nlohmann::json(value).dump()).get<T>();
}

}

types::SourceInfo LocalClient::handshake() { return wire(provider_.handshake(origin_)); }

types::SourceInfo LocalClient::info() { return wire(provider_.info()); }

types::Manifest LocalClient::manifest() { return wire(provider_.manifest()); }

std::vector<types::TableDescriptor> LocalClient::tables() { return wire(provider_.tables()); }

std::string LocalClient::schema(const std::string& table) { return provider_.schema(table); }

types::RowBatch LocalClient::rows(const std::string& table, const types::RowCursor& cursor,
                                  const unsigned int batchSize) {
    return wire(provider_.rows(table, cursor, batchSize));
}

types::Chunk LocalClient::fileChunk(const std::string& path, const uint64_t start, const uint64_t end) {
    return wire(provider_.fileChunk(path, start, end));
}

types::ArchiveBatch LocalClient::batch(const std::vector<std::string>& paths) {
    return wire(provider_.batch(paths));
}

}
