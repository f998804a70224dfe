#pragma once

#include "source/SourceApi.hpp"

namespace sm::source {

class Provider;

// In-process SourceApi. Every result is passed through its JSON wire form, so a local
// migration exercises the same encoding an HTTP one does.
class LocalClient final : public SourceApi {
public:
    explicit LocalClient(Provider& provider, std::string origin = "local") :
        provider_(provider), origin_(std::move(origin)) {}

    types::SourceInfo handshake() override;
    types::SourceInfo info() override;
    types::Manifest manifest() override;
    std::vector<types::TableDescriptor> tables() override;
    std::string schema(const std::string& table) override;
    types::RowBatch rows(const std::string& table, const types::RowCursor& cursor, unsigned int batchSize) override;
    types::Chunk fileChunk(const std::string& path, uint64_t start, uint64_t end) override;
    types::ArchiveBatch batch(const std::vector<std::string>& paths) override;

private:
    Provider& provider_;
    std::string origin_;
};

}
