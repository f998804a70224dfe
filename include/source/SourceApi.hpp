#pragma once

#include "types/Chunk.hpp"
#include "types/Manifest.hpp"
#include "types/SourceInfo.hpp"
#include "types/Table.hpp"
#include "util/errors.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace sm::source {

// The read side of a migration as the destination sees it.
class SourceApi {
public:
    using RetryObserver = std::function<void(unsigned int attempt, const util::MigrationError&)>;

    virtual ~SourceApi() = default;

    virtual types::SourceInfo handshake() = 0;
    virtual types::SourceInfo info() = 0;
    virtual types::Manifest manifest() = 0;
    virtual std::vector<types::TableDescriptor> tables() = 0;
    virtual std::string schema(const std::string& table) = 0;
    virtual types::RowBatch rows(const std::string& table, const types::RowCursor& cursor, unsigned int batchSize) = 0;
    virtual types::Chunk fileChunk(const std::string& path, uint64_t start, uint64_t end) = 0;
    virtual types::ArchiveBatch batch(const std::vector<std::string>& paths) = 0;

    // Called before every re-attempt of a failed request.
    void setRetryObserver(RetryObserver observer) { retryObserver_ = std::move(observer); }

protected:
    RetryObserver retryObserver_;
};

}
