#pragma once

#include "db/Engine.hpp"
#include "types/Session.hpp"
#include "types/Table.hpp"

#include <functional>
#include <string>
#include <vector>

namespace sm::source { class SourceApi; }

namespace sm::sync {

struct BatchApplyResult {
    uint64_t inserted{0};
    uint64_t duplicates{0};
    uint64_t skipped{0};            // rows that failed to decode or insert
    std::vector<std::string> errors;
};

struct TableResult {
    bool created{false};            // false when the table already existed or was resumed mid-way
    BatchApplyResult rows;
};

// Applies source tables to the destination database.
class DatabaseTransfer {
public:
    // Called after each applied batch, with the cursor already advanced.
    using BatchHook = std::function<void(const BatchApplyResult&, const types::DatabaseCursor&)>;

    DatabaseTransfer(db::Engine& engine, std::string destinationPrefix, unsigned int batchSize)
        : engine_(engine), prefix_(std::move(destinationPrefix)), batchSize_(batchSize) {}

    // Swaps sourcePrefix for destinationPrefix when name starts with it.
    static std::string translateName(const std::string& name, const std::string& sourcePrefix,
                                     const std::string& destinationPrefix);

    // Renames the table in DDL: backtick-quoted, double-quoted and bare-word references.
    static std::string renameInSchema(const std::string& ddl, const std::string& from, const std::string& to);

    [[nodiscard]] std::string destinationName(const std::string& sourceName, const std::string& sourcePrefix) const;

    // Runs the translated DDL. Existing tables are left alone. Throws
    // MigrationError(SchemaApplyFailure) with the engine's error text.
    bool createTable(const std::string& ddl, const std::string& sourceName, const std::string& sourcePrefix);

    bool dropTable(const std::string& table);

    // Decodes and inserts rows in one transaction; failing rows are skipped and
    // duplicates counted. A transaction-level failure is retried once before it is thrown.
    BatchApplyResult applyBatch(const std::string& table, const std::vector<types::WireRow>& rows);

    // Schema (unless resuming mid-table) then every remaining page of one table.
    TableResult transferTable(source::SourceApi& source, const types::TableDescriptor& table,
                              const std::string& sourcePrefix, types::DatabaseCursor& cursor,
                              const BatchHook& afterBatch);

    [[nodiscard]] const std::string& destinationPrefix() const noexcept { return prefix_; }

private:
    BatchApplyResult applyOnce(const std::string& table, const std::vector<types::WireRow>& rows);

    db::Engine& engine_;
    std::string prefix_;
    unsigned int batchSize_;
};

}
