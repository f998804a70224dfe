#pragma once

#include "db/Engine.hpp"
#include "types/Table.hpp"

#include <optional>
#include <string>
#include <vector>

namespace sm::db {

// Reads a table in ascending key order, one bounded page at a time.
class KeysetPager {
public:
    struct Page {
        Rows rows;
        std::optional<std::string> primaryKey;
        types::RowCursor nextCursor;
        bool hasMore{false};
    };

    explicit KeysetPager(Engine& engine) : engine_(engine) {}

    // Declared primary key (first column), then the first auto-increment column,
    // then the first present column of a list of conventional key names.
    static std::optional<std::string> detectPrimaryKey(const std::vector<Column>& columns);

    // Throws MigrationError(InvalidRequest) for unsafe names, (NotFound) for missing tables.
    Page fetch(const std::string& table, const types::RowCursor& cursor, unsigned int batchSize) const;

    // fetch() with values that are not valid UTF-8 base64-encoded for the wire.
    types::RowBatch page(const std::string& table, const types::RowCursor& cursor, unsigned int batchSize) const;

    static types::WireRow encode(const Row& row);

private:
    Engine& engine_;
};

}
