#include "db/KeysetPager.hpp"
#include "crypto/base64.hpp"
#include "util/errors.hpp"
#include "util/parse.hpp"

#include <algorithm>
#include <fmt/format.h>

using namespace sm::util;

namespace sm::db {

namespace {

constexpr std::string_view CONVENTIONAL_KEYS[] = {
    "ID", "id", "option_id", "user_id", "term_id", "comment_ID", "post_id", "link_id"
};

}

std::optional<std::string> KeysetPager::detectPrimaryKey(const std::vector<Column>& columns) {
    const Column* first = nullptr;
    for (const auto& c : columns)
        if (c.isPrimaryKey() && (!first || c.primaryKeyOrdinal < first->primaryKeyOrdinal)) first = &c;
    if (first) return first->name;

    for (const auto& c : columns)
        if (c.autoIncrement) return c.name;

    for (const auto name : CONVENTIONAL_KEYS)
        if (std::ranges::any_of(columns, [&](const Column& c) { return c.name == name; }))
            return std::string(name);

    return std::nullopt;
}

KeysetPager::Page KeysetPager::fetch(const std::string& table, const types::RowCursor& cursor,
                                     const unsigned int batchSize) const {
    if (!isSafeIdentifier(table))
        throw MigrationError(ErrorCode::InvalidRequest, "Invalid table name", table);
    if (batchSize == 0) throw MigrationError(ErrorCode::InvalidRequest, "Batch size must be positive", table);

    const auto columns = engine_.columns(table);
    if (columns.empty()) throw MigrationError(ErrorCode::NotFound, "Table not found", table);

    Page page;
    page.primaryKey = detectPrimaryKey(columns);

    if (page.primaryKey) {
        const auto key = Engine::quote(*page.primaryKey);
        if (cursor.lastKey)
            page.rows = engine_.query(fmt::format("SELECT * FROM {} WHERE {} > $1 ORDER BY {} ASC LIMIT {}",
                                                  Engine::quote(table), key, key, batchSize),
                                      {*cursor.lastKey});
        else
            page.rows = engine_.query(fmt::format("SELECT * FROM {} ORDER BY {} ASC LIMIT {}",
                                                  Engine::quote(table), key, batchSize));

        page.nextCursor.lastKey = cursor.lastKey;
        if (!page.rows.empty()) page.nextCursor.lastKey = page.rows.back().at(*page.primaryKey);
        page.nextCursor.offset = cursor.offset + page.rows.size();
    } else {
        // No usable key: offset pagination, unstable under concurrent writes.
        page.rows = engine_.query(fmt::format("SELECT * FROM {} LIMIT {} OFFSET {}",
                                              Engine::quote(table), batchSize, cursor.offset));
        page.nextCursor.offset = cursor.offset + page.rows.size();
    }

    page.hasMore = page.rows.size() == batchSize;
    return page;
}

types::WireRow KeysetPager::encode(const Row& row) {
    types::WireRow out;
    out.reserve(row.fields.size());
    for (const auto& f : row.fields) {
        types::WireField w{f.column, f.value, false};
        if (f.value && !isValidUtf8(*f.value)) {
            w.value = crypto::base64::encode(*f.value);
            w.base64 = true;
        }
        out.push_back(std::move(w));
    }
    return out;
}

types::RowBatch KeysetPager::page(const std::string& table, const types::RowCursor& cursor,
                                  const unsigned int batchSize) const {
    auto p = fetch(table, cursor, batchSize);

    types::RowBatch batch;
    batch.table = table;
    batch.primaryKey = p.primaryKey;
    batch.nextCursor = p.nextCursor;
    batch.hasMore = p.hasMore;
    batch.rows.reserve(p.rows.size());
    for (const auto& row : p.rows) batch.rows.push_back(encode(row));
    return batch;
}

}
