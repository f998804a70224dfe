#include "sync/DatabaseTransfer.hpp"
#include "source/SourceApi.hpp"
#include "crypto/base64.hpp"
#include "util/errors.hpp"
#include "util/parse.hpp"
#include "logging/LogRegistry.hpp"

#include <fmt/format.h>
#include <regex>

using namespace sm::util;
using namespace sm::logging;

namespace sm::sync {

namespace {

std::string regexEscape(const std::string& s) {
    static const std::regex special(R"([.^$|()\[\]{}*+?\\])");
    return std::regex_replace(s, special, R"(\$&)");
}

std::optional<db::Row> decodeRow(const types::WireRow& wire, std::string& error) {
    db::Row row;
    row.fields.reserve(wire.size());
    for (const auto& f : wire) {
        if (!isSafeIdentifier(f.column)) {
            error = "Invalid column name: " + f.column;
            return std::nullopt;
        }
        if (f.base64 && f.value) {
            auto bytes = crypto::base64::tryDecode(*f.value);
            if (!bytes) {
                error = "Failed to decode base64 data for column: " + f.column;
                return std::nullopt;
            }
            row.fields.push_back({f.column, std::move(*bytes)});
        } else {
            row.fields.push_back({f.column, f.value});
        }
    }
    return row;
}

}

std::string DatabaseTransfer::translateName(const std::string& name, const std::string& sourcePrefix,
                                            const std::string& destinationPrefix) {
    if (!sourcePrefix.empty() && name.starts_with(sourcePrefix))
        return destinationPrefix + name.substr(sourcePrefix.size());
    return name;
}

std::string DatabaseTransfer::renameInSchema(const std::string& ddl, const std::string& from, const std::string& to) {
    if (from == to) return ddl;
    const auto escaped = regexEscape(from);

    auto out = std::regex_replace(ddl, std::regex("`" + escaped + "`"), "`" + to + "`");
    out = std::regex_replace(out, std::regex("\"" + escaped + "\""), "\"" + to + "\"");
    // Bare word: not inside a longer identifier.
    out = std::regex_replace(out, std::regex("(^|[^A-Za-z0-9_`\"])" + escaped + "(?=$|[^A-Za-z0-9_`\"])"), "$1" + to);
    return out;
}

std::string DatabaseTransfer::destinationName(const std::string& sourceName, const std::string& sourcePrefix) const {
    return translateName(sourceName, sourcePrefix, prefix_);
}

bool DatabaseTransfer::createTable(const std::string& ddl, const std::string& sourceName,
                                   const std::string& sourcePrefix) {
    const auto table = destinationName(sourceName, sourcePrefix);
    if (!isSafeIdentifier(table)) throw MigrationError(ErrorCode::InvalidRequest, "Invalid table name", table);
    if (trim(ddl).empty()) throw MigrationError(ErrorCode::InvalidRequest, "Empty schema", sourceName);

    if (engine_.tableExists(table)) {
        LogRegistry::db()->info("[DatabaseTransfer::createTable] {} already exists, keeping it", table);
        return false;
    }

    const auto translated = renameInSchema(ddl, sourceName, table);
    try {
        engine_.transact("DatabaseTransfer::createTable", [&](db::Transaction& txn) { txn.exec(translated); });
    } catch (const std::exception& e) {
        throw MigrationError(ErrorCode::SchemaApplyFailure, e.what(), table);
    }

    LogRegistry::db()->info("[DatabaseTransfer::createTable] Created {} from {}", table, sourceName);
    return true;
}

bool DatabaseTransfer::dropTable(const std::string& table) {
    if (!isSafeIdentifier(table)) throw MigrationError(ErrorCode::InvalidRequest, "Invalid table name", table);
    if (!engine_.tableExists(table)) return false;
    engine_.exec("DROP TABLE " + db::Engine::quote(table));
    LogRegistry::db()->info("[DatabaseTransfer::dropTable] Dropped {}", table);
    return true;
}

BatchApplyResult DatabaseTransfer::applyOnce(const std::string& table, const std::vector<types::WireRow>& rows) {
    return engine_.transact("DatabaseTransfer::applyBatch", [&](db::Transaction& txn) {
        BatchApplyResult result;
        for (const auto& wire : rows) {
            std::string error;
            const auto row = decodeRow(wire, error);
            if (!row) {
                ++result.skipped;
                result.errors.push_back(std::move(error));
                continue;
            }

            switch (const auto r = txn.insert(table, *row); r.outcome) {
                case db::InsertOutcome::Inserted: ++result.inserted; break;
                case db::InsertOutcome::Duplicate: ++result.duplicates; break;
                case db::InsertOutcome::Failed:
                    ++result.skipped;
                    result.errors.push_back(r.error);
                    break;
            }
        }
        return result;
    });
}

BatchApplyResult DatabaseTransfer::applyBatch(const std::string& table, const std::vector<types::WireRow>& rows) {
    if (!isSafeIdentifier(table)) throw MigrationError(ErrorCode::InvalidRequest, "Invalid table name", table);

    BatchApplyResult result;
    try {
        result = applyOnce(table, rows);
    } catch (const std::exception& first) {
        LogRegistry::db()->warn("[DatabaseTransfer::applyBatch] Batch for {} rolled back ({}), retrying once",
                                table, first.what());
        try {
            result = applyOnce(table, rows);
        } catch (const std::exception& second) {
            throw MigrationError(ErrorCode::RowApplyFailure,
                                 fmt::format("Batch failed twice: {}", second.what()), table);
        }
    }

    for (const auto& e : result.errors)
        LogRegistry::db()->warn("[DatabaseTransfer::applyBatch] {}: {}", table, e);
    return result;
}

TableResult DatabaseTransfer::transferTable(source::SourceApi& source, const types::TableDescriptor& table,
                                            const std::string& sourcePrefix, types::DatabaseCursor& cursor,
                                            const BatchHook& afterBatch) {
    TableResult result;
    const auto destination = destinationName(table.sourceTableName, sourcePrefix);
    if (!isSafeIdentifier(destination))
        throw MigrationError(ErrorCode::InvalidRequest, "Invalid table name", destination);

    if (!cursor.midTable()) result.created = createTable(source.schema(table.sourceTableName),
                                                         table.sourceTableName, sourcePrefix);
    else
        LogRegistry::sync()->info("[DatabaseTransfer::transferTable] Resuming {} after {} rows (last key '{}')",
                                  destination, cursor.rowsOffset, cursor.lastPrimaryKeySeen);

    while (true) {
        types::RowCursor rc;
        if (!cursor.lastPrimaryKeySeen.empty()) rc.lastKey = cursor.lastPrimaryKeySeen;
        rc.offset = cursor.rowsOffset;

        const auto batch = source.rows(table.sourceTableName, rc, batchSize_);

        // A batch that cannot be applied is skipped whole; later pages still go in.
        BatchApplyResult applied;
        try {
            applied = applyBatch(destination, batch.rows);
        } catch (const MigrationError& e) {
            if (e.code() != ErrorCode::RowApplyFailure) throw;
            LogRegistry::sync()->error("[DatabaseTransfer::transferTable] Skipping {} rows of {} at offset {}: {}",
                                       batch.count(), destination, cursor.rowsOffset, e.what());
            applied.skipped = batch.count();
            applied.errors.push_back(fmt::format("Batch at offset {} skipped: {}", cursor.rowsOffset, e.what()));
        }

        result.rows.inserted += applied.inserted;
        result.rows.duplicates += applied.duplicates;
        result.rows.skipped += applied.skipped;
        result.rows.errors.insert(result.rows.errors.end(), applied.errors.begin(), applied.errors.end());

        cursor.rowsOffset += batch.count();
        if (batch.primaryKey && batch.nextCursor.lastKey) cursor.lastPrimaryKeySeen = *batch.nextCursor.lastKey;

        if (afterBatch) afterBatch(applied, cursor);
        if (!batch.hasMore) break;
    }

    engine_.syncSequences(destination);

    LogRegistry::sync()->info("[DatabaseTransfer::transferTable] {} -> {}: {} inserted, {} duplicates, {} skipped",
                              table.sourceTableName, destination, result.rows.inserted, result.rows.duplicates,
                              result.rows.skipped);
    return result;
}

}
