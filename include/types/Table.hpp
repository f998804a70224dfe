#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace sm::types {

struct TableDescriptor {
    std::string sourceTableName;
    uint64_t rowCount{0};
    std::string destinationTableName;   // filled in by prefix translation on the destination
};

// Keyset position (lastKey) or, for tables without a usable key, a row offset.
struct RowCursor {
    std::optional<std::string> lastKey;
    uint64_t offset{0};

    [[nodiscard]] bool atStart() const noexcept { return !lastKey && offset == 0; }
};

// A column value as it travels between sites. base64 is set when value holds
// the base64 form of bytes that are not valid UTF-8.
struct WireField {
    std::string column;
    std::optional<std::string> value;   // nullopt == SQL NULL
    bool base64{false};
};

using WireRow = std::vector<WireField>;

struct RowBatch {
    std::string table;
    std::vector<WireRow> rows;
    std::optional<std::string> primaryKey;  // nullopt: offset pagination
    RowCursor nextCursor;
    bool hasMore{false};

    [[nodiscard]] size_t count() const noexcept { return rows.size(); }
};

void to_json(nlohmann::json& j, const TableDescriptor& t);
void from_json(const nlohmann::json& j, TableDescriptor& t);
void to_json(nlohmann::json& j, const RowBatch& b);
void from_json(const nlohmann::json& j, RowBatch& b);

}
