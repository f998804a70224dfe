#include "types/Table.hpp"

#include <nlohmann/json.hpp>

namespace sm::types {

namespace {

constexpr std::string_view BASE64_SUFFIX = "_base64";

bool isMarkerKey(const nlohmann::json& row, const std::string& key) {
    if (key.size() <= BASE64_SUFFIX.size() || !key.ends_with(BASE64_SUFFIX)) return false;
    const auto& v = row.at(key);
    return v.is_boolean() && row.contains(key.substr(0, key.size() - BASE64_SUFFIX.size()));
}

}

void to_json(nlohmann::json& j, const TableDescriptor& t) {
    j = {
        {"name", t.sourceTableName},
        {"rows", t.rowCount}
    };
    if (!t.destinationTableName.empty()) j["destination"] = t.destinationTableName;
}

void from_json(const nlohmann::json& j, TableDescriptor& t) {
    t.sourceTableName = j.at("name").get<std::string>();
    t.rowCount = j.value("rows", uint64_t{0});
    t.destinationTableName = j.value("destination", std::string{});
}

void to_json(nlohmann::json& j, const RowBatch& b) {
    auto rows = nlohmann::json::array();
    for (const auto& row : b.rows) {
        auto obj = nlohmann::json::object();
        for (const auto& f : row) {
            if (f.value) obj[f.column] = *f.value;
            else obj[f.column] = nullptr;
            if (f.base64) obj[f.column + std::string(BASE64_SUFFIX)] = true;
        }
        rows.push_back(std::move(obj));
    }

    j = {
        {"table", b.table},
        {"rows", rows},
        {"count", b.count()},
        {"has_more", b.hasMore},
        {"primary_key", b.primaryKey ? nlohmann::json(*b.primaryKey) : nlohmann::json(nullptr)},
        {"last_id", b.nextCursor.lastKey ? nlohmann::json(*b.nextCursor.lastKey) : nlohmann::json(nullptr)},
        {"offset", b.nextCursor.offset}
    };
}

void from_json(const nlohmann::json& j, RowBatch& b) {
    b.table = j.at("table").get<std::string>();
    b.hasMore = j.at("has_more").get<bool>();

    const auto& pk = j.at("primary_key");
    b.primaryKey = pk.is_null() ? std::nullopt : std::optional(pk.get<std::string>());

    const auto& last = j.at("last_id");
    b.nextCursor.lastKey = last.is_null() ? std::nullopt : std::optional(last.get<std::string>());
    b.nextCursor.offset = j.value("offset", uint64_t{0});

    b.rows.clear();
    for (const auto& row : j.at("rows")) {
        if (!row.is_object()) throw std::runtime_error("Row batch entry is not an object");
        WireRow out;
        for (const auto& [key, value] : row.items()) {
            if (isMarkerKey(row, key)) continue;

            WireField f;
            f.column = key;
            if (value.is_null()) f.value = std::nullopt;
            else if (value.is_string()) f.value = value.get<std::string>();
            else f.value = value.dump();

            const auto marker = key + std::string(BASE64_SUFFIX);
            f.base64 = row.contains(marker) && row.at(marker).is_boolean() && row.at(marker).get<bool>();
            out.push_back(std::move(f));
        }
        b.rows.push_back(std::move(out));
    }
}

}
