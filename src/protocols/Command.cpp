#include "protocols/Command.hpp"
#include "dest/Site.hpp"
#include "util/errors.hpp"
#include "logging/LogRegistry.hpp"

#include <fmt/format.h>
#include <nlohmann/json.hpp>

using namespace sm::util;
using namespace sm::logging;
using json = nlohmann::json;

namespace sm::protocols {

namespace {

template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };

template <typename T>
T field(const json& j, const char* key) {
    if (!j.contains(key)) throw MigrationError(ErrorCode::InvalidRequest, fmt::format("Missing '{}'", key));
    try {
        return j.at(key).get<T>();
    } catch (const json::exception& e) {
        throw MigrationError(ErrorCode::InvalidRequest, fmt::format("Invalid '{}': {}", key, e.what()));
    }
}

template <typename T>
T fieldOr(const json& j, const char* key, T fallback) {
    return j.contains(key) && !j.at(key).is_null() ? field<T>(j, key) : fallback;
}

// Accepts both a JSON value and its string encoding, as form-posted payloads send them.
json structured(const json& j, const char* key) {
    const auto& v = j.at(key);
    if (!v.is_string()) return v;
    auto parsed = json::parse(v.get<std::string>(), nullptr, false);
    if (parsed.is_discarded()) throw MigrationError(ErrorCode::InvalidRequest, fmt::format("Invalid '{}'", key));
    return parsed;
}

bool truthy(const json& j, const char* key) {
    if (!j.contains(key)) return false;
    const auto& v = j.at(key);
    if (v.is_boolean()) return v.get<bool>();
    if (v.is_number()) return v.get<double>() != 0;
    if (v.is_string()) {
        const auto s = v.get<std::string>();
        return s == "1" || s == "true" || s == "yes" || s == "on";
    }
    return false;
}

json toJson(const transfer::ExtractResult& r) {
    auto skipped = json::array();
    for (const auto& s : r.skipped) skipped.push_back({{"path", s.path}, {"reason", s.reason}});
    return {{"extracted", r.extracted}, {"bytes_written", r.bytesWritten}, {"skipped", skipped}};
}

json toJson(const sync::BatchApplyResult& r) {
    return {{"inserted", r.inserted}, {"duplicates", r.duplicates}, {"skipped", r.skipped}, {"errors", r.errors}};
}

json toJson(const sync::PrepareResult& r) {
    return {
        {"dropped", r.dropped},
        {"preserved", r.preserved},
        {"errors", r.errors},
        {"operator_preserved", r.operatorId ? json(*r.operatorId) : json(nullptr)}
    };
}

}

json success(const json& data) {
    return {{"success", true}, {"data", data}};
}

json failure(const std::string& code, const std::string& message) {
    return {{"success", false}, {"error", {{"code", code}, {"message", message}}}};
}

Command parseCommand(const json& j) {
    if (!j.is_object()) throw MigrationError(ErrorCode::InvalidRequest, "Command must be a JSON object");
    const auto action = field<std::string>(j, "action");

    if (action == "set_mode") {
        try {
            return command::SetMode{config::siteModeFromString(field<std::string>(j, "mode"))};
        } catch (const std::invalid_argument& e) {
            throw MigrationError(ErrorCode::InvalidRequest, e.what());
        }
    }
    if (action == "regenerate_secret") return command::RegenerateSecret{};
    if (action == "save_connection") return command::SaveConnection{field<std::string>(j, "key")};
    if (action == "load_connection") return command::LoadConnection{};
    if (action == "get_config") return command::GetConfig{};
    if (action == "prepare_database") {
        if (!j.contains("tables")) throw MigrationError(ErrorCode::InvalidRequest, "Missing 'tables'");
        const auto tables = structured(j, "tables");
        if (!tables.is_array()) throw MigrationError(ErrorCode::InvalidRequest, "Invalid tables parameter");
        return command::PrepareDatabase{
            tables.get<std::vector<std::string>>(),
            fieldOr<std::string>(j, "source_prefix", "wp_"),
            truthy(j, "overwrite"),
            fieldOr<std::string>(j, "operator", "")
        };
    }
    if (action == "create_table")
        return command::CreateTable{field<std::string>(j, "schema"), field<std::string>(j, "source_table_name"),
                                    fieldOr<std::string>(j, "source_prefix", "wp_")};
    if (action == "drop_table") return command::DropTable{field<std::string>(j, "table")};
    if (action == "process_rows") {
        if (!j.contains("rows")) throw MigrationError(ErrorCode::InvalidRequest, "Missing 'rows'");
        types::RowBatch batch;
        try {
            from_json(json{{"table", field<std::string>(j, "table")}, {"rows", structured(j, "rows")},
                           {"has_more", false}, {"primary_key", nullptr}, {"last_id", nullptr}}, batch);
        } catch (const std::exception& e) {
            throw MigrationError(ErrorCode::InvalidRequest, fmt::format("Invalid rows: {}", e.what()));
        }
        return command::ProcessRows{batch.table, fieldOr<std::string>(j, "source_prefix", "wp_"),
                                    std::move(batch.rows)};
    }
    if (action == "write_chunk")
        return command::WriteChunk{field<std::string>(j, "path"), fieldOr<uint64_t>(j, "offset", 0),
                                   field<std::string>(j, "data"), field<std::string>(j, "checksum")};
    if (action == "extract_batch")
        return command::ExtractBatch{field<std::string>(j, "data"), field<std::string>(j, "checksum")};
    if (action == "search_replace")
        return command::SearchReplace{fieldOr<std::string>(j, "from", ""), fieldOr<std::string>(j, "to", "")};
    if (action == "flush_caches") return command::FlushCaches{};
    if (action == "finalize") return command::Finalize{};

    throw MigrationError(ErrorCode::InvalidRequest, "Unknown action: " + action);
}

json dispatch(dest::Site& site, const Command& cmd) {
    try {
        return success(std::visit(overloaded{
            [&](const command::SetMode& c) -> json {
                site.setMode(c.mode);
                return {{"mode", config::to_string(c.mode)}};
            },
            [&](const command::RegenerateSecret&) -> json {
                return {{"key", site.regenerateSecret()}};
            },
            [&](const command::SaveConnection& c) -> json {
                return {{"source_url", site.saveConnection(c.key).url}};
            },
            [&](const command::LoadConnection&) -> json {
                return {{"key", site.loadConnection()}};
            },
            [&](const command::GetConfig&) -> json {
                const auto v = site.siteConfig();
                return {{"table_prefix", v.tablePrefix}, {"site_url", v.siteUrl}, {"home_url", v.homeUrl}};
            },
            [&](const command::PrepareDatabase& c) -> json {
                return toJson(site.prepareDatabase(c.tables, c.sourcePrefix, c.overwrite, c.operatorLogin));
            },
            [&](const command::CreateTable& c) -> json {
                return {{"table", site.createTable(c.schema, c.sourceTable, c.sourcePrefix)},
                        {"source_table", c.sourceTable}};
            },
            [&](const command::DropTable& c) -> json {
                if (!site.dropTable(c.table))
                    throw MigrationError(ErrorCode::NotFound, "Table does not exist", c.table);
                return {{"table", c.table}};
            },
            [&](const command::ProcessRows& c) -> json {
                return toJson(site.processRows(c.table, c.sourcePrefix, c.rows));
            },
            [&](const command::WriteChunk& c) -> json {
                const auto r = site.writeChunk(c.path, c.offset, c.data, c.checksum);
                return {{"written", r.bytesWritten}, {"file_size", r.fileSize}};
            },
            [&](const command::ExtractBatch& c) -> json {
                return toJson(site.extractBatch(c.data, c.checksum));
            },
            [&](const command::SearchReplace& c) -> json {
                return site.searchReplace(c.from, c.to);
            },
            [&](const command::FlushCaches&) -> json {
                const auto r = site.flushCaches();
                return {{"transients_deleted", r.transientsDeleted}, {"rewrite_rules_cleared", r.rewriteRulesCleared}};
            },
            [&](const command::Finalize&) -> json {
                const auto r = site.finalize();
                return {{"options_restored", r.optionsRestored}, {"account_restored", r.accountRestored},
                        {"snapshot_found", r.snapshotFound}};
            }
        }, cmd));
    } catch (const MigrationError& e) {
        LogRegistry::sitemigrate()->warn("[protocols::dispatch] {} ({})", e.what(), to_string(e.code()));
        return failure(to_string(e.code()), e.what());
    } catch (const std::exception& e) {
        LogRegistry::sitemigrate()->error("[protocols::dispatch] {}", e.what());
        return failure(to_string(ErrorCode::Internal), e.what());
    }
}

}
