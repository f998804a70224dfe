#include "sync/SmartMerge.hpp"
#include "sync/SnapshotStore.hpp"
#include "serialize/Codec.hpp"
#include "util/errors.hpp"
#include "util/parse.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <fmt/format.h>

using namespace sm::util;
using namespace sm::logging;
using sm::db::Engine;

namespace sm::sync {

namespace {

constexpr auto ACCOUNT_ID = "ID";
constexpr auto ACCOUNT_LOGIN = "user_login";
constexpr auto ATTR_OWNER = "user_id";
constexpr auto ATTR_KEY = "meta_key";
constexpr auto ATTR_VALUE = "meta_value";
constexpr auto OPTION_NAME = "option_name";
constexpr auto OPTION_VALUE = "option_value";

nlohmann::json rowToJson(const db::Row& row) {
    auto j = nlohmann::json::object();
    for (const auto& f : row.fields) j[f.column] = f.value ? nlohmann::json(*f.value) : nlohmann::json(nullptr);
    return j;
}

db::Row rowFromJson(const nlohmann::json& j) {
    db::Row row;
    for (const auto& [col, v] : j.items())
        row.fields.push_back({col, v.is_null() ? std::nullopt : std::optional(v.get<std::string>())});
    return row;
}

}

SmartMerge::SmartMerge(db::Engine& engine, const config::SmartMergeConfig& config, SnapshotStore& snapshots,
                       std::string destinationPrefix)
    : engine_(engine), config_(config), snapshots_(snapshots), prefix_(std::move(destinationPrefix)) {}

std::optional<db::Row> SmartMerge::findAccount(const std::string& login) const {
    if (login.empty() || !engine_.tableExists(accountsTable())) return std::nullopt;
    auto rows = engine_.query(fmt::format("SELECT * FROM {} WHERE {} = $1", Engine::quote(accountsTable()),
                                          Engine::quote(ACCOUNT_LOGIN)), {login});
    if (rows.empty()) return std::nullopt;
    return std::move(rows.front());
}

std::optional<db::Row> SmartMerge::firstAdministrator() const {
    if (!engine_.tableExists(accountsTable()) || !engine_.tableExists(attributesTable())) return std::nullopt;

    const auto sql = fmt::format(
        "SELECT * FROM {0} WHERE {1} IN (SELECT {2} FROM {3} WHERE {4} = $1 AND {5} LIKE $2) ORDER BY {1} ASC LIMIT 1",
        Engine::quote(accountsTable()), Engine::quote(ACCOUNT_ID), Engine::quote(ATTR_OWNER),
        Engine::quote(attributesTable()), Engine::quote(ATTR_KEY), Engine::quote(ATTR_VALUE));

    auto rows = engine_.query(sql, {prefix_ + "capabilities", std::string("%\"administrator\"%")});
    if (rows.empty()) return std::nullopt;
    return std::move(rows.front());
}

nlohmann::json SmartMerge::snapshot(const std::string& operatorLogin) {
    if (auto existing = snapshots_.get(SNAPSHOT_KEY)) {
        LogRegistry::sync()->info("[SmartMerge::snapshot] Reusing unexpired snapshot from an earlier attempt");
        return *existing;
    }

    auto options = nlohmann::json::object();
    if (engine_.tableExists(optionsTable())) {
        const auto sql = fmt::format("SELECT {} FROM {} WHERE {} = $1", Engine::quote(OPTION_VALUE),
                                     Engine::quote(optionsTable()), Engine::quote(OPTION_NAME));
        for (const auto& name : config_.protected_options) {
            const auto rows = engine_.query(sql, {name});
            if (rows.empty()) continue;
            if (const auto& v = rows.front().at(OPTION_VALUE)) options[name] = *v;
        }
    }

    auto account = findAccount(operatorLogin);
    if (!account) account = firstAdministrator();

    const nlohmann::json snap = {
        {"options", options},
        {"account", account ? rowToJson(*account) : nlohmann::json(nullptr)}
    };
    snapshots_.put(SNAPSHOT_KEY, snap);

    LogRegistry::sync()->info("[SmartMerge::snapshot] Preserved {} options{}", options.size(),
                              account ? fmt::format(" and account '{}'", account->str(ACCOUNT_LOGIN)) : "");
    return snap;
}

PrepareResult SmartMerge::prepare(const std::vector<std::string>& destinationTables, const std::string& operatorLogin) {
    PrepareResult result;
    snapshot(operatorLogin);

    if (const auto op = findAccount(operatorLogin)) result.operatorId = op->str(ACCOUNT_ID);
    else if (!operatorLogin.empty())
        LogRegistry::sync()->warn("[SmartMerge::prepare] Operator '{}' not found, account tables will be emptied",
                                  operatorLogin);

    const auto isProtected = [&](const std::string& base) {
        return std::ranges::find(config_.protected_tables, base) != config_.protected_tables.end();
    };

    for (const auto& table : destinationTables) {
        if (!isSafeIdentifier(table)) {
            result.errors.push_back("Invalid table name: " + table);
            continue;
        }

        try {
            if (!engine_.tableExists(table)) continue;

            const auto base = table.starts_with(prefix_) ? table.substr(prefix_.size()) : table;
            const auto quoted = Engine::quote(table);

            if (base == config_.accounts_table) {
                if (result.operatorId) {
                    engine_.exec(fmt::format("DELETE FROM {} WHERE {} <> $1", quoted, Engine::quote(ACCOUNT_ID)),
                                 {*result.operatorId});
                    result.preserved.push_back(table + " (operator preserved)");
                } else {
                    engine_.exec("DELETE FROM " + quoted);
                    result.preserved.push_back(table + " (emptied)");
                }
            } else if (base == config_.account_attributes_table) {
                if (result.operatorId) {
                    engine_.exec(fmt::format("DELETE FROM {} WHERE {} <> $1", quoted, Engine::quote(ATTR_OWNER)),
                                 {*result.operatorId});
                    result.preserved.push_back(table + " (operator attributes preserved)");
                } else {
                    engine_.exec("DELETE FROM " + quoted);
                    result.preserved.push_back(table + " (emptied)");
                }
            } else if (base == config_.options_table || isProtected(base)) {
                result.preserved.push_back(table + " (untouched)");
            } else {
                engine_.exec("DROP TABLE " + quoted);
                result.dropped.push_back(table);
            }
        } catch (const std::exception& e) {
            LogRegistry::sync()->error("[SmartMerge::prepare] Failed to prepare {}: {}", table, e.what());
            result.errors.push_back(fmt::format("Failed to prepare {}: {}", table, e.what()));
        }
    }

    LogRegistry::audit()->info("[SmartMerge::prepare] {} dropped, {} preserved, {} errors, operator {}",
                               result.dropped.size(), result.preserved.size(), result.errors.size(),
                               result.operatorId.value_or("none"));
    return result;
}

bool SmartMerge::restoreOption(const std::string& name, const std::string& value, const bool hasAutoload) {
    const auto table = Engine::quote(optionsTable());
    const auto updated = engine_.exec(fmt::format("UPDATE {} SET {} = $1 WHERE {} = $2", table,
                                                  Engine::quote(OPTION_VALUE), Engine::quote(OPTION_NAME)),
                                      {value, name});
    if (updated > 0) return true;

    if (hasAutoload)
        engine_.exec(fmt::format("INSERT INTO {} ({}, {}, {}) VALUES ($1, $2, $3)", table, Engine::quote(OPTION_NAME),
                                 Engine::quote(OPTION_VALUE), Engine::quote("autoload")),
                     {name, value, std::string("yes")});
    else
        engine_.exec(fmt::format("INSERT INTO {} ({}, {}) VALUES ($1, $2)", table, Engine::quote(OPTION_NAME),
                                 Engine::quote(OPTION_VALUE)),
                     {name, value});
    return true;
}

void SmartMerge::grantAdministrator(const std::string& userId) {
    if (!engine_.tableExists(attributesTable())) return;

    auto caps = serialize::Value::array();
    caps.set(serialize::Key::string("administrator"), serialize::Value::boolean(true));

    const auto sql = fmt::format("INSERT INTO {} ({}, {}, {}) VALUES ($1, $2, $3)", Engine::quote(attributesTable()),
                                 Engine::quote(ATTR_OWNER), Engine::quote(ATTR_KEY), Engine::quote(ATTR_VALUE));
    engine_.transact("SmartMerge::grantAdministrator", [&](db::Transaction& txn) {
        txn.exec(fmt::format("DELETE FROM {} WHERE {} = $1 AND {} IN ($2, $3)", Engine::quote(attributesTable()),
                             Engine::quote(ATTR_OWNER), Engine::quote(ATTR_KEY)),
                 {userId, prefix_ + "capabilities", prefix_ + "user_level"});
        txn.exec(sql, {userId, prefix_ + "capabilities", serialize::Codec::encode(caps)});
        txn.exec(sql, {userId, prefix_ + "user_level", std::string("10")});
    });
}

bool SmartMerge::restoreAccount(const nlohmann::json& account) {
    if (!account.is_object() || !account.contains(ACCOUNT_LOGIN) || !account.at(ACCOUNT_LOGIN).is_string()) return false;
    const auto login = account.at(ACCOUNT_LOGIN).get<std::string>();
    if (findAccount(login)) return false;
    if (!engine_.tableExists(accountsTable())) return false;

    auto row = rowFromJson(account);
    const auto outcome = engine_.transact("SmartMerge::restoreAccount", [&](db::Transaction& txn) {
        return txn.insert(accountsTable(), row);
    });

    // The preserved id may now belong to a migrated account; let the table assign one.
    if (outcome.outcome != db::InsertOutcome::Inserted) {
        std::erase_if(row.fields, [](const db::Field& f) { return f.column == ACCOUNT_ID; });
        engine_.syncSequences(accountsTable());
        const auto retry = engine_.transact("SmartMerge::restoreAccount", [&](db::Transaction& txn) {
            return txn.insert(accountsTable(), row);
        });
        if (retry.outcome != db::InsertOutcome::Inserted)
            throw MigrationError(ErrorCode::RowApplyFailure,
                                 fmt::format("Failed to restore account '{}': {}", login, retry.error),
                                 accountsTable());
    }

    const auto restored = findAccount(login);
    if (!restored) throw MigrationError(ErrorCode::Internal, "Restored account not found", login);
    grantAdministrator(restored->str(ACCOUNT_ID));

    LogRegistry::audit()->info("[SmartMerge::restoreAccount] Re-created account '{}' as {}", login,
                               restored->str(ACCOUNT_ID));
    return true;
}

RestoreResult SmartMerge::restore() {
    RestoreResult result;
    const auto snap = snapshots_.get(SNAPSHOT_KEY);
    if (!snap) {
        LogRegistry::sync()->warn("[SmartMerge::restore] No snapshot to restore (expired or never taken)");
        return result;
    }
    result.snapshotFound = true;

    if (engine_.tableExists(optionsTable()) && snap->contains("options")) {
        const auto columns = engine_.columns(optionsTable());
        const bool hasAutoload = std::ranges::any_of(columns, [](const db::Column& c) { return c.name == "autoload"; });

        for (const auto& [name, value] : snap->at("options").items())
            if (value.is_string() && restoreOption(name, value.get<std::string>(), hasAutoload))
                ++result.optionsRestored;
    }

    if (snap->contains("account")) result.accountRestored = restoreAccount(snap->at("account"));

    snapshots_.discard(SNAPSHOT_KEY);
    LogRegistry::audit()->info("[SmartMerge::restore] Restored {} options{}", result.optionsRestored,
                               result.accountRestored ? " and the preserved account" : "");
    return result;
}

}
