#pragma once

#include "config/Config.hpp"
#include "db/Engine.hpp"

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace sm::sync {

class SnapshotStore;

struct PrepareResult {
    std::vector<std::string> dropped;
    std::vector<std::string> preserved;
    std::vector<std::string> errors;
    std::optional<std::string> operatorId;
};

struct RestoreResult {
    unsigned int optionsRestored{0};
    bool accountRestored{false};
    bool snapshotFound{false};
};

// Keeps a live destination usable across a migration: the operator's account survives
// the table wipe, and protected options and the administrator account are put back
// once the source rows are in.
class SmartMerge {
public:
    static constexpr auto SNAPSHOT_KEY = "sm_preserved";

    SmartMerge(db::Engine& engine, const config::SmartMergeConfig& config, SnapshotStore& snapshots,
               std::string destinationPrefix);

    // Snapshots protected state, then clears or drops each listed destination table that
    // exists. operatorLogin may be empty, in which case account tables are emptied.
    PrepareResult prepare(const std::vector<std::string>& destinationTables, const std::string& operatorLogin);

    // Writes the snapshot without touching any table. An unexpired earlier snapshot is kept.
    nlohmann::json snapshot(const std::string& operatorLogin);

    RestoreResult restore();

    [[nodiscard]] std::optional<db::Row> findAccount(const std::string& login) const;
    [[nodiscard]] std::optional<db::Row> firstAdministrator() const;

    [[nodiscard]] std::string accountsTable() const { return prefix_ + config_.accounts_table; }
    [[nodiscard]] std::string attributesTable() const { return prefix_ + config_.account_attributes_table; }
    [[nodiscard]] std::string optionsTable() const { return prefix_ + config_.options_table; }

private:
    bool restoreOption(const std::string& name, const std::string& value, bool hasAutoload);
    bool restoreAccount(const nlohmann::json& account);
    void grantAdministrator(const std::string& userId);

    db::Engine& engine_;
    const config::SmartMergeConfig& config_;
    SnapshotStore& snapshots_;
    std::string prefix_;
};

}
