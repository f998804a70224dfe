#pragma once

#include "config/Config.hpp"
#include "sync/DatabaseTransfer.hpp"
#include "sync/SearchReplace.hpp"
#include "sync/SmartMerge.hpp"
#include "transfer/BatchArchive.hpp"
#include "transfer/ChunkTransport.hpp"
#include "transfer/PathGuard.hpp"
#include "types/Session.hpp"

#include <string>
#include <vector>

namespace sm::db { class Engine; }
namespace sm::sync { class SnapshotStore; }

namespace sm::dest {

class SettingsStore;

struct SiteConfigView {
    std::string tablePrefix;
    std::string siteUrl;
    std::string homeUrl;
};

struct FlushResult {
    uint64_t transientsDeleted{0};
    bool rewriteRulesCleared{false};
};

// The destination's write operations. Everything a migration changes on this site
// goes through here.
class Site {
public:
    Site(const config::Config& config, db::Engine& engine, SettingsStore& settings, sync::SnapshotStore& snapshots);

    void setMode(config::SiteMode mode);

    // New secret; returns the connection key "<home url>|<base64 secret>".
    std::string regenerateSecret();

    // Validates and stores a connection key from a source. Returns the endpoint it names.
    types::SourceEndpoint saveConnection(const std::string& key);

    // The saved key, empty when none was saved.
    [[nodiscard]] std::string loadConnection() const;

    static types::SourceEndpoint parseConnection(const std::string& key);

    [[nodiscard]] SiteConfigView siteConfig() const;

    sync::PrepareResult prepareDatabase(const std::vector<std::string>& sourceTables, const std::string& sourcePrefix,
                                        bool overwrite, const std::string& operatorLogin);

    // Returns the destination table name.
    std::string createTable(const std::string& schema, const std::string& sourceTable, const std::string& sourcePrefix);
    bool dropTable(const std::string& table);

    sync::BatchApplyResult processRows(const std::string& sourceTable, const std::string& sourcePrefix,
                                       const std::vector<types::WireRow>& rows);

    transfer::WriteResult writeChunk(const std::string& path, uint64_t offset, const std::string& dataBase64,
                                     const std::string& md5);

    transfer::ExtractResult extractBatch(const std::string& dataBase64, const std::string& md5);

    // Source URL from the saved connection unless given explicitly.
    sync::ReplaceStats searchReplace(const std::string& from = {}, const std::string& to = {});

    FlushResult flushCaches();

    sync::RestoreResult finalize();

    [[nodiscard]] const std::string& tablePrefix() const noexcept { return config_.site.table_prefix; }
    [[nodiscard]] const transfer::PathGuard& guard() const noexcept { return guard_; }
    [[nodiscard]] sync::DatabaseTransfer& database() noexcept { return database_; }
    [[nodiscard]] sync::SmartMerge& smartMerge() noexcept { return smartMerge_; }

private:
    const config::Config& config_;
    db::Engine& engine_;
    SettingsStore& settings_;

    transfer::PathGuard guard_;
    transfer::ChunkTransport chunks_;
    transfer::BatchArchive archive_;
    sync::DatabaseTransfer database_;
    sync::SmartMerge smartMerge_;
};

}
