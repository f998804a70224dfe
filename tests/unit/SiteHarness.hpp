#pragma once

#include "TestEnv.hpp"
#include "db/SqliteEngine.hpp"
#include "dest/SettingsStore.hpp"
#include "dest/Site.hpp"
#include "source/LocalClient.hpp"
#include "source/Provider.hpp"
#include "sync/SnapshotStore.hpp"

#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace sm::test {

inline config::Config sourceConfig(const fs::path& root) {
    auto cfg = testConfig(root);
    cfg.site.mode = config::SiteMode::Source;
    cfg.site.site_url = "http://old.test";
    return cfg;
}

// A source site: in-memory database, content root and settings under root.
struct SourceSite {
    config::Config cfg;
    db::SqliteEngine engine{":memory:"};
    dest::SettingsStore settings;
    source::Provider provider;

    explicit SourceSite(const fs::path& root)
        : cfg(sourceConfig(root)), settings(cfg.site.settingsFile()), provider(cfg, engine, settings) {
        fs::create_directories(cfg.site.content_root);
    }
};

struct DestinationSite {
    config::Config cfg;
    db::SqliteEngine engine{":memory:"};
    dest::SettingsStore settings;
    sync::SnapshotStore snapshots;
    dest::Site site;

    explicit DestinationSite(const fs::path& root)
        : cfg(testConfig(root)), settings(cfg.site.settingsFile()),
          snapshots(cfg.site.snapshotDir(), cfg.transfer.snapshot_ttl),
          site(cfg, engine, settings, snapshots) {
        fs::create_directories(cfg.site.content_root);
    }
};

// Forwards to another engine. Records which tables had their key sequences synced,
// and fails the next failingBegins transactions as a dropped connection would.
class InstrumentedEngine final : public db::Engine {
public:
    explicit InstrumentedEngine(db::Engine& inner) : inner_(inner) {}

    std::vector<std::string> synced;
    unsigned int failingBegins{0};

    [[nodiscard]] std::string_view name() const noexcept override { return inner_.name(); }

    std::unique_ptr<db::Transaction> begin() override {
        if (failingBegins > 0) {
            --failingBegins;
            throw std::runtime_error("server closed the connection unexpectedly");
        }
        return inner_.begin();
    }

    std::vector<std::string> listTables(const std::string& prefix) override { return inner_.listTables(prefix); }
    bool tableExists(const std::string& table) override { return inner_.tableExists(table); }
    std::vector<db::Column> columns(const std::string& table) override { return inner_.columns(table); }
    std::string createStatement(const std::string& table) override { return inner_.createStatement(table); }

    void syncSequences(const std::string& table) override {
        synced.push_back(table);
        inner_.syncSequences(table);
    }

private:
    db::Engine& inner_;
};

// LocalClient that records what the destination asked for and can run a callback
// after each rows() call, e.g. to pause or cancel mid-table.
class RecordingSource final : public source::SourceApi {
public:
    struct RowsCall {
        std::string table;
        types::RowCursor cursor;
    };

    explicit RecordingSource(source::Provider& provider) : client_(provider, "https://new.test") {}

    std::vector<std::string> schemaCalls;
    std::vector<RowsCall> rowsCalls;
    std::vector<uint64_t> chunkStarts;
    std::vector<std::vector<std::string>> batchCalls;
    std::function<void(const types::RowBatch&)> afterRows;
    std::function<void()> beforeTables;

    types::SourceInfo handshake() override { return client_.handshake(); }
    types::SourceInfo info() override { return client_.info(); }
    types::Manifest manifest() override { return client_.manifest(); }

    std::vector<types::TableDescriptor> tables() override {
        if (beforeTables) beforeTables();
        return client_.tables();
    }

    std::string schema(const std::string& table) override {
        schemaCalls.push_back(table);
        return client_.schema(table);
    }

    types::RowBatch rows(const std::string& table, const types::RowCursor& cursor, const unsigned int batchSize) override {
        rowsCalls.push_back({table, cursor});
        auto batch = client_.rows(table, cursor, batchSize);
        if (afterRows) afterRows(batch);
        return batch;
    }

    types::Chunk fileChunk(const std::string& path, const uint64_t start, const uint64_t end) override {
        chunkStarts.push_back(start);
        return client_.fileChunk(path, start, end);
    }

    types::ArchiveBatch batch(const std::vector<std::string>& paths) override {
        batchCalls.push_back(paths);
        return client_.batch(paths);
    }

private:
    source::LocalClient client_;
};

}
