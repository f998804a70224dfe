#include "source/Provider.hpp"
#include "db/Engine.hpp"
#include "db/KeysetPager.hpp"
#include "dest/SettingsStore.hpp"
#include "crypto/hash.hpp"
#include "util/errors.hpp"
#include "util/parse.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <fmt/format.h>

using namespace sm::util;
using namespace sm::logging;

namespace sm::source {

Provider::Provider(const config::Config& config, db::Engine& engine, dest::SettingsStore& settings)
    : config_(config), engine_(engine), settings_(settings),
      guard_(config.site.content_root),
      chunks_(guard_, config.transfer.chunk_size),
      archive_(guard_),
      scanner_(config.site.content_root, config.scan, config.transfer) {}

AuthResult Provider::authenticate(const std::optional<std::string_view> presented) const {
    if (!presented || presented->empty()) return AuthResult::Missing;

    const auto secret = settings_.get().migrationSecret;
    if (secret.empty()) {
        LogRegistry::auth()->warn("[Provider::authenticate] No migration secret configured, rejecting request");
        return AuthResult::Invalid;
    }

    return crypto::hash::constantTimeEquals(*presented, secret) ? AuthResult::Ok : AuthResult::Invalid;
}

types::SourceInfo Provider::handshake(const std::string& origin) {
    if (!origin.empty()) {
        const auto limit = config_.server.max_connected_origins;
        settings_.update([&](dest::Settings& s) {
            auto& origins = s.connectedOrigins;
            if (std::ranges::find(origins, origin) != origins.end()) return;
            origins.push_back(origin);
            if (origins.size() > limit)
                origins.erase(origins.begin(), origins.end() - static_cast<std::ptrdiff_t>(limit));
        });
        LogRegistry::audit()->info("[Provider::handshake] Destination connected from {}", origin);
    }
    return info();
}

types::SourceInfo Provider::info() const {
    return {
        .version = SITEMIGRATE_VERSION,
        .siteUrl = config_.site.site_url,
        .homeUrl = config_.site.home(),
        .tablePrefix = config_.site.table_prefix,
        .engine = std::string(engine_.name())
    };
}

types::Manifest Provider::manifest() const {
    return scanner_.scan();
}

std::vector<types::TableDescriptor> Provider::tables() const {
    std::vector<types::TableDescriptor> out;
    for (const auto& name : engine_.listTables(config_.site.table_prefix)) {
        if (!isSafeIdentifier(name)) {
            LogRegistry::db()->warn("[Provider::tables] Skipping table with unsafe name '{}'", name);
            continue;
        }
        out.push_back({name, engine_.countRows(name), {}});
    }
    return out;
}

void Provider::requireTable(const std::string& table) const {
    if (!isSafeIdentifier(table)) throw MigrationError(ErrorCode::InvalidRequest, "Invalid table name", table);
    if (!engine_.tableExists(table)) throw MigrationError(ErrorCode::NotFound, "Table not found", table);
}

std::string Provider::schema(const std::string& table) const {
    requireTable(table);
    auto ddl = engine_.createStatement(table);
    if (ddl.empty()) throw MigrationError(ErrorCode::NotFound, "Could not retrieve table schema", table);
    return ddl;
}

types::RowBatch Provider::rows(const std::string& table, const types::RowCursor& cursor,
                               unsigned int batchSize) const {
    if (batchSize == 0) batchSize = config_.transfer.batch_size;
    batchSize = std::min(batchSize, config::MAX_BATCH_SIZE);
    return db::KeysetPager(engine_).page(table, cursor, batchSize);
}

types::Chunk Provider::fileChunk(const std::string& path, const uint64_t start, const uint64_t end) const {
    return chunks_.readChunk(path, start, end);
}

types::ArchiveBatch Provider::batch(const std::vector<std::string>& paths) const {
    if (paths.empty()) throw MigrationError(ErrorCode::InvalidRequest, "No files requested");
    if (paths.size() > config_.transfer.max_batch_files)
        throw MigrationError(ErrorCode::InvalidRequest,
                             fmt::format("Too many files in one batch ({} > {})", paths.size(),
                                         config_.transfer.max_batch_files));
    return archive_.build(paths);
}

std::vector<std::string> Provider::allowedOrigins() const {
    std::vector<std::string> origins;
    for (const auto& url : {config_.site.site_url, config_.site.home()})
        if (auto o = url_origin(url); !o.empty()) origins.push_back(std::move(o));

    for (auto& o : settings_.get().connectedOrigins) origins.push_back(std::move(o));

    std::ranges::sort(origins);
    origins.erase(std::unique(origins.begin(), origins.end()), origins.end());
    return origins;
}

bool Provider::originAllowed(const std::string_view origin) const {
    if (origin.empty()) return false;
    const auto origins = allowedOrigins();
    return std::ranges::find(origins, origin) != origins.end();
}

}
