#include "dest/Site.hpp"
#include "dest/SettingsStore.hpp"
#include "db/Engine.hpp"
#include "sync/SnapshotStore.hpp"
#include "crypto/base64.hpp"
#include "crypto/hash.hpp"
#include "util/errors.hpp"
#include "util/parse.hpp"
#include "logging/LogRegistry.hpp"

#include <fmt/format.h>

using namespace sm::util;
using namespace sm::logging;

namespace sm::dest {

Site::Site(const config::Config& config, db::Engine& engine, SettingsStore& settings, sync::SnapshotStore& snapshots)
    : config_(config), engine_(engine), settings_(settings),
      guard_(config.site.content_root),
      chunks_(guard_, config.transfer.chunk_size),
      archive_(guard_),
      database_(engine, config.site.table_prefix, config.transfer.batch_size),
      smartMerge_(engine, config.smart_merge, snapshots, config.site.table_prefix) {}

void Site::setMode(const config::SiteMode mode) {
    settings_.update([&](Settings& s) { s.mode = mode; });
    LogRegistry::audit()->info("[Site::setMode] Mode set to {}", config::to_string(mode));
}

std::string Site::regenerateSecret() {
    const auto secret = crypto::hash::generateSecret(64);
    settings_.update([&](Settings& s) { s.migrationSecret = secret; });
    LogRegistry::audit()->info("[Site::regenerateSecret] Migration secret regenerated");

    auto url = config_.site.home();
    while (!url.empty() && url.back() == '/') url.pop_back();
    return url + "|" + crypto::base64::encode(secret);
}

types::SourceEndpoint Site::parseConnection(const std::string& key) {
    const auto trimmed = std::string(trim(key));
    const auto bar = trimmed.find('|');
    if (bar == std::string::npos || trimmed.find('|', bar + 1) != std::string::npos)
        throw MigrationError(ErrorCode::InvalidRequest, "Invalid key format, expected <url>|<secret>");

    types::SourceEndpoint endpoint;
    endpoint.url = trimmed.substr(0, bar);
    if (url_origin(endpoint.url).empty()) throw MigrationError(ErrorCode::InvalidRequest, "Invalid source URL", endpoint.url);

    const auto secret = crypto::base64::tryDecode(trimmed.substr(bar + 1));
    if (!secret || secret->empty()) throw MigrationError(ErrorCode::InvalidRequest, "Invalid secret encoding");
    endpoint.secret = *secret;
    return endpoint;
}

types::SourceEndpoint Site::saveConnection(const std::string& key) {
    auto endpoint = parseConnection(key);
    settings_.update([&](Settings& s) {
        s.connectionString = crypto::base64::encode(std::string(trim(key)));
        s.sourceUrl = endpoint.url;
    });
    LogRegistry::audit()->info("[Site::saveConnection] Source set to {}", endpoint.url);
    return endpoint;
}

std::string Site::loadConnection() const {
    const auto stored = settings_.get().connectionString;
    if (stored.empty()) return {};
    return crypto::base64::decode(stored);
}

SiteConfigView Site::siteConfig() const {
    return {config_.site.table_prefix, config_.site.site_url, config_.site.home()};
}

sync::PrepareResult Site::prepareDatabase(const std::vector<std::string>& sourceTables, const std::string& sourcePrefix,
                                          const bool overwrite, const std::string& operatorLogin) {
    if (!overwrite) return {};

    std::vector<std::string> tables;
    tables.reserve(sourceTables.size());
    for (const auto& t : sourceTables) tables.push_back(database_.destinationName(t, sourcePrefix));

    const auto login = operatorLogin.empty() ? config_.smart_merge.operator_login : operatorLogin;
    return smartMerge_.prepare(tables, login);
}

std::string Site::createTable(const std::string& schema, const std::string& sourceTable,
                              const std::string& sourcePrefix) {
    database_.createTable(schema, sourceTable, sourcePrefix);
    return database_.destinationName(sourceTable, sourcePrefix);
}

bool Site::dropTable(const std::string& table) {
    return database_.dropTable(table);
}

sync::BatchApplyResult Site::processRows(const std::string& sourceTable, const std::string& sourcePrefix,
                                         const std::vector<types::WireRow>& rows) {
    return database_.applyBatch(database_.destinationName(sourceTable, sourcePrefix), rows);
}

transfer::WriteResult Site::writeChunk(const std::string& path, const uint64_t offset, const std::string& dataBase64,
                                       const std::string& md5) {
    return chunks_.writeChunk(path, offset, crypto::base64::decode(dataBase64), md5);
}

transfer::ExtractResult Site::extractBatch(const std::string& dataBase64, const std::string& md5) {
    if (dataBase64.empty()) throw MigrationError(ErrorCode::InvalidRequest, "Empty archive");
    return archive_.extract(crypto::base64::decode(dataBase64), md5);
}

sync::ReplaceStats Site::searchReplace(const std::string& from, const std::string& to) {
    const auto source = from.empty() ? settings_.get().sourceUrl : from;
    if (source.empty()) throw MigrationError(ErrorCode::InvalidRequest, "Source URL not configured");
    const auto destination = to.empty() ? config_.site.home() : to;

    sync::SearchReplace sr(engine_, config_.site.table_prefix, config_.transfer.batch_size);
    auto stats = sr.run(source, destination);
    sr.updateSiteOptions(destination);
    return stats;
}

FlushResult Site::flushCaches() {
    FlushResult result;
    const auto options = config_.site.table_prefix + config_.smart_merge.options_table;
    if (!engine_.tableExists(options)) return result;

    const auto table = db::Engine::quote(options);
    const auto name = db::Engine::quote("option_name");

    result.rewriteRulesCleared = engine_.exec(fmt::format("DELETE FROM {} WHERE {} = $1", table, name),
                                              {std::string("rewrite_rules")}) > 0;
    result.transientsDeleted = engine_.exec(fmt::format("DELETE FROM {} WHERE {} LIKE $1 ESCAPE '\\' OR {} LIKE $2 ESCAPE '\\'",
                                                        table, name, name),
                                            {std::string("\\_transient\\_%"), std::string("\\_site\\_transient\\_%")});

    LogRegistry::sitemigrate()->info("[Site::flushCaches] {} transients deleted{}", result.transientsDeleted,
                                     result.rewriteRulesCleared ? ", rewrite rules cleared" : "");
    return result;
}

sync::RestoreResult Site::finalize() {
    auto result = smartMerge_.restore();
    flushCaches();
    LogRegistry::audit()->info("[Site::finalize] Migration finalized");
    return result;
}

}
