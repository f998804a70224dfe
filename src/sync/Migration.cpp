#include "sync/Migration.hpp"
#include "sync/FileTransfer.hpp"
#include "sync/MigrationLock.hpp"
#include "sync/PauseToken.hpp"
#include "sync/SessionStore.hpp"
#include "dest/Site.hpp"
#include "source/SourceApi.hpp"
#include "crypto/hash.hpp"
#include "util/timestamp.hpp"
#include "logging/LogRegistry.hpp"

#include <fmt/format.h>

using namespace sm::util;
using namespace sm::logging;
using sm::types::Phase;

namespace sm::sync {

namespace {

// A file failure under the abort policy. Not a MigrationError, so FileTransfer lets it through.
struct FileAbort : std::runtime_error {
    FileAbort(const ErrorCode c, const std::string& msg) : std::runtime_error(msg), code(c) {}
    ErrorCode code;
};

}

Migration::Migration(const config::Config& config, dest::Site& site, source::SourceApi& source,
                     SessionStore& store, MigrationLock& lock, PauseToken& token)
    : config_(config), site_(site), source_(source), store_(store), lock_(lock), token_(token) {}

types::Session Migration::start(const types::SourceEndpoint& endpoint, const Options& options) {
    if (const auto existing = store_.load(); existing && existing->resumable())
        throw MigrationError(ErrorCode::ConcurrencyConflict,
                             "A migration session is already in progress; resume or cancel it first", existing->id);

    session_ = {};
    session_.id = crypto::hash::md5(crypto::hash::generateSecret(32)).substr(0, 16);
    session_.source = endpoint;
    session_.tablePrefixDest = site_.tablePrefix();
    session_.startedAt = now();
    options_ = options;

    LogRegistry::audit()->info("[Migration::start] Session {} from {}", session_.id, endpoint.url);
    return drive();
}

types::Session Migration::resume(const Options& options) {
    auto loaded = store_.load();
    if (!loaded) throw MigrationError(ErrorCode::NotFound, "No migration session to resume");
    if (!loaded->resumable())
        throw MigrationError(ErrorCode::InvalidRequest, "Migration session cannot be resumed",
                             std::string(types::to_string(loaded->phase)));

    session_ = std::move(*loaded);
    options_ = options;

    if (session_.phase == Phase::Paused || session_.phase == Phase::Error)
        session_.phase = session_.resumePhase == Phase::Idle ? Phase::Scanning : session_.resumePhase;
    session_.flags.paused = false;
    session_.lastError.clear();

    LogRegistry::audit()->info("[Migration::resume] Session {} resuming in {}", session_.id,
                               types::to_string(session_.phase));
    return drive();
}

types::Session Migration::drive() {
    lock_.acquire(session_.id);
    persist();

    source_.setRetryObserver([this](unsigned int, const MigrationError&) { ++session_.stats.retryCount; });

    try {
        while (session_.phase != Phase::Complete) {
            switch (session_.phase) {
                case Phase::Idle:
                    enter(Phase::Scanning);
                    break;
                case Phase::Scanning:
                    scan();
                    enter(Phase::ScanComplete);
                    break;
                case Phase::ScanComplete:
                    enter(Phase::TransferringDatabase);
                    break;
                case Phase::TransferringDatabase:
                    transferDatabase();
                    enter(Phase::TransferringFiles);
                    break;
                case Phase::TransferringFiles:
                    transferFiles();
                    enter(Phase::Finalizing);
                    break;
                case Phase::Finalizing:
                    finalize();
                    session_.endedAt = now();
                    enter(Phase::Complete);
                    store_.clear();
                    LogRegistry::audit()->info("[Migration::drive] Session {} complete: {} rows, {} files, {} bytes",
                                               session_.id, session_.stats.rowsTransferred,
                                               session_.stats.filesTransferred, session_.stats.bytesTransferred);
                    break;
                default:
                    throw MigrationError(ErrorCode::Internal, "Cannot drive a session in this phase",
                                         std::string(types::to_string(session_.phase)));
            }
        }
    } catch (const Suspended&) {
        LogRegistry::sync()->info("[Migration::drive] Session {} suspended in {}", session_.id,
                                  types::to_string(session_.resumePhase));
    } catch (const Cancelled&) {
        LogRegistry::sync()->info("[Migration::drive] Session {} cancelled", session_.id);
    } catch (const FileAbort& e) {
        fail(e.code, e.what());
    } catch (const MigrationError& e) {
        fail(e.code(), e.what());
    } catch (const std::exception& e) {
        fail(ErrorCode::Internal, e.what());
    }

    source_.setRetryObserver({});
    lock_.release();
    return session_;
}

void Migration::scan() {
    const auto info = source_.handshake();
    session_.tablePrefixSource = info.tablePrefix;
    LogRegistry::sync()->info("[Migration::scan] Connected to {} (sitemigrate {}, {} engine, prefix {})",
                              info.siteUrl, info.version, info.engine, info.tablePrefix);
    checkpoint();

    const auto tables = source_.tables();
    session_.totalTables = static_cast<uint32_t>(tables.size());
    checkpoint();

    session_.manifest = source_.manifest();
    session_.totalFiles = session_.manifest->entries.size();

    LogRegistry::sync()->info("[Migration::scan] {} tables, {} files ({} bytes, {} large)", session_.totalTables,
                              session_.totalFiles, session_.manifest->totalSize, session_.manifest->largeFiles);
}

void Migration::transferDatabase() {
    auto& cursor = session_.databaseCursor;
    const auto tables = source_.tables();
    session_.totalTables = static_cast<uint32_t>(tables.size());

    // Smart-Merge runs once, before anything is dropped or created.
    if (!cursor.hasProgress()) {
        std::vector<std::string> names;
        names.reserve(tables.size());
        for (const auto& t : tables) names.push_back(t.sourceTableName);

        const auto prepared = site_.prepareDatabase(names, session_.tablePrefixSource, options_.overwrite,
                                                    options_.operatorLogin);
        for (const auto& e : prepared.errors) record(ErrorCode::SchemaApplyFailure, "prepare", e);
        persist();
    }

    auto& database = site_.database();
    while (cursor.currentTableIndex < tables.size()) {
        checkpoint();

        const auto& table = tables[cursor.currentTableIndex];
        LogRegistry::sync()->info("[Migration::transferDatabase] Table {}/{}: {} ({} rows)",
                                  cursor.currentTableIndex + 1, tables.size(), table.sourceTableName, table.rowCount);

        try {
            const auto result = database.transferTable(
                source_, table, session_.tablePrefixSource, cursor,
                [this, &table](const BatchApplyResult& r, const types::DatabaseCursor&) {
                    auto& stats = session_.stats;
                    stats.rowsTransferred += r.inserted;
                    stats.rowsDuplicate += r.duplicates;
                    stats.rowsSkipped += r.skipped;
                    for (const auto& e : r.errors) record(ErrorCode::RowApplyFailure, table.sourceTableName, e);
                    persist();
                    checkpoint();
                });
            LogRegistry::sync()->debug("[Migration::transferDatabase] {} done, {} rows{}", table.sourceTableName,
                                       result.rows.inserted, result.created ? ", table created" : "");
        } catch (const MigrationError& e) {
            if (e.fatal()) throw;
            LogRegistry::sync()->error("[Migration::transferDatabase] {} left incomplete after {} rows: {}",
                                       table.sourceTableName, cursor.rowsOffset, e.what());
            record(e.code(), table.sourceTableName,
                   fmt::format("Table left incomplete after {} rows: {}", cursor.rowsOffset, e.what()));
        }

        cursor.nextTable();
        persist();
    }
}

void Migration::transferFiles() {
    if (!session_.manifest) {
        LogRegistry::sync()->info("[Migration::transferFiles] Fetching manifest");
        session_.manifest = source_.manifest();
    }
    session_.totalFiles = session_.manifest->entries.size();

    FileTransfer files(source_, site_.guard(), config_.transfer);

    FileTransfer::Hooks hooks;
    hooks.checkpoint = [this] { checkpoint(); };
    hooks.persist = [this] { persist(); };
    hooks.onRetry = [this](unsigned int, const MigrationError&) { ++session_.stats.retryCount; };
    hooks.onFailure = [this](const std::string& path, const MigrationError& e) {
        record(e.code(), path, e.what());
        if (config_.transfer.file_failure_policy == config::FileFailurePolicy::Abort)
            throw FileAbort(e.code(), fmt::format("{}: {}", path, e.what()));
    };

    files.run(*session_.manifest, session_.fileCursor, session_.stats, hooks);

    LogRegistry::sync()->info("[Migration::transferFiles] {} files transferred, {} failed",
                              session_.stats.filesTransferred, session_.stats.filesFailed);
}

void Migration::finalize() {
    checkpoint();

    const auto replaced = site_.searchReplace(session_.source.url, config_.site.home());
    for (const auto& e : replaced.errors) record(ErrorCode::RowApplyFailure, "search_replace", e);
    persist();
    checkpoint();

    const auto restored = site_.finalize();
    LogRegistry::sync()->info("[Migration::finalize] {} rows rewritten, {} options restored{}",
                              replaced.rowsChanged, restored.optionsRestored,
                              restored.accountRestored ? ", operator account restored" : "");
}

void Migration::enter(const Phase phase) {
    LogRegistry::sync()->info("[Migration] {} -> {}", types::to_string(session_.phase), types::to_string(phase));
    session_.phase = phase;
    persist();
}

void Migration::persist() {
    store_.save(session_);
}

void Migration::checkpoint() {
    lock_.renew();

    auto state = token_.state();
    if (state == PauseToken::State::Pause) {
        pauseHere();
        // Keep the lock alive while parked.
        while ((state = token_.waitFor(config_.transfer.lock_timeout / 4)) == PauseToken::State::Pause)
            lock_.renew();

        if (state == PauseToken::State::Run) {
            session_.flags.paused = false;
            LogRegistry::audit()->info("[Migration::checkpoint] Session {} resumed", session_.id);
            enter(session_.resumePhase);
            return;
        }
    }

    if (state == PauseToken::State::Stop) {
        pauseHere();
        throw Suspended();
    }

    if (state == PauseToken::State::Cancel) {
        cancelHere();
        throw Cancelled();
    }
}

void Migration::pauseHere() {
    if (session_.phase == Phase::Paused) return;
    session_.resumePhase = session_.phase;
    session_.phase = Phase::Paused;
    session_.flags.paused = true;
    persist();
    LogRegistry::audit()->info("[Migration::pauseHere] Session {} paused in {}", session_.id,
                               types::to_string(session_.resumePhase));
}

void Migration::cancelHere() {
    if (session_.phase != Phase::Paused) session_.resumePhase = session_.phase;
    session_.phase = Phase::Cancelled;
    session_.flags.cancelled = true;
    session_.endedAt = now();
    persist();
    store_.clear();
    LogRegistry::audit()->info("[Migration::cancelHere] Session {} cancelled", session_.id);
}

void Migration::fail(const ErrorCode code, const std::string& message) {
    if (session_.phase != Phase::Paused && session_.phase != Phase::Error) session_.resumePhase = session_.phase;
    record(code, std::string(types::to_string(session_.resumePhase)), message);
    session_.phase = Phase::Error;
    session_.lastError = message;
    persist();
    LogRegistry::sync()->error("[Migration::fail] Session {} stopped in {}: {}", session_.id,
                               types::to_string(session_.resumePhase), message);
}

void Migration::record(const ErrorCode code, const std::string& unit, const std::string& message) {
    LogRegistry::sync()->warn("[Migration] {} [{}]: {}", unit, to_string(code), message);
    session_.recordError(code, unit, message, config_.transfer.error_log_limit);
}

}
