#include "types/Session.hpp"
#include "util/timestamp.hpp"

#include <algorithm>
#include <initializer_list>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace {

void requireOnly(const nlohmann::json& j, const std::initializer_list<std::string_view> allowed, const char* where) {
    if (!j.is_object()) throw std::invalid_argument(std::string("Session field '") + where + "' must be an object");
    for (const auto& [key, _] : j.items())
        if (std::ranges::find(allowed, std::string_view(key)) == allowed.end())
            throw std::invalid_argument(std::string("Unknown session field '") + key + "' in " + where);
}

sm::types::Phase phaseAt(const nlohmann::json& j, const char* key) {
    sm::types::Phase p{};
    if (!sm::types::tryParsePhase(j.at(key).get<std::string>(), p))
        throw std::invalid_argument("Unknown session phase: " + j.at(key).get<std::string>());
    return p;
}

}

namespace sm::types {

std::string_view to_string(const Phase p) noexcept {
    switch (p) {
        case Phase::Idle: return "idle";
        case Phase::Scanning: return "scanning";
        case Phase::ScanComplete: return "scan_complete";
        case Phase::TransferringDatabase: return "transferring_database";
        case Phase::TransferringFiles: return "transferring_files";
        case Phase::Finalizing: return "finalizing";
        case Phase::Complete: return "complete";
        case Phase::Paused: return "paused";
        case Phase::Error: return "error";
        case Phase::Cancelled: return "cancelled";
    }
    return "idle";
}

bool tryParsePhase(const std::string_view in, Phase& out) noexcept {
    static constexpr Phase all[] = {
        Phase::Idle, Phase::Scanning, Phase::ScanComplete, Phase::TransferringDatabase,
        Phase::TransferringFiles, Phase::Finalizing, Phase::Complete, Phase::Paused,
        Phase::Error, Phase::Cancelled
    };
    for (const auto p : all) {
        if (to_string(p) == in) {
            out = p;
            return true;
        }
    }
    return false;
}

bool isInProgress(const Phase p) noexcept {
    switch (p) {
        case Phase::Scanning:
        case Phase::ScanComplete:
        case Phase::TransferringDatabase:
        case Phase::TransferringFiles:
        case Phase::Finalizing: return true;
        default: return false;
    }
}

void Session::recordError(const util::ErrorCode code, std::string unit, std::string message, const size_t limit) {
    stats.errorLog.push_back({util::now(), code, std::move(unit), std::move(message)});
    while (stats.errorLog.size() > limit) stats.errorLog.pop_front();
}

void to_json(nlohmann::json& j, const Session& s) {
    auto errors = nlohmann::json::array();
    for (const auto& e : s.stats.errorLog)
        errors.push_back({
            {"at", e.at},
            {"code", util::to_string(e.code)},
            {"unit", e.unit},
            {"message", e.message}
        });

    j = {
        {"version", Session::VERSION},
        {"id", s.id},
        {"phase", to_string(s.phase)},
        {"resume_phase", to_string(s.resumePhase)},
        {"source", {{"url", s.source.url}, {"secret", s.source.secret}}},
        {"table_prefix_source", s.tablePrefixSource},
        {"table_prefix_dest", s.tablePrefixDest},
        {"database_cursor", {
            {"current_table_index", s.databaseCursor.currentTableIndex},
            {"rows_offset", s.databaseCursor.rowsOffset},
            {"last_primary_key", s.databaseCursor.lastPrimaryKeySeen}
        }},
        {"file_cursor", {
            {"current_file_index", s.fileCursor.currentFileIndex},
            {"byte_offset", s.fileCursor.byteOffset},
            {"completed_files", s.fileCursor.completedFilePaths}
        }},
        {"flags", {{"paused", s.flags.paused}, {"cancelled", s.flags.cancelled}}},
        {"stats", {
            {"bytes_transferred", s.stats.bytesTransferred},
            {"rows_transferred", s.stats.rowsTransferred},
            {"rows_skipped", s.stats.rowsSkipped},
            {"rows_duplicate", s.stats.rowsDuplicate},
            {"files_transferred", s.stats.filesTransferred},
            {"files_failed", s.stats.filesFailed},
            {"retry_count", s.stats.retryCount},
            {"error_log", errors}
        }},
        {"last_error", s.lastError},
        {"started_at", s.startedAt},
        {"ended_at", s.endedAt},
        {"total_tables", s.totalTables},
        {"total_files", s.totalFiles}
    };
}

void from_json(const nlohmann::json& j, Session& s) {
    requireOnly(j, {"version", "id", "phase", "resume_phase", "source", "table_prefix_source",
                    "table_prefix_dest", "database_cursor", "file_cursor", "flags", "stats",
                    "last_error", "started_at", "ended_at", "total_tables", "total_files"}, "session");

    if (const auto v = j.at("version").get<unsigned int>(); v != Session::VERSION)
        throw std::invalid_argument("Unsupported session version: " + std::to_string(v));

    s.id = j.at("id").get<std::string>();
    s.phase = phaseAt(j, "phase");
    s.resumePhase = phaseAt(j, "resume_phase");

    const auto& src = j.at("source");
    requireOnly(src, {"url", "secret"}, "source");
    s.source.url = src.at("url").get<std::string>();
    s.source.secret = src.at("secret").get<std::string>();

    s.tablePrefixSource = j.at("table_prefix_source").get<std::string>();
    s.tablePrefixDest = j.at("table_prefix_dest").get<std::string>();
    s.manifest.reset();

    const auto& db = j.at("database_cursor");
    requireOnly(db, {"current_table_index", "rows_offset", "last_primary_key"}, "database_cursor");
    s.databaseCursor.currentTableIndex = db.at("current_table_index").get<uint32_t>();
    s.databaseCursor.rowsOffset = db.at("rows_offset").get<uint64_t>();
    s.databaseCursor.lastPrimaryKeySeen = db.at("last_primary_key").get<std::string>();

    const auto& files = j.at("file_cursor");
    requireOnly(files, {"current_file_index", "byte_offset", "completed_files"}, "file_cursor");
    s.fileCursor.currentFileIndex = files.at("current_file_index").get<uint64_t>();
    s.fileCursor.byteOffset = files.at("byte_offset").get<uint64_t>();
    s.fileCursor.completedFilePaths = files.at("completed_files").get<std::set<std::string>>();

    const auto& flags = j.at("flags");
    requireOnly(flags, {"paused", "cancelled"}, "flags");
    s.flags.paused = flags.at("paused").get<bool>();
    s.flags.cancelled = flags.at("cancelled").get<bool>();

    const auto& stats = j.at("stats");
    requireOnly(stats, {"bytes_transferred", "rows_transferred", "rows_skipped", "rows_duplicate",
                        "files_transferred", "files_failed", "retry_count", "error_log"}, "stats");
    s.stats.bytesTransferred = stats.at("bytes_transferred").get<uint64_t>();
    s.stats.rowsTransferred = stats.at("rows_transferred").get<uint64_t>();
    s.stats.rowsSkipped = stats.at("rows_skipped").get<uint64_t>();
    s.stats.rowsDuplicate = stats.at("rows_duplicate").get<uint64_t>();
    s.stats.filesTransferred = stats.at("files_transferred").get<uint64_t>();
    s.stats.filesFailed = stats.at("files_failed").get<uint64_t>();
    s.stats.retryCount = stats.at("retry_count").get<uint64_t>();

    s.stats.errorLog.clear();
    for (const auto& e : stats.at("error_log")) {
        requireOnly(e, {"at", "code", "unit", "message"}, "error_log");
        s.stats.errorLog.push_back({
            e.at("at").get<std::time_t>(),
            util::errorCodeFromString(e.at("code").get<std::string>()),
            e.at("unit").get<std::string>(),
            e.at("message").get<std::string>()
        });
    }

    s.lastError = j.at("last_error").get<std::string>();
    s.startedAt = j.at("started_at").get<std::time_t>();
    s.endedAt = j.at("ended_at").get<std::time_t>();
    s.totalTables = j.at("total_tables").get<uint32_t>();
    s.totalFiles = j.at("total_files").get<uint64_t>();
}

}
