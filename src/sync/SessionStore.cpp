#include "sync/SessionStore.hpp"
#include "util/files.hpp"
#include "logging/LogRegistry.hpp"

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <unordered_map>

using namespace sm::logging;

namespace sm::sync {

namespace {

int versionOf(const nlohmann::json& doc) {
    if (!doc.is_object() || !doc.contains("version")) throw std::invalid_argument("Session has no version");
    const auto& v = doc.at("version");
    if (v.is_number_unsigned()) return static_cast<int>(v.get<unsigned int>());
    if (v.is_string()) {
        const auto s = v.get<std::string>();
        if (s == "1.0" || s == "1") return 1;
    }
    throw std::invalid_argument("Unsupported session version: " + v.dump());
}

std::string v1Phase(const std::string& phase) {
    static const std::unordered_map<std::string, std::string> map = {
        {"idle", "idle"},
        {"handshake", "scanning"},
        {"scan", "scanning"},
        {"database", "transferring_database"},
        {"files", "transferring_files"},
        {"finalize", "finalizing"},
        {"complete", "complete"},
        {"error", "error"},
        {"paused", "paused"}
    };
    const auto it = map.find(phase);
    if (it == map.end()) throw std::invalid_argument("Unknown version 1 phase: " + phase);
    return it->second;
}

template <typename T>
T numberOr(const nlohmann::json& j, const char* key, T fallback) {
    if (!j.contains(key) || !j.at(key).is_number()) return fallback;
    return j.at(key).get<T>();
}

// Version 1 timestamps are milliseconds since the epoch.
std::time_t v1Time(const nlohmann::json& stats, const char* key) {
    if (!stats.contains(key) || !stats.at(key).is_number()) return 0;
    return static_cast<std::time_t>(stats.at(key).get<double>() / 1000.0);
}

}

nlohmann::json SessionStore::upgradeFromV1(const nlohmann::json& v1) {
    const auto phase = v1Phase(v1.value("phase", std::string("idle")));

    const auto tableIndex = numberOr<uint32_t>(v1, "currentTable", 0);
    const auto tableOffset = numberOr<uint64_t>(v1, "tableOffset", 0);
    const auto fileIndex = numberOr<uint64_t>(v1, "currentFileIndex", 0);
    const auto completed = v1.value("completedFiles", std::vector<std::string>{});

    std::string lastKey;
    if (v1.contains("lastTableId")) {
        const auto& id = v1.at("lastTableId");
        if (id.is_string()) lastKey = id.get<std::string>();
        else if (id.is_number() && id.get<double>() != 0) lastKey = id.dump();
    }

    // Version 1 did not record which phase a pause interrupted.
    std::string resumePhase = phase;
    if (phase == "paused" || phase == "error") {
        if (fileIndex > 0 || !completed.empty()) resumePhase = "transferring_files";
        else if (tableIndex > 0 || tableOffset > 0 || !lastKey.empty()) resumePhase = "transferring_database";
        else resumePhase = "scanning";
    }

    const auto stats = v1.contains("stats") && v1.at("stats").is_object() ? v1.at("stats") : nlohmann::json::object();

    auto errors = nlohmann::json::array();
    if (stats.contains("errors") && stats.at("errors").is_array()) {
        for (const auto& e : stats.at("errors")) {
            std::string message = e.is_string() ? e.get<std::string>()
                                : e.is_object() ? e.value("message", e.dump()) : e.dump();
            errors.push_back({{"at", 0}, {"code", "internal"}, {"unit", ""}, {"message", message}});
        }
    }

    return {
        {"version", types::Session::VERSION},
        {"id", ""},
        {"phase", phase},
        {"resume_phase", resumePhase},
        {"source", {{"url", v1.value("sourceUrl", std::string{})}, {"secret", ""}}},
        {"table_prefix_source", v1.value("sourceTablePrefix", std::string("wp_"))},
        {"table_prefix_dest", ""},
        {"database_cursor", {
            {"current_table_index", tableIndex},
            {"rows_offset", tableOffset},
            {"last_primary_key", lastKey}
        }},
        {"file_cursor", {
            {"current_file_index", fileIndex},
            {"byte_offset", numberOr<uint64_t>(v1, "fileByteOffset", 0)},
            {"completed_files", completed}
        }},
        {"flags", {{"paused", phase == "paused"}, {"cancelled", false}}},
        {"stats", {
            {"bytes_transferred", numberOr<uint64_t>(stats, "bytesTransferred", 0)},
            {"rows_transferred", numberOr<uint64_t>(stats, "rowsTransferred", 0)},
            {"rows_skipped", 0},
            {"rows_duplicate", 0},
            {"files_transferred", numberOr<uint64_t>(stats, "filesTransferred", 0)},
            {"files_failed", 0},
            {"retry_count", numberOr<uint64_t>(stats, "retries", 0)},
            {"error_log", errors}
        }},
        {"last_error", ""},
        {"started_at", v1Time(stats, "startTime")},
        {"ended_at", v1Time(stats, "endTime")},
        {"total_tables", numberOr<uint32_t>(v1, "totalTables", 0)},
        {"total_files", numberOr<uint64_t>(v1, "totalFiles", 0)}
    };
}

nlohmann::json SessionStore::upgrade(const nlohmann::json& doc) {
    switch (versionOf(doc)) {
        case 1: return upgradeFromV1(doc);
        case static_cast<int>(types::Session::VERSION): return doc;
        default: throw std::invalid_argument("Unsupported session version: " + doc.at("version").dump());
    }
}

std::optional<types::Session> SessionStore::load() const {
    std::error_code ec;
    if (!std::filesystem::exists(file_, ec)) return std::nullopt;

    const auto doc = nlohmann::json::parse(util::readFileToString(file_), nullptr, false);
    if (doc.is_discarded()) throw std::invalid_argument("Session file is not valid JSON: " + file_.string());

    const auto current = upgrade(doc);
    if (current != doc)
        LogRegistry::sync()->info("[SessionStore::load] Upgraded session from version {}", doc.at("version").dump());

    return current.get<types::Session>();
}

void SessionStore::save(const types::Session& session) const {
    util::writeFileAtomic(file_, nlohmann::json(session).dump(2));
}

void SessionStore::clear() const {
    std::error_code ec;
    std::filesystem::remove(file_, ec);
    if (ec) LogRegistry::sync()->warn("[SessionStore::clear] Failed to remove {}: {}", file_.string(), ec.message());
}

bool SessionStore::exists() const {
    std::error_code ec;
    return std::filesystem::exists(file_, ec);
}

}
