#include "sync/SnapshotStore.hpp"
#include "util/errors.hpp"
#include "util/files.hpp"
#include "util/parse.hpp"
#include "util/timestamp.hpp"
#include "logging/LogRegistry.hpp"

using namespace sm::util;
using namespace sm::logging;

namespace sm::sync {

SnapshotStore::SnapshotStore(std::filesystem::path dir, const std::chrono::seconds ttl)
    : dir_(std::move(dir)), ttl_(ttl) {}

std::filesystem::path SnapshotStore::fileFor(const std::string& key) const {
    if (!isSafeIdentifier(key)) throw MigrationError(ErrorCode::InvalidRequest, "Invalid snapshot key", key);
    return dir_ / (key + ".json");
}

std::optional<nlohmann::json> SnapshotStore::readLive(const std::string& key) {
    const auto file = fileFor(key);
    std::error_code ec;
    if (!std::filesystem::exists(file, ec)) return std::nullopt;

    const auto doc = nlohmann::json::parse(readFileToString(file), nullptr, false);
    if (doc.is_discarded() || !doc.is_object() || !doc.contains("value") ||
        !doc.contains("expires_at") || !doc.at("expires_at").is_number_integer()) {
        LogRegistry::sync()->warn("[SnapshotStore::get] Discarding unreadable snapshot '{}'", key);
        std::filesystem::remove(file, ec);
        return std::nullopt;
    }

    if (doc.at("expires_at").get<std::time_t>() <= now()) {
        LogRegistry::sync()->info("[SnapshotStore::get] Snapshot '{}' expired", key);
        std::filesystem::remove(file, ec);
        return std::nullopt;
    }

    return doc.at("value");
}

bool SnapshotStore::put(const std::string& key, const nlohmann::json& value, const bool overwrite) {
    std::scoped_lock lock(mutex_);
    if (!overwrite && readLive(key)) {
        LogRegistry::sync()->info("[SnapshotStore::put] Keeping existing snapshot '{}'", key);
        return false;
    }

    const nlohmann::json doc = {
        {"expires_at", now() + static_cast<std::time_t>(ttl_.count())},
        {"value", value}
    };
    writeFileAtomic(fileFor(key), doc.dump());
    return true;
}

std::optional<nlohmann::json> SnapshotStore::get(const std::string& key) {
    std::scoped_lock lock(mutex_);
    return readLive(key);
}

void SnapshotStore::discard(const std::string& key) {
    std::scoped_lock lock(mutex_);
    std::error_code ec;
    std::filesystem::remove(fileFor(key), ec);
    if (ec) LogRegistry::sync()->warn("[SnapshotStore::discard] Failed to remove '{}': {}", key, ec.message());
}

}
