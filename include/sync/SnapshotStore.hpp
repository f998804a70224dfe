#pragma once

#include <chrono>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace sm::sync {

// Short-lived named JSON values on disk, each with its own expiry.
class SnapshotStore {
public:
    SnapshotStore(std::filesystem::path dir, std::chrono::seconds ttl);

    // An unexpired value under the same key is kept unless overwrite is set. Returns
    // whether the value was written.
    bool put(const std::string& key, const nlohmann::json& value, bool overwrite = false);

    // Expired entries read as absent and are removed.
    [[nodiscard]] std::optional<nlohmann::json> get(const std::string& key);

    void discard(const std::string& key);

    [[nodiscard]] std::chrono::seconds ttl() const noexcept { return ttl_; }

private:
    [[nodiscard]] std::filesystem::path fileFor(const std::string& key) const;
    std::optional<nlohmann::json> readLive(const std::string& key);

    std::filesystem::path dir_;
    std::chrono::seconds ttl_;
    std::mutex mutex_;
};

}
