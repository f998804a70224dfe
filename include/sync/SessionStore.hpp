#pragma once

#include "types/Session.hpp"

#include <filesystem>
#include <optional>

#include <nlohmann/json_fwd.hpp>

namespace sm::sync {

// The destination's persisted migration session (one per destination).
class SessionStore {
public:
    explicit SessionStore(std::filesystem::path file) : file_(std::move(file)) {}

    // nullopt when nothing is persisted. Throws std::invalid_argument for documents
    // that are neither a valid current session nor an upgradable older one.
    [[nodiscard]] std::optional<types::Session> load() const;

    void save(const types::Session& session) const;
    void clear() const;

    [[nodiscard]] bool exists() const;
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return file_; }

    // Current-version document for any supported version.
    static nlohmann::json upgrade(const nlohmann::json& doc);

    // Version 1: the flat layout ({"version": "1.0", "phase": "database", "currentTable": 3, ...}).
    static nlohmann::json upgradeFromV1(const nlohmann::json& v1);

private:
    std::filesystem::path file_;
};

}
