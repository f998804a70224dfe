#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace sm::dest {

struct Settings {
    config::SiteMode mode = config::SiteMode::None;
    std::string migrationSecret;
    std::string connectionString;       // base64 of "url|base64(secret)"
    std::string sourceUrl;
    std::vector<std::string> connectedOrigins;
};

void to_json(nlohmann::json& j, const Settings& s);
void from_json(const nlohmann::json& j, Settings& s);

// Tool settings persisted as one JSON document, replaced atomically on every change.
class SettingsStore {
public:
    explicit SettingsStore(std::filesystem::path file);

    [[nodiscard]] Settings get() const;

    // Applies fn to the current settings and writes the result.
    void update(const std::function<void(Settings&)>& fn);

    // Mode from the settings file, falling back to the configured mode.
    [[nodiscard]] config::SiteMode effectiveMode(config::SiteMode configured) const;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return file_; }

private:
    void persist() const;

    std::filesystem::path file_;
    mutable std::mutex mutex_;
    Settings settings_;
};

}
