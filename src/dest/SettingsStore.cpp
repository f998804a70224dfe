#include "dest/SettingsStore.hpp"
#include "util/files.hpp"
#include "logging/LogRegistry.hpp"

#include <nlohmann/json.hpp>

using namespace sm::logging;

namespace sm::dest {

void to_json(nlohmann::json& j, const Settings& s) {
    j = {
        {"mode", config::to_string(s.mode)},
        {"migration_secret", s.migrationSecret},
        {"connection_string", s.connectionString},
        {"source_url", s.sourceUrl},
        {"connected_origins", s.connectedOrigins}
    };
}

void from_json(const nlohmann::json& j, Settings& s) {
    s.mode = config::siteModeFromString(j.value("mode", std::string("none")));
    s.migrationSecret = j.value("migration_secret", std::string{});
    s.connectionString = j.value("connection_string", std::string{});
    s.sourceUrl = j.value("source_url", std::string{});
    s.connectedOrigins = j.value("connected_origins", std::vector<std::string>{});
}

SettingsStore::SettingsStore(std::filesystem::path file) : file_(std::move(file)) {
    std::error_code ec;
    if (!std::filesystem::exists(file_, ec)) return;

    try {
        settings_ = nlohmann::json::parse(util::readFileToString(file_)).get<Settings>();
    } catch (const std::exception& e) {
        throw std::runtime_error("Failed to load settings from " + file_.string() + ": " + e.what());
    }
}

Settings SettingsStore::get() const {
    std::scoped_lock lock(mutex_);
    return settings_;
}

void SettingsStore::update(const std::function<void(Settings&)>& fn) {
    std::scoped_lock lock(mutex_);
    auto next = settings_;
    fn(next);
    std::swap(settings_, next);
    try {
        persist();
    } catch (const std::exception& e) {
        std::swap(settings_, next);
        LogRegistry::sitemigrate()->error("[SettingsStore::update] Failed to persist settings: {}", e.what());
        throw;
    }
}

config::SiteMode SettingsStore::effectiveMode(const config::SiteMode configured) const {
    std::scoped_lock lock(mutex_);
    return settings_.mode == config::SiteMode::None ? configured : settings_.mode;
}

void SettingsStore::persist() const {
    util::writeFileAtomic(file_, nlohmann::json(settings_).dump(2));
}

}
