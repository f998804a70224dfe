#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace sm::config {

constexpr static uintmax_t MiB = 1024 * 1024;
constexpr static uintmax_t MIN_CHUNK_SIZE = MiB / 2;
constexpr static uintmax_t MAX_CHUNK_SIZE = 10 * MiB;
constexpr static unsigned int MIN_BATCH_SIZE = 100;
constexpr static unsigned int MAX_BATCH_SIZE = 5000;

enum class SiteMode { None, Source, Destination };

std::string to_string(SiteMode mode);
SiteMode siteModeFromString(const std::string& s);

enum class FileFailurePolicy { Continue, Abort };

std::string to_string(FileFailurePolicy policy);
FileFailurePolicy fileFailurePolicyFromString(const std::string& s);

struct SiteConfig {
    SiteMode mode = SiteMode::None;
    std::filesystem::path content_root = "/var/www/html/wp-content";
    std::string site_url = "http://localhost";
    std::string home_url;                        // empty: same as site_url
    std::string table_prefix = "wp_";
    std::filesystem::path state_dir = "/var/lib/sitemigrate";

    [[nodiscard]] const std::string& home() const { return home_url.empty() ? site_url : home_url; }

    [[nodiscard]] std::filesystem::path settingsFile() const { return state_dir / "settings.json"; }
    [[nodiscard]] std::filesystem::path sessionFile() const { return state_dir / "session.json"; }
    [[nodiscard]] std::filesystem::path lockFile() const { return state_dir / "migration.lock"; }
    [[nodiscard]] std::filesystem::path snapshotDir() const { return state_dir / "snapshots"; }
};

enum class EngineKind { Postgres, Sqlite };

struct DatabaseConfig {
    EngineKind engine = EngineKind::Postgres;
    std::string host = "localhost";
    uint16_t port = 5432;
    std::string name = "sitemigrate";
    std::string user = "sitemigrate";
    std::string password_env = "SITEMIGRATE_DB_PASSWORD";
    std::filesystem::path sqlite_path = "/var/lib/sitemigrate/site.db";
};

struct ServerConfig {
    std::string host = "0.0.0.0";
    uint16_t port = 33380;
    uintmax_t max_body_bytes = 16 * MiB;
    unsigned int max_connected_origins = 10;
};

struct TransferConfig {
    uintmax_t chunk_size = 2 * MiB;              // also the large-file threshold
    unsigned int batch_size = 1000;              // rows per page
    unsigned int max_retries = 5;
    unsigned int chunk_max_retries = 3;
    std::chrono::milliseconds retry_base{1000};
    std::chrono::milliseconds retry_cap{16000};
    uintmax_t max_batch_bytes = 2 * MiB;
    unsigned int max_batch_files = 100;
    unsigned int persist_every_files = 10;
    std::chrono::seconds lock_timeout{1800};
    std::chrono::seconds snapshot_ttl{3600};
    std::chrono::seconds request_timeout{300};
    FileFailurePolicy file_failure_policy = FileFailurePolicy::Continue;
    unsigned int error_log_limit = 200;

    // Clamp everything to the ranges the transfer protocol accepts.
    void clamp();
};

struct SmartMergeConfig {
    std::string accounts_table = "users";
    std::string account_attributes_table = "usermeta";
    std::string options_table = "options";
    std::vector<std::string> protected_tables = {"users", "usermeta"};
    std::vector<std::string> protected_options = {
        "siteurl", "home", "admin_email", "active_plugins", "current_theme", "template", "stylesheet",
        "sm_migration_secret", "sm_source_url", "sm_source_mode"
    };
    std::string operator_login;                  // destination account that must survive; empty: none
};

struct ScanConfig {
    std::vector<std::string> roots = {"plugins", "themes", "uploads"};
    std::vector<std::string> exclude_files = {
        ".DS_Store", "Thumbs.db", ".env", ".htaccess", "debug.log"
    };
    // Bare names match any path component; names containing '/' match a relative path prefix.
    std::vector<std::string> exclude_dirs = {
        ".git", ".svn", ".hg", "node_modules", "bower_components", "cache", "backups", "upgrade", "uploads/cache"
    };
    std::vector<std::string> exclude_extensions = {"log", "tmp", "bak", "swp", "swo"};
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum sitemigrate = spdlog::level::info;
    spdlog::level::level_enum db          = spdlog::level::warn;
    spdlog::level::level_enum files       = spdlog::level::info;
    spdlog::level::level_enum http        = spdlog::level::warn;
    spdlog::level::level_enum rewrite     = spdlog::level::info;
    spdlog::level::level_enum sync        = spdlog::level::info;
    spdlog::level::level_enum auth        = spdlog::level::warn;
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::debug;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir = "/var/log/sitemigrate";
    LogLevelsConfig levels;
};

struct Config {
    SiteConfig site;
    DatabaseConfig database;
    ServerConfig server;
    TransferConfig transfer;
    SmartMergeConfig smart_merge;
    ScanConfig scan;
    LoggingConfig logging;
};

constexpr auto DEFAULT_CONFIG_PATH = "/etc/sitemigrate/config.yaml";

Config loadConfig(const std::filesystem::path& path);

void to_json(nlohmann::json& j, const Config& c);
void from_json(const nlohmann::json& j, Config& c);
void to_json(nlohmann::json& j, const SiteConfig& c);
void from_json(const nlohmann::json& j, SiteConfig& c);
void to_json(nlohmann::json& j, const DatabaseConfig& c);
void from_json(const nlohmann::json& j, DatabaseConfig& c);
void to_json(nlohmann::json& j, const ServerConfig& c);
void from_json(const nlohmann::json& j, ServerConfig& c);
void to_json(nlohmann::json& j, const TransferConfig& c);
void from_json(const nlohmann::json& j, TransferConfig& c);
void to_json(nlohmann::json& j, const SmartMergeConfig& c);
void from_json(const nlohmann::json& j, SmartMergeConfig& c);
void to_json(nlohmann::json& j, const ScanConfig& c);
void from_json(const nlohmann::json& j, ScanConfig& c);
void to_json(nlohmann::json& j, const LogLevelsConfig& c);
void from_json(const nlohmann::json& j, LogLevelsConfig& c);
void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c);
void from_json(const nlohmann::json& j, SubsystemLogLevelsConfig& c);
void to_json(nlohmann::json& j, const LoggingConfig& c);
void from_json(const nlohmann::json& j, LoggingConfig& c);

} // namespace sm::config
