#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <stdexcept>
#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>

namespace sm::config {

std::string to_string(const SiteMode mode) {
    switch (mode) {
        case SiteMode::Source: return "source";
        case SiteMode::Destination: return "destination";
        default: return "none";
    }
}

SiteMode siteModeFromString(const std::string& s) {
    if (s == "source") return SiteMode::Source;
    if (s == "destination") return SiteMode::Destination;
    if (s == "none" || s.empty()) return SiteMode::None;
    throw std::invalid_argument("Invalid site mode: " + s);
}

std::string to_string(const FileFailurePolicy policy) {
    return policy == FileFailurePolicy::Abort ? "abort" : "continue";
}

FileFailurePolicy fileFailurePolicyFromString(const std::string& s) {
    if (s == "abort") return FileFailurePolicy::Abort;
    if (s == "continue" || s.empty()) return FileFailurePolicy::Continue;
    throw std::invalid_argument("Invalid file failure policy: " + s);
}

void TransferConfig::clamp() {
    chunk_size = std::clamp(chunk_size, MIN_CHUNK_SIZE, MAX_CHUNK_SIZE);
    batch_size = std::clamp(batch_size, MIN_BATCH_SIZE, MAX_BATCH_SIZE);
    max_retries = std::clamp(max_retries, 1u, 10u);
    chunk_max_retries = std::clamp(chunk_max_retries, 1u, 10u);
    if (retry_base.count() < 0) retry_base = std::chrono::milliseconds(0);
    retry_cap = std::max(retry_cap, retry_base);
    max_batch_bytes = std::max<uintmax_t>(max_batch_bytes, 64 * 1024);
    max_batch_files = std::clamp(max_batch_files, 1u, 1000u);
    persist_every_files = std::max(persist_every_files, 1u);
    lock_timeout = std::clamp(lock_timeout, std::chrono::seconds(300), std::chrono::seconds(7200));
    if (snapshot_ttl.count() <= 0) snapshot_ttl = std::chrono::seconds(3600);
    if (request_timeout.count() <= 0) request_timeout = std::chrono::seconds(300);
    error_log_limit = std::max(error_log_limit, 1u);
}

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;
    YAML::Node root = YAML::LoadFile(path.string());

    const auto section = [&]<typename T>(const char* key, T& out) {
        if (auto node = root[key]; node && !YAML::convert<T>::decode(node, out))
            throw std::runtime_error(fmt::format("Invalid '{}' section in {}", key, path.string()));
    };

    section("site", cfg.site);
    section("database", cfg.database);
    section("server", cfg.server);
    section("transfer", cfg.transfer);
    section("smart_merge", cfg.smart_merge);
    section("scan", cfg.scan);
    section("logging", cfg.logging);

    return cfg;
}

namespace {

std::string levelName(const spdlog::level::level_enum lvl) {
    const auto sv = spdlog::level::to_string_view(lvl);
    return {sv.data(), sv.size()};
}

spdlog::level::level_enum levelValue(const nlohmann::json& j, const char* key, const spdlog::level::level_enum def) {
    return j.contains(key) ? spdlog::level::from_str(j.at(key).get<std::string>()) : def;
}

}

void to_json(nlohmann::json& j, const Config& c) {
    j = {
        {"site", c.site},
        {"database", c.database},
        {"server", c.server},
        {"transfer", c.transfer},
        {"smart_merge", c.smart_merge},
        {"scan", c.scan},
        {"logging", c.logging}
    };
}

void from_json(const nlohmann::json& j, Config& c) {
    j.at("site").get_to(c.site);
    j.at("database").get_to(c.database);
    j.at("server").get_to(c.server);
    j.at("transfer").get_to(c.transfer);
    j.at("smart_merge").get_to(c.smart_merge);
    j.at("scan").get_to(c.scan);
    j.at("logging").get_to(c.logging);
}

void to_json(nlohmann::json& j, const SiteConfig& c) {
    j = {
        {"mode", to_string(c.mode)},
        {"content_root", c.content_root.string()},
        {"site_url", c.site_url},
        {"home_url", c.home()},
        {"table_prefix", c.table_prefix},
        {"state_dir", c.state_dir.string()}
    };
}

void from_json(const nlohmann::json& j, SiteConfig& c) {
    c.mode = siteModeFromString(j.value("mode", "none"));
    c.content_root = j.value("content_root", c.content_root.string());
    c.site_url = j.value("site_url", c.site_url);
    c.home_url = j.value("home_url", "");
    c.table_prefix = j.value("table_prefix", c.table_prefix);
    c.state_dir = j.value("state_dir", c.state_dir.string());
}

void to_json(nlohmann::json& j, const DatabaseConfig& c) {
    j = {
        {"engine", c.engine == EngineKind::Sqlite ? "sqlite" : "postgres"},
        {"host", c.host},
        {"port", c.port},
        {"name", c.name},
        {"user", c.user},
        {"password_env", c.password_env},
        {"sqlite_path", c.sqlite_path.string()}
    };
}

void from_json(const nlohmann::json& j, DatabaseConfig& c) {
    c.engine = j.value("engine", "postgres") == "sqlite" ? EngineKind::Sqlite : EngineKind::Postgres;
    c.host = j.value("host", c.host);
    c.port = j.value("port", c.port);
    c.name = j.value("name", c.name);
    c.user = j.value("user", c.user);
    c.password_env = j.value("password_env", c.password_env);
    c.sqlite_path = j.value("sqlite_path", c.sqlite_path.string());
}

void to_json(nlohmann::json& j, const ServerConfig& c) {
    j = {
        {"host", c.host},
        {"port", c.port},
        {"max_body_bytes", c.max_body_bytes},
        {"max_connected_origins", c.max_connected_origins}
    };
}

void from_json(const nlohmann::json& j, ServerConfig& c) {
    c.host = j.value("host", c.host);
    c.port = j.value("port", c.port);
    c.max_body_bytes = j.value("max_body_bytes", c.max_body_bytes);
    c.max_connected_origins = j.value("max_connected_origins", c.max_connected_origins);
}

void to_json(nlohmann::json& j, const TransferConfig& c) {
    j = {
        {"chunk_size", c.chunk_size},
        {"batch_size", c.batch_size},
        {"max_retries", c.max_retries},
        {"chunk_max_retries", c.chunk_max_retries},
        {"retry_base_ms", c.retry_base.count()},
        {"retry_cap_ms", c.retry_cap.count()},
        {"max_batch_bytes", c.max_batch_bytes},
        {"max_batch_files", c.max_batch_files},
        {"persist_every_files", c.persist_every_files},
        {"lock_timeout", c.lock_timeout.count()},
        {"snapshot_ttl", c.snapshot_ttl.count()},
        {"request_timeout", c.request_timeout.count()},
        {"file_failure_policy", to_string(c.file_failure_policy)},
        {"error_log_limit", c.error_log_limit}
    };
}

void from_json(const nlohmann::json& j, TransferConfig& c) {
    c.chunk_size = j.value("chunk_size", c.chunk_size);
    c.batch_size = j.value("batch_size", c.batch_size);
    c.max_retries = j.value("max_retries", c.max_retries);
    c.chunk_max_retries = j.value("chunk_max_retries", c.chunk_max_retries);
    c.retry_base = std::chrono::milliseconds(j.value("retry_base_ms", c.retry_base.count()));
    c.retry_cap = std::chrono::milliseconds(j.value("retry_cap_ms", c.retry_cap.count()));
    c.max_batch_bytes = j.value("max_batch_bytes", c.max_batch_bytes);
    c.max_batch_files = j.value("max_batch_files", c.max_batch_files);
    c.persist_every_files = j.value("persist_every_files", c.persist_every_files);
    c.lock_timeout = std::chrono::seconds(j.value("lock_timeout", c.lock_timeout.count()));
    c.snapshot_ttl = std::chrono::seconds(j.value("snapshot_ttl", c.snapshot_ttl.count()));
    c.request_timeout = std::chrono::seconds(j.value("request_timeout", c.request_timeout.count()));
    c.file_failure_policy = fileFailurePolicyFromString(j.value("file_failure_policy", "continue"));
    c.error_log_limit = j.value("error_log_limit", c.error_log_limit);
    c.clamp();
}

void to_json(nlohmann::json& j, const SmartMergeConfig& c) {
    j = {
        {"accounts_table", c.accounts_table},
        {"account_attributes_table", c.account_attributes_table},
        {"options_table", c.options_table},
        {"protected_tables", c.protected_tables},
        {"protected_options", c.protected_options},
        {"operator_login", c.operator_login}
    };
}

void from_json(const nlohmann::json& j, SmartMergeConfig& c) {
    c.accounts_table = j.value("accounts_table", c.accounts_table);
    c.account_attributes_table = j.value("account_attributes_table", c.account_attributes_table);
    c.options_table = j.value("options_table", c.options_table);
    c.protected_tables = j.value("protected_tables", c.protected_tables);
    c.protected_options = j.value("protected_options", c.protected_options);
    c.operator_login = j.value("operator_login", "");
}

void to_json(nlohmann::json& j, const ScanConfig& c) {
    j = {
        {"roots", c.roots},
        {"exclude_files", c.exclude_files},
        {"exclude_dirs", c.exclude_dirs},
        {"exclude_extensions", c.exclude_extensions}
    };
}

void from_json(const nlohmann::json& j, ScanConfig& c) {
    c.roots = j.value("roots", c.roots);
    c.exclude_files = j.value("exclude_files", c.exclude_files);
    c.exclude_dirs = j.value("exclude_dirs", c.exclude_dirs);
    c.exclude_extensions = j.value("exclude_extensions", c.exclude_extensions);
}

void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c) {
    j = {
        {"sitemigrate", levelName(c.sitemigrate)},
        {"db", levelName(c.db)},
        {"files", levelName(c.files)},
        {"http", levelName(c.http)},
        {"rewrite", levelName(c.rewrite)},
        {"sync", levelName(c.sync)},
        {"auth", levelName(c.auth)}
    };
}

void from_json(const nlohmann::json& j, SubsystemLogLevelsConfig& c) {
    c.sitemigrate = levelValue(j, "sitemigrate", spdlog::level::info);
    c.db = levelValue(j, "db", spdlog::level::warn);
    c.files = levelValue(j, "files", spdlog::level::info);
    c.http = levelValue(j, "http", spdlog::level::warn);
    c.rewrite = levelValue(j, "rewrite", spdlog::level::info);
    c.sync = levelValue(j, "sync", spdlog::level::info);
    c.auth = levelValue(j, "auth", spdlog::level::warn);
}

void to_json(nlohmann::json& j, const LogLevelsConfig& c) {
    j = {
        {"console_log_level", levelName(c.console_log_level)},
        {"file_log_level", levelName(c.file_log_level)},
        {"subsystem_levels", c.subsystem_levels}
    };
}

void from_json(const nlohmann::json& j, LogLevelsConfig& c) {
    c.console_log_level = levelValue(j, "console_log_level", spdlog::level::info);
    c.file_log_level = levelValue(j, "file_log_level", spdlog::level::debug);
    if (j.contains("subsystem_levels")) j.at("subsystem_levels").get_to(c.subsystem_levels);
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = {
        {"log_dir", c.log_dir.string()},
        {"levels", c.levels}
    };
}

void from_json(const nlohmann::json& j, LoggingConfig& c) {
    c.log_dir = j.value("log_dir", c.log_dir.string());
    if (j.contains("levels")) j.at("levels").get_to(c.levels);
}

} // namespace sm::config
