#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace sm::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

static spdlog::level::level_enum levelOr(const Node& node, const spdlog::level::level_enum def) {
    return node ? spdlog::level::from_str(node.as<std::string>()) : def;
}

template<typename T>
static std::vector<T> listOr(const Node& node, const std::vector<T>& def) {
    return node && node.IsSequence() ? node.as<std::vector<T>>() : def;
}

template<>
struct convert<SiteConfig> {
    static Node encode(const SiteConfig& rhs) {
        Node node;
        node["mode"] = sm::config::to_string(rhs.mode);
        node["content_root"] = rhs.content_root.string();
        node["site_url"] = rhs.site_url;
        node["home_url"] = rhs.home_url;
        node["table_prefix"] = rhs.table_prefix;
        node["state_dir"] = rhs.state_dir.string();
        return node;
    }

    static bool decode(const Node& node, SiteConfig& rhs) {
        if (!node.IsMap()) return false;
        const SiteConfig def;
        rhs.mode = siteModeFromString(node["mode"].as<std::string>("none"));
        rhs.content_root = node["content_root"].as<std::string>(def.content_root.string());
        rhs.site_url = node["site_url"].as<std::string>(def.site_url);
        rhs.home_url = node["home_url"].as<std::string>("");
        rhs.table_prefix = node["table_prefix"].as<std::string>(def.table_prefix);
        rhs.state_dir = node["state_dir"].as<std::string>(def.state_dir.string());
        return true;
    }
};

template<>
struct convert<DatabaseConfig> {
    static Node encode(const DatabaseConfig& rhs) {
        Node node;
        node["engine"] = rhs.engine == EngineKind::Sqlite ? "sqlite" : "postgres";
        node["host"] = rhs.host;
        node["port"] = rhs.port;
        node["name"] = rhs.name;
        node["user"] = rhs.user;
        node["password_env"] = rhs.password_env;
        node["sqlite_path"] = rhs.sqlite_path.string();
        return node;
    }

    static bool decode(const Node& node, DatabaseConfig& rhs) {
        if (!node.IsMap()) return false;
        const DatabaseConfig def;
        const auto engine = node["engine"].as<std::string>("postgres");
        if (engine != "postgres" && engine != "sqlite") return false;
        rhs.engine = engine == "sqlite" ? EngineKind::Sqlite : EngineKind::Postgres;
        rhs.host = node["host"].as<std::string>(def.host);
        rhs.port = node["port"].as<uint16_t>(def.port);
        rhs.name = node["name"].as<std::string>(def.name);
        rhs.user = node["user"].as<std::string>(def.user);
        rhs.password_env = node["password_env"].as<std::string>(def.password_env);
        rhs.sqlite_path = node["sqlite_path"].as<std::string>(def.sqlite_path.string());
        return true;
    }
};

template<>
struct convert<ServerConfig> {
    static Node encode(const ServerConfig& rhs) {
        Node node;
        node["host"] = rhs.host;
        node["port"] = rhs.port;
        node["max_body_mb"] = rhs.max_body_bytes / MiB;
        node["max_connected_origins"] = rhs.max_connected_origins;
        return node;
    }

    static bool decode(const Node& node, ServerConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.host = node["host"].as<std::string>("0.0.0.0");
        rhs.port = node["port"].as<uint16_t>(33380);
        rhs.max_body_bytes = node["max_body_mb"].as<uintmax_t>(16) * MiB;
        rhs.max_connected_origins = node["max_connected_origins"].as<unsigned int>(10);
        return true;
    }
};

template<>
struct convert<TransferConfig> {
    static Node encode(const TransferConfig& rhs) {
        Node node;
        node["chunk_size"] = rhs.chunk_size;
        node["batch_size"] = rhs.batch_size;
        node["max_retries"] = rhs.max_retries;
        node["chunk_max_retries"] = rhs.chunk_max_retries;
        node["retry_base_ms"] = rhs.retry_base.count();
        node["retry_cap_ms"] = rhs.retry_cap.count();
        node["max_batch_bytes"] = rhs.max_batch_bytes;
        node["max_batch_files"] = rhs.max_batch_files;
        node["persist_every_files"] = rhs.persist_every_files;
        node["lock_timeout"] = rhs.lock_timeout.count();
        node["snapshot_ttl"] = rhs.snapshot_ttl.count();
        node["request_timeout"] = rhs.request_timeout.count();
        node["file_failure_policy"] = sm::config::to_string(rhs.file_failure_policy);
        node["error_log_limit"] = rhs.error_log_limit;
        return node;
    }

    static bool decode(const Node& node, TransferConfig& rhs) {
        if (!node.IsMap()) return false;
        const TransferConfig def;
        rhs.chunk_size = node["chunk_size"].as<uintmax_t>(def.chunk_size);
        rhs.batch_size = node["batch_size"].as<unsigned int>(def.batch_size);
        rhs.max_retries = node["max_retries"].as<unsigned int>(def.max_retries);
        rhs.chunk_max_retries = node["chunk_max_retries"].as<unsigned int>(def.chunk_max_retries);
        rhs.retry_base = std::chrono::milliseconds(node["retry_base_ms"].as<long>(def.retry_base.count()));
        rhs.retry_cap = std::chrono::milliseconds(node["retry_cap_ms"].as<long>(def.retry_cap.count()));
        rhs.max_batch_bytes = node["max_batch_bytes"].as<uintmax_t>(def.max_batch_bytes);
        rhs.max_batch_files = node["max_batch_files"].as<unsigned int>(def.max_batch_files);
        rhs.persist_every_files = node["persist_every_files"].as<unsigned int>(def.persist_every_files);
        rhs.lock_timeout = std::chrono::seconds(node["lock_timeout"].as<long>(def.lock_timeout.count()));
        rhs.snapshot_ttl = std::chrono::seconds(node["snapshot_ttl"].as<long>(def.snapshot_ttl.count()));
        rhs.request_timeout = std::chrono::seconds(node["request_timeout"].as<long>(def.request_timeout.count()));
        rhs.file_failure_policy = fileFailurePolicyFromString(node["file_failure_policy"].as<std::string>("continue"));
        rhs.error_log_limit = node["error_log_limit"].as<unsigned int>(def.error_log_limit);
        rhs.clamp();
        return true;
    }
};

template<>
struct convert<SmartMergeConfig> {
    static Node encode(const SmartMergeConfig& rhs) {
        Node node;
        node["accounts_table"] = rhs.accounts_table;
        node["account_attributes_table"] = rhs.account_attributes_table;
        node["options_table"] = rhs.options_table;
        node["protected_tables"] = rhs.protected_tables;
        node["protected_options"] = rhs.protected_options;
        node["operator_login"] = rhs.operator_login;
        return node;
    }

    static bool decode(const Node& node, SmartMergeConfig& rhs) {
        if (!node.IsMap()) return false;
        const SmartMergeConfig def;
        rhs.accounts_table = node["accounts_table"].as<std::string>(def.accounts_table);
        rhs.account_attributes_table = node["account_attributes_table"].as<std::string>(def.account_attributes_table);
        rhs.options_table = node["options_table"].as<std::string>(def.options_table);
        rhs.protected_tables = listOr(node["protected_tables"], def.protected_tables);
        rhs.protected_options = listOr(node["protected_options"], def.protected_options);
        rhs.operator_login = node["operator_login"].as<std::string>("");
        return true;
    }
};

template<>
struct convert<ScanConfig> {
    static Node encode(const ScanConfig& rhs) {
        Node node;
        node["roots"] = rhs.roots;
        node["exclude_files"] = rhs.exclude_files;
        node["exclude_dirs"] = rhs.exclude_dirs;
        node["exclude_extensions"] = rhs.exclude_extensions;
        return node;
    }

    static bool decode(const Node& node, ScanConfig& rhs) {
        if (!node.IsMap()) return false;
        const ScanConfig def;
        rhs.roots = listOr(node["roots"], def.roots);
        rhs.exclude_files = listOr(node["exclude_files"], def.exclude_files);
        rhs.exclude_dirs = listOr(node["exclude_dirs"], def.exclude_dirs);
        rhs.exclude_extensions = listOr(node["exclude_extensions"], def.exclude_extensions);
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["sitemigrate"] = to_std_string(spdlog::level::to_string_view(rhs.sitemigrate));
        node["db"]          = to_std_string(spdlog::level::to_string_view(rhs.db));
        node["files"]       = to_std_string(spdlog::level::to_string_view(rhs.files));
        node["http"]        = to_std_string(spdlog::level::to_string_view(rhs.http));
        node["rewrite"]     = to_std_string(spdlog::level::to_string_view(rhs.rewrite));
        node["sync"]        = to_std_string(spdlog::level::to_string_view(rhs.sync));
        node["auth"]        = to_std_string(spdlog::level::to_string_view(rhs.auth));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        const SubsystemLogLevelsConfig def;
        rhs.sitemigrate = levelOr(node["sitemigrate"], def.sitemigrate);
        rhs.db = levelOr(node["db"], def.db);
        rhs.files = levelOr(node["files"], def.files);
        rhs.http = levelOr(node["http"], def.http);
        rhs.rewrite = levelOr(node["rewrite"], def.rewrite);
        rhs.sync = levelOr(node["sync"], def.sync);
        rhs.auth = levelOr(node["auth"], def.auth);
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"] = convert<SubsystemLogLevelsConfig>::encode(rhs.subsystem_levels);
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = levelOr(node["console_log_level"], spdlog::level::info);
        rhs.file_log_level = levelOr(node["file_log_level"], spdlog::level::debug);
        if (node["subsystem_levels"])
            return convert<SubsystemLogLevelsConfig>::decode(node["subsystem_levels"], rhs.subsystem_levels);
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["levels"] = convert<LogLevelsConfig>::encode(rhs.levels);
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("/var/log/sitemigrate");
        if (node["levels"]) return convert<LogLevelsConfig>::decode(node["levels"], rhs.levels);
        return true;
    }
};

}
