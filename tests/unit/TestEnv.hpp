#pragma once

#include "config/Config.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <unistd.h>

namespace sm::test {

namespace fs = std::filesystem;

// Scratch directory removed on destruction.
class TempDir {
public:
    TempDir() {
        static std::atomic<unsigned> counter{0};
        std::random_device rd;
        path_ = fs::temp_directory_path() /
                ("sm-test-" + std::to_string(::getpid()) + "-" + std::to_string(rd()) + "-" + std::to_string(counter++));
        fs::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const fs::path& path() const { return path_; }
    fs::path operator/(const fs::path& rel) const { return path_ / rel; }

private:
    fs::path path_;
};

inline void writeFile(const fs::path& p, const std::string& content) {
    fs::create_directories(p.parent_path());
    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    out << content;
}

inline std::string readFile(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

// Small limits, sqlite in memory, no real sleeping between retries.
inline config::Config testConfig(const fs::path& root) {
    config::Config cfg;
    cfg.site.mode = config::SiteMode::Destination;
    cfg.site.content_root = root / "content";
    cfg.site.site_url = "https://new.test";
    cfg.site.table_prefix = "wp_";
    cfg.site.state_dir = root / "state";

    cfg.database.engine = config::EngineKind::Sqlite;
    cfg.database.sqlite_path = ":memory:";

    cfg.transfer.chunk_size = 64;
    cfg.transfer.batch_size = 2;
    cfg.transfer.max_retries = 2;
    cfg.transfer.chunk_max_retries = 2;
    cfg.transfer.retry_base = std::chrono::milliseconds(0);
    cfg.transfer.retry_cap = std::chrono::milliseconds(0);
    cfg.transfer.max_batch_bytes = 1024;
    cfg.transfer.max_batch_files = 4;
    cfg.transfer.persist_every_files = 1;
    cfg.transfer.lock_timeout = std::chrono::seconds(60);

    cfg.logging.log_dir = root / "log";
    return cfg;
}

}
