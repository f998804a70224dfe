#pragma once

#include "db/Engine.hpp"

#include <filesystem>
#include <mutex>

struct sqlite3;

namespace sm::db {

// Single-file or in-memory (":memory:") SQLite database.
class SqliteEngine final : public Engine {
public:
    explicit SqliteEngine(const std::filesystem::path& path);
    ~SqliteEngine() override;

    SqliteEngine(const SqliteEngine&) = delete;
    SqliteEngine& operator=(const SqliteEngine&) = delete;

    [[nodiscard]] std::string_view name() const noexcept override { return "sqlite"; }

    std::unique_ptr<Transaction> begin() override;

    std::vector<std::string> listTables(const std::string& prefix) override;
    bool tableExists(const std::string& table) override;
    std::vector<Column> columns(const std::string& table) override;
    std::string createStatement(const std::string& table) override;

private:
    friend class SqliteTransaction;

    sqlite3* db_ = nullptr;
    std::mutex mutex_;
};

}
