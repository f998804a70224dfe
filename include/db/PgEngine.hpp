#pragma once

#include "db/Engine.hpp"
#include "config/Config.hpp"

#include <mutex>
#include <pqxx/pqxx>

namespace sm::db {

class PgEngine final : public Engine {
public:
    explicit PgEngine(const config::DatabaseConfig& cfg);

    [[nodiscard]] std::string_view name() const noexcept override { return "postgres"; }

    std::unique_ptr<Transaction> begin() override;

    std::vector<std::string> listTables(const std::string& prefix) override;
    bool tableExists(const std::string& table) override;
    std::vector<Column> columns(const std::string& table) override;
    std::string createStatement(const std::string& table) override;
    void syncSequences(const std::string& table) override;

    // $1 is the quoted table name, $2 the column name as stored.
    static std::string setvalSql(const std::string& table, const std::string& column);

    static std::string connectionString(const config::DatabaseConfig& cfg);

private:
    friend class PgTransaction;

    pqxx::connection conn_;
    std::mutex mutex_;
};

}
