#pragma once

#include "logging/LogRegistry.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace sm::config { struct DatabaseConfig; }

namespace sm::db {

// Bound to $1..$N in statement order. nullopt binds SQL NULL.
using Params = std::vector<std::optional<std::string>>;

struct Field {
    std::string column;
    std::optional<std::string> value;
};

struct Row {
    std::vector<Field> fields;

    [[nodiscard]] bool has(std::string_view column) const noexcept;

    // Throws std::out_of_range when the column is absent.
    [[nodiscard]] const std::optional<std::string>& at(std::string_view column) const;

    // NULL and absent read as empty.
    [[nodiscard]] std::string str(std::string_view column) const;
};

using Rows = std::vector<Row>;

struct Column {
    std::string name;
    std::string type;               // as declared, lower-cased
    unsigned int primaryKeyOrdinal{0};  // 1-based position in the primary key, 0 when not part of it
    bool autoIncrement{false};

    [[nodiscard]] bool isPrimaryKey() const noexcept { return primaryKeyOrdinal > 0; }
};

// char/varchar/text family, including engine spellings such as "character varying".
bool isTextType(std::string_view type);

enum class InsertOutcome { Inserted, Duplicate, Failed };

struct InsertResult {
    InsertOutcome outcome{InsertOutcome::Inserted};
    std::string error;
};

class Transaction {
public:
    virtual ~Transaction() = default;

    virtual Rows query(const std::string& sql, const Params& params = {}) = 0;

    // Returns affected rows.
    virtual uint64_t exec(const std::string& sql, const Params& params = {}) = 0;

    // One row under its own savepoint: a failing row never aborts the surrounding
    // transaction. Rows hitting a unique constraint are reported as duplicates.
    virtual InsertResult insert(const std::string& table, const Row& row) = 0;

    virtual void commit() = 0;
};

class Engine {
public:
    virtual ~Engine() = default;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    // Transactions are not re-entrant: do not call Engine methods while holding one.
    virtual std::unique_ptr<Transaction> begin() = 0;

    virtual std::vector<std::string> listTables(const std::string& prefix) = 0;
    virtual bool tableExists(const std::string& table) = 0;
    virtual std::vector<Column> columns(const std::string& table) = 0;

    // The DDL that recreates the table, naming it as the source names it.
    virtual std::string createStatement(const std::string& table) = 0;

    uint64_t countRows(const std::string& table);

    // Moves generated-key sequences past the highest key stored, after rows were
    // written with explicit keys. Engines whose keys advance on insert do nothing.
    virtual void syncSequences(const std::string& table) { (void)table; }

    template <typename Func>
    auto transact(const std::string& ctx, Func&& func) -> decltype(func(std::declval<Transaction&>())) {
        logging::LogRegistry::db()->trace("[Engine::transact] Starting transaction: {}", ctx);
        const auto txn = begin();

        try {
            if constexpr (std::is_void_v<decltype(func(*txn))>) {
                func(*txn);
                txn->commit();
                logging::LogRegistry::db()->trace("[Engine::transact] Transaction committed: {}", ctx);
            } else {
                auto result = func(*txn);
                txn->commit();
                logging::LogRegistry::db()->trace("[Engine::transact] Transaction committed: {}", ctx);
                return result;
            }
        } catch (const std::exception& e) {
            logging::LogRegistry::db()->error("[Engine::transact] Exception in transaction context '{}', rolling back: {}",
                                              ctx, e.what());
            throw;
        }
    }

    Rows query(const std::string& sql, const Params& params = {});
    uint64_t exec(const std::string& sql, const Params& params = {});

    // Double-quoted identifier, understood by both PostgreSQL and SQLite.
    static std::string quote(std::string_view identifier);

    static std::string insertSql(const std::string& table, const Row& row);
};


// PostgreSQL or SQLite, as the config names.
std::unique_ptr<Engine> openEngine(const config::DatabaseConfig& cfg);

}
