#include "db/SqliteEngine.hpp"
#include "util/parse.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <fmt/format.h>

using namespace sm::logging;

namespace sm::db {

namespace {

class Statement {
public:
    Statement(sqlite3* db, const char* sql, const char** tail) : db_(db) {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt_, tail) != SQLITE_OK)
            throw std::runtime_error(fmt::format("Failed to prepare statement: {}", sqlite3_errmsg(db)));
    }
    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    [[nodiscard]] sqlite3_stmt* get() const { return stmt_; }
    [[nodiscard]] bool empty() const { return stmt_ == nullptr; }

    void bind(const Params& params) {
        for (size_t i = 0; i < params.size(); ++i) {
            const auto name = fmt::format("${}", i + 1);
            const int idx = sqlite3_bind_parameter_index(stmt_, name.c_str());
            if (idx == 0) continue;

            int rc;
            const auto& v = params[i];
            if (!v) rc = sqlite3_bind_null(stmt_, idx);
            else if (util::isValidUtf8(*v))
                rc = sqlite3_bind_text(stmt_, idx, v->data(), static_cast<int>(v->size()), SQLITE_TRANSIENT);
            else
                rc = sqlite3_bind_blob(stmt_, idx, v->data(), static_cast<int>(v->size()), SQLITE_TRANSIENT);

            if (rc != SQLITE_OK)
                throw std::runtime_error(fmt::format("Failed to bind parameter {}: {}", name, sqlite3_errmsg(db_)));
        }
    }

    Row row() const {
        Row r;
        const int n = sqlite3_column_count(stmt_);
        r.fields.reserve(n);
        for (int i = 0; i < n; ++i) {
            Field f;
            f.column = sqlite3_column_name(stmt_, i);
            switch (sqlite3_column_type(stmt_, i)) {
                case SQLITE_NULL: break;
                case SQLITE_BLOB: {
                    const auto* data = static_cast<const char*>(sqlite3_column_blob(stmt_, i));
                    f.value = std::string(data ? data : "", sqlite3_column_bytes(stmt_, i));
                    break;
                }
                default: {
                    const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, i));
                    f.value = std::string(text ? text : "", sqlite3_column_bytes(stmt_, i));
                }
            }
            r.fields.push_back(std::move(f));
        }
        return r;
    }

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;
};

bool isConstraintViolation(const int rc) {
    return (rc & 0xff) == SQLITE_CONSTRAINT;
}

}

class SqliteTransaction final : public Transaction {
public:
    explicit SqliteTransaction(SqliteEngine& engine)
        : engine_(engine), lock_(engine.mutex_) {
        run("BEGIN");
    }

    ~SqliteTransaction() override {
        if (!done_) sqlite3_exec(engine_.db_, "ROLLBACK", nullptr, nullptr, nullptr);
    }

    Rows query(const std::string& sql, const Params& params) override {
        Rows rows;
        Statement stmt(engine_.db_, sql.c_str(), nullptr);
        stmt.bind(params);
        int rc;
        while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) rows.push_back(stmt.row());
        if (rc != SQLITE_DONE)
            throw std::runtime_error(fmt::format("Query failed: {}", sqlite3_errmsg(engine_.db_)));
        return rows;
    }

    uint64_t exec(const std::string& sql, const Params& params) override {
        const char* cursor = sql.c_str();
        uint64_t affected = 0;

        // Several ';'-separated statements are allowed when nothing is bound.
        while (cursor && *cursor) {
            const char* tail = nullptr;
            Statement stmt(engine_.db_, cursor, &tail);
            cursor = tail;
            if (stmt.empty()) continue;

            stmt.bind(params);
            int rc;
            while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {}
            if (rc != SQLITE_DONE)
                throw std::runtime_error(fmt::format("Statement failed: {}", sqlite3_errmsg(engine_.db_)));
            affected += static_cast<uint64_t>(sqlite3_changes(engine_.db_));
            if (!params.empty()) break;
        }
        return affected;
    }

    InsertResult insert(const std::string& table, const Row& row) override {
        Params params;
        params.reserve(row.fields.size());
        for (const auto& f : row.fields) params.push_back(f.value);

        run("SAVEPOINT sm_row");
        try {
            Statement stmt(engine_.db_, Engine::insertSql(table, row).c_str(), nullptr);
            stmt.bind(params);
            const int rc = sqlite3_step(stmt.get());
            if (rc != SQLITE_DONE) {
                const std::string err = sqlite3_errmsg(engine_.db_);
                run("ROLLBACK TO SAVEPOINT sm_row");
                run("RELEASE SAVEPOINT sm_row");
                if (isConstraintViolation(sqlite3_extended_errcode(engine_.db_)) &&
                    err.find("UNIQUE") != std::string::npos)
                    return {InsertOutcome::Duplicate, err};
                return {InsertOutcome::Failed, err};
            }
            const bool inserted = sqlite3_changes(engine_.db_) > 0;
            run("RELEASE SAVEPOINT sm_row");
            return {inserted ? InsertOutcome::Inserted : InsertOutcome::Duplicate, {}};
        } catch (const std::runtime_error& e) {
            run("ROLLBACK TO SAVEPOINT sm_row");
            run("RELEASE SAVEPOINT sm_row");
            return {InsertOutcome::Failed, e.what()};
        }
    }

    void commit() override {
        run("COMMIT");
        done_ = true;
    }

private:
    void run(const char* sql) const {
        char* err = nullptr;
        if (sqlite3_exec(engine_.db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
            const std::string msg = err ? err : "unknown error";
            sqlite3_free(err);
            throw std::runtime_error(fmt::format("{} failed: {}", sql, msg));
        }
    }

    SqliteEngine& engine_;
    std::unique_lock<std::mutex> lock_;
    bool done_ = false;
};

SqliteEngine::SqliteEngine(const std::filesystem::path& path) {
    if (sqlite3_open(path.c_str(), &db_) != SQLITE_OK) {
        const std::string err = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error(fmt::format("Failed to open SQLite database {}: {}", path.string(), err));
    }
    sqlite3_busy_timeout(db_, 5000);
    LogRegistry::db()->debug("[SqliteEngine] Opened {}", path.string());
}

SqliteEngine::~SqliteEngine() {
    if (db_) sqlite3_close(db_);
}

std::unique_ptr<Transaction> SqliteEngine::begin() {
    return std::make_unique<SqliteTransaction>(*this);
}

std::vector<std::string> SqliteEngine::listTables(const std::string& prefix) {
    std::vector<std::string> tables;
    for (const auto& row : query("SELECT name FROM sqlite_master WHERE type = 'table' "
                                 "AND name NOT LIKE 'sqlite\\_%' ESCAPE '\\' ORDER BY name")) {
        auto name = row.str("name");
        if (name.starts_with(prefix)) tables.push_back(std::move(name));
    }
    return tables;
}

bool SqliteEngine::tableExists(const std::string& table) {
    return !query("SELECT 1 AS present FROM sqlite_master WHERE type = 'table' AND name = $1", {table}).empty();
}

std::vector<Column> SqliteEngine::columns(const std::string& table) {
    std::vector<Column> cols;
    for (const auto& row : query(fmt::format("PRAGMA table_info({})", quote(table)))) {
        Column c;
        c.name = row.str("name");
        c.type = row.str("type");
        std::ranges::transform(c.type, c.type.begin(), [](const unsigned char ch) { return std::tolower(ch); });
        c.primaryKeyOrdinal = static_cast<unsigned int>(std::stoul(row.str("pk").empty() ? "0" : row.str("pk")));
        cols.push_back(std::move(c));
    }

    // INTEGER PRIMARY KEY aliases the rowid and is assigned automatically.
    const auto pkCount = std::ranges::count_if(cols, [](const Column& c) { return c.isPrimaryKey(); });
    for (auto& c : cols)
        if (pkCount == 1 && c.isPrimaryKey() && c.type == "integer") c.autoIncrement = true;

    return cols;
}

std::string SqliteEngine::createStatement(const std::string& table) {
    const auto rows = query("SELECT sql FROM sqlite_master WHERE type = 'table' AND name = $1", {table});
    if (rows.empty() || !rows.front().at("sql"))
        throw std::runtime_error(fmt::format("No schema recorded for table {}", table));

    auto ddl = *rows.front().at("sql");
    for (const auto& idx : query("SELECT sql FROM sqlite_master WHERE type = 'index' AND tbl_name = $1 "
                                 "AND sql IS NOT NULL ORDER BY name", {table}))
        ddl += ";\n" + idx.str("sql");
    return ddl;
}

}
