#include "db/PgEngine.hpp"

#include <algorithm>
#include <cstdlib>
#include <stdexcept>
#include <fmt/format.h>

using namespace sm::logging;

namespace sm::db {

namespace {

pqxx::params toParams(const Params& params) {
    pqxx::params p;
    for (const auto& v : params) {
        if (v) p.append(*v);
        else p.append();
    }
    return p;
}

Rows toRows(const pqxx::result& res) {
    Rows rows;
    rows.reserve(res.size());
    for (const auto& r : res) {
        Row row;
        row.fields.reserve(r.size());
        for (const auto& f : r) {
            Field field;
            field.column = f.name();
            if (!f.is_null()) field.value = std::string(f.c_str(), f.size());
            row.fields.push_back(std::move(field));
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

std::string likePrefix(const std::string& prefix) {
    std::string out;
    for (const char c : prefix) {
        if (c == '_' || c == '%' || c == '\\') out.push_back('\\');
        out.push_back(c);
    }
    return out + "%";
}

constexpr auto COLUMNS_SQL = R"SQL(
SELECT c.column_name, c.data_type, c.udt_name, c.is_nullable, c.column_default,
       c.character_maximum_length, c.is_identity,
       (SELECT k.ordinal_position
          FROM information_schema.table_constraints t
          JOIN information_schema.key_column_usage k
            ON k.constraint_name = t.constraint_name
           AND k.table_schema = t.table_schema
           AND k.table_name = t.table_name
         WHERE t.constraint_type = 'PRIMARY KEY'
           AND t.table_schema = c.table_schema
           AND t.table_name = c.table_name
           AND k.column_name = c.column_name) AS pk_ordinal
  FROM information_schema.columns c
 WHERE c.table_schema = current_schema() AND c.table_name = $1
 ORDER BY c.ordinal_position
)SQL";

constexpr auto UNIQUE_SQL = R"SQL(
SELECT t.constraint_name, k.column_name
  FROM information_schema.table_constraints t
  JOIN information_schema.key_column_usage k
    ON k.constraint_name = t.constraint_name
   AND k.table_schema = t.table_schema
   AND k.table_name = t.table_name
 WHERE t.constraint_type = 'UNIQUE'
   AND t.table_schema = current_schema() AND t.table_name = $1
 ORDER BY t.constraint_name, k.ordinal_position
)SQL";

}

class PgTransaction final : public Transaction {
public:
    explicit PgTransaction(PgEngine& engine) : lock_(engine.mutex_), txn_(engine.conn_) {}

    Rows query(const std::string& sql, const Params& params) override {
        return toRows(txn_.exec(sql, toParams(params)));
    }

    uint64_t exec(const std::string& sql, const Params& params) override {
        if (params.empty()) return static_cast<uint64_t>(txn_.exec(sql).affected_rows());
        return static_cast<uint64_t>(txn_.exec(sql, toParams(params)).affected_rows());
    }

    InsertResult insert(const std::string& table, const Row& row) override {
        Params params;
        params.reserve(row.fields.size());
        for (const auto& f : row.fields) params.push_back(f.value);

        try {
            pqxx::subtransaction sub(txn_, "sm_row");
            const auto res = sub.exec(Engine::insertSql(table, row), toParams(params));
            sub.commit();
            return {res.affected_rows() > 0 ? InsertOutcome::Inserted : InsertOutcome::Duplicate, {}};
        } catch (const pqxx::unique_violation& e) {
            return {InsertOutcome::Duplicate, e.what()};
        } catch (const pqxx::sql_error& e) {
            return {InsertOutcome::Failed, e.what()};
        } catch (const pqxx::conversion_error& e) {
            return {InsertOutcome::Failed, e.what()};
        }
    }

    void commit() override { txn_.commit(); }

private:
    std::unique_lock<std::mutex> lock_;
    pqxx::work txn_;
};

std::string PgEngine::connectionString(const config::DatabaseConfig& cfg) {
    const char* password = cfg.password_env.empty() ? nullptr : std::getenv(cfg.password_env.c_str());
    auto conn = fmt::format("host={} port={} dbname={} user={}", cfg.host, cfg.port, cfg.name, cfg.user);
    if (password && *password) conn += fmt::format(" password={}", password);
    return conn;
}

PgEngine::PgEngine(const config::DatabaseConfig& cfg) : conn_(connectionString(cfg)) {
    if (!conn_.is_open()) throw std::runtime_error("Failed to open PostgreSQL connection");
    LogRegistry::db()->debug("[PgEngine] Connected to {}@{}:{}/{}", cfg.user, cfg.host, cfg.port, cfg.name);
}

std::unique_ptr<Transaction> PgEngine::begin() {
    return std::make_unique<PgTransaction>(*this);
}

std::vector<std::string> PgEngine::listTables(const std::string& prefix) {
    std::vector<std::string> tables;
    const auto rows = query("SELECT table_name FROM information_schema.tables "
                            "WHERE table_schema = current_schema() AND table_type = 'BASE TABLE' "
                            "AND table_name LIKE $1 ESCAPE '\\' ORDER BY table_name", {likePrefix(prefix)});
    for (const auto& row : rows) {
        auto name = row.str("table_name");
        if (name.starts_with(prefix)) tables.push_back(std::move(name));
    }
    return tables;
}

bool PgEngine::tableExists(const std::string& table) {
    return !query("SELECT 1 AS present FROM information_schema.tables "
                  "WHERE table_schema = current_schema() AND table_name = $1", {table}).empty();
}

std::vector<Column> PgEngine::columns(const std::string& table) {
    std::vector<Column> cols;
    for (const auto& row : query(COLUMNS_SQL, {table})) {
        Column c;
        c.name = row.str("column_name");
        c.type = row.str("data_type");
        const auto pk = row.str("pk_ordinal");
        c.primaryKeyOrdinal = pk.empty() ? 0 : static_cast<unsigned int>(std::stoul(pk));
        c.autoIncrement = row.str("is_identity") == "YES" || row.str("column_default").starts_with("nextval(");
        cols.push_back(std::move(c));
    }
    return cols;
}

std::string PgEngine::setvalSql(const std::string& table, const std::string& column) {
    const auto col = quote(column);
    return fmt::format("SELECT setval(pg_get_serial_sequence($1, $2), COALESCE(MAX({0}), 1), MAX({0}) IS NOT NULL) "
                       "FROM {1}", col, quote(table));
}

void PgEngine::syncSequences(const std::string& table) {
    for (const auto& c : columns(table)) {
        if (!c.autoIncrement) continue;
        query(setvalSql(table, c.name), {quote(table), c.name});
        LogRegistry::db()->debug("[PgEngine::syncSequences] Advanced sequence of {}.{}", table, c.name);
    }
}

// PostgreSQL has no SHOW CREATE TABLE; rebuild one from the catalog. Sequence-backed
// defaults become serial types so the statement does not depend on a named sequence.
std::string PgEngine::createStatement(const std::string& table) {
    const auto cols = query(COLUMNS_SQL, {table});
    if (cols.empty()) throw std::runtime_error(fmt::format("No schema recorded for table {}", table));

    std::vector<std::string> defs;
    std::vector<std::pair<unsigned int, std::string>> pk;

    for (const auto& row : cols) {
        const auto colName = row.str("column_name");
        const auto dataType = row.str("data_type");
        const auto def = row.str("column_default");
        const auto maxLen = row.str("character_maximum_length");
        const bool serial = def.starts_with("nextval(");

        std::string type;
        if (serial && dataType == "bigint") type = "bigserial";
        else if (serial && dataType == "smallint") type = "smallserial";
        else if (serial) type = "serial";
        else if (dataType == "character varying") type = maxLen.empty() ? "varchar" : fmt::format("varchar({})", maxLen);
        else if (dataType == "character") type = maxLen.empty() ? "char" : fmt::format("char({})", maxLen);
        else if (dataType == "USER-DEFINED" || dataType == "ARRAY") type = row.str("udt_name");
        else type = dataType;

        auto line = fmt::format("  {} {}", quote(colName), type);
        if (row.str("is_identity") == "YES") line += " GENERATED BY DEFAULT AS IDENTITY";
        if (row.str("is_nullable") == "NO" && !serial) line += " NOT NULL";
        if (!def.empty() && !serial) line += " DEFAULT " + def;
        defs.push_back(std::move(line));

        if (const auto ord = row.str("pk_ordinal"); !ord.empty())
            pk.emplace_back(static_cast<unsigned int>(std::stoul(ord)), colName);
    }

    if (!pk.empty()) {
        std::ranges::sort(pk);
        std::string keyCols;
        for (const auto& [_, c] : pk) keyCols += (keyCols.empty() ? "" : ", ") + quote(c);
        defs.push_back(fmt::format("  PRIMARY KEY ({})", keyCols));
    }

    std::string current, uniqueCols;
    const auto flushUnique = [&] {
        if (!uniqueCols.empty()) defs.push_back(fmt::format("  UNIQUE ({})", uniqueCols));
        uniqueCols.clear();
    };
    for (const auto& row : query(UNIQUE_SQL, {table})) {
        if (row.str("constraint_name") != current) {
            flushUnique();
            current = row.str("constraint_name");
        }
        uniqueCols += (uniqueCols.empty() ? "" : ", ") + quote(row.str("column_name"));
    }
    flushUnique();

    std::string body;
    for (size_t i = 0; i < defs.size(); ++i) body += defs[i] + (i + 1 < defs.size() ? ",\n" : "\n");
    return fmt::format("CREATE TABLE {} (\n{})", quote(table), body);
}

}
