#include "db/Engine.hpp"
#include "db/PgEngine.hpp"
#include "db/SqliteEngine.hpp"
#include "config/Config.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <fmt/format.h>

namespace sm::db {

bool Row::has(const std::string_view column) const noexcept {
    return std::ranges::any_of(fields, [&](const Field& f) { return f.column == column; });
}

const std::optional<std::string>& Row::at(const std::string_view column) const {
    for (const auto& f : fields)
        if (f.column == column) return f.value;
    throw std::out_of_range(fmt::format("Column '{}' not present in row", column));
}

std::string Row::str(const std::string_view column) const {
    for (const auto& f : fields)
        if (f.column == column) return f.value.value_or("");
    return "";
}

bool isTextType(const std::string_view type) {
    std::string base;
    for (const char c : type) {
        if (c == '(') break;
        base.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    while (!base.empty() && base.back() == ' ') base.pop_back();

    static constexpr std::string_view textTypes[] = {
        "char", "varchar", "text", "tinytext", "mediumtext", "longtext",
        "character", "character varying", "nchar", "nvarchar", "clob", "bpchar"
    };
    return std::ranges::find(textTypes, std::string_view(base)) != std::end(textTypes);
}

uint64_t Engine::countRows(const std::string& table) {
    const auto rows = query(fmt::format("SELECT COUNT(*) AS n FROM {}", quote(table)));
    if (rows.empty()) return 0;
    return std::stoull(rows.front().str("n"));
}

Rows Engine::query(const std::string& sql, const Params& params) {
    return transact(sql, [&](Transaction& txn) { return txn.query(sql, params); });
}

uint64_t Engine::exec(const std::string& sql, const Params& params) {
    return transact(sql, [&](Transaction& txn) { return txn.exec(sql, params); });
}

std::string Engine::quote(const std::string_view identifier) {
    std::string out = "\"";
    for (const char c : identifier) {
        if (c == '"') out += "\"\"";
        else out.push_back(c);
    }
    out.push_back('"');
    return out;
}

std::string Engine::insertSql(const std::string& table, const Row& row) {
    std::string cols, placeholders;
    for (size_t i = 0; i < row.fields.size(); ++i) {
        if (i) {
            cols += ", ";
            placeholders += ", ";
        }
        cols += quote(row.fields[i].column);
        placeholders += fmt::format("${}", i + 1);
    }
    return fmt::format("INSERT INTO {} ({}) VALUES ({}) ON CONFLICT DO NOTHING", quote(table), cols, placeholders);
}


std::unique_ptr<Engine> openEngine(const config::DatabaseConfig& cfg) {
    switch (cfg.engine) {
        case config::EngineKind::Postgres:
            return std::make_unique<PgEngine>(cfg);
        case config::EngineKind::Sqlite:
            logging::LogRegistry::db()->debug("[openEngine] Opening SQLite database {}", cfg.sqlite_path.string());
            return std::make_unique<SqliteEngine>(cfg.sqlite_path);
    }
    throw std::invalid_argument("Unknown database engine");
}

}
