#include "sync/SearchReplace.hpp"
#include "db/KeysetPager.hpp"
#include "logging/LogRegistry.hpp"

#include <fmt/format.h>
#include <nlohmann/json.hpp>

using namespace sm::logging;
using sm::db::Engine;

namespace sm::sync {

void to_json(nlohmann::json& j, const ReplaceStats& s) {
    j = {
        {"tables_processed", s.tablesProcessed},
        {"rows_processed", s.rowsProcessed},
        {"rows_changed", s.rowsChanged},
        {"errors", s.errors}
    };
}

ReplaceStats SearchReplace::run(const serialize::Rewriter& rewriter) {
    ReplaceStats stats;
    for (const auto* base : TABLES) {
        const auto table = prefix_ + base;
        if (!engine_.tableExists(table)) {
            LogRegistry::rewrite()->debug("[SearchReplace::run] Skipping missing table {}", table);
            continue;
        }

        try {
            processTable(table, rewriter, stats);
            ++stats.tablesProcessed;
        } catch (const std::exception& e) {
            LogRegistry::rewrite()->error("[SearchReplace::run] {} failed: {}", table, e.what());
            stats.errors.push_back(fmt::format("{}: {}", table, e.what()));
        }
    }

    LogRegistry::rewrite()->info("[SearchReplace::run] {} tables, {} rows scanned, {} rows changed, {} errors",
                                 stats.tablesProcessed, stats.rowsProcessed, stats.rowsChanged, stats.errors.size());
    return stats;
}

void SearchReplace::processTable(const std::string& table, const serialize::Rewriter& rewriter, ReplaceStats& stats) {
    const auto columns = engine_.columns(table);
    const auto key = db::KeysetPager::detectPrimaryKey(columns);
    if (!key) {
        stats.errors.push_back(table + ": no usable key, skipped");
        return;
    }

    std::vector<std::string> textColumns;
    for (const auto& c : columns)
        if (c.name != *key && db::isTextType(c.type)) textColumns.push_back(c.name);
    if (textColumns.empty()) return;

    const db::KeysetPager pager(engine_);
    types::RowCursor cursor;

    while (true) {
        const auto page = pager.fetch(table, cursor, batchSize_);

        for (const auto& row : page.rows) {
            ++stats.rowsProcessed;

            std::vector<std::pair<std::string, std::string>> changed;
            for (const auto& col : textColumns) {
                if (!row.has(col)) continue;
                const auto& value = row.at(col);
                if (!value || !rewriter.mayMatch(*value)) continue;
                if (auto rewritten = rewriter.rewrite(*value); rewritten != *value)
                    changed.emplace_back(col, std::move(rewritten));
            }
            if (changed.empty()) continue;

            std::string assignments;
            db::Params params;
            for (size_t i = 0; i < changed.size(); ++i) {
                if (i) assignments += ", ";
                assignments += fmt::format("{} = ${}", Engine::quote(changed[i].first), i + 1);
                params.emplace_back(std::move(changed[i].second));
            }
            params.emplace_back(row.at(*key));

            try {
                engine_.exec(fmt::format("UPDATE {} SET {} WHERE {} = ${}", Engine::quote(table), assignments,
                                         Engine::quote(*key), params.size()),
                             params);
                ++stats.rowsChanged;
            } catch (const std::exception& e) {
                const auto msg = fmt::format("{} {}={}: {}", table, *key, row.str(*key), e.what());
                LogRegistry::rewrite()->warn("[SearchReplace::processTable] Update failed: {}", msg);
                stats.errors.push_back(msg);
            }
        }

        if (!page.hasMore) break;
        cursor = page.nextCursor;
    }
}

void SearchReplace::updateSiteOptions(const std::string& url) {
    const auto table = prefix_ + "options";
    if (!engine_.tableExists(table)) return;

    for (const auto* name : {"siteurl", "home"})
        engine_.exec(fmt::format("UPDATE {} SET {} = $1 WHERE {} = $2", Engine::quote(table),
                                 Engine::quote("option_value"), Engine::quote("option_name")),
                     {url, std::string(name)});
    LogRegistry::rewrite()->info("[SearchReplace::updateSiteOptions] siteurl and home set to {}", url);
}

}
