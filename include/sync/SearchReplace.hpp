#pragma once

#include "db/Engine.hpp"
#include "serialize/Rewriter.hpp"

#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace sm::sync {

struct ReplaceStats {
    unsigned int tablesProcessed{0};
    uint64_t rowsProcessed{0};
    uint64_t rowsChanged{0};
    std::vector<std::string> errors;
};

void to_json(nlohmann::json& j, const ReplaceStats& s);

// Rewrites URLs in the text columns of the content tables, leaving serialized
// values well formed.
class SearchReplace {
public:
    static constexpr const char* TABLES[] = {
        "options", "postmeta", "commentmeta", "termmeta", "usermeta", "posts", "comments"
    };

    SearchReplace(db::Engine& engine, std::string destinationPrefix, unsigned int batchSize)
        : engine_(engine), prefix_(std::move(destinationPrefix)), batchSize_(batchSize) {}

    // Missing tables are skipped. A failing row update is recorded and the walk goes on.
    ReplaceStats run(const serialize::Rewriter& rewriter);

    ReplaceStats run(const std::string& from, const std::string& to) { return run(serialize::Rewriter(from, to)); }

    // Points siteurl and home at url.
    void updateSiteOptions(const std::string& url);

private:
    void processTable(const std::string& table, const serialize::Rewriter& rewriter, ReplaceStats& stats);

    db::Engine& engine_;
    std::string prefix_;
    unsigned int batchSize_;
};

}
