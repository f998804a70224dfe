#include "types/SourceInfo.hpp"

#include <nlohmann/json.hpp>

namespace sm::types {

void to_json(nlohmann::json& j, const SourceInfo& s) {
    j = {
        {"version", s.version},
        {"site_url", s.siteUrl},
        {"home_url", s.homeUrl},
        {"table_prefix", s.tablePrefix},
        {"engine", s.engine}
    };
}

void from_json(const nlohmann::json& j, SourceInfo& s) {
    s.version = j.value("version", std::string{});
    s.siteUrl = j.at("site_url").get<std::string>();
    s.homeUrl = j.value("home_url", s.siteUrl);
    s.tablePrefix = j.at("table_prefix").get<std::string>();
    s.engine = j.value("engine", std::string{});
}

}
