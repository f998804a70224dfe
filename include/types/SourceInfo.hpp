#pragma once

#include <string>

#include <nlohmann/json_fwd.hpp>

namespace sm::types {

struct SourceInfo {
    std::string version;
    std::string siteUrl;
    std::string homeUrl;
    std::string tablePrefix;
    std::string engine;
};

void to_json(nlohmann::json& j, const SourceInfo& s);
void from_json(const nlohmann::json& j, SourceInfo& s);

}
