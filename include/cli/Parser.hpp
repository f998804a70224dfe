#pragma once

#include "cli/types.hpp"

#include <algorithm>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sm::cli {

// Upsert a flag (last wins)
inline void setOpt(CommandCall& c, const std::string& key, const std::optional<std::string>& val) {
    for (auto& [k, v] : c.options) if (k == key) { v = val; return; }
    c.options.push_back(FlagKV{key, val});
}

inline bool isFlag(const std::string_view s) {
    return s.size() > 1 && s[0] == '-' && s != "--";
}

// Flags listed in `valueless` never consume the following word.
inline CommandCall parseArgs(const std::vector<std::string>& args, const std::vector<std::string>& valueless = {}) {
    CommandCall call;
    bool stop_flags = false;

    for (size_t i = 0; i < args.size(); ++i) {
        const auto& a = args[i];

        if (!stop_flags && a == "--") {
            stop_flags = true;
            continue;
        }

        if (!stop_flags && isFlag(a)) {
            auto key = a.substr(a.find_first_not_of('-'));
            if (const auto eq = key.find('='); eq != std::string::npos) {
                setOpt(call, key.substr(0, eq), key.substr(eq + 1));
                continue;
            }

            const bool takesValue = std::find(valueless.begin(), valueless.end(), key) == valueless.end();
            if (takesValue && i + 1 < args.size() && !isFlag(args[i + 1])) {
                setOpt(call, key, args[i + 1]);
                ++i;
            } else {
                setOpt(call, key, std::nullopt);
            }
            continue;
        }

        if (call.name.empty()) call.name = a;
        else call.positionals.push_back(a);
    }

    return call;
}

inline std::optional<std::string> optVal(const CommandCall& c, const std::string& key) {
    for (const auto& [k, v] : c.options)
        if (k == key) return v;
    return std::nullopt;
}

inline bool hasFlag(const CommandCall& c, const std::string& key) {
    for (const auto& [k, v] : c.options)
        if (k == key) return true;
    return false;
}

}
