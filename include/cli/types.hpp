#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace sm::cli {

struct FlagKV {
    std::string key;
    std::optional<std::string> value;
};

struct CommandCall {
    std::string name;
    std::vector<FlagKV> options;
    std::vector<std::string> positionals;
};

struct CommandResult {
    int exit_code = 0;                 // 0 = success
    std::string stdout_text;
    std::string stderr_text;
};

using CommandHandler = std::function<CommandResult(const CommandCall&)>;

struct CommandInfo {
    std::string usage;
    std::string description;
    CommandHandler handler;
};

inline CommandResult ok(std::string out) { return {0, std::move(out), {}}; }
inline CommandResult invalid(std::string msg) { return {2, {}, std::move(msg)}; }
inline CommandResult failed(std::string msg) { return {1, {}, std::move(msg)}; }

}
