#include "cli/Router.hpp"
#include "logging/LogRegistry.hpp"
#include "util/errors.hpp"

#include <fmt/format.h>

#include <algorithm>

using namespace sm::cli;
using namespace sm::logging;
using namespace sm::util;

void Router::registerCommand(const std::string& name, std::string usage, std::string description,
                             CommandHandler handler) {
    commands_[name] = CommandInfo{std::move(usage), std::move(description), std::move(handler)};
}

CommandResult Router::execute(const CommandCall& call) const {
    if (call.name.empty() || call.name == "help") return ok(usage());

    const auto it = commands_.find(call.name);
    if (it == commands_.end()) return invalid(fmt::format("Unknown command: {}\n\n{}", call.name, usage()));

    LogRegistry::sitemigrate()->debug("[cli::Router] Executing command: '{}'", call.name);

    try {
        return it->second.handler(call);
    } catch (const MigrationError& e) {
        LogRegistry::sitemigrate()->error("[cli::Router] {} failed: {} ({})", call.name, e.what(), to_string(e.code()));
        return failed(fmt::format("{}: {}\n", to_string(e.code()), e.what()));
    } catch (const std::exception& e) {
        LogRegistry::sitemigrate()->error("[cli::Router] {} failed: {}", call.name, e.what());
        return failed(fmt::format("error: {}\n", e.what()));
    }
}

std::string Router::usage() const {
    std::string out = "usage: sitemigrate <command> [--config <path>] [options]\n\ncommands:\n";
    size_t width = 0;
    for (const auto& [name, info] : commands_) width = std::max(width, info.usage.size());
    for (const auto& [name, info] : commands_)
        out += fmt::format("  {:<{}}  {}\n", info.usage, width, info.description);
    return out;
}
