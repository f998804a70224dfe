#include "cli/Parser.hpp"
#include "cli/Router.hpp"
#include "cli/commands.hpp"
#include "config/ConfigRegistry.hpp"
#include "logging/LogRegistry.hpp"

#include <fmt/core.h>

#include <exception>
#include <string>
#include <vector>

using namespace sm::cli;
using namespace sm::config;
using namespace sm::logging;

int main(const int argc, char** argv) {
    const std::vector<std::string> args(argv + 1, argv + argc);
    const auto call = parseArgs(args, {"keep-existing", "json", "help"});

    Router router;
    registerCommands(router);

    if (call.name.empty() || call.name == "help" || hasFlag(call, "help")) {
        fmt::print("{}", router.usage());
        return call.name.empty() && !hasFlag(call, "help") ? 2 : 0;
    }

    try {
        ConfigRegistry::init(optVal(call, "config").value_or(DEFAULT_CONFIG_PATH));
        LogRegistry::init(ConfigRegistry::get().logging.log_dir);
    } catch (const std::exception& e) {
        fmt::print(stderr, "sitemigrate: failed to initialize: {}\n", e.what());
        return 1;
    }

    const auto result = router.execute(call);
    if (!result.stdout_text.empty()) fmt::print("{}", result.stdout_text);
    if (!result.stderr_text.empty()) fmt::print(stderr, "{}", result.stderr_text);
    return result.exit_code;
}
