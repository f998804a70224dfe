#pragma once

#include "cli/types.hpp"

#include <map>
#include <string>

namespace sm::cli {

class Router {
public:
    void registerCommand(const std::string& name, std::string usage, std::string description, CommandHandler handler);

    CommandResult execute(const CommandCall& call) const;

    [[nodiscard]] std::string usage() const;

private:
    std::map<std::string, CommandInfo> commands_;
};

}
