#pragma once

#include "config/Config.hpp"
#include "types/Table.hpp"

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace sm::dest { class Site; }

namespace sm::protocols {

namespace command {

struct SetMode { config::SiteMode mode; };
struct RegenerateSecret {};
struct SaveConnection { std::string key; };
struct LoadConnection {};
struct GetConfig {};
struct PrepareDatabase {
    std::vector<std::string> tables;
    std::string sourcePrefix = "wp_";
    bool overwrite = false;
    std::string operatorLogin;
};
struct CreateTable { std::string schema, sourceTable, sourcePrefix = "wp_"; };
struct DropTable { std::string table; };
struct ProcessRows { std::string table, sourcePrefix = "wp_"; std::vector<types::WireRow> rows; };
struct WriteChunk { std::string path; uint64_t offset{0}; std::string data, checksum; };
struct ExtractBatch { std::string data, checksum; };
struct SearchReplace { std::string from, to; };
struct FlushCaches {};
struct Finalize {};

}

using Command = std::variant<
    command::SetMode,
    command::RegenerateSecret,
    command::SaveConnection,
    command::LoadConnection,
    command::GetConfig,
    command::PrepareDatabase,
    command::CreateTable,
    command::DropTable,
    command::ProcessRows,
    command::WriteChunk,
    command::ExtractBatch,
    command::SearchReplace,
    command::FlushCaches,
    command::Finalize
>;

// {"action": "<name>", ...fields}. Throws MigrationError(InvalidRequest).
Command parseCommand(const nlohmann::json& j);

// Never throws: failures come back as {"success": false, "error": {"code", "message"}}.
nlohmann::json dispatch(dest::Site& site, const Command& cmd);

nlohmann::json success(const nlohmann::json& data);
nlohmann::json failure(const std::string& code, const std::string& message);

}
