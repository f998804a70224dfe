#pragma once

#include "config/Config.hpp"
#include "transfer/BatchArchive.hpp"
#include "transfer/ChunkTransport.hpp"
#include "transfer/FileScanner.hpp"
#include "transfer/PathGuard.hpp"
#include "types/SourceInfo.hpp"
#include "types/Table.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sm::db { class Engine; }
namespace sm::dest { class SettingsStore; }

namespace sm::source {

enum class AuthResult { Ok, Missing, Invalid };

// Serves this site's schema, rows and files to a destination.
class Provider {
public:
    Provider(const config::Config& config, db::Engine& engine, dest::SettingsStore& settings);

    [[nodiscard]] AuthResult authenticate(std::optional<std::string_view> presented) const;

    // Records origin (when non-empty) among the connected destinations.
    types::SourceInfo handshake(const std::string& origin);

    [[nodiscard]] types::SourceInfo info() const;
    [[nodiscard]] types::Manifest manifest() const;
    [[nodiscard]] std::vector<types::TableDescriptor> tables() const;
    [[nodiscard]] std::string schema(const std::string& table) const;
    [[nodiscard]] types::RowBatch rows(const std::string& table, const types::RowCursor& cursor,
                                       unsigned int batchSize) const;
    [[nodiscard]] types::Chunk fileChunk(const std::string& path, uint64_t start, uint64_t end) const;
    [[nodiscard]] types::ArchiveBatch batch(const std::vector<std::string>& paths) const;

    // Own site and home origins plus every connected destination.
    [[nodiscard]] std::vector<std::string> allowedOrigins() const;
    [[nodiscard]] bool originAllowed(std::string_view origin) const;

    [[nodiscard]] const config::Config& config() const noexcept { return config_; }

private:
    void requireTable(const std::string& table) const;

    const config::Config& config_;
    db::Engine& engine_;
    dest::SettingsStore& settings_;

    transfer::PathGuard guard_;
    transfer::ChunkTransport chunks_;
    transfer::BatchArchive archive_;
    transfer::FileScanner scanner_;
};

}
