#pragma once

#include "types/Manifest.hpp"
#include "util/errors.hpp"

#include <cstdint>
#include <ctime>
#include <deque>
#include <optional>
#include <set>
#include <string>
#include <string_view>

#include <nlohmann/json_fwd.hpp>

namespace sm::types {

enum class Phase : uint8_t {
    Idle,
    Scanning,
    ScanComplete,
    TransferringDatabase,
    TransferringFiles,
    Finalizing,
    Complete,
    Paused,
    Error,
    Cancelled
};

std::string_view to_string(Phase p) noexcept;

// Returns false if unrecognized (and leaves out unchanged)
bool tryParsePhase(std::string_view in, Phase& out) noexcept;

// scanning .. finalizing
bool isInProgress(Phase p) noexcept;

struct SourceEndpoint {
    std::string url;
    std::string secret;
};

struct DatabaseCursor {
    uint32_t currentTableIndex{0};
    uint64_t rowsOffset{0};
    std::string lastPrimaryKeySeen;     // empty: none yet

    // True once anything past the start of the first table has been applied.
    [[nodiscard]] bool hasProgress() const noexcept {
        return currentTableIndex > 0 || rowsOffset > 0 || !lastPrimaryKeySeen.empty();
    }

    [[nodiscard]] bool midTable() const noexcept { return rowsOffset > 0 || !lastPrimaryKeySeen.empty(); }

    void nextTable() noexcept {
        ++currentTableIndex;
        rowsOffset = 0;
        lastPrimaryKeySeen.clear();
    }
};

struct FileCursor {
    uint64_t currentFileIndex{0};
    uint64_t byteOffset{0};
    std::set<std::string> completedFilePaths;
};

struct SessionFlags {
    bool paused{false};
    bool cancelled{false};
};

struct ErrorEntry {
    std::time_t at{0};
    util::ErrorCode code{util::ErrorCode::Internal};
    std::string unit;               // table, file or phase the error belongs to
    std::string message;
};

struct SessionStats {
    uint64_t bytesTransferred{0};
    uint64_t rowsTransferred{0};
    uint64_t rowsSkipped{0};
    uint64_t rowsDuplicate{0};
    uint64_t filesTransferred{0};
    uint64_t filesFailed{0};
    uint64_t retryCount{0};
    std::deque<ErrorEntry> errorLog;    // newest last, bounded
};

struct Session {
    static constexpr unsigned int VERSION = 2;

    std::string id;
    Phase phase{Phase::Idle};
    Phase resumePhase{Phase::Idle};     // where a paused or errored session picks up
    SourceEndpoint source;
    std::string tablePrefixSource;
    std::string tablePrefixDest;

    std::optional<Manifest> manifest;   // runtime only, re-fetched on resume

    DatabaseCursor databaseCursor;
    FileCursor fileCursor;
    SessionFlags flags;
    SessionStats stats;

    std::string lastError;
    std::time_t startedAt{0};
    std::time_t endedAt{0};
    uint32_t totalTables{0};
    uint64_t totalFiles{0};

    void recordError(util::ErrorCode code, std::string unit, std::string message, size_t limit);

    [[nodiscard]] bool resumable() const noexcept {
        return phase == Phase::Paused || phase == Phase::Error || isInProgress(phase);
    }
};

void to_json(nlohmann::json& j, const Session& s);

// Strict: rejects unknown fields and any version other than Session::VERSION.
void from_json(const nlohmann::json& j, Session& s);

}
