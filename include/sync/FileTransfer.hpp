#pragma once

#include "config/Config.hpp"
#include "transfer/BatchArchive.hpp"
#include "transfer/ChunkTransport.hpp"
#include "transfer/PathGuard.hpp"
#include "types/Manifest.hpp"
#include "types/Session.hpp"
#include "util/RetryPolicy.hpp"

#include <functional>
#include <string>
#include <vector>

namespace sm::source { class SourceApi; }

namespace sm::sync {

// Pulls the manifest's files into the destination content root, in manifest order.
class FileTransfer {
public:
    struct Hooks {
        std::function<void()> checkpoint;                   // between units of work; may throw to leave
        std::function<void()> persist;                      // write the session now
        std::function<void(const std::string& path, const util::MigrationError&)> onFailure;
        std::function<void(unsigned int attempt, const util::MigrationError&)> onRetry;
    };

    FileTransfer(source::SourceApi& source, const transfer::PathGuard& guard, const config::TransferConfig& config);

    // Resumes at cursor.currentFileIndex, skipping completed paths.
    void run(const types::Manifest& manifest, types::FileCursor& cursor, types::SessionStats& stats,
             const Hooks& hooks);

    // One large file from cursor.byteOffset to the end. Returns bytes written.
    uint64_t transferLarge(const types::FileManifestEntry& file, types::FileCursor& cursor,
                           types::SessionStats& stats, const Hooks& hooks);

    // One archive of small files.
    transfer::ExtractResult transferBatch(const std::vector<std::string>& paths, const Hooks& hooks);

    util::RetryPolicy& retryPolicy() noexcept { return checksumRetry_; }

private:
    source::SourceApi& source_;
    const transfer::PathGuard& guard_;
    const config::TransferConfig& config_;
    transfer::ChunkTransport chunks_;
    transfer::BatchArchive archive_;
    util::RetryPolicy checksumRetry_;
};

}
