#include "sync/FileTransfer.hpp"
#include "source/SourceApi.hpp"
#include "crypto/base64.hpp"
#include "logging/LogRegistry.hpp"

#include <filesystem>
#include <fmt/format.h>
#include <unordered_set>

using namespace sm::util;
using namespace sm::logging;

namespace sm::sync {

FileTransfer::FileTransfer(source::SourceApi& source, const transfer::PathGuard& guard,
                           const config::TransferConfig& config)
    : source_(source), guard_(guard), config_(config),
      chunks_(guard, config.chunk_size), archive_(guard) {
    checksumRetry_.maxRetries = config.chunk_max_retries;
    checksumRetry_.baseDelay = config.retry_base;
    checksumRetry_.maxDelay = config.retry_cap;
}

uint64_t FileTransfer::transferLarge(const types::FileManifestEntry& file, types::FileCursor& cursor,
                                     types::SessionStats& stats, const Hooks& hooks) {
    uint64_t offset = cursor.byteOffset;

    // The partial file must end exactly where the cursor says, otherwise start over.
    if (offset > 0) {
        std::error_code ec;
        const auto have = std::filesystem::file_size(guard_.resolve(file.relativePath), ec);
        if (ec || have < offset) {
            LogRegistry::files()->warn("[FileTransfer::transferLarge] Partial copy of {} is shorter than recorded, "
                                       "restarting it", file.relativePath);
            offset = cursor.byteOffset = 0;
        }
    }

    uint64_t written = 0;
    while (offset < file.sizeBytes) {
        const auto chunkWritten = checksumRetry_.run([&] {
            const auto chunk = source_.fileChunk(file.relativePath, offset, 0);
            const auto bytes = crypto::base64::decode(chunk.payloadBase64);
            return chunks_.writeChunk(file.relativePath, offset, bytes, chunk.md5Checksum).bytesWritten;
        }, {ErrorCode::ChecksumMismatch}, hooks.onRetry);

        if (chunkWritten == 0)
            throw MigrationError(ErrorCode::NotFound,
                                 fmt::format("Source file shrank to {} of {} bytes", offset, file.sizeBytes),
                                 file.relativePath);

        offset += chunkWritten;
        written += chunkWritten;
        cursor.byteOffset = offset;
        stats.bytesTransferred += chunkWritten;

        if (offset < file.sizeBytes && hooks.checkpoint) hooks.checkpoint();
    }

    LogRegistry::files()->debug("[FileTransfer::transferLarge] {} done, {} bytes", file.relativePath, written);
    return written;
}

transfer::ExtractResult FileTransfer::transferBatch(const std::vector<std::string>& paths, const Hooks& hooks) {
    return checksumRetry_.run([&] {
        const auto batch = source_.batch(paths);
        const auto bytes = crypto::base64::decode(batch.dataBase64);
        return archive_.extract(bytes, batch.md5Checksum);
    }, {ErrorCode::ChecksumMismatch}, hooks.onRetry);
}

void FileTransfer::run(const types::Manifest& manifest, types::FileCursor& cursor, types::SessionStats& stats,
                       const Hooks& hooks) {
    const auto& entries = manifest.entries;
    unsigned int sincePersist = 0;

    const auto done = [&](const std::string& path) {
        cursor.completedFilePaths.insert(path);
        ++stats.filesTransferred;
        ++sincePersist;
    };

    const auto failed = [&](const std::string& path, const MigrationError& e) {
        ++stats.filesFailed;
        ++sincePersist;
        LogRegistry::files()->error("[FileTransfer::run] {}: {}", path, e.what());
        if (hooks.onFailure) hooks.onFailure(path, e);
    };

    const auto maybePersist = [&] {
        if (sincePersist >= config_.persist_every_files && hooks.persist) {
            hooks.persist();
            sincePersist = 0;
        }
    };

    size_t i = cursor.currentFileIndex;
    while (i < entries.size()) {
        if (hooks.checkpoint) hooks.checkpoint();

        const auto& entry = entries[i];
        if (cursor.completedFilePaths.contains(entry.relativePath)) {
            cursor.currentFileIndex = ++i;
            continue;
        }

        if (entry.isLarge) {
            try {
                transferLarge(entry, cursor, stats, hooks);
                done(entry.relativePath);
            } catch (const MigrationError& e) {
                if (e.fatal()) throw;
                failed(entry.relativePath, MigrationError(e.code(), e.what(), entry.relativePath));
            }
            cursor.byteOffset = 0;
            cursor.currentFileIndex = ++i;
            maybePersist();
            continue;
        }

        // Consecutive small files up to the batch limits.
        std::vector<std::string> paths;
        uint64_t bytes = 0;
        size_t j = i;
        for (; j < entries.size() && !entries[j].isLarge; ++j) {
            const auto& e = entries[j];
            if (cursor.completedFilePaths.contains(e.relativePath)) continue;
            if (!paths.empty() && (bytes + e.sizeBytes > config_.max_batch_bytes || paths.size() >= config_.max_batch_files))
                break;
            paths.push_back(e.relativePath);
            bytes += e.sizeBytes;
        }

        if (paths.empty()) {
            cursor.currentFileIndex = i = j;
            continue;
        }

        try {
            const auto result = transferBatch(paths, hooks);
            stats.bytesTransferred += result.bytesWritten;

            std::unordered_set<std::string> handled(result.extractedPaths.begin(), result.extractedPaths.end());
            for (const auto& p : result.extractedPaths) done(p);

            for (const auto& s : result.skipped) {
                handled.insert(s.path);
                const auto code = transfer::PathGuard::isSafeRelative(s.path) ? ErrorCode::Internal
                                                                               : ErrorCode::PathViolation;
                failed(s.path, MigrationError(code, s.reason, s.path));
            }

            for (const auto& p : paths)
                if (!handled.contains(p))
                    failed(p, MigrationError(ErrorCode::NotFound, "Missing from the source archive", p));
        } catch (const MigrationError& e) {
            if (e.fatal()) throw;
            for (const auto& p : paths) failed(p, MigrationError(e.code(), e.what(), p));
        }

        i = j;
        cursor.currentFileIndex = i;
        maybePersist();
    }

    if (hooks.persist) hooks.persist();
}

}
