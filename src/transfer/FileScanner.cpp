#include "transfer/FileScanner.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <fmt/format.h>

namespace fs = std::filesystem;
using namespace sm::logging;

namespace sm::transfer {

namespace {

std::string lower(std::string s) {
    std::ranges::transform(s, s.begin(), [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::time_t toTimeT(const fs::file_time_type t) {
    using namespace std::chrono;
    const auto sys = time_point_cast<system_clock::duration>(t - fs::file_time_type::clock::now() + system_clock::now());
    return system_clock::to_time_t(sys);
}

}

FileScanner::FileScanner(fs::path contentRoot, config::ScanConfig scan, const config::TransferConfig& transfer)
    : contentRoot_(std::move(contentRoot)), scan_(std::move(scan)),
      chunkSize_(transfer.chunk_size), maxBatchBytes_(transfer.max_batch_bytes),
      maxBatchFiles_(transfer.max_batch_files) {}

bool FileScanner::excludedFile(const std::string& filename) const {
    if (std::ranges::find(scan_.exclude_files, filename) != scan_.exclude_files.end()) return true;

    const auto dot = filename.rfind('.');
    if (dot == std::string::npos || dot == 0) return false;
    const auto ext = lower(filename.substr(dot + 1));
    return std::ranges::find(scan_.exclude_extensions, ext) != scan_.exclude_extensions.end();
}

bool FileScanner::excludedDirectory(const std::string& relativeDir) const {
    for (const auto& pattern : scan_.exclude_dirs) {
        if (pattern.find('/') != std::string::npos) {
            if (relativeDir == pattern || relativeDir.starts_with(pattern + "/")) return true;
            continue;
        }
        for (const auto& part : fs::path(relativeDir))
            if (part.string() == pattern) return true;
    }
    return false;
}

types::Manifest FileScanner::scan() const {
    types::Manifest manifest;
    for (const auto& root : scan_.roots) scanRoot(root, manifest);

    std::ranges::sort(manifest.entries, {}, &types::FileManifestEntry::relativePath);
    manifest.computeAggregates(chunkSize_, maxBatchBytes_, maxBatchFiles_);

    LogRegistry::files()->info("[FileScanner::scan] {} files, {} ({} large, {} batches)",
                               manifest.totalCount, formatSize(manifest.totalSize), manifest.largeFiles,
                               manifest.batches);
    return manifest;
}

void FileScanner::scanRoot(const std::string& root, types::Manifest& manifest) const {
    const auto dir = contentRoot_ / root;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        LogRegistry::files()->debug("[FileScanner::scanRoot] Skipping missing root {}", dir.string());
        return;
    }

    fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        LogRegistry::files()->error("[FileScanner::scanRoot] Cannot scan {}: {}", dir.string(), ec.message());
        return;
    }

    for (const fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            LogRegistry::files()->warn("[FileScanner::scanRoot] Error while scanning {}: {}", dir.string(), ec.message());
            ec.clear();
            continue;
        }

        const auto& entry = *it;
        const auto rel = entry.path().lexically_relative(contentRoot_).generic_string();

        const auto status = entry.symlink_status(ec);
        if (ec || fs::is_symlink(status)) continue;

        if (fs::is_directory(status)) {
            if (excludedDirectory(rel)) it.disable_recursion_pending();
            continue;
        }
        if (!fs::is_regular_file(status)) continue;
        if (excludedFile(entry.path().filename().string())) continue;

        types::FileManifestEntry e;
        e.relativePath = rel;
        e.sizeBytes = entry.file_size(ec);
        if (ec) continue;
        const auto mtime = entry.last_write_time(ec);
        e.mtime = ec ? 0 : toTimeT(mtime);
        e.isLarge = e.sizeBytes > chunkSize_;
        manifest.entries.push_back(std::move(e));
    }
}

std::vector<std::vector<std::string>> FileScanner::createBatches(const types::Manifest& manifest) const {
    std::vector<std::vector<std::string>> batches;
    std::vector<std::string> current;
    uint64_t currentSize = 0;

    for (const auto& f : manifest.entries) {
        if (f.isLarge) continue;

        if (!current.empty() && (currentSize + f.sizeBytes > maxBatchBytes_ || current.size() >= maxBatchFiles_)) {
            batches.push_back(std::move(current));
            current.clear();
            currentSize = 0;
        }

        current.push_back(f.relativePath);
        currentSize += f.sizeBytes;
    }

    if (!current.empty()) batches.push_back(std::move(current));
    return batches;
}

std::string FileScanner::formatSize(const uint64_t bytes) {
    static constexpr const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    auto value = static_cast<double>(bytes);
    size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < std::size(units)) {
        value /= 1024.0;
        ++unit;
    }
    return unit == 0 ? fmt::format("{} B", bytes) : fmt::format("{:.2f} {}", value, units[unit]);
}

}
