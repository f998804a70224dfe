#pragma once

#include "config/Config.hpp"
#include "types/Manifest.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace sm::transfer {

class FileScanner {
public:
    FileScanner(std::filesystem::path contentRoot, config::ScanConfig scan, const config::TransferConfig& transfer);

    // Regular files under the configured roots, sorted by path; symlinks are not followed.
    [[nodiscard]] types::Manifest scan() const;

    // Consecutive small files grouped under the batch byte and file-count limits.
    [[nodiscard]] std::vector<std::vector<std::string>> createBatches(const types::Manifest& manifest) const;

    [[nodiscard]] bool excludedFile(const std::string& filename) const;
    [[nodiscard]] bool excludedDirectory(const std::string& relativeDir) const;

    static std::string formatSize(uint64_t bytes);

private:
    void scanRoot(const std::string& root, types::Manifest& manifest) const;

    std::filesystem::path contentRoot_;
    config::ScanConfig scan_;
    uint64_t chunkSize_;
    uint64_t maxBatchBytes_;
    unsigned int maxBatchFiles_;
};

}
