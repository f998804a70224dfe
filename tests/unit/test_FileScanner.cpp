#include <gtest/gtest.h>
#include "TestEnv.hpp"
#include "transfer/FileScanner.hpp"

#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;
using namespace sm::transfer;
using namespace sm::test;

class FileScannerTest : public ::testing::Test {
protected:
    TempDir tmp;
    sm::config::Config cfg;
    fs::path content;

    void SetUp() override {
        cfg = testConfig(tmp.path());
        content = cfg.site.content_root;

        writeFile(content / "plugins" / "hello" / "hello.php", "<?php echo 1;");
        writeFile(content / "themes" / "t" / "style.css", std::string(100, 'c'));     // large at chunk size 64
        writeFile(content / "uploads" / "2024" / "a.jpg", "jpeg");
        writeFile(content / "uploads" / "cache" / "x.jpg", "cached");
        writeFile(content / "plugins" / "hello" / "node_modules" / "dep.js", "module");
        writeFile(content / "plugins" / "hello" / ".git" / "HEAD", "ref");
        writeFile(content / "plugins" / "hello" / "debug.log", "noise");
        writeFile(content / "plugins" / "hello" / "backup.BAK", "old");
        writeFile(content / "uploads" / ".DS_Store", "mac");
        writeFile(content / "elsewhere" / "ignored.txt", "not a scan root");
    }

    [[nodiscard]] FileScanner scanner() const { return {content, cfg.scan, cfg.transfer}; }

    static std::vector<std::string> paths(const sm::types::Manifest& m) {
        std::vector<std::string> out;
        for (const auto& e : m.entries) out.push_back(e.relativePath);
        return out;
    }
};

TEST_F(FileScannerTest, ScansRootsAndAppliesExclusions) {
    const auto manifest = scanner().scan();
    EXPECT_EQ(paths(manifest), (std::vector<std::string>{
        "plugins/hello/hello.php",
        "themes/t/style.css",
        "uploads/2024/a.jpg",
    }));
    EXPECT_EQ(manifest.totalCount, 3u);
    EXPECT_EQ(manifest.largeFiles, 1u);
    EXPECT_EQ(manifest.smallFiles, 2u);
    EXPECT_EQ(manifest.totalChunks, 2u);
}

TEST_F(FileScannerTest, SymlinksAreNotFollowed) {
    writeFile(tmp / "secret" / "key.pem", "private");
    fs::create_directory_symlink(tmp / "secret", content / "uploads" / "linked");
    fs::create_symlink(tmp / "secret" / "key.pem", content / "uploads" / "key.pem");

    const auto all = paths(scanner().scan());
    EXPECT_TRUE(std::ranges::none_of(all, [](const std::string& p) { return p.find("key.pem") != std::string::npos; }));
}

TEST_F(FileScannerTest, ExclusionRules) {
    const auto s = scanner();
    EXPECT_TRUE(s.excludedFile(".htaccess"));
    EXPECT_TRUE(s.excludedFile("trace.LOG"));
    EXPECT_FALSE(s.excludedFile("index.php"));
    EXPECT_FALSE(s.excludedFile(".hidden"));

    EXPECT_TRUE(s.excludedDirectory("plugins/x/.git"));
    EXPECT_TRUE(s.excludedDirectory("uploads/cache"));
    EXPECT_TRUE(s.excludedDirectory("uploads/cache/2024"));
    EXPECT_FALSE(s.excludedDirectory("plugins/cache-buster"));
    EXPECT_TRUE(s.excludedDirectory("plugins/cache"));
}

TEST_F(FileScannerTest, BatchesRespectFileAndByteLimits) {
    for (int i = 0; i < 9; ++i) writeFile(content / "uploads" / "many" / ("f" + std::to_string(i) + ".txt"), "0123456789");

    const auto s = scanner();
    const auto manifest = s.scan();
    const auto batches = s.createBatches(manifest);

    size_t small = 0;
    for (const auto& b : batches) {
        EXPECT_LE(b.size(), cfg.transfer.max_batch_files);
        small += b.size();
    }
    EXPECT_EQ(small, manifest.smallFiles);
    EXPECT_EQ(batches.size(), manifest.batches);
}

TEST_F(FileScannerTest, FormatSize) {
    EXPECT_EQ(FileScanner::formatSize(10), "10 B");
    EXPECT_EQ(FileScanner::formatSize(1536), "1.50 KB");
    EXPECT_EQ(FileScanner::formatSize(3 * 1024 * 1024), "3.00 MB");
}
