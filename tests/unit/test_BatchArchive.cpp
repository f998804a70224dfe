#include <gtest/gtest.h>
#include "TestEnv.hpp"
#include "crypto/base64.hpp"
#include "crypto/hash.hpp"
#include "transfer/BatchArchive.hpp"
#include "util/errors.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <filesystem>
#include <memory>
#include <utility>

namespace fs = std::filesystem;
using namespace sm::transfer;
using namespace sm::test;
using sm::util::ErrorCode;
using sm::util::MigrationError;

namespace {

la_ssize_t appendOut(archive*, void* client, const void* buf, const size_t len) {
    static_cast<std::string*>(client)->append(static_cast<const char*>(buf), len);
    return static_cast<la_ssize_t>(len);
}

// Hand-built zip with arbitrary entry names, as a hostile source could send.
std::string rawZip(const std::vector<std::pair<std::string, std::string>>& entries) {
    std::string out;
    archive* w = archive_write_new();
    archive_write_set_format_zip(w);
    archive_write_open(w, &out, nullptr, appendOut, nullptr);
    for (const auto& [name, data] : entries) {
        archive_entry* e = archive_entry_new();
        archive_entry_set_pathname(e, name.c_str());
        archive_entry_set_size(e, static_cast<la_int64_t>(data.size()));
        archive_entry_set_filetype(e, AE_IFREG);
        archive_entry_set_perm(e, 0644);
        archive_write_header(w, e);
        archive_write_data(w, data.data(), data.size());
        archive_entry_free(e);
    }
    archive_write_close(w);
    archive_write_free(w);
    return out;
}

}

class BatchArchiveTest : public ::testing::Test {
protected:
    TempDir tmp;
    std::unique_ptr<PathGuard> srcGuard, dstGuard;

    void SetUp() override {
        writeFile(tmp / "src" / "uploads" / "a.txt", "alpha");
        writeFile(tmp / "src" / "themes" / "t" / "b.css", "body{}");
        writeFile(tmp / "src" / "uploads" / "empty.txt", "");
        fs::create_directories(tmp / "dst");
        srcGuard = std::make_unique<PathGuard>(tmp / "src");
        dstGuard = std::make_unique<PathGuard>(tmp / "dst");
    }
};

TEST_F(BatchArchiveTest, BuildThenExtractCopiesFiles) {
    const auto batch = BatchArchive(*srcGuard).build({"uploads/a.txt", "themes/t/b.css", "uploads/empty.txt",
                                                       "uploads/missing.txt"});
    EXPECT_EQ(batch.fileCount, 3u);

    const auto bytes = sm::crypto::base64::decode(batch.dataBase64);
    EXPECT_EQ(bytes.size(), batch.size);
    EXPECT_EQ(sm::crypto::hash::md5(bytes), batch.md5Checksum);

    const auto result = BatchArchive(*dstGuard).extract(bytes, batch.md5Checksum);
    EXPECT_EQ(result.extracted, 3u);
    EXPECT_TRUE(result.skipped.empty());
    EXPECT_EQ(result.bytesWritten, 11u);
    EXPECT_EQ(readFile(tmp / "dst" / "uploads" / "a.txt"), "alpha");
    EXPECT_EQ(readFile(tmp / "dst" / "themes" / "t" / "b.css"), "body{}");
    EXPECT_TRUE(fs::exists(tmp / "dst" / "uploads" / "empty.txt"));
}

TEST_F(BatchArchiveTest, ChecksumMismatchWritesNothing) {
    const auto batch = BatchArchive(*srcGuard).build({"uploads/a.txt"});
    const auto bytes = sm::crypto::base64::decode(batch.dataBase64);
    try {
        (void)BatchArchive(*dstGuard).extract(bytes, sm::crypto::hash::md5("tampered"));
        FAIL() << "expected ChecksumMismatch";
    } catch (const MigrationError& e) {
        EXPECT_EQ(e.code(), ErrorCode::ChecksumMismatch);
    }
    EXPECT_FALSE(fs::exists(tmp / "dst" / "uploads"));
}

TEST_F(BatchArchiveTest, HostileEntriesAreSkippedAndReported) {
    const auto zip = rawZip({
        {"uploads/ok.txt", "fine"},
        {"../escape.txt", "bad"},
        {"/etc/cron.d/x", "bad"},
        {"uploads/ok.txt", "second copy"},
    });

    const auto result = BatchArchive(*dstGuard).extract(zip, sm::crypto::hash::md5(zip));
    EXPECT_EQ(result.extracted, 1u);
    ASSERT_EQ(result.skipped.size(), 3u);
    EXPECT_EQ(result.skipped[0].reason, "unsafe path");
    EXPECT_EQ(result.skipped[2].reason, "duplicate entry");

    EXPECT_EQ(readFile(tmp / "dst" / "uploads" / "ok.txt"), "fine");
    EXPECT_FALSE(fs::exists(tmp / "escape.txt"));
}
