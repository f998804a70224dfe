#include <gtest/gtest.h>
#include "TestEnv.hpp"
#include "crypto/base64.hpp"
#include "crypto/hash.hpp"
#include "transfer/ChunkTransport.hpp"
#include "util/errors.hpp"

#include <filesystem>
#include <functional>
#include <memory>
#include <string>

namespace fs = std::filesystem;
using namespace sm::transfer;
using namespace sm::test;
using sm::util::ErrorCode;
using sm::util::MigrationError;
namespace hash = sm::crypto::hash;

class ChunkTransportTest : public ::testing::Test {
protected:
    TempDir tmp;
    std::unique_ptr<PathGuard> guard;
    std::string payload;

    void SetUp() override {
        fs::create_directories(tmp / "content");
        guard = std::make_unique<PathGuard>(tmp / "content");
        for (int i = 0; i < 150; ++i) payload.push_back(static_cast<char>('a' + i % 26));
        writeFile(tmp / "content" / "uploads" / "big.bin", payload);
    }

    [[nodiscard]] ChunkTransport transport() const { return {*guard, 64}; }

    static ErrorCode codeOf(const std::function<void()>& fn) {
        try {
            fn();
        } catch (const MigrationError& e) {
            return e.code();
        }
        ADD_FAILURE() << "expected MigrationError";
        return ErrorCode::Internal;
    }
};

TEST_F(ChunkTransportTest, ReadsDefaultSizedChunk) {
    const auto chunk = transport().readChunk("uploads/big.bin", 0, 0);
    EXPECT_EQ(chunk.startOffset, 0u);
    EXPECT_EQ(chunk.endOffsetExclusive, 64u);
    EXPECT_EQ(chunk.bytesRead, 64u);
    EXPECT_EQ(chunk.fileSize, 150u);
    EXPECT_EQ(sm::crypto::base64::decode(chunk.payloadBase64), payload.substr(0, 64));
    EXPECT_EQ(chunk.md5Checksum, hash::md5(payload.substr(0, 64)));
}

TEST_F(ChunkTransportTest, LastChunkIsClampedToFileSize) {
    const auto chunk = transport().readChunk("uploads/big.bin", 128, 0);
    EXPECT_EQ(chunk.bytesRead, 22u);
    EXPECT_EQ(chunk.endOffsetExclusive, 150u);
}

TEST_F(ChunkTransportTest, ReadErrors) {
    const auto t = transport();
    EXPECT_EQ(codeOf([&] { (void)t.readChunk("uploads/none.bin", 0, 0); }), ErrorCode::NotFound);
    EXPECT_EQ(codeOf([&] { (void)t.readChunk("uploads/big.bin", 151, 0); }), ErrorCode::InvalidRequest);
    EXPECT_EQ(codeOf([&] { (void)t.readChunk("../etc/passwd", 0, 0); }), ErrorCode::PathViolation);
}

TEST_F(ChunkTransportTest, ReassemblesFileFromChunks) {
    const auto t = transport();
    uint64_t offset = 0;
    while (offset < payload.size()) {
        const auto chunk = t.readChunk("uploads/big.bin", offset, 0);
        const auto bytes = sm::crypto::base64::decode(chunk.payloadBase64);
        const auto res = t.writeChunk("copy/big.bin", offset, bytes, chunk.md5Checksum);
        EXPECT_EQ(res.fileSize, chunk.endOffsetExclusive);
        offset = chunk.endOffsetExclusive;
    }
    EXPECT_EQ(readFile(tmp / "content" / "copy" / "big.bin"), payload);
    EXPECT_EQ(hash::md5File(tmp / "content" / "copy" / "big.bin"), hash::md5(payload));
}

TEST_F(ChunkTransportTest, ChecksumIsVerifiedBeforeAnyWrite) {
    const auto t = transport();
    EXPECT_EQ(codeOf([&] { (void)t.writeChunk("copy/new.bin", 0, "hello", hash::md5("other")); }),
              ErrorCode::ChecksumMismatch);
    EXPECT_FALSE(fs::exists(tmp / "content" / "copy" / "new.bin"));
    EXPECT_FALSE(fs::exists(tmp / "content" / "copy"));
}

TEST_F(ChunkTransportTest, ReplayedChunkIsHarmless) {
    const auto t = transport();
    (void)t.writeChunk("f.txt", 0, "abcd", hash::md5("abcd"));
    (void)t.writeChunk("f.txt", 4, "efgh", hash::md5("efgh"));
    // the second chunk again, e.g. after a lost response
    const auto res = t.writeChunk("f.txt", 4, "efgh", hash::md5("efgh"));
    EXPECT_EQ(res.fileSize, 8u);
    EXPECT_EQ(readFile(tmp / "content" / "f.txt"), "abcdefgh");
}

TEST_F(ChunkTransportTest, OffsetZeroTruncatesAndGapIsRejected) {
    const auto t = transport();
    writeFile(tmp / "content" / "f.txt", "stale content that is long");
    (void)t.writeChunk("f.txt", 0, "new", hash::md5("new"));
    EXPECT_EQ(readFile(tmp / "content" / "f.txt"), "new");

    EXPECT_EQ(codeOf([&] { (void)t.writeChunk("f.txt", 10, "x", hash::md5("x")); }), ErrorCode::InvalidRequest);
    EXPECT_EQ(readFile(tmp / "content" / "f.txt"), "new");
}

TEST_F(ChunkTransportTest, WriteOutsideRootIsRejected) {
    const auto t = transport();
    EXPECT_EQ(codeOf([&] { (void)t.writeChunk("../../evil.txt", 0, "x", hash::md5("x")); }),
              ErrorCode::PathViolation);
}
