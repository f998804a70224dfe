#include "transfer/ChunkTransport.hpp"
#include "crypto/base64.hpp"
#include "crypto/hash.hpp"
#include "util/errors.hpp"
#include "logging/LogRegistry.hpp"

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fmt/format.h>

namespace fs = std::filesystem;
using namespace sm::util;
using namespace sm::logging;

namespace sm::transfer {

namespace {

// Closing the descriptor also drops any flock held through it.
class FileDescriptor {
public:
    explicit FileDescriptor(const int fd) : fd_(fd) {}
    ~FileDescriptor() { if (fd_ >= 0) ::close(fd_); }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    [[nodiscard]] int get() const { return fd_; }
    [[nodiscard]] bool valid() const { return fd_ >= 0; }

private:
    int fd_;
};

[[noreturn]] void ioFailure(const std::string& what, const std::string& path) {
    throw MigrationError(ErrorCode::Internal, fmt::format("{}: {}", what, std::strerror(errno)), path);
}

}

types::Chunk ChunkTransport::readChunk(const std::string& path, const uint64_t start, uint64_t end) const {
    const auto abs = guard_.resolve(path);

    const FileDescriptor fd(::open(abs.c_str(), O_RDONLY | O_CLOEXEC));
    if (!fd.valid()) {
        if (errno == ENOENT) throw MigrationError(ErrorCode::NotFound, "File not found", path);
        ioFailure("Failed to open file", path);
    }

    struct stat st{};
    if (::fstat(fd.get(), &st) != 0) ioFailure("Failed to stat file", path);
    if (!S_ISREG(st.st_mode)) throw MigrationError(ErrorCode::InvalidRequest, "Not a regular file", path);

    const auto size = static_cast<uint64_t>(st.st_size);
    if (start > size) throw MigrationError(ErrorCode::InvalidRequest, "Start offset beyond end of file", path);
    if (end == 0) end = start + chunkSize_;
    if (end < start) throw MigrationError(ErrorCode::InvalidRequest, "End offset before start offset", path);
    end = std::min(end, size);

    std::string buffer(end - start, '\0');
    size_t got = 0;
    while (got < buffer.size()) {
        const auto n = ::pread(fd.get(), buffer.data() + got, buffer.size() - got, static_cast<off_t>(start + got));
        if (n < 0) {
            if (errno == EINTR) continue;
            ioFailure("Failed to read file", path);
        }
        if (n == 0) break;
        got += static_cast<size_t>(n);
    }
    buffer.resize(got);

    types::Chunk chunk;
    chunk.path = path;
    chunk.startOffset = start;
    chunk.endOffsetExclusive = start + got;
    chunk.md5Checksum = crypto::hash::md5(buffer);
    chunk.payloadBase64 = crypto::base64::encode(buffer);
    chunk.bytesRead = got;
    chunk.fileSize = size;

    LogRegistry::files()->trace("[ChunkTransport::readChunk] {} [{}, {}) of {}", path, start, start + got, size);
    return chunk;
}

WriteResult ChunkTransport::writeChunk(const std::string& path, const uint64_t offset, const std::string_view bytes,
                                       const std::string_view md5) const {
    if (!crypto::hash::constantTimeEquals(crypto::hash::md5(bytes), md5)) {
        LogRegistry::files()->warn("[ChunkTransport::writeChunk] Checksum mismatch for {} at offset {}", path, offset);
        throw MigrationError(ErrorCode::ChecksumMismatch, "Chunk checksum mismatch", path);
    }

    const auto abs = guard_.resolve(path);
    fs::create_directories(abs.parent_path());

    const FileDescriptor fd(::open(abs.c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, 0644));
    if (!fd.valid()) ioFailure("Failed to open file for writing", path);
    if (::flock(fd.get(), LOCK_EX) != 0) ioFailure("Failed to lock file", path);

    struct stat st{};
    if (::fstat(fd.get(), &st) != 0) ioFailure("Failed to stat file", path);
    const auto current = static_cast<uint64_t>(st.st_size);

    if (offset == 0 || current > offset) {
        if (::ftruncate(fd.get(), static_cast<off_t>(offset)) != 0) ioFailure("Failed to truncate file", path);
    } else if (current < offset) {
        throw MigrationError(ErrorCode::InvalidRequest,
                             fmt::format("Chunk at offset {} would leave a gap after {} bytes", offset, current), path);
    }

    if (::lseek(fd.get(), 0, SEEK_END) < 0) ioFailure("Failed to seek file", path);

    size_t written = 0;
    while (written < bytes.size()) {
        const auto n = ::write(fd.get(), bytes.data() + written, bytes.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            ioFailure("Failed to write file", path);
        }
        written += static_cast<size_t>(n);
    }

    if (::fchmod(fd.get(), 0644) != 0) ioFailure("Failed to set file mode", path);

    LogRegistry::files()->trace("[ChunkTransport::writeChunk] {} +{} bytes at {}", path, written, offset);
    return {written, offset + written};
}

}
