#include "sync/MigrationLock.hpp"
#include "util/errors.hpp"
#include "util/timestamp.hpp"
#include "logging/LogRegistry.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/file.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

using namespace sm::util;
using namespace sm::logging;

namespace sm::sync {

namespace {

std::string hostname() {
    char buf[256] = {0};
    if (::gethostname(buf, sizeof(buf) - 1) != 0) return "unknown";
    return buf;
}

// Holds flock on the lock file for one read-modify-write.
class FileLock {
public:
    explicit FileLock(const std::filesystem::path& file)
        : fd_(::open(file.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600)) {
        if (fd_ < 0)
            throw MigrationError(ErrorCode::Internal, fmt::format("Cannot open lock file: {}", std::strerror(errno)),
                                 file.string());
        while (::flock(fd_, LOCK_EX) != 0) {
            if (errno == EINTR) continue;
            const std::string err = std::strerror(errno);
            ::close(fd_);
            throw MigrationError(ErrorCode::Internal, "Cannot lock lock file: " + err, file.string());
        }
    }
    ~FileLock() { ::close(fd_); }

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    [[nodiscard]] std::string read() const {
        std::string out;
        char buf[1024];
        ::lseek(fd_, 0, SEEK_SET);
        ssize_t n;
        while ((n = ::read(fd_, buf, sizeof(buf))) > 0) out.append(buf, static_cast<size_t>(n));
        return out;
    }

    void write(const std::string& contents) const {
        if (::ftruncate(fd_, 0) != 0 || ::pwrite(fd_, contents.data(), contents.size(), 0) !=
                                             static_cast<ssize_t>(contents.size()))
            throw MigrationError(ErrorCode::Internal, fmt::format("Cannot write lock file: {}", std::strerror(errno)));
    }

private:
    int fd_;
};

std::optional<LockHolder> parse(const std::string& text) {
    const auto j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return std::nullopt;
    try {
        return LockHolder{
            j.at("owner").get<std::string>(),
            j.at("pid").get<pid_t>(),
            j.at("host").get<std::string>(),
            j.at("expires_at").get<std::time_t>()
        };
    } catch (const nlohmann::json::exception& e) {
        LogRegistry::sync()->warn("[MigrationLock] Ignoring malformed lock file: {}", e.what());
        return std::nullopt;
    }
}

bool live(const LockHolder& h) {
    if (h.expiresAt <= now()) return false;
    if (h.host == hostname() && h.pid > 0 && ::kill(h.pid, 0) != 0 && errno == ESRCH) return false;
    return true;
}

}

MigrationLock::MigrationLock(std::filesystem::path file, const std::chrono::seconds ttl)
    : file_(std::move(file)), ttl_(ttl) {}

MigrationLock::~MigrationLock() {
    try {
        release();
    } catch (const std::exception& e) {
        LogRegistry::sync()->error("[MigrationLock] Failed to release lock: {}", e.what());
    }
}

std::string MigrationLock::serialize(const std::time_t expiresAt) const {
    const nlohmann::json j = {
        {"owner", owner_},
        {"pid", ::getpid()},
        {"host", hostname()},
        {"expires_at", expiresAt}
    };
    return j.dump();
}

void MigrationLock::acquire(const std::string& owner) {
    if (file_.has_parent_path()) std::filesystem::create_directories(file_.parent_path());

    const FileLock lock(file_);
    if (const auto h = parse(lock.read()); h && live(*h)) {
        const bool ours = h->pid == ::getpid() && h->host == hostname() && h->owner == owner;
        if (!ours)
            throw MigrationError(ErrorCode::ConcurrencyConflict,
                                 fmt::format("Migration already in progress (owner {}, pid {} on {})",
                                             h->owner, h->pid, h->host));
    }

    owner_ = owner;
    lock.write(serialize(now() + static_cast<std::time_t>(ttl_.count())));
    held_ = true;
    lastRenew_ = std::chrono::steady_clock::now();
    LogRegistry::sync()->debug("[MigrationLock::acquire] Acquired {} for {}", file_.string(), owner_);
}

void MigrationLock::renew() {
    if (!held_) return;
    const auto t = std::chrono::steady_clock::now();
    if (t - lastRenew_ < ttl_ / 10) return;

    const FileLock lock(file_);
    if (const auto h = parse(lock.read()); h && !(h->pid == ::getpid() && h->host == hostname() && h->owner == owner_)) {
        held_ = false;
        throw MigrationError(ErrorCode::ConcurrencyConflict,
                             fmt::format("Migration lock was taken over (owner {}, pid {} on {})",
                                         h->owner, h->pid, h->host));
    }
    lock.write(serialize(now() + static_cast<std::time_t>(ttl_.count())));
    lastRenew_ = t;
}

void MigrationLock::release() {
    if (!held_) return;
    held_ = false;

    const FileLock lock(file_);
    if (const auto h = parse(lock.read()); h && h->pid == ::getpid() && h->owner == owner_) {
        std::error_code ec;
        std::filesystem::remove(file_, ec);
        if (ec) LogRegistry::sync()->warn("[MigrationLock::release] Failed to remove {}: {}", file_.string(), ec.message());
    }
}

std::optional<LockHolder> MigrationLock::holder(const std::filesystem::path& file) {
    std::error_code ec;
    if (!std::filesystem::exists(file, ec)) return std::nullopt;
    const FileLock lock(file);
    if (auto h = parse(lock.read()); h && live(*h)) return h;
    return std::nullopt;
}

}
