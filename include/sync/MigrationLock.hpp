#pragma once

#include <chrono>
#include <ctime>
#include <filesystem>
#include <optional>
#include <string>
#include <sys/types.h>

namespace sm::sync {

struct LockHolder {
    std::string owner;
    pid_t pid{0};
    std::string host;
    std::time_t expiresAt{0};
};

// One active migration per destination. The lock is a small JSON file with an expiry,
// read and written under flock; a holder that is past its expiry, or a dead process on
// this host, no longer counts.
class MigrationLock {
public:
    MigrationLock(std::filesystem::path file, std::chrono::seconds ttl);
    ~MigrationLock();

    MigrationLock(const MigrationLock&) = delete;
    MigrationLock& operator=(const MigrationLock&) = delete;

    // Throws MigrationError(ConcurrencyConflict) while another live holder has it.
    void acquire(const std::string& owner);

    // Pushes the expiry out again. Cheap to call often: the file is only rewritten
    // once a tenth of the TTL has passed since the last renewal. Throws
    // MigrationError(ConcurrencyConflict) if another holder took the lock meanwhile.
    void renew();

    void release();

    [[nodiscard]] bool held() const noexcept { return held_; }

    // The live holder, if any.
    static std::optional<LockHolder> holder(const std::filesystem::path& file);

private:
    [[nodiscard]] std::string serialize(std::time_t expiresAt) const;

    std::filesystem::path file_;
    std::chrono::seconds ttl_;
    std::string owner_;
    bool held_ = false;
    std::chrono::steady_clock::time_point lastRenew_{};
};

}
