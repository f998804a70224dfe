#include <gtest/gtest.h>
#include "TestEnv.hpp"
#include "sync/MigrationLock.hpp"
#include "util/errors.hpp"
#include "util/timestamp.hpp"

#include <nlohmann/json.hpp>
#include <unistd.h>

using namespace sm;
using namespace sm::test;
using sm::sync::MigrationLock;
using sm::util::ErrorCode;
using sm::util::MigrationError;

class MigrationLockTest : public ::testing::Test {
protected:
    TempDir tmp;
    fs::path file = tmp / "state" / "migration.lock";
};

TEST_F(MigrationLockTest, SecondOwnerIsRejected) {
    MigrationLock first(file, std::chrono::seconds(600));
    first.acquire("session-a");
    EXPECT_TRUE(first.held());

    MigrationLock second(file, std::chrono::seconds(600));
    try {
        second.acquire("session-b");
        FAIL() << "expected ConcurrencyConflict";
    } catch (const MigrationError& e) {
        EXPECT_EQ(e.code(), ErrorCode::ConcurrencyConflict);
    }
    EXPECT_FALSE(second.held());

    const auto holder = MigrationLock::holder(file);
    ASSERT_TRUE(holder.has_value());
    EXPECT_EQ(holder->owner, "session-a");
    EXPECT_EQ(holder->pid, ::getpid());
}

TEST_F(MigrationLockTest, ReleaseFreesTheLock) {
    {
        MigrationLock first(file, std::chrono::seconds(600));
        first.acquire("session-a");
        first.release();
        EXPECT_FALSE(fs::exists(file));
    }

    MigrationLock second(file, std::chrono::seconds(600));
    EXPECT_NO_THROW(second.acquire("session-b"));
}

TEST_F(MigrationLockTest, DestructorReleases) {
    {
        MigrationLock lock(file, std::chrono::seconds(600));
        lock.acquire("session-a");
    }
    EXPECT_FALSE(MigrationLock::holder(file).has_value());
}

TEST_F(MigrationLockTest, ExpiredHolderNoLongerCounts) {
    const nlohmann::json stale = {
        {"owner", "crashed"}, {"pid", ::getpid()}, {"host", "elsewhere"}, {"expires_at", util::now() - 10}
    };
    writeFile(file, stale.dump());
    EXPECT_FALSE(MigrationLock::holder(file).has_value());

    MigrationLock lock(file, std::chrono::seconds(600));
    EXPECT_NO_THROW(lock.acquire("session-b"));
}

TEST_F(MigrationLockTest, SameOwnerMayReacquire) {
    MigrationLock lock(file, std::chrono::seconds(600));
    lock.acquire("session-a");
    EXPECT_NO_THROW(lock.acquire("session-a"));
}

TEST_F(MigrationLockTest, RenewAfterTakeoverDoesNotOverwrite) {
    // a zero TTL renews on every call
    MigrationLock lock(file, std::chrono::seconds(0));
    lock.acquire("session-a");
    EXPECT_NO_THROW(lock.renew());

    const nlohmann::json other = {
        {"owner", "session-b"}, {"pid", ::getpid() + 1}, {"host", "elsewhere"}, {"expires_at", util::now() + 600}
    };
    writeFile(file, other.dump());

    try {
        lock.renew();
        FAIL() << "expected ConcurrencyConflict";
    } catch (const MigrationError& e) {
        EXPECT_EQ(e.code(), ErrorCode::ConcurrencyConflict);
    }
    EXPECT_FALSE(lock.held());

    lock.release();
    const auto holder = MigrationLock::holder(file);
    ASSERT_TRUE(holder.has_value());
    EXPECT_EQ(holder->owner, "session-b");
}
