#include <gtest/gtest.h>
#include "SiteHarness.hpp"
#include "sync/Migration.hpp"
#include "sync/MigrationLock.hpp"
#include "sync/PauseToken.hpp"
#include "sync/SessionStore.hpp"
#include "util/errors.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <thread>

using namespace sm;
using namespace sm::test;
using sm::sync::Migration;
using sm::sync::MigrationLock;
using sm::sync::PauseToken;
using sm::sync::SessionStore;
using sm::types::Phase;
using sm::util::ErrorCode;
using sm::util::MigrationError;

namespace {

constexpr auto ADMIN_CAPS = R"(a:1:{s:13:"administrator";b:1;})";

void createSiteTables(db::Engine& e) {
    e.exec("CREATE TABLE wp_users (ID INTEGER PRIMARY KEY, user_login TEXT UNIQUE, user_pass TEXT)");
    e.exec("CREATE TABLE wp_usermeta (umeta_id INTEGER PRIMARY KEY, user_id INTEGER, meta_key TEXT, meta_value TEXT)");
    e.exec("CREATE TABLE wp_options (option_id INTEGER PRIMARY KEY, option_name TEXT UNIQUE, option_value TEXT, "
           "autoload TEXT)");
}

}

class MigrationTest : public ::testing::Test {
protected:
    TempDir tmp;
    std::unique_ptr<SourceSite> src;
    std::unique_ptr<DestinationSite> dst;
    std::unique_ptr<RecordingSource> source;
    std::unique_ptr<SessionStore> store;
    std::unique_ptr<MigrationLock> lock;
    PauseToken token;

    void SetUp() override {
        src = std::make_unique<SourceSite>(tmp / "src");
        dst = std::make_unique<DestinationSite>(tmp / "dst");
        source = std::make_unique<RecordingSource>(src->provider);
        store = std::make_unique<SessionStore>(dst->cfg.site.sessionFile());
        lock = std::make_unique<MigrationLock>(dst->cfg.site.lockFile(), dst->cfg.transfer.lock_timeout);
    }

    [[nodiscard]] Migration migration() {
        return {dst->cfg, dst->site, *source, *store, *lock, token};
    }

    static types::SourceEndpoint endpoint() { return {"http://old.test", "c2VjcmV0"}; }

    [[nodiscard]] std::string option(const std::string& name) const {
        const auto rows = dst->engine.query("SELECT option_value FROM wp_options WHERE option_name = $1", {name});
        return rows.empty() ? "<missing>" : rows.front().str("option_value");
    }

    // A source with accounts, options, posts and content; a destination with its own
    // operator account and site options.
    void seedSites() {
        auto& s = src->engine;
        createSiteTables(s);
        s.exec("INSERT INTO wp_users VALUES (7, 'admin', '$P$source')");
        s.exec("INSERT INTO wp_users VALUES (8, 'editor', '$P$editor')");
        s.exec("INSERT INTO wp_usermeta VALUES (20, 8, 'wp_capabilities', 'a:1:{s:6:\"editor\";b:1;}')");
        s.exec("INSERT INTO wp_options VALUES (1, 'siteurl', 'http://old.test', 'yes')");
        s.exec("INSERT INTO wp_options VALUES (2, 'home', 'http://old.test', 'yes')");
        s.exec("INSERT INTO wp_options VALUES (10, 'blogname', 'Source Blog', 'yes')");
        s.exec("CREATE TABLE wp_posts (ID INTEGER PRIMARY KEY, post_content TEXT)");
        s.exec("INSERT INTO wp_posts VALUES (1, 'see http://old.test/about')");
        s.exec("INSERT INTO wp_posts VALUES (2, 'plain text')");
        s.exec("INSERT INTO wp_posts VALUES (3, 'img http://old.test/wp-content/uploads/a.jpg')");

        const auto& content = src->cfg.site.content_root;
        writeFile(content / "uploads" / "2024" / "a.jpg", "jpeg");
        writeFile(content / "themes" / "t" / "style.css", std::string(150, 'c'));

        auto& d = dst->engine;
        createSiteTables(d);
        d.exec("INSERT INTO wp_users VALUES (7, 'admin', '$P$destination')");
        d.exec("INSERT INTO wp_users VALUES (9, 'stale', '$P$stale')");
        d.exec("INSERT INTO wp_usermeta VALUES (1, 7, 'wp_capabilities', $1)", {std::string(ADMIN_CAPS)});
        d.exec("INSERT INTO wp_options VALUES (1, 'siteurl', 'https://new.test', 'yes')");
        d.exec("INSERT INTO wp_options VALUES (2, 'home', 'https://new.test', 'yes')");
        d.exec("INSERT INTO wp_options VALUES (3, 'admin_email', 'ops@new.test', 'yes')");
    }

    // wp_t01 .. wp_t10, one row each except wp_t03.
    void seedNumberedTables() {
        for (int i = 1; i <= 10; ++i) {
            const auto table = fmt::format("wp_t{:02}", i);
            src->engine.exec(fmt::format("CREATE TABLE {} (id INTEGER PRIMARY KEY, v TEXT)", table));
            if (i != 3) src->engine.exec(fmt::format("INSERT INTO {} VALUES (1, 'row')", table));
        }
        for (const auto id : {1, 2, 4500, 4501, 4502})
            src->engine.exec("INSERT INTO wp_t03 VALUES ($1, 'row')", {std::to_string(id)});
    }

    [[nodiscard]] uint64_t sourceRowTotal() const {
        uint64_t total = 0;
        for (const auto& t : src->engine.listTables("wp_")) total += src->engine.countRows(t);
        return total;
    }
};

TEST_F(MigrationTest, SmartMergeMigrationKeepsOperatorAndRewritesUrls) {
    seedSites();

    Migration::Options options;
    options.operatorLogin = "admin";
    const auto session = migration().start(endpoint(), options);

    EXPECT_EQ(session.phase, Phase::Complete) << session.lastError;
    EXPECT_EQ(session.tablePrefixSource, "wp_");
    EXPECT_EQ(session.totalTables, 4u);
    EXPECT_EQ(session.totalFiles, 2u);
    EXPECT_EQ(session.stats.filesTransferred, 2u);
    EXPECT_EQ(session.stats.filesFailed, 0u);
    EXPECT_FALSE(store->exists());
    EXPECT_FALSE(lock->held());
    EXPECT_FALSE(MigrationLock::holder(dst->cfg.site.lockFile()).has_value());

    // operator account untouched, stale account gone, source account arrived
    const auto admin = dst->engine.query("SELECT user_pass FROM wp_users WHERE \"ID\" = $1", {std::string("7")});
    ASSERT_EQ(admin.size(), 1u);
    EXPECT_EQ(admin.front().str("user_pass"), "$P$destination");
    EXPECT_TRUE(dst->engine.query("SELECT 1 AS x FROM wp_users WHERE \"ID\" = $1", {std::string("9")}).empty());
    EXPECT_EQ(dst->engine.query("SELECT user_login FROM wp_users WHERE \"ID\" = $1", {std::string("8")})
                  .front().str("user_login"), "editor");

    EXPECT_EQ(option("siteurl"), "https://new.test");
    EXPECT_EQ(option("home"), "https://new.test");
    EXPECT_EQ(option("admin_email"), "ops@new.test");
    EXPECT_EQ(option("blogname"), "Source Blog");

    const auto post = dst->engine.query("SELECT post_content FROM wp_posts WHERE \"ID\" = $1", {std::string("1")});
    ASSERT_EQ(post.size(), 1u);
    EXPECT_EQ(post.front().str("post_content"), "see https://new.test/about");
    EXPECT_EQ(dst->engine.countRows("wp_posts"), 3u);

    const auto& content = dst->cfg.site.content_root;
    EXPECT_EQ(readFile(content / "uploads" / "2024" / "a.jpg"), "jpeg");
    EXPECT_EQ(readFile(content / "themes" / "t" / "style.css"), std::string(150, 'c'));
}

TEST_F(MigrationTest, ResumesFromPersistedTableAndKey) {
    seedNumberedTables();

    // the first two tables and part of the third arrived before the interruption
    for (int i = 1; i <= 3; ++i)
        dst->engine.exec(fmt::format("CREATE TABLE wp_t{:02} (id INTEGER PRIMARY KEY, v TEXT)", i));
    dst->engine.exec("INSERT INTO wp_t01 VALUES (1, 'row')");
    dst->engine.exec("INSERT INTO wp_t02 VALUES (1, 'row')");
    for (const auto id : {1, 2, 4500})
        dst->engine.exec("INSERT INTO wp_t03 VALUES ($1, 'row')", {std::to_string(id)});

    types::Session persisted;
    persisted.id = "resume-test";
    persisted.phase = Phase::Paused;
    persisted.resumePhase = Phase::TransferringDatabase;
    persisted.source = endpoint();
    persisted.tablePrefixSource = "wp_";
    persisted.tablePrefixDest = "wp_";
    persisted.flags.paused = true;
    persisted.databaseCursor = {2, 3, "4500"};
    store->save(persisted);

    const auto session = migration().resume();
    EXPECT_EQ(session.phase, Phase::Complete) << session.lastError;
    EXPECT_EQ(session.id, "resume-test");

    for (const auto& t : {"wp_t01", "wp_t02", "wp_t03"})
        EXPECT_EQ(std::ranges::count(source->schemaCalls, std::string(t)), 0) << t;

    ASSERT_FALSE(source->rowsCalls.empty());
    EXPECT_EQ(source->rowsCalls.front().table, "wp_t03");
    EXPECT_EQ(source->rowsCalls.front().cursor.lastKey, std::optional<std::string>("4500"));

    EXPECT_EQ(dst->engine.countRows("wp_t03"), 5u);
    for (int i = 4; i <= 10; ++i) {
        const auto table = fmt::format("wp_t{:02}", i);
        EXPECT_TRUE(dst->engine.tableExists(table)) << table;
        EXPECT_EQ(dst->engine.countRows(table), 1u) << table;
    }
    EXPECT_EQ(session.stats.rowsTransferred, 2u + 7u);
    EXPECT_FALSE(store->exists());
}

TEST_F(MigrationTest, StopSuspendsAndResumeFinishes) {
    seedNumberedTables();
    source->afterRows = [this](const types::RowBatch&) {
        if (source->rowsCalls.size() == 2) token.stop();
    };

    const auto stopped = migration().start(endpoint());
    EXPECT_EQ(stopped.phase, Phase::Paused);
    EXPECT_EQ(stopped.resumePhase, Phase::TransferringDatabase);
    EXPECT_TRUE(stopped.flags.paused);
    EXPECT_FALSE(lock->held());

    const auto persisted = store->load();
    ASSERT_TRUE(persisted.has_value());
    EXPECT_EQ(persisted->phase, Phase::Paused);
    EXPECT_TRUE(persisted->databaseCursor.hasProgress());

    source->afterRows = nullptr;
    token.resume();
    const auto finished = migration().resume();
    EXPECT_EQ(finished.phase, Phase::Complete) << finished.lastError;
    EXPECT_EQ(finished.id, stopped.id);

    for (const auto& t : src->engine.listTables("wp_"))
        EXPECT_EQ(dst->engine.countRows(t), src->engine.countRows(t)) << t;
    EXPECT_EQ(finished.stats.rowsTransferred, sourceRowTotal());
}

TEST_F(MigrationTest, CancelClearsSession) {
    seedNumberedTables();
    source->afterRows = [this](const types::RowBatch&) { token.cancel(); };

    const auto session = migration().start(endpoint());
    EXPECT_EQ(session.phase, Phase::Cancelled);
    EXPECT_TRUE(session.flags.cancelled);
    EXPECT_EQ(session.resumePhase, Phase::TransferringDatabase);
    EXPECT_FALSE(store->exists());
    EXPECT_FALSE(lock->held());

    try {
        (void)migration().resume();
        FAIL() << "expected NotFound";
    } catch (const MigrationError& e) {
        EXPECT_EQ(e.code(), ErrorCode::NotFound);
    }
}

TEST_F(MigrationTest, PauseWaitsInPlaceUntilResumed) {
    seedNumberedTables();

    Phase seenWhilePaused = Phase::Idle;
    std::thread resumer;
    source->afterRows = [&](const types::RowBatch&) {
        if (source->rowsCalls.size() != 1) return;
        token.pause();
        resumer = std::thread([&] {
            for (int i = 0; i < 500; ++i) {
                if (const auto s = store->load(); s && s->phase == Phase::Paused) {
                    seenWhilePaused = s->phase;
                    break;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
            token.resume();
        });
    };

    const auto session = migration().start(endpoint());
    resumer.join();

    EXPECT_EQ(seenWhilePaused, Phase::Paused);
    EXPECT_EQ(session.phase, Phase::Complete) << session.lastError;
    EXPECT_FALSE(session.flags.paused);
    EXPECT_EQ(session.stats.rowsTransferred, sourceRowTotal());
}

TEST_F(MigrationTest, RefusesWhileAnotherMigrationHoldsTheLock) {
    seedNumberedTables();
    MigrationLock other(dst->cfg.site.lockFile(), dst->cfg.transfer.lock_timeout);
    other.acquire("someone-else");

    try {
        (void)migration().start(endpoint());
        FAIL() << "expected ConcurrencyConflict";
    } catch (const MigrationError& e) {
        EXPECT_EQ(e.code(), ErrorCode::ConcurrencyConflict);
    }
    EXPECT_TRUE(source->rowsCalls.empty());
}

TEST_F(MigrationTest, RefusesToStartOverResumableSession) {
    seedNumberedTables();
    source->afterRows = [this](const types::RowBatch&) { token.stop(); };
    (void)migration().start(endpoint());
    ASSERT_TRUE(store->exists());

    token.resume();
    try {
        (void)migration().start(endpoint());
        FAIL() << "expected ConcurrencyConflict";
    } catch (const MigrationError& e) {
        EXPECT_EQ(e.code(), ErrorCode::ConcurrencyConflict);
    }
}

TEST_F(MigrationTest, FatalErrorLeavesResumableSession) {
    seedNumberedTables();
    source->beforeTables = [] { throw MigrationError(ErrorCode::AuthFailure, "Invalid secret"); };

    const auto failed = migration().start(endpoint());
    EXPECT_EQ(failed.phase, Phase::Error);
    EXPECT_EQ(failed.resumePhase, Phase::Scanning);
    EXPECT_EQ(failed.lastError, "Invalid secret");
    ASSERT_FALSE(failed.stats.errorLog.empty());
    EXPECT_EQ(failed.stats.errorLog.back().code, ErrorCode::AuthFailure);
    EXPECT_FALSE(lock->held());

    const auto persisted = store->load();
    ASSERT_TRUE(persisted.has_value());
    EXPECT_TRUE(persisted->resumable());

    source->beforeTables = nullptr;
    const auto resumed = migration().resume();
    EXPECT_EQ(resumed.phase, Phase::Complete) << resumed.lastError;
    EXPECT_TRUE(resumed.lastError.empty());
}
