#include <gtest/gtest.h>
#include "SiteHarness.hpp"
#include "serialize/Codec.hpp"
#include "sync/SmartMerge.hpp"

using namespace sm;
using namespace sm::test;

namespace {

constexpr auto ADMIN_CAPS = R"(a:1:{s:13:"administrator";b:1;})";

}

class SmartMergeTest : public ::testing::Test {
protected:
    TempDir tmp;
    std::unique_ptr<DestinationSite> dst;

    void SetUp() override {
        dst = std::make_unique<DestinationSite>(tmp.path());
        auto& e = dst->engine;

        e.exec("CREATE TABLE wp_users (ID INTEGER PRIMARY KEY, user_login TEXT UNIQUE, user_pass TEXT)");
        e.exec("INSERT INTO wp_users VALUES (7, 'admin', '$P$destination')");
        e.exec("INSERT INTO wp_users VALUES (9, 'stale', '$P$stale')");

        e.exec("CREATE TABLE wp_usermeta (umeta_id INTEGER PRIMARY KEY, user_id INTEGER, meta_key TEXT, meta_value TEXT)");
        e.exec("INSERT INTO wp_usermeta VALUES (1, 7, 'wp_capabilities', $1)", {std::string(ADMIN_CAPS)});
        e.exec("INSERT INTO wp_usermeta VALUES (2, 9, 'wp_capabilities', 'a:0:{}')");

        e.exec("CREATE TABLE wp_options (option_id INTEGER PRIMARY KEY, option_name TEXT UNIQUE, option_value TEXT, "
               "autoload TEXT)");
        e.exec("INSERT INTO wp_options VALUES (1, 'siteurl', 'https://new.test', 'yes')");
        e.exec("INSERT INTO wp_options VALUES (2, 'home', 'https://new.test', 'yes')");
        e.exec("INSERT INTO wp_options VALUES (3, 'admin_email', 'ops@new.test', 'yes')");
        e.exec("INSERT INTO wp_options VALUES (4, 'blogname', 'Destination', 'yes')");

        e.exec("CREATE TABLE wp_posts (ID INTEGER PRIMARY KEY, post_title TEXT)");
        e.exec("INSERT INTO wp_posts VALUES (1, 'destination post')");
    }

    sync::SmartMerge& merge() { return dst->site.smartMerge(); }

    [[nodiscard]] std::string option(const std::string& name) const {
        const auto rows = dst->engine.query("SELECT option_value FROM wp_options WHERE option_name = $1", {name});
        return rows.empty() ? "<missing>" : rows.front().str("option_value");
    }

    static const std::vector<std::string>& allTables() {
        static const std::vector<std::string> t = {"wp_options", "wp_posts", "wp_usermeta", "wp_users", "wp_absent"};
        return t;
    }
};

TEST_F(SmartMergeTest, PrepareKeepsOperatorAndOptions) {
    const auto result = merge().prepare(allTables(), "admin");

    EXPECT_EQ(result.operatorId, std::optional<std::string>("7"));
    EXPECT_EQ(result.dropped, std::vector<std::string>{"wp_posts"});
    EXPECT_TRUE(result.errors.empty());

    EXPECT_FALSE(dst->engine.tableExists("wp_posts"));
    EXPECT_EQ(dst->engine.countRows("wp_users"), 1u);
    EXPECT_EQ(dst->engine.query("SELECT user_login FROM wp_users").front().str("user_login"), "admin");
    EXPECT_EQ(dst->engine.countRows("wp_usermeta"), 1u);
    EXPECT_EQ(dst->engine.countRows("wp_options"), 4u);
}

TEST_F(SmartMergeTest, PrepareWithoutOperatorEmptiesAccounts) {
    const auto result = merge().prepare(allTables(), "");
    EXPECT_FALSE(result.operatorId.has_value());
    EXPECT_EQ(dst->engine.countRows("wp_users"), 0u);
    EXPECT_EQ(dst->engine.countRows("wp_usermeta"), 0u);

    // the first administrator was still captured
    const auto snap = dst->snapshots.get(sync::SmartMerge::SNAPSHOT_KEY);
    ASSERT_TRUE(snap.has_value());
    EXPECT_EQ(snap->at("account").at("user_login"), "admin");
}

TEST_F(SmartMergeTest, RestorePutsProtectedOptionsBack) {
    (void)merge().prepare(allTables(), "admin");

    // what the source's rows and the URL rewrite would leave behind
    dst->engine.exec("UPDATE wp_options SET option_value = 'http://old.test' WHERE option_name IN ('siteurl', 'home')");
    dst->engine.exec("DELETE FROM wp_options WHERE option_name = 'admin_email'");
    dst->engine.exec("UPDATE wp_options SET option_value = 'Source Blog' WHERE option_name = 'blogname'");

    const auto restored = merge().restore();
    EXPECT_TRUE(restored.snapshotFound);
    EXPECT_EQ(restored.optionsRestored, 3u);
    EXPECT_FALSE(restored.accountRestored);

    EXPECT_EQ(option("siteurl"), "https://new.test");
    EXPECT_EQ(option("home"), "https://new.test");
    EXPECT_EQ(option("admin_email"), "ops@new.test");
    EXPECT_EQ(option("blogname"), "Source Blog");

    EXPECT_FALSE(dst->snapshots.get(sync::SmartMerge::SNAPSHOT_KEY).has_value());
}

TEST_F(SmartMergeTest, LostOperatorIsRecreatedAsAdministrator) {
    (void)merge().prepare(allTables(), "admin");

    // source data replaced the account tables wholesale
    dst->engine.exec("DELETE FROM wp_users");
    dst->engine.exec("DELETE FROM wp_usermeta");
    dst->engine.exec("INSERT INTO wp_users VALUES (7, 'someone_else', '$P$source')");

    const auto restored = merge().restore();
    EXPECT_TRUE(restored.accountRestored);

    const auto admin = merge().findAccount("admin");
    ASSERT_TRUE(admin.has_value());
    EXPECT_EQ(admin->str("user_pass"), "$P$destination");
    EXPECT_NE(admin->str("ID"), "7");

    const auto caps = dst->engine.query("SELECT meta_value FROM wp_usermeta WHERE user_id = $1 AND meta_key = $2",
                                        {admin->str("ID"), std::string("wp_capabilities")});
    ASSERT_EQ(caps.size(), 1u);
    EXPECT_EQ(caps.front().str("meta_value"), ADMIN_CAPS);
    ASSERT_TRUE(merge().firstAdministrator().has_value());
}

TEST_F(SmartMergeTest, RecreatedAccountSyncsKeySequenceBeforeTakingNewId) {
    InstrumentedEngine engine(dst->engine);
    sync::SmartMerge recording(engine, dst->cfg.smart_merge, dst->snapshots, "wp_");
    (void)recording.prepare(allTables(), "admin");

    dst->engine.exec("DELETE FROM wp_users");
    dst->engine.exec("INSERT INTO wp_users VALUES (1, 'first', '$P$source')");
    dst->engine.exec("INSERT INTO wp_users VALUES (7, 'someone_else', '$P$source')");
    engine.synced.clear();

    EXPECT_TRUE(recording.restore().accountRestored);
    EXPECT_EQ(engine.synced, (std::vector<std::string>{"wp_users"}));

    const auto admin = recording.findAccount("admin");
    ASSERT_TRUE(admin.has_value());
    EXPECT_EQ(admin->str("ID"), "8");
}

TEST_F(SmartMergeTest, SnapshotFromEarlierAttemptIsReused) {
    const auto first = merge().snapshot("admin");
    dst->engine.exec("UPDATE wp_options SET option_value = 'changed' WHERE option_name = 'admin_email'");
    const auto second = merge().snapshot("admin");
    EXPECT_EQ(first, second);
    EXPECT_EQ(second.at("options").at("admin_email"), "ops@new.test");
}
