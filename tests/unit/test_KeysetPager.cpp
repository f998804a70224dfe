#include <gtest/gtest.h>
#include "db/KeysetPager.hpp"
#include "db/SqliteEngine.hpp"
#include "util/errors.hpp"

#include <fmt/format.h>

using namespace sm::db;
using namespace sm::types;
using sm::util::ErrorCode;
using sm::util::MigrationError;

class KeysetPagerTest : public ::testing::Test {
protected:
    SqliteEngine engine{":memory:"};

    void SetUp() override {
        engine.exec("CREATE TABLE wp_posts (ID INTEGER PRIMARY KEY, post_title TEXT)");
        for (int i = 1; i <= 5; ++i)
            engine.exec("INSERT INTO wp_posts (ID, post_title) VALUES ($1, $2)",
                        {std::to_string(i * 10), fmt::format("Post {}", i)});

        engine.exec("CREATE TABLE wp_log (message TEXT)");
        for (int i = 0; i < 3; ++i) engine.exec("INSERT INTO wp_log (message) VALUES ($1)", {fmt::format("m{}", i)});
    }
};

TEST_F(KeysetPagerTest, DetectsDeclaredPrimaryKey) {
    EXPECT_EQ(KeysetPager::detectPrimaryKey(engine.columns("wp_posts")), std::optional<std::string>("ID"));
    EXPECT_FALSE(KeysetPager::detectPrimaryKey(engine.columns("wp_log")).has_value());
}

TEST_F(KeysetPagerTest, FallsBackToConventionalKeyName) {
    const std::vector<Column> cols{{"meta_key", "text", 0, false}, {"user_id", "integer", 0, false}};
    EXPECT_EQ(KeysetPager::detectPrimaryKey(cols), std::optional<std::string>("user_id"));
}

// An undeclared key: the auto-increment column wins over an unrelated column named id.
TEST_F(KeysetPagerTest, AutoIncrementBeatsConventionalName) {
    const std::vector<Column> cols{{"id", "text", 0, false}, {"seq", "integer", 0, true}};
    EXPECT_EQ(KeysetPager::detectPrimaryKey(cols), std::optional<std::string>("seq"));
}

TEST_F(KeysetPagerTest, CompositeKeyPagesOnFirstColumn) {
    const std::vector<Column> cols{{"b", "integer", 2, false}, {"a", "integer", 1, false}};
    EXPECT_EQ(KeysetPager::detectPrimaryKey(cols), std::optional<std::string>("a"));
}

TEST_F(KeysetPagerTest, WalksKeyedTableInPages) {
    KeysetPager pager(engine);

    auto p1 = pager.fetch("wp_posts", {}, 2);
    ASSERT_EQ(p1.rows.size(), 2u);
    EXPECT_TRUE(p1.hasMore);
    EXPECT_EQ(p1.rows[0].str("ID"), "10");
    EXPECT_EQ(p1.nextCursor.lastKey, std::optional<std::string>("20"));

    auto p2 = pager.fetch("wp_posts", p1.nextCursor, 2);
    ASSERT_EQ(p2.rows.size(), 2u);
    EXPECT_EQ(p2.rows[0].str("ID"), "30");

    auto p3 = pager.fetch("wp_posts", p2.nextCursor, 2);
    ASSERT_EQ(p3.rows.size(), 1u);
    EXPECT_FALSE(p3.hasMore);
    EXPECT_EQ(p3.rows[0].str("post_title"), "Post 5");
    EXPECT_EQ(p3.nextCursor.offset, 5u);
}

TEST_F(KeysetPagerTest, ResumesAfterGivenKey) {
    KeysetPager pager(engine);
    RowCursor cursor;
    cursor.lastKey = "30";
    const auto page = pager.fetch("wp_posts", cursor, 10);
    ASSERT_EQ(page.rows.size(), 2u);
    EXPECT_EQ(page.rows[0].str("ID"), "40");
    EXPECT_FALSE(page.hasMore);
}

TEST_F(KeysetPagerTest, KeylessTableUsesOffset) {
    KeysetPager pager(engine);
    const auto p1 = pager.fetch("wp_log", {}, 2);
    EXPECT_FALSE(p1.primaryKey.has_value());
    EXPECT_EQ(p1.rows.size(), 2u);
    EXPECT_EQ(p1.nextCursor.offset, 2u);

    const auto p2 = pager.fetch("wp_log", p1.nextCursor, 2);
    EXPECT_EQ(p2.rows.size(), 1u);
    EXPECT_FALSE(p2.hasMore);
}

TEST_F(KeysetPagerTest, RejectsUnsafeAndMissingTables) {
    KeysetPager pager(engine);
    try {
        (void)pager.fetch("wp_posts; DROP TABLE wp_posts", {}, 2);
        FAIL() << "expected InvalidRequest";
    } catch (const MigrationError& e) {
        EXPECT_EQ(e.code(), ErrorCode::InvalidRequest);
    }

    try {
        (void)pager.fetch("wp_missing", {}, 2);
        FAIL() << "expected NotFound";
    } catch (const MigrationError& e) {
        EXPECT_EQ(e.code(), ErrorCode::NotFound);
    }
}

TEST_F(KeysetPagerTest, NonUtf8ValuesAreBase64OnTheWire) {
    Row row;
    row.fields.push_back({"data", std::string("\xff\xfe", 2)});
    row.fields.push_back({"title", std::string("plain")});
    row.fields.push_back({"empty", std::nullopt});

    const auto wire = KeysetPager::encode(row);
    ASSERT_EQ(wire.size(), 3u);
    EXPECT_TRUE(wire[0].base64);
    EXPECT_EQ(wire[0].value, std::optional<std::string>("//4="));
    EXPECT_FALSE(wire[1].base64);
    EXPECT_FALSE(wire[2].value.has_value());
}
