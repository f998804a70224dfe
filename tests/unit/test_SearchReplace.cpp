#include <gtest/gtest.h>
#include "SiteHarness.hpp"
#include "serialize/Codec.hpp"
#include "sync/SearchReplace.hpp"

using namespace sm;
using namespace sm::test;
using sm::sync::SearchReplace;

class SearchReplaceTest : public ::testing::Test {
protected:
    TempDir tmp;
    std::unique_ptr<DestinationSite> dst;

    void SetUp() override {
        dst = std::make_unique<DestinationSite>(tmp.path());
        auto& e = dst->engine;

        e.exec("CREATE TABLE wp_options (option_id INTEGER PRIMARY KEY, option_name TEXT, option_value TEXT)");
        e.exec("INSERT INTO wp_options VALUES (1, 'siteurl', 'http://old.test')");
        e.exec("INSERT INTO wp_options VALUES (2, 'home', 'http://old.test')");
        e.exec("INSERT INTO wp_options VALUES (3, 'widget', $1)",
               {std::string(R"(a:2:{s:3:"url";s:20:"http://old.test/shop";s:5:"count";i:3;})")});
        e.exec("INSERT INTO wp_options VALUES (4, 'blogname', 'Unrelated')");

        e.exec("CREATE TABLE wp_posts (ID INTEGER PRIMARY KEY, post_content TEXT, guid VARCHAR(255), menu_order INTEGER)");
        for (int i = 1; i <= 5; ++i)
            e.exec("INSERT INTO wp_posts VALUES ($1, $2, $3, 0)",
                   {std::to_string(i), "<a href=\"https://old.test/p/" + std::to_string(i) + "\">x</a>",
                    "http://old.test/?p=" + std::to_string(i)});

        e.exec("CREATE TABLE wp_postmeta (meta_key TEXT, meta_value TEXT)");
        e.exec("INSERT INTO wp_postmeta VALUES ('k', 'http://old.test')");
    }

    std::string value(const std::string& sql) const { return dst->engine.query(sql).front().str("v"); }
};

TEST_F(SearchReplaceTest, RewritesTextColumnsAcrossPages) {
    SearchReplace sr(dst->engine, "wp_", 2);
    const auto stats = sr.run("http://old.test", "https://new.test");

    EXPECT_EQ(stats.tablesProcessed, 3u);
    EXPECT_EQ(stats.rowsChanged, 8u);
    EXPECT_EQ(value("SELECT option_value AS v FROM wp_options WHERE option_id = 1"), "https://new.test");
    EXPECT_EQ(value("SELECT post_content AS v FROM wp_posts WHERE ID = 5"), "<a href=\"https://new.test/p/5\">x</a>");
    EXPECT_EQ(value("SELECT guid AS v FROM wp_posts WHERE ID = 3"), "https://new.test/?p=3");
    EXPECT_EQ(value("SELECT option_value AS v FROM wp_options WHERE option_id = 4"), "Unrelated");
}

TEST_F(SearchReplaceTest, SerializedOptionStaysDecodable) {
    SearchReplace sr(dst->engine, "wp_", 100);
    (void)sr.run("http://old.test", "https://new.test");

    const auto out = value("SELECT option_value AS v FROM wp_options WHERE option_id = 3");
    EXPECT_EQ(out, R"(a:2:{s:3:"url";s:21:"https://new.test/shop";s:5:"count";i:3;})");
    EXPECT_NO_THROW(serialize::Codec::decode(out));
}

TEST_F(SearchReplaceTest, KeylessTableIsReportedAndSkipped) {
    SearchReplace sr(dst->engine, "wp_", 100);
    const auto stats = sr.run("http://old.test", "https://new.test");

    ASSERT_EQ(stats.errors.size(), 1u);
    EXPECT_NE(stats.errors.front().find("wp_postmeta"), std::string::npos);
    EXPECT_EQ(value("SELECT meta_value AS v FROM wp_postmeta"), "http://old.test");
}

TEST_F(SearchReplaceTest, UpdateSiteOptions) {
    SearchReplace sr(dst->engine, "wp_", 100);
    sr.updateSiteOptions("https://elsewhere.test");
    EXPECT_EQ(value("SELECT option_value AS v FROM wp_options WHERE option_name = 'siteurl'"), "https://elsewhere.test");
    EXPECT_EQ(value("SELECT option_value AS v FROM wp_options WHERE option_name = 'home'"), "https://elsewhere.test");
}
