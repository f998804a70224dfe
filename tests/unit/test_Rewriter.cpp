#include <gtest/gtest.h>
#include "serialize/Codec.hpp"
#include "serialize/Rewriter.hpp"

#include <algorithm>
#include <vector>

using namespace sm::serialize;

class RewriterTest : public ::testing::Test {
protected:
    Rewriter rw{"http://old.test", "https://new.test"};
};

TEST_F(RewriterTest, BuildsSchemeAndSlashVariantsLongestFirst) {
    const auto& pairs = rw.pairs();
    auto has = [&](const std::string& s, const std::string& r) {
        return std::ranges::any_of(pairs, [&](const Rewriter::Pair& p) { return p.search == s && p.replace == r; });
    };
    EXPECT_TRUE(has("http://old.test", "https://new.test"));
    EXPECT_TRUE(has("https://old.test", "https://new.test"));
    EXPECT_TRUE(has("http://old.test/", "https://new.test/"));
    EXPECT_TRUE(has("https://old.test/", "https://new.test/"));

    for (size_t i = 1; i < pairs.size(); ++i)
        EXPECT_GE(pairs[i - 1].search.size(), pairs[i].search.size());
}

TEST_F(RewriterTest, PlainTextReplacement) {
    EXPECT_EQ(rw.rewrite("See http://old.test/about and https://old.test"),
              "See https://new.test/about and https://new.test");
}

TEST_F(RewriterTest, UnrelatedValueIsUnchanged) {
    const std::string v = R"(a:1:{s:1:"k";s:5:"hello";})";
    EXPECT_EQ(rw.rewrite(v), v);
}

TEST_F(RewriterTest, SerializedLengthsAreFixed) {
    const auto in = Codec::encode([] {
        auto v = Value::array();
        v.set(Key::string("siteurl"), Value::string("http://old.test/blog"));
        v.set(Key::integer(3), Value::integer(7));
        return v;
    }());

    const auto out = rw.rewrite(in);
    EXPECT_EQ(out, R"(a:2:{s:7:"siteurl";s:21:"https://new.test/blog";i:3;i:7;})");
    EXPECT_NO_THROW(Codec::decode(out));
}

TEST_F(RewriterTest, NestedSerializedStringIsRewritten) {
    const std::string inner = R"(s:15:"http://old.test";)";
    const std::string outer = "a:1:{i:0;s:" + std::to_string(inner.size()) + ":\"" + inner + "\";}";

    const auto out = rw.rewrite(outer);
    const auto tree = Codec::decode(out);
    const auto* leaf = tree.find(Key::integer(0));
    ASSERT_NE(leaf, nullptr);
    EXPECT_EQ(Codec::decode(leaf->scalar).scalar, "https://new.test");
}

TEST_F(RewriterTest, BrokenSerializedFallsBackToPlain) {
    // declared length is wrong, so this is treated as text
    const std::string broken = R"(s:99:"http://old.test";)";
    EXPECT_EQ(rw.rewrite(broken), R"(s:99:"https://new.test";)");
}

TEST_F(RewriterTest, ImplausibleElementCountFallsBackToPlain) {
    const std::string bogus = R"(a:100000000000000:{i:0;s:15:"http://old.test";})";
    EXPECT_EQ(rw.rewrite(bogus), R"(a:100000000000000:{i:0;s:15:"https://new.test";})");
}

TEST_F(RewriterTest, ReplacementIsNotRescanned) {
    Rewriter chain(std::vector<Rewriter::Pair>{{"a", "ab"}, {"b", "c"}});
    EXPECT_EQ(chain.replacePlain("ab"), "abc");
}
