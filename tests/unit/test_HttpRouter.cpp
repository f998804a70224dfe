#include <gtest/gtest.h>
#include "SiteHarness.hpp"
#include "protocols/http/Router.hpp"

#include <nlohmann/json.hpp>

using namespace sm;
using namespace sm::test;
using namespace sm::protocols::http;
using json = nlohmann::json;

namespace {

constexpr auto SECRET = "s3cret-for-tests";

}

class HttpRouterTest : public ::testing::Test {
protected:
    TempDir tmp;
    std::unique_ptr<SourceSite> src;
    std::unique_ptr<Router> router;

    void SetUp() override {
        src = std::make_unique<SourceSite>(tmp.path());
        src->settings.update([](dest::Settings& s) { s.migrationSecret = SECRET; });

        src->engine.exec("CREATE TABLE wp_posts (ID INTEGER PRIMARY KEY, post_title TEXT)");
        for (int i = 1; i <= 3; ++i)
            src->engine.exec("INSERT INTO wp_posts VALUES ($1, $2)", {std::to_string(i), "Post " + std::to_string(i)});

        router = std::make_unique<Router>(src->provider);
    }

    static request make(const verb method, const std::string& target, const char* secret = SECRET) {
        request req{method, target, 11};
        if (secret) req.set(SECRET_HEADER, secret);
        return req;
    }

    string_response send(request req) { return router->route(std::move(req)); }

    static json body(const string_response& res) { return json::parse(res.body()); }

    static std::string header(const string_response& res, const field f) {
        const auto it = res.find(f);
        return it == res.end() ? std::string() : std::string(it->value());
    }
};

TEST_F(HttpRouterTest, MissingSecretIsUnauthorized) {
    const auto res = send(make(verb::get, "/config/info", nullptr));
    EXPECT_EQ(res.result(), status::unauthorized);
    EXPECT_EQ(body(res).at("error").at("code"), "auth_failure");
}

TEST_F(HttpRouterTest, WrongSecretIsForbidden) {
    const auto res = send(make(verb::get, "/config/info", "guess"));
    EXPECT_EQ(res.result(), status::forbidden);
    EXPECT_EQ(body(res).at("success"), false);
}

TEST_F(HttpRouterTest, NoConfiguredSecretRejectsEverything) {
    src->settings.update([](dest::Settings& s) { s.migrationSecret.clear(); });
    EXPECT_EQ(send(make(verb::get, "/config/info")).result(), status::forbidden);
}

TEST_F(HttpRouterTest, ServesSiteInfo) {
    const auto res = send(make(verb::get, "/config/info"));
    ASSERT_EQ(res.result(), status::ok);
    EXPECT_EQ(header(res, field::content_type), "application/json");

    const auto info = body(res);
    EXPECT_EQ(info.at("site_url"), "http://old.test");
    EXPECT_EQ(info.at("table_prefix"), "wp_");
}

TEST_F(HttpRouterTest, StreamsRowsByKey) {
    const auto first = body(send(make(verb::get, "/stream/rows?table=wp_posts&batch=2")));
    EXPECT_EQ(first.at("count"), 2);
    EXPECT_EQ(first.at("has_more"), true);
    EXPECT_EQ(first.at("primary_key"), "ID");
    EXPECT_EQ(first.at("last_id"), "2");

    const auto second = body(send(make(verb::get, "/stream/rows?table=wp_posts&batch=2&last_id=2")));
    EXPECT_EQ(second.at("count"), 1);
    EXPECT_EQ(second.at("has_more"), false);
    EXPECT_EQ(second.at("rows").at(0).at("post_title"), "Post 3");
}

TEST_F(HttpRouterTest, ListsTables) {
    const auto res = body(send(make(verb::get, "/scan/database")));
    EXPECT_EQ(res.at("count"), 1);
    EXPECT_EQ(res.at("total_rows"), 3);
    EXPECT_EQ(res.at("tables").at(0).at("name"), "wp_posts");
}

TEST_F(HttpRouterTest, ReportsRequestErrors) {
    auto res = send(make(verb::get, "/stream/schema"));
    EXPECT_EQ(res.result(), status::bad_request);
    EXPECT_EQ(body(res).at("error").at("code"), "invalid_request");

    res = send(make(verb::get, "/stream/schema?table=wp_missing"));
    EXPECT_EQ(res.result(), status::not_found);

    res = send(make(verb::get, "/stream/rows?table=wp_posts&offset=abc"));
    EXPECT_EQ(res.result(), status::bad_request);

    res = send(make(verb::get, "/stream/file?path=../../etc/passwd&start=0&end=10"));
    EXPECT_EQ(body(res).at("error").at("code"), "path_violation");

    res = send(make(verb::get, "/nowhere"));
    EXPECT_EQ(res.result(), status::not_found);

    res = send(make(verb::put, "/config/info"));
    EXPECT_EQ(res.result(), status::method_not_allowed);
}

TEST_F(HttpRouterTest, CorsOnlyForKnownOrigins) {
    auto preflight = make(verb::options, "/config/info", nullptr);
    preflight.set(field::origin, "http://old.test");
    const auto ok = send(std::move(preflight));
    EXPECT_EQ(ok.result(), status::no_content);
    EXPECT_EQ(header(ok, field::access_control_allow_origin), "http://old.test");

    auto stranger = make(verb::options, "/config/info", nullptr);
    stranger.set(field::origin, "https://evil.test");
    const auto denied = send(std::move(stranger));
    EXPECT_EQ(denied.result(), status::no_content);
    EXPECT_TRUE(header(denied, field::access_control_allow_origin).empty());
}

TEST_F(HttpRouterTest, HandshakeRegistersDestinationOrigin) {
    auto before = make(verb::get, "/config/info");
    before.set(field::origin, "https://new.test");
    EXPECT_TRUE(header(send(std::move(before)), field::access_control_allow_origin).empty());

    auto handshake = make(verb::post, "/handshake");
    handshake.set(field::origin, "https://new.test");
    const auto res = send(std::move(handshake));
    ASSERT_EQ(res.result(), status::ok);
    EXPECT_EQ(body(res).at("site_url"), "http://old.test");

    const auto origins = src->settings.get().connectedOrigins;
    ASSERT_EQ(origins.size(), 1u);
    EXPECT_EQ(origins.front(), "https://new.test");

    auto after = make(verb::get, "/config/info");
    after.set(field::origin, "https://new.test");
    EXPECT_EQ(header(send(std::move(after)), field::access_control_allow_origin), "https://new.test");
}
