#pragma once

#include <boost/beast/http.hpp>
#include <nlohmann/json_fwd.hpp>

#include <string>
#include <unordered_map>

namespace sm::source { class Provider; }

namespace sm::protocols::http {

using request = boost::beast::http::request<boost::beast::http::string_body>;
using string_response = boost::beast::http::response<boost::beast::http::string_body>;

using field = boost::beast::http::field;
using verb = boost::beast::http::verb;
using status = boost::beast::http::status;

inline constexpr const char* SECRET_HEADER = "X-Migration-Secret";

// Maps the source read API onto a Provider.
class Router {
public:
    explicit Router(source::Provider& provider);

    string_response route(request&& req);

private:
    using Params = std::unordered_map<std::string, std::string>;

    nlohmann::json handle(const request& req, const std::string& path, const Params& params);

    void applyCors(const request& req, string_response& res) const;

    static std::string callerOrigin(const request& req);

    static string_response makeJsonResponse(const request& req, const nlohmann::json& j, status s = status::ok);
    static string_response makeErrorResponse(const request& req, const std::string& code, const std::string& msg,
                                             status s);

    source::Provider& provider_;
};

}
