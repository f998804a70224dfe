#include "protocols/http/Router.hpp"
#include "source/Provider.hpp"
#include "util/errors.hpp"
#include "util/parse.hpp"
#include "logging/LogRegistry.hpp"

#include <nlohmann/json.hpp>

#include <charconv>

using namespace sm::protocols::http;
using namespace sm::util;
using namespace sm::logging;

namespace {

const std::string& required(const std::unordered_map<std::string, std::string>& params, const std::string& key) {
    const auto it = params.find(key);
    if (it == params.end() || it->second.empty())
        throw MigrationError(ErrorCode::InvalidRequest, "Missing parameter: " + key);
    return it->second;
}

uint64_t number(const std::unordered_map<std::string, std::string>& params, const std::string& key,
                const uint64_t fallback = 0) {
    const auto it = params.find(key);
    if (it == params.end() || it->second.empty()) return fallback;

    uint64_t out{};
    const auto& s = it->second;
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    if (ec != std::errc() || ptr != s.data() + s.size())
        throw MigrationError(ErrorCode::InvalidRequest, "Invalid number for " + key, s);
    return out;
}

}

Router::Router(source::Provider& provider) : provider_(provider) {}

string_response Router::route(request&& req) {
    const std::string target(req.target());
    const auto path = target_path(target);

    if (req.method() == verb::options) {
        string_response res{status::no_content, req.version()};
        res.keep_alive(req.keep_alive());
        applyCors(req, res);
        res.prepare_payload();
        return res;
    }

    if (req.method() != verb::get && req.method() != verb::post)
        return makeErrorResponse(req, to_string(ErrorCode::InvalidRequest), "Method not allowed",
                                 status::method_not_allowed);

    const auto header = req.find(SECRET_HEADER);
    const auto presented = header == req.end() ? std::nullopt
                                               : std::optional<std::string_view>(std::string_view(header->value().data(),
                                                                                 header->value().size()));

    switch (provider_.authenticate(presented)) {
        case source::AuthResult::Missing: {
            LogRegistry::auth()->warn("[Router] Missing migration secret for {}", path);
            auto res = makeErrorResponse(req, to_string(ErrorCode::AuthFailure), "Migration secret required",
                                         status::unauthorized);
            applyCors(req, res);
            return res;
        }
        case source::AuthResult::Invalid: {
            LogRegistry::auth()->warn("[Router] Invalid migration secret for {} from {}", path, callerOrigin(req));
            auto res = makeErrorResponse(req, to_string(ErrorCode::AuthFailure), "Invalid migration secret",
                                         status::forbidden);
            applyCors(req, res);
            return res;
        }
        case source::AuthResult::Ok:
            break;
    }

    const std::string method(req.method_string());
    string_response res;
    try {
        Params params;
        try {
            params = parse_query_params(target);
        } catch (const std::runtime_error& e) {
            throw MigrationError(ErrorCode::InvalidRequest, e.what(), target);
        }
        res = makeJsonResponse(req, handle(req, path, params));
    } catch (const MigrationError& e) {
        LogRegistry::http()->warn("[Router] {} {}: {}", method, path, e.what());
        res = makeErrorResponse(req, to_string(e.code()), e.what(),
                                static_cast<status>(httpStatusFor(e.code())));
    } catch (const nlohmann::json::exception& e) {
        LogRegistry::http()->warn("[Router] {} {}: malformed parameter: {}", method, path, e.what());
        res = makeErrorResponse(req, to_string(ErrorCode::InvalidRequest), e.what(), status::bad_request);
    } catch (const std::exception& e) {
        LogRegistry::http()->error("[Router] {} {}: {}", method, path, e.what());
        res = makeErrorResponse(req, to_string(ErrorCode::Internal), e.what(), status::internal_server_error);
    }

    applyCors(req, res);
    return res;
}

nlohmann::json Router::handle(const request& req, const std::string& path, const Params& params) {
    const bool get = req.method() == verb::get;

    if (path == "/handshake" && req.method() == verb::post)
        return provider_.handshake(callerOrigin(req));

    if (!get) throw MigrationError(ErrorCode::NotFound, "No such endpoint", path);

    if (path == "/config/info") return provider_.info();

    if (path == "/scan/manifest") return provider_.manifest();

    if (path == "/scan/database") {
        const auto tables = provider_.tables();
        uint64_t total = 0;
        for (const auto& t : tables) total += t.rowCount;
        return {{"tables", tables}, {"total_rows", total}, {"count", tables.size()}};
    }

    if (path == "/stream/schema") {
        const auto& table = required(params, "table");
        return {{"table", table}, {"schema", provider_.schema(table)}};
    }

    if (path == "/stream/rows") {
        types::RowCursor cursor;
        if (const auto it = params.find("last_id"); it != params.end() && !it->second.empty())
            cursor.lastKey = it->second;
        else cursor.offset = number(params, "offset");
        return provider_.rows(required(params, "table"), cursor,
                              static_cast<unsigned int>(number(params, "batch")));
    }

    if (path == "/stream/file")
        return provider_.fileChunk(required(params, "path"), number(params, "start"), number(params, "end"));

    if (path == "/stream/batch") {
        const auto files = nlohmann::json::parse(required(params, "files"));
        if (!files.is_array()) throw MigrationError(ErrorCode::InvalidRequest, "files must be a JSON array");
        return provider_.batch(files.get<std::vector<std::string>>());
    }

    throw MigrationError(ErrorCode::NotFound, "No such endpoint", path);
}

void Router::applyCors(const request& req, string_response& res) const {
    const auto it = req.find(field::origin);
    if (it == req.end()) return;

    const std::string origin(it->value());
    if (!provider_.originAllowed(origin)) {
        LogRegistry::http()->debug("[Router] Origin {} not allowed, omitting CORS headers", origin);
        return;
    }

    res.set(field::access_control_allow_origin, origin);
    res.set(field::vary, "Origin");
    res.set(field::access_control_allow_methods, "GET, POST, OPTIONS");
    res.set(field::access_control_allow_headers, std::string("Content-Type, ") + SECRET_HEADER);
    res.set(field::access_control_max_age, "600");
}

std::string Router::callerOrigin(const request& req) {
    if (const auto it = req.find(field::origin); it != req.end() && !it->value().empty())
        return std::string(it->value());
    if (const auto it = req.find(field::referer); it != req.end())
        return url_origin(std::string_view(it->value().data(), it->value().size()));
    return {};
}

string_response Router::makeJsonResponse(const request& req, const nlohmann::json& j, const status s) {
    string_response res{s, req.version()};
    res.set(field::content_type, "application/json");
    res.set(field::cache_control, "no-store");
    res.body() = j.dump();
    res.prepare_payload();
    res.keep_alive(req.keep_alive());
    return res;
}

string_response Router::makeErrorResponse(const request& req, const std::string& code, const std::string& msg,
                                          const status s) {
    return makeJsonResponse(req, {{"success", false}, {"error", {{"code", code}, {"message", msg}}}}, s);
}
