#include "source/HttpClient.hpp"
#include "config/Config.hpp"
#include "util/curlWrappers.hpp"
#include "logging/LogRegistry.hpp"

#include <fmt/format.h>
#include <nlohmann/json.hpp>

using namespace sm::util;
using namespace sm::logging;

namespace sm::source {

namespace {

ErrorCode codeForStatus(const long status) {
    if (status == 401 || status == 403) return ErrorCode::AuthFailure;
    if (status == 404) return ErrorCode::NotFound;
    if (status == 409) return ErrorCode::ConcurrencyConflict;
    if (status >= 500 || status == 408 || status == 429) return ErrorCode::TransientNetworkFailure;
    return ErrorCode::InvalidRequest;
}

// Error bodies look like {"success": false, "error": {"code": "...", "message": "..."}}.
std::string errorMessage(const std::string& body) {
    const auto j = nlohmann::json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object() || !j.contains("error")) return body.substr(0, 200);
    const auto& err = j.at("error");
    if (err.is_string()) return err.get<std::string>();
    if (err.is_object()) return err.value("message", std::string{});
    return body.substr(0, 200);
}

RetryPolicy makePolicy(const unsigned int retries, const config::TransferConfig& t) {
    RetryPolicy p;
    p.maxRetries = retries;
    p.baseDelay = t.retry_base;
    p.maxDelay = t.retry_cap;
    return p;
}

}

HttpClient::HttpClient(std::string baseUrl, std::string secret, const config::TransferConfig& transfer)
    : baseUrl_(std::move(baseUrl)), secret_(std::move(secret)), timeout_(transfer.request_timeout),
      metadataPolicy_(makePolicy(transfer.max_retries, transfer)),
      chunkPolicy_(makePolicy(transfer.chunk_max_retries, transfer)) {
    while (!baseUrl_.empty() && baseUrl_.back() == '/') baseUrl_.pop_back();
}

void HttpClient::setSleeper(RetryPolicy::Sleeper sleeper) {
    metadataPolicy_.sleep = sleeper;
    chunkPolicy_.sleep = std::move(sleeper);
}

nlohmann::json HttpClient::once(const std::string& method, const std::string& path, const Query& query) const {
    CurlEasy escaper;
    std::string url = baseUrl_ + path;
    for (size_t i = 0; i < query.size(); ++i)
        url += fmt::format("{}{}={}", i == 0 ? '?' : '&', query[i].first, escaper.escape(query[i].second));

    SList headers;
    headers.add("X-Migration-Secret: " + secret_);
    headers.add("Accept: application/json");
    if (!origin_.empty()) headers.add("Origin: " + origin_);

    const auto resp = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
        curl_easy_setopt(h, CURLOPT_TIMEOUT, static_cast<long>(timeout_.count()));
        curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT, 30L);
        if (method == "POST") {
            curl_easy_setopt(h, CURLOPT_POST, 1L);
            curl_easy_setopt(h, CURLOPT_POSTFIELDS, "");
        }
    });

    if (resp.curl != CURLE_OK)
        throw MigrationError(ErrorCode::TransientNetworkFailure,
                             fmt::format("Request failed: {}", resp.error), method + " " + path);

    if (!resp.ok())
        throw MigrationError(codeForStatus(resp.http),
                             fmt::format("HTTP {}: {}", resp.http, errorMessage(resp.body)), method + " " + path);

    auto j = nlohmann::json::parse(resp.body, nullptr, false);
    if (j.is_discarded())
        throw MigrationError(ErrorCode::TransientNetworkFailure, "Malformed JSON response", method + " " + path);
    return j;
}

nlohmann::json HttpClient::request(const std::string& method, const std::string& path, const Query& query,
                                   const RetryPolicy& policy) const {
    return policy.run([&] { return once(method, path, query); }, {ErrorCode::TransientNetworkFailure},
                      [&](const unsigned int attempt, const MigrationError& e) {
                          LogRegistry::http()->warn("[HttpClient::request] {} {} failed ({}), retry {}/{} in {} ms",
                                                    method, path, e.what(), attempt, policy.maxRetries,
                                                    policy.delayFor(attempt - 1).count());
                          if (retryObserver_) retryObserver_(attempt, e);
                      });
}

types::SourceInfo HttpClient::handshake() {
    return request("POST", "/handshake", {}, metadataPolicy_).get<types::SourceInfo>();
}

types::SourceInfo HttpClient::info() {
    return request("GET", "/config/info", {}, metadataPolicy_).get<types::SourceInfo>();
}

types::Manifest HttpClient::manifest() {
    return request("GET", "/scan/manifest", {}, metadataPolicy_).get<types::Manifest>();
}

std::vector<types::TableDescriptor> HttpClient::tables() {
    return request("GET", "/scan/database", {}, metadataPolicy_).at("tables").get<std::vector<types::TableDescriptor>>();
}

std::string HttpClient::schema(const std::string& table) {
    return request("GET", "/stream/schema", {{"table", table}}, metadataPolicy_).at("schema").get<std::string>();
}

types::RowBatch HttpClient::rows(const std::string& table, const types::RowCursor& cursor,
                                 const unsigned int batchSize) {
    Query q{{"table", table}, {"batch", std::to_string(batchSize)}};
    if (cursor.lastKey) q.emplace_back("last_id", *cursor.lastKey);
    else if (cursor.offset > 0) q.emplace_back("offset", std::to_string(cursor.offset));

    auto batch = request("GET", "/stream/rows", q, metadataPolicy_).get<types::RowBatch>();
    // The source reports the next offset; keep our own running count when it does not.
    if (batch.nextCursor.offset == 0) batch.nextCursor.offset = cursor.offset + batch.count();
    return batch;
}

types::Chunk HttpClient::fileChunk(const std::string& path, const uint64_t start, const uint64_t end) {
    Query q{{"path", path}, {"start", std::to_string(start)}};
    if (end > 0) q.emplace_back("end", std::to_string(end));
    return request("GET", "/stream/file", q, chunkPolicy_).get<types::Chunk>();
}

types::ArchiveBatch HttpClient::batch(const std::vector<std::string>& paths) {
    return request("GET", "/stream/batch", {{"files", nlohmann::json(paths).dump()}}, chunkPolicy_)
        .get<types::ArchiveBatch>();
}

}
