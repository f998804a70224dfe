#pragma once

#include "source/SourceApi.hpp"
#include "util/RetryPolicy.hpp"

#include <chrono>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace sm::config { struct TransferConfig; }

namespace sm::source {

// SourceApi over HTTP(S). Network failures, timeouts and 5xx answers are retried with
// exponential backoff; everything else surfaces immediately.
class HttpClient final : public SourceApi {
public:
    using Query = std::vector<std::pair<std::string, std::string>>;

    HttpClient(std::string baseUrl, std::string secret, const config::TransferConfig& transfer);

    types::SourceInfo handshake() override;
    types::SourceInfo info() override;
    types::Manifest manifest() override;
    std::vector<types::TableDescriptor> tables() override;
    std::string schema(const std::string& table) override;
    types::RowBatch rows(const std::string& table, const types::RowCursor& cursor, unsigned int batchSize) override;
    types::Chunk fileChunk(const std::string& path, uint64_t start, uint64_t end) override;
    types::ArchiveBatch batch(const std::vector<std::string>& paths) override;

    // Tests substitute a sleeper that records instead of waiting.
    void setSleeper(util::RetryPolicy::Sleeper sleeper);

    // Sent as the Origin header, so the source lists this destination among its connected origins.
    void setOrigin(std::string origin) { origin_ = std::move(origin); }

    [[nodiscard]] const std::string& baseUrl() const noexcept { return baseUrl_; }

private:
    nlohmann::json request(const std::string& method, const std::string& path, const Query& query,
                           const util::RetryPolicy& policy) const;
    nlohmann::json once(const std::string& method, const std::string& path, const Query& query) const;

    std::string baseUrl_;
    std::string secret_;
    std::string origin_;
    std::chrono::seconds timeout_;
    util::RetryPolicy metadataPolicy_;
    util::RetryPolicy chunkPolicy_;
};

}
