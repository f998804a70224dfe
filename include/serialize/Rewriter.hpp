#pragma once

#include "serialize/Value.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace sm::serialize {

// URL substitution that keeps PHP-serialized payloads well formed.
class Rewriter {
public:
    struct Pair {
        std::string search;
        std::string replace;
    };

    // Bare URL, URL with trailing slash, and both the http and https spelling of each.
    Rewriter(std::string_view sourceUrl, std::string_view destinationUrl);

    explicit Rewriter(std::vector<Pair> pairs);

    [[nodiscard]] const std::vector<Pair>& pairs() const noexcept { return pairs_; }

    // Single left-to-right pass; at each position the longest matching search wins and
    // the inserted replacement is never scanned again.
    [[nodiscard]] std::string replacePlain(std::string_view s) const;

    // Serialized input is decoded, rewritten leaf by leaf and re-encoded with fresh
    // lengths; anything that does not decode gets replacePlain().
    [[nodiscard]] std::string rewrite(std::string_view value) const;

    // Walks a decoded tree with an explicit worklist. Returns true when any leaf changed.
    bool rewriteTree(Value& root, size_t depth = 0) const;

    [[nodiscard]] bool mayMatch(std::string_view s) const;

private:
    std::string rewriteAt(std::string_view value, size_t depth) const;

    std::vector<Pair> pairs_;
    std::string firstChars_;
};

}
