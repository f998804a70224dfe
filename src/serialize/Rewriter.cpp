#include "serialize/Rewriter.hpp"
#include "serialize/Codec.hpp"
#include "util/parse.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <unordered_set>

using namespace sm::logging;

namespace sm::serialize {

namespace {

std::string withScheme(std::string_view url, const std::string_view scheme) {
    for (const std::string_view s : {"https://", "http://"})
        if (url.starts_with(s)) return std::string(scheme) + std::string(url.substr(s.size()));
    return std::string(url);
}

std::string stripTrailingSlash(std::string_view url) {
    while (!url.empty() && url.back() == '/') url.remove_suffix(1);
    return std::string(url);
}

}

Rewriter::Rewriter(const std::string_view sourceUrl, const std::string_view destinationUrl) {
    const auto src = stripTrailingSlash(sourceUrl);
    const auto dst = stripTrailingSlash(destinationUrl);

    std::vector<Pair> pairs;
    for (const auto& [s, d] : std::vector<std::pair<std::string, std::string>>{
             {src, dst},
             {withScheme(src, "http://"), withScheme(dst, "http://")},
             {withScheme(src, "https://"), withScheme(dst, "https://")}}) {
        pairs.push_back({s, d});
        pairs.push_back({s + "/", d + "/"});
    }

    *this = Rewriter(std::move(pairs));
}

Rewriter::Rewriter(std::vector<Pair> pairs) {
    for (auto& p : pairs) {
        if (p.search.empty() || p.search == p.replace) continue;
        const bool dup = std::ranges::any_of(pairs_, [&](const Pair& q) { return q.search == p.search; });
        if (!dup) pairs_.push_back(std::move(p));
    }

    std::ranges::stable_sort(pairs_, [](const Pair& a, const Pair& b) { return a.search.size() > b.search.size(); });

    for (const auto& p : pairs_)
        if (firstChars_.find(p.search.front()) == std::string::npos) firstChars_.push_back(p.search.front());
}

bool Rewriter::mayMatch(const std::string_view s) const {
    return std::ranges::any_of(pairs_, [&](const Pair& p) { return s.find(p.search) != std::string_view::npos; });
}

std::string Rewriter::replacePlain(const std::string_view s) const {
    if (pairs_.empty()) return std::string(s);

    std::string out;
    out.reserve(s.size());

    size_t i = 0;
    while (i < s.size()) {
        const auto next = s.find_first_of(firstChars_, i);
        if (next == std::string_view::npos) {
            out.append(s.substr(i));
            break;
        }
        out.append(s.substr(i, next - i));
        i = next;

        const Pair* hit = nullptr;
        for (const auto& p : pairs_) {
            if (s.compare(i, p.search.size(), p.search) == 0) {
                hit = &p;
                break;
            }
        }

        if (hit) {
            out.append(hit->replace);
            i += hit->search.size();
        } else {
            out.push_back(s[i]);
            ++i;
        }
    }
    return out;
}

std::string Rewriter::rewrite(const std::string_view value) const {
    if (!mayMatch(value)) return std::string(value);
    return rewriteAt(value, 0);
}

std::string Rewriter::rewriteAt(const std::string_view value, const size_t depth) const {
    const auto core = util::trim(value);
    if (!Codec::isSerialized(core) || depth > Codec::MAX_DEPTH) return replacePlain(value);

    auto tree = Codec::tryDecode(core);
    if (!tree) {
        LogRegistry::rewrite()->debug("[Rewriter::rewrite] Value looks serialized but does not decode, "
                                      "falling back to plain replacement");
        return replacePlain(value);
    }

    if (!rewriteTree(*tree, depth)) return std::string(value);

    const auto lead = static_cast<size_t>(core.data() - value.data());
    const auto trail = value.size() - lead - core.size();
    return std::string(value.substr(0, lead)) + Codec::encode(*tree) + std::string(value.substr(lead + core.size(), trail));
}

bool Rewriter::rewriteTree(Value& root, const size_t depth) const {
    struct Item {
        Value* node;
        size_t depth;
    };

    bool changed = false;
    std::vector<Item> work{{&root, depth}};
    std::unordered_set<const Value*> visited;

    while (!work.empty()) {
        const auto [node, d] = work.back();
        work.pop_back();

        if (!visited.insert(node).second) continue;
        if (d > Codec::MAX_DEPTH) {
            LogRegistry::rewrite()->warn("[Rewriter::rewriteTree] Depth limit reached, leaving subtree untouched");
            continue;
        }

        if (node->kind == Value::Kind::String) {
            if (!mayMatch(node->scalar)) continue;
            auto next = rewriteAt(node->scalar, d + 1);
            if (next != node->scalar) {
                node->scalar = std::move(next);
                changed = true;
            }
            continue;
        }

        if (node->isContainer())
            for (auto it = node->members.rbegin(); it != node->members.rend(); ++it)
                work.push_back({&it->value, d + 1});
    }

    return changed;
}

}
