#include "transfer/PathGuard.hpp"
#include "util/errors.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>

namespace fs = std::filesystem;
using namespace sm::util;
using namespace sm::logging;

namespace sm::transfer {

namespace {

bool isWithin(const fs::path& root, const fs::path& candidate) {
    auto r = root.begin();
    auto c = candidate.begin();
    for (; r != root.end(); ++r, ++c) {
        if (r->empty()) continue;   // trailing separator
        if (c == candidate.end() || *r != *c) return false;
    }
    return true;
}

}

PathGuard::PathGuard(const fs::path& root) : root_(fs::weakly_canonical(fs::absolute(root))) {}

bool PathGuard::isSafeRelative(const std::string_view relative) noexcept {
    if (relative.empty()) return false;
    if (relative.front() == '/' || relative.front() == '\\') return false;
    if (relative.find('\0') != std::string_view::npos) return false;
    if (relative.find('\\') != std::string_view::npos) return false;

    size_t start = 0;
    while (start <= relative.size()) {
        const auto end = std::min(relative.find('/', start), relative.size());
        if (relative.substr(start, end - start) == "..") return false;
        start = end + 1;
    }
    return true;
}

fs::path PathGuard::resolve(const std::string_view relative) const {
    if (!isSafeRelative(relative)) {
        LogRegistry::files()->warn("[PathGuard::resolve] Rejected path: {}", relative);
        throw MigrationError(ErrorCode::PathViolation, "Unsafe path", std::string(relative));
    }

    const auto joined = (root_ / fs::path(relative)).lexically_normal();

    std::error_code ec;
    const auto resolved = fs::weakly_canonical(joined, ec);
    if (ec) throw MigrationError(ErrorCode::PathViolation, "Path cannot be resolved: " + ec.message(),
                                 std::string(relative));

    if (!isWithin(root_, resolved) || resolved == root_) {
        LogRegistry::files()->warn("[PathGuard::resolve] Path escapes content root: {} -> {}", relative, resolved.string());
        throw MigrationError(ErrorCode::PathViolation, "Path escapes content root", std::string(relative));
    }

    return resolved;
}

bool PathGuard::allows(const std::string_view relative) const noexcept {
    try {
        (void)resolve(relative);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

}
