#pragma once

#include <filesystem>
#include <string_view>

namespace sm::transfer {

// Confines relative paths received over the wire to one content root.
class PathGuard {
public:
    explicit PathGuard(const std::filesystem::path& root);

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

    // Absolute path inside the root, symlinks resolved.
    // Throws MigrationError(PathViolation) for absolute paths, '..' components,
    // NUL bytes, or anything that resolves outside the root.
    [[nodiscard]] std::filesystem::path resolve(std::string_view relative) const;

    [[nodiscard]] bool allows(std::string_view relative) const noexcept;

    // Lexical checks only.
    static bool isSafeRelative(std::string_view relative) noexcept;

private:
    std::filesystem::path root_;
};

}
