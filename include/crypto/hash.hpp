#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace sm::crypto::hash {

// Lower-case hex MD5, the digest the transfer protocol checksums with.
std::string md5(std::string_view data);
std::string md5File(const std::filesystem::path& path);

// Length check, then sodium_memcmp.
bool constantTimeEquals(std::string_view a, std::string_view b) noexcept;

std::string generateSecret(size_t length = 64);

}
