#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace sm::crypto::base64 {

std::string encode(std::string_view data);

// Throws util::MigrationError(InvalidRequest) on malformed input.
std::string decode(std::string_view b64);

std::optional<std::string> tryDecode(std::string_view b64);

}
