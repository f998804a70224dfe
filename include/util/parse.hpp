#pragma once

#include <string>
#include <string_view>
#include <unordered_map>

namespace sm::util {

std::unordered_map<std::string, std::string> parse_query_params(const std::string& target);

std::string url_decode(const std::string& value);

// Path component of a request target, without the query string.
std::string target_path(const std::string& target);

// Scheme + host (+ port) of an absolute URL, empty when the input is not one.
std::string url_origin(std::string_view url);

std::string_view trim(std::string_view s);

// Identifiers that may be spliced into SQL: ^[A-Za-z0-9_]+$
bool isSafeIdentifier(std::string_view name) noexcept;

bool isValidUtf8(std::string_view s) noexcept;

}
