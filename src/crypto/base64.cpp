#include "crypto/base64.hpp"
#include "util/errors.hpp"

#include <sodium.h>
#include <cstring>

namespace sm::crypto::base64 {

std::string encode(const std::string_view data) {
    const size_t encoded_len = sodium_base64_ENCODED_LEN(data.size(), sodium_base64_VARIANT_ORIGINAL);
    std::string result(encoded_len, '\0');

    sodium_bin2base64(result.data(), result.size(),
                      reinterpret_cast<const unsigned char*>(data.data()), data.size(),
                      sodium_base64_VARIANT_ORIGINAL);

    result.resize(std::strlen(result.c_str())); // Trim null terminator
    return result;
}

std::optional<std::string> tryDecode(const std::string_view b64) {
    std::string decoded(b64.size() / 4 * 3 + 3, '\0');
    size_t out_len = 0;
    const char* end = nullptr;
    if (sodium_base642bin(reinterpret_cast<unsigned char*>(decoded.data()), decoded.size(),
                          b64.data(), b64.size(),
                          "\r\n", &out_len, &end,
                          sodium_base64_VARIANT_ORIGINAL) != 0)
        return std::nullopt;
    if (end != b64.data() + b64.size()) return std::nullopt;
    decoded.resize(out_len);
    return decoded;
}

std::string decode(const std::string_view b64) {
    auto decoded = tryDecode(b64);
    if (!decoded) throw util::MigrationError(util::ErrorCode::InvalidRequest, "Invalid base64 payload");
    return std::move(*decoded);
}

}
