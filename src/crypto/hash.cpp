#include "crypto/hash.hpp"

#include <openssl/evp.h>
#include <sodium.h>

#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace sm::crypto::hash {

namespace {

using MdCtx = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

MdCtx newMd5() {
    MdCtx ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1)
        throw std::runtime_error("Failed to initialise MD5 digest");
    return ctx;
}

std::string finish(EVP_MD_CTX* ctx) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx, digest, &len) != 1) throw std::runtime_error("Failed to finalise MD5 digest");

    std::ostringstream result;
    for (unsigned int i = 0; i < len; ++i)
        result << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
    return result.str();
}

}

std::string md5(const std::string_view data) {
    const auto ctx = newMd5();
    if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1)
        throw std::runtime_error("Failed to update MD5 digest");
    return finish(ctx.get());
}

std::string md5File(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) throw std::runtime_error("Failed to open file for hashing: " + path.string());

    const auto ctx = newMd5();
    char buffer[8192];
    while (file.good()) {
        file.read(buffer, sizeof(buffer));
        EVP_DigestUpdate(ctx.get(), buffer, static_cast<size_t>(file.gcount()));
    }
    return finish(ctx.get());
}

bool constantTimeEquals(const std::string_view a, const std::string_view b) noexcept {
    if (a.size() != b.size()) return false;
    if (a.empty()) return true;
    return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
}

std::string generateSecret(const size_t length) {
    if (sodium_init() < 0) throw std::runtime_error("libsodium failed to initialize");

    constexpr std::string_view alphabet =
        "abcdefghijklmnopqrstuvwxyz"
        "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
        "0123456789"
        "!@#$%^&*()";

    std::string secret;
    secret.reserve(length);
    for (size_t i = 0; i < length; ++i) secret.push_back(alphabet[randombytes_uniform(alphabet.size())]);
    return secret;
}

}
