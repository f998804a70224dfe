#pragma once

#include "serialize/Value.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace sm::serialize {

class DecodeError : public std::runtime_error {
public:
    DecodeError(const std::string& what, size_t offset)
        : std::runtime_error(what + " at offset " + std::to_string(offset)), offset_(offset) {}

    [[nodiscard]] size_t offset() const noexcept { return offset_; }

private:
    size_t offset_;
};

// PHP serialize() format: N; b: i: d: s: a: O:. Lengths are byte counts.
class Codec {
public:
    static constexpr size_t MAX_DEPTH = 128;

    // The whole input must be one value. Throws DecodeError.
    static Value decode(std::string_view data);

    // nullopt when the input is not one well-formed value
    static std::optional<Value> tryDecode(std::string_view data);

    // Lengths and element counts are recomputed from the tree.
    static std::string encode(const Value& value);

    // Cheap structural check, no full parse. Surrounding whitespace is ignored.
    static bool isSerialized(std::string_view data);
};

}
