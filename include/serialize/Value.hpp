#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace sm::serialize {

// Array keys are either integers or byte strings; object property names are always strings.
struct Key {
    bool isInt{false};
    std::string text;       // decimal digits when isInt, raw bytes otherwise

    static Key integer(int64_t k) { return {true, std::to_string(k)}; }
    static Key string(std::string k) { return {false, std::move(k)}; }

    bool operator==(const Key&) const = default;
};

struct Member;

// One node of a decoded PHP-serialized value. Scalars keep their textual form so
// that re-encoding an untouched tree reproduces the input byte for byte.
struct Value {
    enum class Kind { Null, Bool, Int, Float, String, Array, Object };

    Kind kind{Kind::Null};
    std::string scalar;             // Bool "0"/"1", Int and Float text, String bytes
    std::string className;          // Object only
    std::vector<Member> members;    // Array and Object, in encounter order

    static Value null() { return {}; }
    static Value boolean(bool b);
    static Value integer(int64_t i);
    static Value string(std::string s);
    static Value array();
    static Value object(std::string cls);

    [[nodiscard]] bool isContainer() const noexcept { return kind == Kind::Array || kind == Kind::Object; }

    Value& set(Key key, Value v);

    // nullptr when no member has that key
    [[nodiscard]] const Value* find(const Key& key) const;

    bool operator==(const Value&) const;
};

struct Member {
    Key key;
    Value value;

    bool operator==(const Member&) const = default;
};

inline Value Value::boolean(const bool b) { Value v; v.kind = Kind::Bool; v.scalar = b ? "1" : "0"; return v; }
inline Value Value::integer(const int64_t i) { Value v; v.kind = Kind::Int; v.scalar = std::to_string(i); return v; }
inline Value Value::string(std::string s) { Value v; v.kind = Kind::String; v.scalar = std::move(s); return v; }
inline Value Value::array() { Value v; v.kind = Kind::Array; return v; }
inline Value Value::object(std::string cls) { Value v; v.kind = Kind::Object; v.className = std::move(cls); return v; }

inline Value& Value::set(Key key, Value v) {
    members.push_back({std::move(key), std::move(v)});
    return members.back().value;
}

inline const Value* Value::find(const Key& key) const {
    for (const auto& m : members)
        if (m.key == key) return &m.value;
    return nullptr;
}

inline bool Value::operator==(const Value& o) const {
    return kind == o.kind && scalar == o.scalar && className == o.className && members == o.members;
}

}
