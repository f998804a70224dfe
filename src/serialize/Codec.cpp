#include "serialize/Codec.hpp"
#include "util/parse.hpp"

#include <charconv>
#include <vector>
#include <fmt/format.h>

namespace sm::serialize {

namespace {

class Parser {
public:
    explicit Parser(const std::string_view in) : in_(in) {}

    // Containers are walked with an explicit stack of open frames.
    Value parseDocument() {
        std::vector<Frame> open;
        Key key;

        for (;;) {
            if (open.size() > Codec::MAX_DEPTH) fail("Nesting too deep");

            size_t count = 0;
            Value v = parseHead(count);

            if (v.isContainer() && count > 0) {
                open.push_back({std::move(v), count, std::move(key)});
            } else {
                if (v.isContainer()) expect('}');

                // attach the finished value, closing every frame it completes
                for (;;) {
                    if (open.empty()) {
                        if (pos_ != in_.size()) fail("Trailing data after value");
                        return v;
                    }
                    auto& top = open.back();
                    top.value.members.push_back({std::move(key), std::move(v)});
                    if (--top.remaining > 0) break;

                    expect('}');
                    v = std::move(top.value);
                    key = std::move(top.key);
                    open.pop_back();
                }
            }

            key = parseKey();
            if (open.back().value.kind == Value::Kind::Object && key.isInt)
                fail("Object property names must be strings");
        }
    }

private:
    struct Frame {
        Value value;
        size_t remaining;
        Key key;            // under which the finished value joins its parent
    };

    // smallest member is i:0;N;
    static constexpr size_t MIN_MEMBER_BYTES = 6;

    [[noreturn]] void fail(const std::string& what) const { throw DecodeError(what, pos_); }

    [[nodiscard]] char peek() const {
        if (pos_ >= in_.size()) fail("Unexpected end of input");
        return in_[pos_];
    }

    void expect(const char c) {
        if (peek() != c) fail(fmt::format("Expected '{}'", c));
        ++pos_;
    }

    size_t readLength() {
        const auto start = pos_;
        while (pos_ < in_.size() && in_[pos_] >= '0' && in_[pos_] <= '9') ++pos_;
        if (pos_ == start) fail("Expected length");

        size_t n = 0;
        const auto [ptr, ec] = std::from_chars(in_.data() + start, in_.data() + pos_, n);
        if (ec != std::errc{}) fail("Length out of range");
        return n;
    }

    std::string readIntText() {
        const auto start = pos_;
        if (pos_ < in_.size() && (in_[pos_] == '-' || in_[pos_] == '+')) ++pos_;
        const auto digits = pos_;
        while (pos_ < in_.size() && in_[pos_] >= '0' && in_[pos_] <= '9') ++pos_;
        if (pos_ == digits) fail("Expected integer");
        return std::string(in_.substr(start, pos_ - start));
    }

    std::string readQuoted(const size_t len) {
        expect('"');
        if (in_.size() - pos_ < len) fail("String length exceeds input");
        std::string s(in_.substr(pos_, len));
        pos_ += len;
        expect('"');
        return s;
    }

    // Consumes the opening brace; the element count must fit in what is left.
    void openMembers(const size_t count) {
        expect('{');
        if (count > (in_.size() - pos_) / MIN_MEMBER_BYTES) fail("Element count exceeds input");
    }

    Key parseKey() {
        const char c = peek();
        if (c == 'i') {
            pos_ += 1;
            expect(':');
            auto k = readIntText();
            expect(';');
            return {true, std::move(k)};
        }
        if (c == 's') {
            pos_ += 1;
            expect(':');
            const auto len = readLength();
            expect(':');
            auto k = readQuoted(len);
            expect(';');
            return {false, std::move(k)};
        }
        fail("Invalid array key");
    }

    // A scalar is read whole. For a, O the header through '{' is read and count is set.
    Value parseHead(size_t& count) {
        Value v;
        switch (peek()) {
            case 'N':
                ++pos_;
                expect(';');
                return v;
            case 'b': {
                ++pos_;
                expect(':');
                const char c = peek();
                if (c != '0' && c != '1') fail("Invalid boolean");
                ++pos_;
                expect(';');
                v.kind = Value::Kind::Bool;
                v.scalar = std::string(1, c);
                return v;
            }
            case 'i':
                ++pos_;
                expect(':');
                v.kind = Value::Kind::Int;
                v.scalar = readIntText();
                expect(';');
                return v;
            case 'd': {
                ++pos_;
                expect(':');
                const auto start = pos_;
                while (pos_ < in_.size() && in_[pos_] != ';') ++pos_;
                if (pos_ == start) fail("Expected float");
                v.kind = Value::Kind::Float;
                v.scalar = std::string(in_.substr(start, pos_ - start));
                for (const char c : v.scalar)
                    if (!((c >= '0' && c <= '9') || c == '.' || c == 'e' || c == 'E' || c == '-' || c == '+' ||
                          c == 'I' || c == 'N' || c == 'F' || c == 'A'))
                        fail("Invalid float");
                expect(';');
                return v;
            }
            case 's': {
                ++pos_;
                expect(':');
                const auto len = readLength();
                expect(':');
                v.kind = Value::Kind::String;
                v.scalar = readQuoted(len);
                expect(';');
                return v;
            }
            case 'a': {
                ++pos_;
                expect(':');
                count = readLength();
                expect(':');
                v.kind = Value::Kind::Array;
                openMembers(count);
                return v;
            }
            case 'O': {
                ++pos_;
                expect(':');
                const auto nameLen = readLength();
                expect(':');
                v.kind = Value::Kind::Object;
                v.className = readQuoted(nameLen);
                expect(':');
                count = readLength();
                expect(':');
                openMembers(count);
                return v;
            }
            default:
                fail(fmt::format("Unsupported type tag '{}'", peek()));
        }
    }

    std::string_view in_;
    size_t pos_ = 0;
};

void encodeKey(const Key& k, std::string& out) {
    if (k.isInt) out += fmt::format("i:{};", k.text);
    else out += fmt::format("s:{}:\"{}\";", k.text.size(), k.text);
}

void encodeInto(const Value& v, std::string& out, const size_t depth) {
    if (depth > Codec::MAX_DEPTH) throw std::length_error("Serialized value nesting too deep to encode");

    switch (v.kind) {
        case Value::Kind::Null: out += "N;"; return;
        case Value::Kind::Bool: out += fmt::format("b:{};", v.scalar == "1" ? "1" : "0"); return;
        case Value::Kind::Int: out += fmt::format("i:{};", v.scalar); return;
        case Value::Kind::Float: out += fmt::format("d:{};", v.scalar); return;
        case Value::Kind::String: out += fmt::format("s:{}:\"{}\";", v.scalar.size(), v.scalar); return;
        case Value::Kind::Array: out += fmt::format("a:{}:{{", v.members.size()); break;
        case Value::Kind::Object:
            out += fmt::format("O:{}:\"{}\":{}:{{", v.className.size(), v.className, v.members.size());
            break;
    }

    for (const auto& m : v.members) {
        encodeKey(m.key, out);
        encodeInto(m.value, out, depth + 1);
    }
    out += '}';
}

bool matchesHeader(const std::string_view d, const bool numberThenSemicolon) {
    // ^X:[0-9]+:  or  ^X:[0-9.E-]+;$
    size_t i = 2;
    const auto start = i;
    if (numberThenSemicolon) {
        while (i < d.size() && ((d[i] >= '0' && d[i] <= '9') || d[i] == '.' || d[i] == 'E' || d[i] == '-')) ++i;
        return i > start && i == d.size() - 1 && d[i] == ';';
    }
    while (i < d.size() && d[i] >= '0' && d[i] <= '9') ++i;
    return i > start && i < d.size() && d[i] == ':';
}

}

Value Codec::decode(const std::string_view data) {
    return Parser(data).parseDocument();
}

std::optional<Value> Codec::tryDecode(const std::string_view data) {
    try {
        return decode(data);
    } catch (const DecodeError&) {
        return std::nullopt;
    }
}

std::string Codec::encode(const Value& value) {
    std::string out;
    encodeInto(value, out, 0);
    return out;
}

bool Codec::isSerialized(const std::string_view data) {
    const auto d = util::trim(data);

    if (d == "N;") return true;
    if (d.size() < 4) return false;
    if (d[1] != ':') return false;

    const char last = d.back();
    if (last != ';' && last != '}') return false;

    switch (d[0]) {
        case 's': return d[d.size() - 2] == '"' && matchesHeader(d, false);
        case 'a':
        case 'O': return matchesHeader(d, false);
        case 'b':
        case 'i':
        case 'd': return matchesHeader(d, true);
        default: return false;
    }
}

}
