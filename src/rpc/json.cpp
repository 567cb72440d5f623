// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "rpc/json.h"

#include <charconv>
#include <cmath>
#include <cstdio>
#include <stdexcept>
#include <type_traits>
#include <variant>

namespace rpc {

namespace {

[[noreturn]] void fail(const std::string& what) {
    throw std::runtime_error("JSON: " + what);
}

template <typename T>
const T& expect_type(const std::variant<NullValue, bool, int64_t, double,
                                        std::string, JsonValue::Array,
                                        JsonValue::Object>& v,
                     const char* name) {
    if (const T* p = std::get_if<T>(&v)) return *p;
    fail(std::string("value is not ") + name);
}

} // namespace

bool JsonValue::get_bool() const { return expect_type<bool>(storage_, "a bool"); }
int64_t JsonValue::get_int() const { return expect_type<int64_t>(storage_, "an integer"); }

double JsonValue::get_double() const {
    if (const auto* i = std::get_if<int64_t>(&storage_)) {
        return static_cast<double>(*i);
    }
    return expect_type<double>(storage_, "a number");
}

const std::string& JsonValue::get_string() const {
    return expect_type<std::string>(storage_, "a string");
}

const JsonValue::Array& JsonValue::get_array() const {
    return expect_type<Array>(storage_, "an array");
}

const JsonValue::Object& JsonValue::get_object() const {
    return expect_type<Object>(storage_, "an object");
}

JsonValue& JsonValue::operator[](const std::string& key) {
    if (is_null()) storage_ = Object{};
    if (!is_object()) fail("indexing a non-object by key");
    return std::get<Object>(storage_)[key];
}

const JsonValue& JsonValue::operator[](const std::string& key) const {
    static const JsonValue missing;
    if (!is_object()) return missing;
    const auto& obj = std::get<Object>(storage_);
    auto it = obj.find(key);
    return it == obj.end() ? missing : it->second;
}

const JsonValue& JsonValue::at(size_t index) const {
    return get_array().at(index);
}

void JsonValue::push_back(JsonValue val) {
    if (is_null()) storage_ = Array{};
    if (!is_array()) fail("appending to a non-array");
    std::get<Array>(storage_).push_back(std::move(val));
}

bool JsonValue::has_key(const std::string& key) const {
    return is_object() && std::get<Object>(storage_).count(key) != 0;
}

size_t JsonValue::size() const {
    return std::visit([](const auto& v) -> size_t {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, Array> || std::is_same_v<T, Object> ||
                      std::is_same_v<T, std::string>) {
            return v.size();
        } else {
            return 0;
        }
    }, storage_);
}

// ---------------------------------------------------------------------------
// Reading
// ---------------------------------------------------------------------------

namespace {

struct Cursor {
    std::string_view text;
    size_t pos = 0;

    bool done() const { return pos >= text.size(); }
    char peek() const { return done() ? '\0' : text[pos]; }

    char next() {
        if (done()) fail("unexpected end of input");
        return text[pos++];
    }

    void skip_ws() {
        while (!done() && (text[pos] == ' ' || text[pos] == '\t' ||
                           text[pos] == '\n' || text[pos] == '\r')) {
            ++pos;
        }
    }

    bool eat(char c) {
        skip_ws();
        if (peek() != c || done()) return false;
        ++pos;
        return true;
    }

    void require(char c) {
        if (!eat(c)) fail(std::string("expected '") + c + "'");
    }

    bool eat_word(std::string_view w) {
        if (text.substr(pos, w.size()) != w) return false;
        pos += w.size();
        return true;
    }

    bool digit() const { return peek() >= '0' && peek() <= '9'; }
    void digits() { while (digit()) ++pos; }
};

JsonValue read_value(Cursor& c, int depth);

uint32_t read_hex4(Cursor& c) {
    uint32_t v = 0;
    for (int i = 0; i < 4; ++i) {
        const char h = c.next();
        int d;
        if (h >= '0' && h <= '9') d = h - '0';
        else if (h >= 'a' && h <= 'f') d = h - 'a' + 10;
        else if (h >= 'A' && h <= 'F') d = h - 'A' + 10;
        else fail("bad \\u escape");
        v = (v << 4) | static_cast<uint32_t>(d);
    }
    return v;
}

void put_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
        return;
    }
    int extra = cp < 0x800 ? 1 : cp < 0x10000 ? 2 : 3;
    static constexpr uint8_t LEAD[] = {0, 0xC0, 0xE0, 0xF0};
    out += static_cast<char>(LEAD[extra] | (cp >> (6 * extra)));
    while (extra-- > 0) {
        out += static_cast<char>(0x80 | ((cp >> (6 * extra)) & 0x3F));
    }
}

std::string read_string(Cursor& c) {
    c.require('"');
    std::string out;
    for (;;) {
        const char ch = c.next();
        if (ch == '"') return out;
        if (static_cast<unsigned char>(ch) < 0x20) fail("raw control character in string");
        if (ch != '\\') {
            out += ch;
            continue;
        }
        const char esc = c.next();
        switch (esc) {
        case '"': case '\\': case '/': out += esc; break;
        case 'b': out += '\b'; break;
        case 'f': out += '\f'; break;
        case 'n': out += '\n'; break;
        case 'r': out += '\r'; break;
        case 't': out += '\t'; break;
        case 'u': {
            uint32_t cp = read_hex4(c);
            if (cp >= 0xD800 && cp <= 0xDBFF) {
                if (!c.eat_word("\\u")) fail("unpaired surrogate");
                const uint32_t low = read_hex4(c);
                if (low < 0xDC00 || low > 0xDFFF) fail("unpaired surrogate");
                cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
            }
            put_utf8(out, cp);
            break;
        }
        default:
            fail(std::string("bad escape \\") + esc);
        }
    }
}

JsonValue read_number(Cursor& c) {
    const size_t start = c.pos;
    if (c.peek() == '-') ++c.pos;
    if (c.peek() == '0') {
        ++c.pos;
    } else if (c.digit()) {
        c.digits();
    } else {
        fail("malformed number");
    }
    bool integral = true;
    if (c.peek() == '.') {
        integral = false;
        ++c.pos;
        if (!c.digit()) fail("malformed fraction");
        c.digits();
    }
    if (c.peek() == 'e' || c.peek() == 'E') {
        integral = false;
        ++c.pos;
        if (c.peek() == '+' || c.peek() == '-') ++c.pos;
        if (!c.digit()) fail("malformed exponent");
        c.digits();
    }

    const char* first = c.text.data() + start;
    const char* last = c.text.data() + c.pos;
    if (integral) {
        int64_t i = 0;
        auto r = std::from_chars(first, last, i);
        if (r.ec == std::errc{} && r.ptr == last) return JsonValue(i);
        // Beyond int64: fall through and keep it as a double.
    }
    double d = 0;
    auto r = std::from_chars(first, last, d);
    if (r.ec != std::errc{} || r.ptr != last) fail("number out of range");
    return JsonValue(d);
}

JsonValue read_value(Cursor& c, int depth) {
    if (depth > MAX_JSON_DEPTH) fail("nesting too deep");
    c.skip_ws();
    switch (c.peek()) {
    case '"':
        return JsonValue(read_string(c));
    case '[': {
        c.require('[');
        JsonValue::Array arr;
        if (c.eat(']')) return JsonValue(std::move(arr));
        do {
            arr.push_back(read_value(c, depth + 1));
        } while (c.eat(','));
        c.require(']');
        return JsonValue(std::move(arr));
    }
    case '{': {
        c.require('{');
        JsonValue::Object obj;
        if (c.eat('}')) return JsonValue(std::move(obj));
        do {
            c.skip_ws();
            std::string key = read_string(c);
            c.require(':');
            obj[std::move(key)] = read_value(c, depth + 1);
        } while (c.eat(','));
        c.require('}');
        return JsonValue(std::move(obj));
    }
    default:
        break;
    }
    if (c.eat_word("true")) return JsonValue(true);
    if (c.eat_word("false")) return JsonValue(false);
    if (c.eat_word("null")) return JsonValue(nullptr);
    if (c.peek() == '-' || c.digit()) return read_number(c);
    if (c.done()) fail("unexpected end of input");
    fail(std::string("unexpected character '") + c.peek() + "'");
}

// ---------------------------------------------------------------------------
// Writing
// ---------------------------------------------------------------------------

class Writer {
public:
    explicit Writer(int indent) : indent_(indent) {}

    void value(const JsonValue& v, int level) {
        if (v.is_array()) {
            const auto& arr = v.get_array();
            open_close('[', ']', arr.empty(), level, [&] {
                for (size_t i = 0; i < arr.size(); ++i) {
                    if (i) out_ += ',';
                    line(level + 1);
                    value(arr[i], level + 1);
                }
            });
        } else if (v.is_object()) {
            const auto& obj = v.get_object();
            open_close('{', '}', obj.empty(), level, [&] {
                bool first = true;
                for (const auto& [key, member] : obj) {
                    if (!first) out_ += ',';
                    first = false;
                    line(level + 1);
                    quoted(key);
                    out_ += indent_ >= 0 ? ": " : ":";
                    value(member, level + 1);
                }
            });
        } else if (v.is_null()) {
            out_ += "null";
        } else if (v.is_bool()) {
            out_ += v.get_bool() ? "true" : "false";
        } else if (v.is_int()) {
            out_ += std::to_string(v.get_int());
        } else if (v.is_double()) {
            real(v.get_double());
        } else {
            quoted(v.get_string());
        }
    }

    std::string take() { return std::move(out_); }

private:
    template <typename Body>
    void open_close(char open, char close, bool empty, int level, Body body) {
        out_ += open;
        if (!empty) {
            body();
            line(level);
        }
        out_ += close;
    }

    void line(int level) {
        if (indent_ < 0) return;
        out_ += '\n';
        out_.append(static_cast<size_t>(indent_ * level), ' ');
    }

    void real(double d) {
        if (!std::isfinite(d)) {
            out_ += "null";
            return;
        }
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.17g", d);
        out_ += buf;
    }

    void quoted(const std::string& s) {
        out_ += '"';
        for (char ch : s) {
            switch (ch) {
            case '"': out_ += "\\\""; break;
            case '\\': out_ += "\\\\"; break;
            case '\n': out_ += "\\n"; break;
            case '\r': out_ += "\\r"; break;
            case '\t': out_ += "\\t"; break;
            case '\b': out_ += "\\b"; break;
            case '\f': out_ += "\\f"; break;
            default:
                if (static_cast<unsigned char>(ch) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x",
                                  static_cast<unsigned>(static_cast<unsigned char>(ch)));
                    out_ += buf;
                } else {
                    out_ += ch;
                }
            }
        }
        out_ += '"';
    }

    int indent_;
    std::string out_;
};

} // namespace

JsonValue parse_json(std::string_view input) {
    Cursor c{input};
    JsonValue v = read_value(c, 0);
    c.skip_ws();
    if (!c.done()) fail("trailing content after value");
    return v;
}

core::Result<JsonValue> try_parse_json(std::string_view input) {
    try {
        return parse_json(input);
    } catch (const std::exception& e) {
        return core::Error(core::ErrorCode::PARSE_BAD_FORMAT, e.what());
    }
}

std::string json_serialize(const JsonValue& val) {
    Writer w(-1);
    w.value(val, 0);
    return w.take();
}

std::string json_serialize_pretty(const JsonValue& val, int indent) {
    Writer w(indent < 0 ? 0 : indent);
    w.value(val, 0);
    return w.take() + '\n';
}

} // namespace rpc
