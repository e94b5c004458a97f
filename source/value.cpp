// value.cpp - Record value printing and JSON text conversion

#include <record_patch/value.h>
#include <record_patch/builders.h>
#include <record_patch/errors.h>
#include <record_patch/json_pointer.h>

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdio>

namespace record_patch {

std::string path_to_string(const Path& path)
{
    if (path.empty()) {
        return "/";
    }
    std::string result;
    for (const auto& elem : path) {
        result += '/';
        if (auto* key = std::get_if<std::string>(&elem)) {
            result += escape_token(*key);
        } else {
            result += std::to_string(std::get<std::size_t>(elem));
        }
    }
    return result;
}

void print_value(const Value& val, const std::string& prefix, std::size_t depth)
{
    const std::string pad(depth * 2, ' ');

    if (auto* m = val.get_if<ValueMap>()) {
        std::vector<std::string> keys;
        for (const auto& [k, v] : *m) {
            keys.push_back(k);
        }
        std::sort(keys.begin(), keys.end());
        for (const auto& k : keys) {
            const Value& member = m->find(k)->get();
            if (member.is_map() || member.is_vector()) {
                std::cout << pad << prefix << k << ":\n";
                print_value(member, "", depth + 1);
            } else {
                std::cout << pad << prefix << k << ": " << to_json(member) << "\n";
            }
        }
        return;
    }

    if (auto* v = val.get_if<ValueVector>()) {
        for (std::size_t i = 0; i < v->size(); ++i) {
            const Value& elem = (*v)[i].get();
            if (elem.is_map() || elem.is_vector()) {
                std::cout << pad << prefix << "- [" << i << "]\n";
                print_value(elem, "", depth + 1);
            } else {
                std::cout << pad << prefix << "- " << to_json(elem) << "\n";
            }
        }
        return;
    }

    std::cout << pad << prefix << to_json(val) << "\n";
}

// ============================================================
// JSON writer
// ============================================================

namespace {

class JsonWriter
{
public:
    explicit JsonWriter(bool compact) : compact_(compact) {}

    void write(const Value& val)
    {
        std::visit([this](const auto& arg) { write_alternative(arg); }, val.data);
    }

    std::string take() { return std::move(out_); }

private:
    void write_alternative(std::monostate) { out_ += "null"; }
    void write_alternative(bool b) { out_ += b ? "true" : "false"; }
    void write_alternative(int64_t n) { out_ += std::to_string(n); }

    void write_alternative(double d)
    {
        if (!std::isfinite(d)) {
            out_ += "null";
            return;
        }
        char buf[32];
        auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), d);
        out_.append(buf, end);
    }

    void write_alternative(const std::string& s) { write_string(s); }

    void write_alternative(const ValueMap& m)
    {
        if (m.empty()) {
            out_ += "{}";
            return;
        }
        // immer::map iterates in hash order
        std::vector<const std::string*> keys;
        keys.reserve(m.size());
        for (const auto& [k, v] : m) {
            keys.push_back(&k);
        }
        std::sort(keys.begin(), keys.end(),
                  [](const std::string* a, const std::string* b) { return *a < *b; });

        out_ += '{';
        ++depth_;
        for (std::size_t i = 0; i < keys.size(); ++i) {
            if (i > 0) out_ += ',';
            newline();
            write_string(*keys[i]);
            out_ += compact_ ? ":" : ": ";
            write(m.find(*keys[i])->get());
        }
        --depth_;
        newline();
        out_ += '}';
    }

    void write_alternative(const ValueVector& v)
    {
        if (v.empty()) {
            out_ += "[]";
            return;
        }
        out_ += '[';
        ++depth_;
        for (std::size_t i = 0; i < v.size(); ++i) {
            if (i > 0) out_ += ',';
            newline();
            write(v[i].get());
        }
        --depth_;
        newline();
        out_ += ']';
    }

    void write_string(const std::string& s)
    {
        out_ += '"';
        for (char c : s) {
            switch (c) {
            case '"':  out_ += "\\\""; break;
            case '\\': out_ += "\\\\"; break;
            case '\b': out_ += "\\b"; break;
            case '\f': out_ += "\\f"; break;
            case '\n': out_ += "\\n"; break;
            case '\r': out_ += "\\r"; break;
            case '\t': out_ += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    out_ += buf;
                } else {
                    out_ += c;
                }
            }
        }
        out_ += '"';
    }

    void newline()
    {
        if (compact_) return;
        out_ += '\n';
        out_.append(depth_ * 2, ' ');
    }

    std::string out_;
    bool compact_;
    std::size_t depth_ = 0;
};

// ============================================================
// JSON reader
//
// Strict RFC 8259 text. Integers that fit int64 stay integers,
// every other number is a double. Errors throw SyntaxError.
// ============================================================

class JsonReader
{
public:
    explicit JsonReader(std::string_view text) : text_(text) {}

    Value read_document()
    {
        skip_ws();
        if (at_end()) {
            fail("empty JSON text");
        }
        Value result = read_value(0);
        skip_ws();
        if (!at_end()) {
            fail("unexpected text after the JSON value");
        }
        return result;
    }

private:
    static constexpr std::size_t max_depth = 512;

    [[noreturn]] void fail(const std::string& what) const
    {
        throw SyntaxError(what + " at offset " + std::to_string(pos_));
    }

    bool at_end() const { return pos_ >= text_.size(); }
    char peek() const { return at_end() ? '\0' : text_[pos_]; }

    void skip_ws()
    {
        while (!at_end()) {
            char c = text_[pos_];
            if (c != ' ' && c != '\t' && c != '\n' && c != '\r') break;
            ++pos_;
        }
    }

    void require(char c)
    {
        if (peek() != c) {
            fail(std::string("expected '") + c + "'");
        }
        ++pos_;
    }

    void require_word(std::string_view word)
    {
        if (text_.substr(pos_, word.size()) != word) {
            fail("invalid literal");
        }
        pos_ += word.size();
    }

    Value read_value(std::size_t depth)
    {
        if (depth > max_depth) {
            fail("nesting too deep");
        }
        skip_ws();
        switch (peek()) {
        case '{': return read_object(depth);
        case '[': return read_array(depth);
        case '"': return Value{read_string()};
        case 't': require_word("true"); return Value{true};
        case 'f': require_word("false"); return Value{false};
        case 'n': require_word("null"); return Value{};
        default:
            if (peek() == '-' || (peek() >= '0' && peek() <= '9')) {
                return read_number();
            }
            fail("unexpected character");
        }
    }

    Value read_object(std::size_t depth)
    {
        require('{');
        auto members = ValueMap{}.transient();
        skip_ws();
        if (peek() == '}') {
            ++pos_;
            return Value{members.persistent()};
        }
        for (;;) {
            skip_ws();
            std::string key = read_string();
            skip_ws();
            require(':');
            members.set(std::move(key), ValueBox{read_value(depth + 1)});
            skip_ws();
            if (peek() == ',') {
                ++pos_;
                continue;
            }
            require('}');
            return Value{members.persistent()};
        }
    }

    Value read_array(std::size_t depth)
    {
        require('[');
        auto elements = ValueVector{}.transient();
        skip_ws();
        if (peek() == ']') {
            ++pos_;
            return Value{elements.persistent()};
        }
        for (;;) {
            elements.push_back(ValueBox{read_value(depth + 1)});
            skip_ws();
            if (peek() == ',') {
                ++pos_;
                continue;
            }
            require(']');
            return Value{elements.persistent()};
        }
    }

    unsigned read_hex4()
    {
        if (pos_ + 4 > text_.size()) {
            fail("truncated \\u escape");
        }
        unsigned code = 0;
        auto [ptr, ec] = std::from_chars(text_.data() + pos_, text_.data() + pos_ + 4, code, 16);
        if (ec != std::errc{} || ptr != text_.data() + pos_ + 4) {
            fail("invalid \\u escape");
        }
        pos_ += 4;
        return code;
    }

    static void append_utf8(std::string& out, unsigned cp)
    {
        if (cp < 0x80) {
            out += static_cast<char>(cp);
        } else if (cp < 0x800) {
            out += static_cast<char>(0xC0 | (cp >> 6));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else if (cp < 0x10000) {
            out += static_cast<char>(0xE0 | (cp >> 12));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else {
            out += static_cast<char>(0xF0 | (cp >> 18));
            out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
    }

    std::string read_string()
    {
        require('"');
        std::string out;
        for (;;) {
            if (at_end()) {
                fail("unterminated string");
            }
            char c = text_[pos_++];
            if (c == '"') {
                return out;
            }
            if (static_cast<unsigned char>(c) < 0x20) {
                fail("control character in string");
            }
            if (c != '\\') {
                out += c;
                continue;
            }
            if (at_end()) {
                fail("unterminated string");
            }
            switch (text_[pos_++]) {
            case '"':  out += '"'; break;
            case '\\': out += '\\'; break;
            case '/':  out += '/'; break;
            case 'b':  out += '\b'; break;
            case 'f':  out += '\f'; break;
            case 'n':  out += '\n'; break;
            case 'r':  out += '\r'; break;
            case 't':  out += '\t'; break;
            case 'u': {
                unsigned cp = read_hex4();
                if (cp >= 0xDC00 && cp <= 0xDFFF) {
                    fail("invalid surrogate");
                }
                // a high surrogate must start a pair
                if (cp >= 0xD800 && cp < 0xDC00) {
                    if (text_.substr(pos_, 2) != "\\u") {
                        fail("invalid surrogate");
                    }
                    pos_ += 2;
                    unsigned low = read_hex4();
                    if (low < 0xDC00 || low > 0xDFFF) {
                        fail("invalid surrogate");
                    }
                    cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                }
                append_utf8(out, cp);
                break;
            }
            default:
                --pos_;
                fail("invalid escape sequence");
            }
        }
    }

    Value read_number()
    {
        const std::size_t start = pos_;
        bool integral = true;

        if (peek() == '-') ++pos_;
        if (peek() == '0') {
            ++pos_;
        } else if (peek() >= '1' && peek() <= '9') {
            skip_digits();
        } else {
            fail("invalid number");
        }
        if (peek() == '.') {
            integral = false;
            ++pos_;
            if (!skip_digits()) fail("invalid number");
        }
        if (peek() == 'e' || peek() == 'E') {
            integral = false;
            ++pos_;
            if (peek() == '+' || peek() == '-') ++pos_;
            if (!skip_digits()) fail("invalid number");
        }

        const char* first = text_.data() + start;
        const char* last = text_.data() + pos_;
        if (integral) {
            int64_t n = 0;
            auto [ptr, ec] = std::from_chars(first, last, n);
            if (ec == std::errc{} && ptr == last) {
                return Value{n};
            }
        }
        double d = 0.0;
        auto [ptr, ec] = std::from_chars(first, last, d);
        if (ec != std::errc{} || ptr != last) {
            fail("number out of range");
        }
        return Value{d};
    }

    bool skip_digits()
    {
        const std::size_t start = pos_;
        while (peek() >= '0' && peek() <= '9') ++pos_;
        return pos_ > start;
    }

    std::string_view text_;
    std::size_t pos_ = 0;
};

} // anonymous namespace

std::string to_json(const Value& val, bool compact)
{
    JsonWriter writer(compact);
    writer.write(val);
    return writer.take();
}

Value from_json(const std::string& json_str, std::string* error_out)
{
    try {
        return JsonReader(json_str).read_document();
    } catch (const SyntaxError& e) {
        if (error_out) *error_out = e.what();
        return Value{};
    }
}

// ============================================================
// Explicit Template Instantiation
// ============================================================

template struct BasicValue<thread_safe_memory_policy>;
template class BasicMapBuilder<thread_safe_memory_policy>;
template class BasicVectorBuilder<thread_safe_memory_policy>;

} // namespace record_patch
