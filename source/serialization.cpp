// serialization.cpp - JSON reader and writer for Value

#include <jsondiff/serialization.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdio>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace jsondiff {

// ============================================================
// JSON Serialization
// ============================================================

namespace {

// JSON escape special characters in strings
std::string json_escape_string(const std::string& s) {
    std::string result;
    result.reserve(s.size() + 16);

    for (char c : s) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\b': result += "\\b"; break;
            case '\f': result += "\\f"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    // Control characters as \uXXXX
                    char buf[7];
                    std::snprintf(buf, sizeof(buf), "\\u%04x",
                                  static_cast<unsigned int>(static_cast<unsigned char>(c)));
                    result += buf;
                } else {
                    result += c;
                }
        }
    }
    return result;
}

std::vector<std::string> sorted_keys(const ValueObject& obj) {
    std::vector<std::string> keys(obj.order.begin(), obj.order.end());
    std::sort(keys.begin(), keys.end());
    return keys;
}

void to_json_impl(const Value& val, std::ostringstream& oss, bool compact, int indent_width, int indent_level) {
    const std::string indent = compact ? "" : std::string(indent_level * indent_width, ' ');
    const std::string child_indent = compact ? "" : std::string((indent_level + 1) * indent_width, ' ');
    const std::string newline = compact ? "" : "\n";
    const std::string space_after_colon = compact ? "" : " ";

    std::visit([&](const auto& arg) {
        using T = std::decay_t<decltype(arg)>;

        if constexpr (std::is_same_v<T, std::monostate>) {
            oss << "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            oss << (arg ? "true" : "false");
        } else if constexpr (std::is_same_v<T, double>) {
            oss << format_number(arg);
        } else if constexpr (std::is_same_v<T, std::string>) {
            oss << "\"" << json_escape_string(arg) << "\"";
        } else if constexpr (std::is_same_v<T, ValueObject>) {
            if (arg.empty()) {
                oss << "{}";
            } else {
                oss << "{" << newline;
                bool first = true;
                for (const auto& k : sorted_keys(arg)) {
                    if (!first) oss << "," << newline;
                    first = false;
                    oss << child_indent << "\"" << json_escape_string(k) << "\":" << space_after_colon;
                    to_json_impl(*arg.find(k), oss, compact, indent_width, indent_level + 1);
                }
                oss << newline << indent << "}";
            }
        } else if constexpr (std::is_same_v<T, ValueVector>) {
            if (arg.size() == 0) {
                oss << "[]";
            } else {
                oss << "[" << newline;
                bool first = true;
                for (const auto& v : arg) {
                    if (!first) oss << "," << newline;
                    first = false;
                    oss << child_indent;
                    to_json_impl(*v, oss, compact, indent_width, indent_level + 1);
                }
                oss << newline << indent << "]";
            }
        }
    }, val.data);
}

// ============================================================
// Simple JSON Parser
// ============================================================

class JsonParser {
public:
    JsonParser(const std::string& json) : json_(json), pos_(0) {}

    std::optional<Value> parse(std::string* error_out) {
        try {
            skip_whitespace();
            if (pos_ >= json_.size()) {
                if (error_out) *error_out = "Empty JSON input";
                return std::nullopt;
            }
            Value result = parse_value();
            skip_whitespace();
            if (pos_ < json_.size()) {
                throw std::runtime_error("Unexpected trailing character '" + std::string(1, json_[pos_]) +
                                         "' at position " + std::to_string(pos_));
            }
            return result;
        } catch (const std::exception& e) {
            if (error_out) *error_out = e.what();
            return std::nullopt;
        }
    }

private:
    const std::string& json_;
    std::size_t pos_;
    int depth_ = 0;

    char peek() const {
        return pos_ < json_.size() ? json_[pos_] : '\0';
    }

    char consume() {
        return pos_ < json_.size() ? json_[pos_++] : '\0';
    }

    void skip_whitespace() {
        while (pos_ < json_.size() && std::isspace(static_cast<unsigned char>(json_[pos_]))) {
            ++pos_;
        }
    }

    void expect(char c) {
        skip_whitespace();
        if (consume() != c) {
            throw std::runtime_error(std::string("Expected '") + c + "' at position " + std::to_string(pos_));
        }
    }

    void enter() {
        if (++depth_ > kMaxJsonDepth) {
            throw std::runtime_error("Nesting deeper than " + std::to_string(kMaxJsonDepth) +
                                     " at position " + std::to_string(pos_));
        }
    }

    Value parse_value() {
        skip_whitespace();
        char c = peek();

        if (c == '{') return parse_object();
        if (c == '[') return parse_array();
        if (c == '"') return parse_string();
        if (c == 't' || c == 'f') return parse_bool();
        if (c == 'n') return parse_null();
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return parse_number();

        if (c == '\0') {
            throw std::runtime_error("Unexpected end of input at position " + std::to_string(pos_));
        }
        throw std::runtime_error("Unexpected character '" + std::string(1, c) + "' at position " + std::to_string(pos_));
    }

    Value parse_object() {
        expect('{');
        enter();
        skip_whitespace();

        if (peek() == '}') {
            consume();
            --depth_;
            return Value{ValueObject{}};
        }

        auto entries = ValueMap{}.transient();
        auto order = KeyVector{}.transient();

        while (true) {
            skip_whitespace();
            std::string key = parse_string_raw();
            expect(':');
            Value val = parse_value();
            // Duplicate keys: last value wins, first position is kept
            if (!entries.count(key)) order.push_back(key);
            entries.set(std::move(key), ValueBox{std::move(val)});

            skip_whitespace();
            char c = peek();
            if (c == '}') {
                consume();
                break;
            }
            if (c != ',') {
                throw std::runtime_error("Expected ',' or '}' in object at position " + std::to_string(pos_));
            }
            consume();
        }

        --depth_;
        return Value{ValueObject{entries.persistent(), order.persistent()}};
    }

    Value parse_array() {
        expect('[');
        enter();
        skip_whitespace();

        if (peek() == ']') {
            consume();
            --depth_;
            return Value{ValueVector{}};
        }

        auto transient = ValueVector{}.transient();

        while (true) {
            Value val = parse_value();
            transient.push_back(ValueBox{std::move(val)});

            skip_whitespace();
            char c = peek();
            if (c == ']') {
                consume();
                break;
            }
            if (c != ',') {
                throw std::runtime_error("Expected ',' or ']' in array at position " + std::to_string(pos_));
            }
            consume();
        }

        --depth_;
        return Value{transient.persistent()};
    }

    unsigned parse_hex4() {
        if (pos_ + 4 > json_.size()) {
            throw std::runtime_error("Invalid unicode escape");
        }
        unsigned codepoint = 0;
        auto [ptr, ec] = std::from_chars(json_.data() + pos_, json_.data() + pos_ + 4, codepoint, 16);
        if (ec != std::errc{} || ptr != json_.data() + pos_ + 4) {
            throw std::runtime_error("Invalid unicode escape at position " + std::to_string(pos_));
        }
        pos_ += 4;
        return codepoint;
    }

    static void append_utf8(std::string& out, unsigned codepoint) {
        if (codepoint < 0x80) {
            out += static_cast<char>(codepoint);
        } else if (codepoint < 0x800) {
            out += static_cast<char>(0xC0 | (codepoint >> 6));
            out += static_cast<char>(0x80 | (codepoint & 0x3F));
        } else if (codepoint < 0x10000) {
            out += static_cast<char>(0xE0 | (codepoint >> 12));
            out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (codepoint & 0x3F));
        } else {
            out += static_cast<char>(0xF0 | (codepoint >> 18));
            out += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (codepoint & 0x3F));
        }
    }

    std::string parse_string_raw() {
        expect('"');
        std::string result;

        while (pos_ < json_.size()) {
            char c = consume();
            if (c == '"') {
                return result;
            }
            if (c == '\\') {
                if (pos_ >= json_.size()) {
                    throw std::runtime_error("Unexpected end of string escape");
                }
                char escaped = consume();
                switch (escaped) {
                    case '"':  result += '"'; break;
                    case '\\': result += '\\'; break;
                    case '/':  result += '/'; break;
                    case 'b':  result += '\b'; break;
                    case 'f':  result += '\f'; break;
                    case 'n':  result += '\n'; break;
                    case 'r':  result += '\r'; break;
                    case 't':  result += '\t'; break;
                    case 'u': {
                        unsigned codepoint = parse_hex4();
                        // Surrogate pair -> one supplementary code point
                        if (codepoint >= 0xD800 && codepoint <= 0xDBFF &&
                            json_.compare(pos_, 2, "\\u") == 0) {
                            pos_ += 2;
                            unsigned low = parse_hex4();
                            if (low >= 0xDC00 && low <= 0xDFFF) {
                                codepoint = 0x10000 + ((codepoint - 0xD800) << 10) + (low - 0xDC00);
                            } else {
                                append_utf8(result, codepoint);
                                codepoint = low;
                            }
                        }
                        append_utf8(result, codepoint);
                        break;
                    }
                    default:
                        throw std::runtime_error("Invalid escape sequence: \\" + std::string(1, escaped));
                }
            } else if (static_cast<unsigned char>(c) < 0x20) {
                throw std::runtime_error("Unescaped control character in string at position " +
                                         std::to_string(pos_ - 1));
            } else {
                result += c;
            }
        }

        throw std::runtime_error("Unterminated string");
    }

    Value parse_string() {
        return Value{parse_string_raw()};
    }

    Value parse_number() {
        std::size_t start = pos_;

        if (peek() == '-') consume();
        if (!std::isdigit(static_cast<unsigned char>(peek()))) {
            throw std::runtime_error("Invalid number at position " + std::to_string(start));
        }
        while (std::isdigit(static_cast<unsigned char>(peek()))) consume();
        if (peek() == '.') {
            consume();
            if (!std::isdigit(static_cast<unsigned char>(peek()))) {
                throw std::runtime_error("Invalid number at position " + std::to_string(start));
            }
            while (std::isdigit(static_cast<unsigned char>(peek()))) consume();
        }
        if (peek() == 'e' || peek() == 'E') {
            consume();
            if (peek() == '+' || peek() == '-') consume();
            if (!std::isdigit(static_cast<unsigned char>(peek()))) {
                throw std::runtime_error("Invalid number exponent at position " + std::to_string(start));
            }
            while (std::isdigit(static_cast<unsigned char>(peek()))) consume();
        }

        double value = 0.0;
        auto [ptr, ec] = std::from_chars(json_.data() + start, json_.data() + pos_, value);
        if (ec == std::errc::result_out_of_range) {
            throw std::runtime_error("Number out of range at position " + std::to_string(start));
        }
        if (ec != std::errc{} || ptr != json_.data() + pos_) {
            throw std::runtime_error("Invalid number at position " + std::to_string(start));
        }
        return Value{value};
    }

    Value parse_bool() {
        if (json_.compare(pos_, 4, "true") == 0) {
            pos_ += 4;
            return Value{true};
        }
        if (json_.compare(pos_, 5, "false") == 0) {
            pos_ += 5;
            return Value{false};
        }
        throw std::runtime_error("Expected 'true' or 'false' at position " + std::to_string(pos_));
    }

    Value parse_null() {
        if (json_.compare(pos_, 4, "null") == 0) {
            pos_ += 4;
            return Value{};
        }
        throw std::runtime_error("Expected 'null' at position " + std::to_string(pos_));
    }
};

bool is_blank(const std::string& text) {
    return std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c); });
}

} // anonymous namespace

std::string to_json(const Value& val, bool compact, int indent_width) {
    std::ostringstream oss;
    to_json_impl(val, oss, compact, std::max(indent_width, 0), 0);
    return oss.str();
}

std::string to_canonical_json(const Value& val) {
    return to_json(val, true);
}

Value from_json(const std::string& json_str, std::string* error_out) {
    JsonParser parser(json_str);
    if (auto parsed = parser.parse(error_out)) {
        return std::move(*parsed);
    }
    return Value{};
}

std::optional<Value> try_parse_json(const std::string& json_str, std::string* error_out) {
    JsonParser parser(json_str);
    return parser.parse(error_out);
}

PrettyPrintResult pretty_print(const std::string& raw_text, int indent_width) {
    PrettyPrintResult result;
    if (is_blank(raw_text)) {
        result.text = raw_text;
        result.error = "Empty JSON input";
        return result;
    }

    auto parsed = try_parse_json(raw_text, &result.error);
    if (!parsed) {
        detail::log_access_error("pretty_print", "input is not valid JSON, passing raw text through: " + result.error);
        result.text = raw_text;
        return result;
    }

    result.text = to_json(*parsed, false, indent_width);
    result.formatted = true;
    return result;
}

} // namespace jsondiff
