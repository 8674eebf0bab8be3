//! # JSON Parser Implementation
//!
//! Single-pass recursive descent over the input characters. Strings are
//! unescaped as they are read (including `\uXXXX` escapes and surrogate
//! pairs, which are re-encoded as UTF-8). Integers are parsed with
//! `std::from_chars`; integers that overflow `int64_t` fall back to double.

#include "json/json_parser.hpp"

#include <charconv>
#include <cstdlib>

namespace todo::json {

namespace {

auto is_digit(char c) -> bool {
    return c >= '0' && c <= '9';
}

void append_utf8(std::string& out, uint32_t codepoint) {
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

} // anonymous namespace

JsonParser::JsonParser(std::string_view input) : input_(input) {}

auto JsonParser::peek() const -> char {
    return at_end() ? '\0' : input_[pos_];
}

auto JsonParser::advance() -> char {
    if (at_end()) {
        return '\0';
    }
    char c = input_[pos_++];
    if (c == '\n') {
        ++line_;
        column_ = 1;
    } else {
        ++column_;
    }
    return c;
}

void JsonParser::skip_whitespace() {
    while (!at_end()) {
        char c = peek();
        if (c != ' ' && c != '\t' && c != '\n' && c != '\r') {
            break;
        }
        advance();
    }
}

auto JsonParser::error(const std::string& msg) const -> JsonError {
    return JsonError::make(msg, line_, column_, pos_);
}

auto JsonParser::parse() -> Result<JsonValue, JsonError> {
    skip_whitespace();
    auto result = parse_value();
    if (is_err(result)) {
        return result;
    }
    skip_whitespace();
    if (!at_end()) {
        return error("Unexpected content after JSON value");
    }
    return result;
}

auto JsonParser::parse_value() -> Result<JsonValue, JsonError> {
    if (at_end()) {
        return error("Unexpected end of input");
    }

    switch (peek()) {
    case '{':
        return parse_object();
    case '[':
        return parse_array();
    case '"': {
        auto str = parse_string();
        if (is_err(str)) {
            return unwrap_err(str);
        }
        return JsonValue(std::move(unwrap(str)));
    }
    case 't':
    case 'f':
    case 'n':
        return parse_literal();
    default:
        if (peek() == '-' || is_digit(peek())) {
            return parse_number();
        }
        return error("Unexpected character: " + std::string(1, peek()));
    }
}

auto JsonParser::parse_object() -> Result<JsonValue, JsonError> {
    if (++depth_ > MAX_DEPTH) {
        return error("Maximum nesting depth exceeded");
    }
    advance(); // '{'

    JsonObject obj;
    skip_whitespace();
    if (peek() == '}') {
        advance();
        --depth_;
        return JsonValue(std::move(obj));
    }

    while (true) {
        skip_whitespace();
        if (peek() != '"') {
            return error("Expected string key in object");
        }
        auto key = parse_string();
        if (is_err(key)) {
            return unwrap_err(key);
        }

        skip_whitespace();
        if (peek() != ':') {
            return error("Expected ':' after object key");
        }
        advance();
        skip_whitespace();

        auto value = parse_value();
        if (is_err(value)) {
            return value;
        }
        obj[std::move(unwrap(key))] = std::move(unwrap(value));

        skip_whitespace();
        char c = peek();
        if (c == ',') {
            advance();
            skip_whitespace();
            if (peek() == '}') {
                return error("Trailing comma in object");
            }
        } else if (c == '}') {
            advance();
            --depth_;
            return JsonValue(std::move(obj));
        } else {
            return error("Expected ',' or '}' in object");
        }
    }
}

auto JsonParser::parse_array() -> Result<JsonValue, JsonError> {
    if (++depth_ > MAX_DEPTH) {
        return error("Maximum nesting depth exceeded");
    }
    advance(); // '['

    JsonArray arr;
    skip_whitespace();
    if (peek() == ']') {
        advance();
        --depth_;
        return JsonValue(std::move(arr));
    }

    while (true) {
        skip_whitespace();
        auto value = parse_value();
        if (is_err(value)) {
            return value;
        }
        arr.push_back(std::move(unwrap(value)));

        skip_whitespace();
        char c = peek();
        if (c == ',') {
            advance();
            skip_whitespace();
            if (peek() == ']') {
                return error("Trailing comma in array");
            }
        } else if (c == ']') {
            advance();
            --depth_;
            return JsonValue(std::move(arr));
        } else {
            return error("Expected ',' or ']' in array");
        }
    }
}

auto JsonParser::parse_hex4() -> Result<uint32_t, JsonError> {
    if (pos_ + 4 > input_.size()) {
        return error("Incomplete unicode escape sequence");
    }
    uint32_t value = 0;
    const char* first = input_.data() + pos_;
    auto [ptr, ec] = std::from_chars(first, first + 4, value, 16);
    if (ec != std::errc{} || ptr != first + 4) {
        return error("Invalid unicode escape sequence");
    }
    for (int i = 0; i < 4; ++i) {
        advance();
    }
    return value;
}

auto JsonParser::parse_string() -> Result<std::string, JsonError> {
    size_t start_line = line_;
    size_t start_col = column_;
    size_t start_pos = pos_;
    advance(); // opening quote

    std::string value;
    while (!at_end()) {
        char c = advance();
        if (c == '"') {
            return value;
        }
        if (static_cast<unsigned char>(c) < 0x20) {
            return error("Control character in string");
        }
        if (c != '\\') {
            value += c;
            continue;
        }

        char escaped = advance();
        switch (escaped) {
        case '"':
        case '\\':
        case '/':
            value += escaped;
            break;
        case 'b':
            value += '\b';
            break;
        case 'f':
            value += '\f';
            break;
        case 'n':
            value += '\n';
            break;
        case 'r':
            value += '\r';
            break;
        case 't':
            value += '\t';
            break;
        case 'u': {
            auto high = parse_hex4();
            if (is_err(high)) {
                return unwrap_err(high);
            }
            uint32_t codepoint = unwrap(high);
            // UTF-16 surrogate pair
            if (codepoint >= 0xD800 && codepoint <= 0xDBFF && peek() == '\\' &&
                pos_ + 1 < input_.size() && input_[pos_ + 1] == 'u') {
                advance();
                advance();
                auto low = parse_hex4();
                if (is_err(low)) {
                    return unwrap_err(low);
                }
                uint32_t lo = unwrap(low);
                if (lo < 0xDC00 || lo > 0xDFFF) {
                    return error("Invalid low surrogate in unicode escape");
                }
                codepoint = 0x10000 + ((codepoint - 0xD800) << 10) + (lo - 0xDC00);
            }
            append_utf8(value, codepoint);
            break;
        }
        default:
            return error("Invalid escape sequence: \\" + std::string(1, escaped));
        }
    }

    return JsonError::make("Unterminated string", start_line, start_col, start_pos);
}

auto JsonParser::parse_number() -> Result<JsonValue, JsonError> {
    size_t start = pos_;
    bool is_float = false;

    if (peek() == '-') {
        advance();
    }
    if (peek() == '0') {
        advance();
    } else if (is_digit(peek())) {
        while (is_digit(peek())) {
            advance();
        }
    } else {
        return error("Invalid number");
    }

    if (peek() == '.') {
        is_float = true;
        advance();
        if (!is_digit(peek())) {
            return error("Expected digit after decimal point");
        }
        while (is_digit(peek())) {
            advance();
        }
    }

    if (peek() == 'e' || peek() == 'E') {
        is_float = true;
        advance();
        if (peek() == '+' || peek() == '-') {
            advance();
        }
        if (!is_digit(peek())) {
            return error("Expected digit in exponent");
        }
        while (is_digit(peek())) {
            advance();
        }
    }

    std::string_view text = input_.substr(start, pos_ - start);
    if (!is_float) {
        int64_t value = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec == std::errc{} && ptr == text.data() + text.size()) {
            return JsonValue(value);
        }
        // Out of int64_t range, keep it as a double
    }
    return JsonValue(std::strtod(std::string(text).c_str(), nullptr));
}

auto JsonParser::parse_literal() -> Result<JsonValue, JsonError> {
    auto rest = input_.substr(pos_);
    auto consume = [this](size_t n) {
        for (size_t i = 0; i < n; ++i) {
            advance();
        }
    };

    if (rest.starts_with("true")) {
        consume(4);
        return JsonValue(true);
    }
    if (rest.starts_with("false")) {
        consume(5);
        return JsonValue(false);
    }
    if (rest.starts_with("null")) {
        consume(4);
        return JsonValue();
    }
    return error("Unknown literal");
}

auto parse_json(std::string_view input) -> Result<JsonValue, JsonError> {
    JsonParser parser(input);
    return parser.parse();
}

} // namespace todo::json
