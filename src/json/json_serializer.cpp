//! # JSON Serializer
//!
//! Converts `JsonValue` trees back to compact text, the format of the
//! storage file and of JSON log lines.
//!
//! Strings are escaped per RFC 8259: `"` and `\` are backslash-escaped, the
//! common control characters use their short escapes, and any other byte
//! below 0x20 is written as `\u00XX`. Bytes at or above 0x80 are copied
//! through unchanged, so UTF-8 text is preserved as-is.
//!
//! Integers are written without a decimal point. Floats always carry a
//! decimal point or exponent so they read back as floats. NaN and infinity
//! have no JSON spelling and are written as `null`.

#include "json/json_value.hpp"

#include <cmath>
#include <cstdio>
#include <iomanip>
#include <sstream>

namespace todo::json {

namespace {

void append_escaped(std::string& out, const std::string& s) {
    out += '"';
    for (char c : s) {
        switch (c) {
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\b':
            out += "\\b";
            break;
        case '\f':
            out += "\\f";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                char buf[8];
                std::snprintf(buf, sizeof(buf), "\\u%04x",
                              static_cast<unsigned>(static_cast<unsigned char>(c)));
                out += buf;
            } else {
                out += c;
            }
            break;
        }
    }
    out += '"';
}

void append_number(std::string& out, const JsonNumber& num) {
    if (num.is_integer()) {
        out += std::to_string(num.i64);
        return;
    }
    if (std::isnan(num.f64) || std::isinf(num.f64)) {
        out += "null";
        return;
    }

    std::ostringstream oss;
    oss << std::setprecision(17) << num.f64;
    std::string text = oss.str();
    if (text.find_first_of(".eE") == std::string::npos) {
        text += ".0";
    }
    out += text;
}

/// Writes `value` to `out` with no whitespace between tokens.
void write_value(const JsonValue& value, std::string& out) {
    if (value.is_null()) {
        out += "null";
    } else if (value.is_bool()) {
        out += value.as_bool() ? "true" : "false";
    } else if (value.is_number()) {
        append_number(out, value.as_number());
    } else if (value.is_string()) {
        append_escaped(out, value.as_string());
    } else if (value.is_array()) {
        out += '[';
        bool first = true;
        for (const auto& elem : value.as_array()) {
            if (!first) {
                out += ',';
            }
            first = false;
            write_value(elem, out);
        }
        out += ']';
    } else {
        out += '{';
        bool first = true;
        for (const auto& [key, val] : value.as_object()) {
            if (!first) {
                out += ',';
            }
            first = false;
            append_escaped(out, key);
            out += ':';
            write_value(val, out);
        }
        out += '}';
    }
}

} // anonymous namespace

auto JsonValue::to_string() const -> std::string {
    std::string result;
    write_value(*this, result);
    return result;
}

} // namespace todo::json
