// src/util/csv_escape.hpp
#pragma once
#include <string>
#include <string_view>

namespace tsgen {

// True if `in` starts with a Unicode White_Space code point (UTF-8):
// \t \n \v \f \r, space, U+0085, U+00A0, U+1680, U+2000..U+200A,
// U+2028, U+2029, U+202F, U+205F, U+3000.
inline bool starts_with_space(std::string_view in) {
    if (in.empty()) return false;
    const auto b = [&](std::size_t i) { return static_cast<unsigned char>(in[i]); };

    const unsigned char c0 = b(0);
    if (c0 == ' ' || (c0 >= '\t' && c0 <= '\r')) return true;
    if (c0 == 0xC2 && in.size() >= 2) return b(1) == 0x85 || b(1) == 0xA0;
    if (in.size() < 3) return false;
    if (c0 == 0xE1) return b(1) == 0x9A && b(2) == 0x80;                           // U+1680
    if (c0 == 0xE3) return b(1) == 0x80 && b(2) == 0x80;                           // U+3000
    if (c0 == 0xE2 && b(1) == 0x80) {
        const unsigned char c2 = b(2);
        return (c2 >= 0x80 && c2 <= 0x8A) || c2 == 0xA8 || c2 == 0xA9 || c2 == 0xAF;
    }
    if (c0 == 0xE2 && b(1) == 0x81) return b(2) == 0x9F;                           // U+205F
    return false;
}

// A field needs quoting if it holds the delimiter, a quote, CR or LF,
// starts with whitespace (some readers trim it), or is exactly `\.`
// (the end-of-data marker of PostgreSQL's COPY).
inline bool csv_needs_quotes(std::string_view in, char delimiter = ',') {
    if (in.empty()) return false;
    if (in == "\\.") return true;
    for (char c : in) {
        if (c == delimiter || c == '"' || c == '\r' || c == '\n') return true;
    }
    return starts_with_space(in);
}

// Minimal RFC4180 field escaper: quotes the field when needed and doubles
// embedded quotes. Anything else passes through untouched.
inline std::string csv_escape(std::string_view in, char delimiter = ',') {
    if (!csv_needs_quotes(in, delimiter)) return std::string(in);

    std::string out;
    out.reserve(in.size() + 8);
    out.push_back('"');
    for (char c : in) {
        if (c == '"') out += "\"\"";
        else          out.push_back(c);
    }
    out.push_back('"');
    return out;
}

}
