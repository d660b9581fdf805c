#ifndef EDNKIT_EDN_TABLES_H
#define EDNKIT_EDN_TABLES_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace ednkit::edn {

namespace detail {

constexpr std::array<bool, 256> make_escape_table() {
    std::array<bool, 256> table{};
    for (int i = 0; i < 0x20; ++i) {
        table[i] = true;
    }
    table['"'] = true;
    table['\\'] = true;
    return table;
}

constexpr std::array<bool, 256> make_symbol_table() {
    std::array<bool, 256> table{};
    for (int ch = 'a'; ch <= 'z'; ++ch) {
        table[ch] = true;
    }
    for (int ch = 'A'; ch <= 'Z'; ++ch) {
        table[ch] = true;
    }
    for (int ch = '0'; ch <= '9'; ++ch) {
        table[ch] = true;
    }
    for (char ch : {'.', '*', '+', '!', '-', '_', '?', '$', '%', '&', '=', '<', '>'}) {
        table[static_cast<unsigned char>(ch)] = true;
    }
    return table;
}

constexpr std::array<std::uint8_t, 256> make_hex_table() {
    std::array<std::uint8_t, 256> table{};
    for (auto &entry : table) {
        entry = 255;
    }
    for (int ch = '0'; ch <= '9'; ++ch) {
        table[ch] = static_cast<std::uint8_t>(ch - '0');
    }
    for (int ch = 'a'; ch <= 'f'; ++ch) {
        table[ch] = static_cast<std::uint8_t>(10 + ch - 'a');
    }
    for (int ch = 'A'; ch <= 'F'; ++ch) {
        table[ch] = static_cast<std::uint8_t>(10 + ch - 'A');
    }
    return table;
}

} // namespace detail

/// Bytes that end a fast string scan: control bytes, '"' and '\\'.
inline constexpr std::array<bool, 256> kEscape = detail::make_escape_table();
/// Bytes allowed inside a symbol or keyword body.
inline constexpr std::array<bool, 256> kSymbolByte = detail::make_symbol_table();
/// Hex digit value, 255 for anything else.
inline constexpr std::array<std::uint8_t, 256> kHexValue = detail::make_hex_table();

constexpr bool is_whitespace(std::uint8_t ch) noexcept {
    return ch == ' ' || ch == '\n' || ch == '\r' || ch == '\t' || ch == ',';
}

constexpr bool is_delimiter(std::uint8_t ch) noexcept {
    switch (ch) {
    case ' ':
    case '\n':
    case '\r':
    case '\t':
    case ',':
    case '(':
    case ')':
    case '[':
    case ']':
    case '{':
    case '}':
    case '"':
        return true;
    default:
        return false;
    }
}

constexpr bool is_digit(std::uint8_t ch) noexcept { return ch >= '0' && ch <= '9'; }

/// True when the text would be read as a number: a digit, or a sign then a digit.
constexpr bool starts_number(std::string_view text) noexcept {
    if (text.empty()) {
        return false;
    }
    auto first = static_cast<std::uint8_t>(text[0]);
    if (is_digit(first)) {
        return true;
    }
    return (first == '-' || first == '+') && text.size() > 1 && is_digit(static_cast<std::uint8_t>(text[1]));
}

constexpr std::size_t first_non_symbol_byte(std::string_view text) noexcept {
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (!kSymbolByte[static_cast<std::uint8_t>(text[i])]) {
            return i;
        }
    }
    return text.size();
}

/// Keyword body that reads back as the same keyword.
constexpr bool is_keyword_name(std::string_view name) noexcept {
    return !name.empty() && first_non_symbol_byte(name) == name.size();
}

/// Symbol text that reads back as the same symbol, not a number or a reserved word.
constexpr bool is_symbol_name(std::string_view name) noexcept {
    if (name.empty() || starts_number(name) || name == "true" || name == "false" || name == "nil") {
        return false;
    }
    return first_non_symbol_byte(name) == name.size();
}

} // namespace ednkit::edn

#endif // EDNKIT_EDN_TABLES_H
