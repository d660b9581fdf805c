#include "EdnDecode.h"

#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <system_error>
#include <utility>

#include "Tables.h"
#include "Utf.h"

namespace ednkit::edn {

template <typename R>
Deserializer<R>::Deserializer(R read) : read_(std::move(read)) {}

template <typename R>
void Deserializer<R>::set_option(Option opt, bool enabled) {
    auto bit = static_cast<std::uint32_t>(opt);
    if (enabled) {
        options_ |= bit;
    } else {
        options_ &= ~bit;
    }
}

template <typename R>
void Deserializer<R>::set_recursion_limit(std::size_t limit) {
    remaining_depth_ = limit;
}

template <typename R>
Error Deserializer<R>::error(ErrorCode code) const {
    return Error::syntax(code, read_.position());
}

template <typename R>
Error Deserializer<R>::peek_error(ErrorCode code) const {
    return Error::syntax(code, read_.peek_position());
}

template <typename R>
Error Deserializer<R>::fix_position(Error err) const {
    return err.fix_position(token_pos_);
}

template <typename R>
std::size_t Deserializer<R>::byte_offset() const {
    return read_.byte_offset();
}

template <typename R>
bool Deserializer<R>::bounded() const {
    return (options_ & static_cast<std::uint32_t>(Option::UnboundedDepth)) == 0;
}

template <typename R>
Result<void> Deserializer<R>::enter() {
    if (!bounded()) {
        return {};
    }
    if (remaining_depth_ == 0) {
        return std::unexpected(error(ErrorCode::RecursionLimitExceeded));
    }
    remaining_depth_ -= 1;
    return {};
}

template <typename R>
void Deserializer<R>::leave() {
    if (bounded()) {
        remaining_depth_ += 1;
    }
}

template <typename R>
Result<std::optional<std::uint8_t>> Deserializer<R>::parse_whitespace() {
    while (true) {
        auto ch = read_.peek();
        if (!ch) {
            return std::unexpected(ch.error());
        }
        if (!*ch || !is_whitespace(**ch)) {
            return ch;
        }
        read_.discard();
    }
}

// Consumes one scalar, or only the opening delimiter of a container.
template <typename R>
Result<typename Deserializer<R>::Token> Deserializer<R>::parse_token() {
    auto peeked = parse_whitespace();
    if (!peeked) {
        return std::unexpected(peeked.error());
    }
    if (!*peeked) {
        return std::unexpected(peek_error(ErrorCode::EofWhileParsingValue));
    }
    std::uint8_t ch = **peeked;
    Token token;
    switch (ch) {
    case '(':
    case '[':
    case '{':
        read_.discard();
        token.kind = TokenKind::Open;
        token.open = ch == '(' ? ContainerKind::List : (ch == '[' ? ContainerKind::Vector : ContainerKind::Map);
        return token;
    case '#': {
        read_.discard();
        auto next = read_.peek();
        if (!next) {
            return std::unexpected(next.error());
        }
        if (*next && **next == '{') {
            read_.discard();
            token.kind = TokenKind::Open;
            token.open = ContainerKind::Set;
            return token;
        }
        if (*next && **next == '#') {
            read_.discard();
            auto number = parse_symbolic_number();
            if (!number) {
                return std::unexpected(number.error());
            }
            token.kind = TokenKind::Number;
            token.number = *number;
            return token;
        }
        return std::unexpected(peek_error(ErrorCode::ExpectedSetOpen));
    }
    case '"': {
        read_.discard();
        auto text = read_.parse_str(scratch_);
        if (!text) {
            return std::unexpected(text.error());
        }
        token.kind = TokenKind::String;
        token.text = *text;
        return token;
    }
    case ':': {
        read_.discard();
        auto name = read_.parse_keyword(scratch_);
        if (!name) {
            return std::unexpected(name.error());
        }
        token.kind = TokenKind::Keyword;
        token.text = *name;
        return token;
    }
    case '\\': {
        read_.discard();
        auto c = parse_char();
        if (!c) {
            return std::unexpected(c.error());
        }
        token.kind = TokenKind::Char;
        token.character = *c;
        return token;
    }
    case 't':
    case 'f':
    case 'n': {
        read_.discard();
        const char *reserved = ch == 't' ? "true" : (ch == 'f' ? "false" : "nil");
        auto word = read_.parse_reserved_or_symbol(scratch_, reserved);
        if (!word) {
            return std::unexpected(word.error());
        }
        if (*word) {
            token.kind = TokenKind::Symbol;
            token.text = **word;
        } else if (ch == 'n') {
            token.kind = TokenKind::Nil;
        } else {
            token.kind = TokenKind::Bool;
            token.boolean = ch == 't';
        }
        return token;
    }
    case ')':
    case ']':
    case '}':
        return std::unexpected(peek_error(ErrorCode::ExpectedSomeValue));
    default:
        break;
    }

    bool sign = ch == '-' || ch == '+';
    if (!sign && !is_digit(ch) && !kSymbolByte[ch]) {
        return std::unexpected(peek_error(ErrorCode::ExpectedSomeValue));
    }
    bool number_start = is_digit(ch);
    if (sign) {
        read_.discard();
        auto next = read_.peek();
        if (!next) {
            return std::unexpected(next.error());
        }
        number_start = *next && is_digit(**next);
    }
    if (number_start) {
        auto number = parse_number(ch == '-');
        if (!number) {
            return std::unexpected(number.error());
        }
        token.kind = TokenKind::Number;
        token.number = *number;
        return token;
    }
    if (!sign) {
        read_.discard();
    }
    auto symbol = read_.parse_symbol(scratch_, ch);
    if (!symbol) {
        return std::unexpected(symbol.error());
    }
    token.kind = TokenKind::Symbol;
    token.text = *symbol;
    return token;
}

template <typename R>
typename Deserializer<R>::OpenFrame Deserializer<R>::frame_for(ContainerKind kind) {
    switch (kind) {
    case ContainerKind::List:
        return OpenFrame{')', ErrorCode::EofWhileParsingList};
    case ContainerKind::Vector:
        return OpenFrame{']', ErrorCode::EofWhileParsingVector};
    case ContainerKind::Set:
        return OpenFrame{'}', ErrorCode::EofWhileParsingSet};
    case ContainerKind::Map:
        break;
    }
    return OpenFrame{'}', ErrorCode::EofWhileParsingObject};
}

template <typename R>
Value Deserializer<R>::token_value(const Token &token) {
    switch (token.kind) {
    case TokenKind::Nil:
        return Value();
    case TokenKind::Bool:
        return Value(token.boolean);
    case TokenKind::Number:
        return Value(token.number);
    case TokenKind::String:
        return Value(token.text.to_string());
    case TokenKind::Char:
        return Value::character(token.character);
    case TokenKind::Keyword:
        return Value::keyword(token.text.to_string());
    case TokenKind::Symbol:
        return Value::symbol(token.text.to_string());
    case TokenKind::Open:
        break;
    }
    return Value();
}

template <typename R>
Result<Value> Deserializer<R>::parse_value() {
    auto token = parse_token();
    if (!token) {
        return std::unexpected(token.error());
    }
    if (token->kind != TokenKind::Open) {
        return token_value(*token);
    }
    auto entered = enter();
    if (!entered) {
        return std::unexpected(entered.error());
    }
    ContainerKind kind = token->open;
    if (kind == ContainerKind::Map) {
        auto map = parse_entries();
        leave();
        if (!map) {
            return std::unexpected(map.error());
        }
        return Value(std::move(*map));
    }
    OpenFrame frame = frame_for(kind);
    auto items = parse_elements(frame.close, frame.eof);
    leave();
    if (!items) {
        return std::unexpected(items.error());
    }
    switch (kind) {
    case ContainerKind::List:
        return Value::list(std::move(*items));
    case ContainerKind::Set:
        return Value::set(std::move(*items));
    default:
        return Value::vector(std::move(*items));
    }
}

template <typename R>
Result<Value::Sequence> Deserializer<R>::parse_elements(std::uint8_t close, ErrorCode eof) {
    Value::Sequence items;
    while (true) {
        auto peeked = parse_whitespace();
        if (!peeked) {
            return std::unexpected(peeked.error());
        }
        if (!*peeked) {
            return std::unexpected(error(eof));
        }
        if (**peeked == close) {
            read_.discard();
            return items;
        }
        auto item = parse_value();
        if (!item) {
            return std::unexpected(item.error());
        }
        items.push_back(std::move(*item));
    }
}

template <typename R>
Result<Map> Deserializer<R>::parse_entries() {
    Map map;
    while (true) {
        auto peeked = parse_whitespace();
        if (!peeked) {
            return std::unexpected(peeked.error());
        }
        if (!*peeked) {
            return std::unexpected(error(ErrorCode::EofWhileParsingObject));
        }
        if (**peeked == '}') {
            read_.discard();
            return map;
        }
        auto key = parse_value();
        if (!key) {
            return std::unexpected(key.error());
        }
        peeked = parse_whitespace();
        if (!peeked) {
            return std::unexpected(peeked.error());
        }
        if (!*peeked) {
            return std::unexpected(error(ErrorCode::EofWhileParsingObject));
        }
        if (**peeked == '}') {
            return std::unexpected(error(ErrorCode::ExpectedMapValue));
        }
        auto value = parse_value();
        if (!value) {
            return std::unexpected(value.error());
        }
        map.insert(std::move(*key), std::move(*value));
    }
}

template <typename R>
Result<std::size_t> Deserializer<R>::scan_digits() {
    std::size_t count = 0;
    while (true) {
        auto ch = read_.peek();
        if (!ch) {
            return std::unexpected(ch.error());
        }
        if (!*ch || !is_digit(**ch)) {
            return count;
        }
        read_.discard();
        scratch_.push_back(static_cast<char>(**ch));
        count += 1;
    }
}

// Sign already consumed, the next byte is a digit.
template <typename R>
Result<Number> Deserializer<R>::parse_number(bool negative) {
    scratch_.clear();
    if (negative) {
        scratch_.push_back('-');
    }
    std::size_t int_start = scratch_.size();
    auto digits = scan_digits();
    if (!digits) {
        return std::unexpected(digits.error());
    }
    if (*digits > 1 && scratch_[int_start] == '0') {
        return std::unexpected(error(ErrorCode::InvalidNumber));
    }

    bool is_float = false;
    auto ch = read_.peek();
    if (!ch) {
        return std::unexpected(ch.error());
    }
    if (*ch && **ch == '.') {
        read_.discard();
        scratch_.push_back('.');
        is_float = true;
        auto fraction = scan_digits();
        if (!fraction) {
            return std::unexpected(fraction.error());
        }
        if (*fraction == 0) {
            return std::unexpected(error(ErrorCode::InvalidNumber));
        }
        ch = read_.peek();
        if (!ch) {
            return std::unexpected(ch.error());
        }
    }
    if (*ch && (**ch == 'e' || **ch == 'E')) {
        read_.discard();
        scratch_.push_back('e');
        is_float = true;
        ch = read_.peek();
        if (!ch) {
            return std::unexpected(ch.error());
        }
        if (*ch && (**ch == '+' || **ch == '-')) {
            read_.discard();
            scratch_.push_back(static_cast<char>(**ch));
        }
        auto exponent = scan_digits();
        if (!exponent) {
            return std::unexpected(exponent.error());
        }
        if (*exponent == 0) {
            return std::unexpected(error(ErrorCode::InvalidNumber));
        }
        ch = read_.peek();
        if (!ch) {
            return std::unexpected(ch.error());
        }
    }
    if (*ch && !is_delimiter(**ch)) {
        return std::unexpected(error(ErrorCode::InvalidNumber));
    }

    const char *first = scratch_.data();
    const char *last = scratch_.data() + scratch_.size();
    if (is_float) {
        errno = 0;
        char *end_ptr = nullptr;
        double value = std::strtod(scratch_.c_str(), &end_ptr);
        if (errno == ERANGE && std::isinf(value)) {
            return std::unexpected(error(ErrorCode::NumberOutOfRange));
        }
        if (end_ptr != last) {
            return std::unexpected(error(ErrorCode::InvalidNumber));
        }
        return Number::from_f64(value);
    }
    if (negative) {
        std::int64_t value = 0;
        auto result = std::from_chars(first, last, value);
        if (result.ec == std::errc::result_out_of_range) {
            return std::unexpected(error(ErrorCode::NumberOutOfRange));
        }
        if (result.ec != std::errc() || result.ptr != last) {
            return std::unexpected(error(ErrorCode::InvalidNumber));
        }
        return Number::from_i64(value);
    }
    std::uint64_t value = 0;
    auto result = std::from_chars(first, last, value);
    if (result.ec == std::errc::result_out_of_range) {
        return std::unexpected(error(ErrorCode::NumberOutOfRange));
    }
    if (result.ec != std::errc() || result.ptr != last) {
        return std::unexpected(error(ErrorCode::InvalidNumber));
    }
    return Number::from_u64(value);
}

// "##" already consumed.
template <typename R>
Result<Number> Deserializer<R>::parse_symbolic_number() {
    auto ch = read_.next();
    if (!ch) {
        return std::unexpected(ch.error());
    }
    if (!*ch) {
        return std::unexpected(error(ErrorCode::EofWhileParsingValue));
    }
    if (!kSymbolByte[**ch]) {
        return std::unexpected(error(ErrorCode::InvalidNumber));
    }
    auto name = read_.parse_symbol(scratch_, **ch);
    if (!name) {
        return std::unexpected(name.error());
    }
    std::string_view text = name->view();
    if (text == "Inf") {
        return Number::from_f64(std::numeric_limits<double>::infinity());
    }
    if (text == "-Inf") {
        return Number::from_f64(-std::numeric_limits<double>::infinity());
    }
    if (text == "NaN") {
        return Number::from_f64(std::numeric_limits<double>::quiet_NaN());
    }
    return std::unexpected(error(ErrorCode::InvalidNumber));
}

template <typename R>
Result<void> Deserializer<R>::check_char_end() {
    auto ch = read_.peek();
    if (!ch) {
        return std::unexpected(ch.error());
    }
    if (*ch && !is_delimiter(**ch) && **ch != '\\') {
        return std::unexpected(error(ErrorCode::InvalidCharacter));
    }
    return {};
}

// Backslash already consumed.
template <typename R>
Result<char32_t> Deserializer<R>::parse_char() {
    auto peeked = read_.peek();
    if (!peeked) {
        return std::unexpected(peeked.error());
    }
    if (!*peeked) {
        return std::unexpected(error(ErrorCode::EofWhileParsingChar));
    }
    std::uint8_t first = **peeked;
    read_.discard();
    if (first >= 0x80) {
        return parse_utf8_char(first);
    }
    if (!kSymbolByte[first]) {
        auto ended = check_char_end();
        if (!ended) {
            return std::unexpected(ended.error());
        }
        return static_cast<char32_t>(first);
    }

    scratch_.clear();
    scratch_.push_back(static_cast<char>(first));
    while (true) {
        auto ch = read_.peek();
        if (!ch) {
            return std::unexpected(ch.error());
        }
        if (!*ch || !kSymbolByte[**ch]) {
            break;
        }
        read_.discard();
        scratch_.push_back(static_cast<char>(**ch));
    }
    auto ended = check_char_end();
    if (!ended) {
        return std::unexpected(ended.error());
    }
    if (scratch_.size() == 1) {
        return static_cast<char32_t>(first);
    }
    if (scratch_ == "newline") {
        return U'\n';
    }
    if (scratch_ == "return") {
        return U'\r';
    }
    if (scratch_ == "tab") {
        return U'\t';
    }
    if (scratch_ == "space") {
        return U' ';
    }
    if (scratch_.size() == 5 && scratch_[0] == 'u') {
        std::uint32_t codepoint = 0;
        for (std::size_t i = 1; i < scratch_.size(); ++i) {
            std::uint8_t digit = kHexValue[static_cast<std::uint8_t>(scratch_[i])];
            if (digit == 255) {
                return std::unexpected(error(ErrorCode::InvalidCharacter));
            }
            codepoint = (codepoint << 4) | digit;
        }
        if (!is_scalar_value(codepoint)) {
            return std::unexpected(error(ErrorCode::InvalidCharacter));
        }
        return static_cast<char32_t>(codepoint);
    }
    return std::unexpected(error(ErrorCode::InvalidCharacter));
}

template <typename R>
Result<char32_t> Deserializer<R>::parse_utf8_char(std::uint8_t lead) {
    std::size_t len = utf8_sequence_length(lead);
    if (len == 0) {
        return std::unexpected(error(ErrorCode::InvalidCharacter));
    }
    char buf[4] = {static_cast<char>(lead), 0, 0, 0};
    for (std::size_t i = 1; i < len; ++i) {
        auto ch = read_.next();
        if (!ch) {
            return std::unexpected(ch.error());
        }
        if (!*ch) {
            return std::unexpected(error(ErrorCode::EofWhileParsingChar));
        }
        buf[i] = static_cast<char>(**ch);
    }
    std::size_t pos = 0;
    std::uint32_t codepoint = 0;
    if (!utf8_next_codepoint(buf, len, pos, codepoint) || pos != len) {
        return std::unexpected(error(ErrorCode::InvalidCharacter));
    }
    auto ended = check_char_end();
    if (!ended) {
        return std::unexpected(ended.error());
    }
    return static_cast<char32_t>(codepoint);
}

template <typename R>
Result<void> Deserializer<R>::deserialize_any(Visitor &visitor) {
    auto token = parse_token();
    if (!token) {
        return std::unexpected(token.error());
    }
    Result<void> visited;
    switch (token->kind) {
    case TokenKind::Open: {
        auto entered = enter();
        if (!entered) {
            return std::unexpected(entered.error());
        }
        OpenFrame frame = frame_for(token->open);
        visited = visit_elements(visitor, token->open, frame.close, frame.eof);
        leave();
        break;
    }
    case TokenKind::Nil:
        visited = visitor.visit_nil();
        break;
    case TokenKind::Bool:
        visited = visitor.visit_bool(token->boolean);
        break;
    case TokenKind::Number:
        visited = visitor.visit_number(token->number);
        break;
    case TokenKind::String:
        visited = visitor.visit_string(token->text);
        break;
    case TokenKind::Char:
        visited = visitor.visit_char(token->character);
        break;
    case TokenKind::Keyword:
        visited = visitor.visit_keyword(token->text);
        break;
    case TokenKind::Symbol:
        visited = visitor.visit_symbol(token->text);
        break;
    }
    if (!visited) {
        return std::unexpected(visited.error().fix_position(read_.position()));
    }
    return {};
}

template <typename R>
Result<void> Deserializer<R>::visit_elements(Visitor &visitor, ContainerKind kind, std::uint8_t close,
                                             ErrorCode eof) {
    auto begun = visitor.begin(kind);
    if (!begun) {
        return std::unexpected(begun.error().fix_position(read_.position()));
    }
    bool pairs = kind == ContainerKind::Map;
    bool awaiting_value = false;
    while (true) {
        auto peeked = parse_whitespace();
        if (!peeked) {
            return std::unexpected(peeked.error());
        }
        if (!*peeked) {
            return std::unexpected(error(eof));
        }
        if (**peeked == close) {
            if (awaiting_value) {
                return std::unexpected(error(ErrorCode::ExpectedMapValue));
            }
            read_.discard();
            return visitor.end(kind);
        }
        auto item = deserialize_any(visitor);
        if (!item) {
            return std::unexpected(item.error());
        }
        if (pairs) {
            awaiting_value = !awaiting_value;
        }
    }
}

template <typename R>
Result<void> Deserializer<R>::ignore_value() {
    auto peeked = parse_whitespace();
    if (!peeked) {
        return std::unexpected(peeked.error());
    }
    if (*peeked && **peeked == '"') {
        read_.discard();
        return read_.ignore_str();
    }
    auto token = parse_token();
    if (!token) {
        return std::unexpected(token.error());
    }
    if (token->kind != TokenKind::Open) {
        return {};
    }
    auto entered = enter();
    if (!entered) {
        return std::unexpected(entered.error());
    }
    OpenFrame frame = frame_for(token->open);
    auto ignored = ignore_elements(frame.close, frame.eof, token->open == ContainerKind::Map);
    leave();
    return ignored;
}

template <typename R>
Result<void> Deserializer<R>::ignore_elements(std::uint8_t close, ErrorCode eof, bool pairs) {
    bool awaiting_value = false;
    while (true) {
        auto peeked = parse_whitespace();
        if (!peeked) {
            return std::unexpected(peeked.error());
        }
        if (!*peeked) {
            return std::unexpected(error(eof));
        }
        if (**peeked == close) {
            if (awaiting_value) {
                return std::unexpected(error(ErrorCode::ExpectedMapValue));
            }
            read_.discard();
            return {};
        }
        auto item = ignore_value();
        if (!item) {
            return std::unexpected(item.error());
        }
        if (pairs) {
            awaiting_value = !awaiting_value;
        }
    }
}

template <typename R>
Result<void> Deserializer<R>::end() {
    auto peeked = parse_whitespace();
    if (!peeked) {
        return std::unexpected(peeked.error());
    }
    if (*peeked) {
        return std::unexpected(peek_error(ErrorCode::TrailingCharacters));
    }
    return {};
}

template <typename R>
Result<bool> Deserializer<R>::at_end() {
    auto peeked = parse_whitespace();
    if (!peeked) {
        return std::unexpected(peeked.error());
    }
    return !peeked->has_value();
}

template <typename R>
Result<typename Deserializer<R>::Token> Deserializer<R>::next_token(Position &pos) {
    if (pending_symbol_) {
        held_ = std::move(*pending_symbol_);
        pending_symbol_.reset();
        pos = token_pos_;
        Token token;
        token.kind = TokenKind::Symbol;
        token.text = Reference::copied(held_);
        return token;
    }
    auto peeked = parse_whitespace();
    if (!peeked) {
        return std::unexpected(peeked.error());
    }
    pos = read_.peek_position();
    token_pos_ = pos;
    return parse_token();
}

template <typename R>
Error Deserializer<R>::invalid_type(const Token &found, const char *expected, Position pos) const {
    std::string what =
            found.kind == TokenKind::Open ? container_kind_name(found.open) : describe_unexpected(token_value(found));
    return Error::invalid_type(what, expected).fix_position(pos);
}

template <typename R>
Result<void> Deserializer<R>::deserialize_nil() {
    Position pos;
    auto token = next_token(pos);
    if (!token) {
        return std::unexpected(token.error());
    }
    if (token->kind != TokenKind::Nil) {
        return std::unexpected(invalid_type(*token, "nil", pos));
    }
    return {};
}

template <typename R>
Result<bool> Deserializer<R>::try_nil() {
    if (pending_symbol_) {
        return false;
    }
    auto peeked = parse_whitespace();
    if (!peeked) {
        return std::unexpected(peeked.error());
    }
    if (!*peeked || **peeked != 'n') {
        return false;
    }
    // either nil or a symbol starting with 'n'; a symbol is kept for the next pull
    token_pos_ = read_.peek_position();
    read_.discard();
    auto word = read_.parse_reserved_or_symbol(scratch_, "nil");
    if (!word) {
        return std::unexpected(word.error());
    }
    if (!*word) {
        return true;
    }
    pending_symbol_ = (*word)->to_string();
    return false;
}

template <typename R>
Result<bool> Deserializer<R>::deserialize_bool() {
    Position pos;
    auto token = next_token(pos);
    if (!token) {
        return std::unexpected(token.error());
    }
    if (token->kind == TokenKind::Bool) {
        return token->boolean;
    }
    return std::unexpected(invalid_type(*token, "a boolean", pos));
}

template <typename R>
Result<Number> Deserializer<R>::deserialize_number() {
    Position pos;
    auto token = next_token(pos);
    if (!token) {
        return std::unexpected(token.error());
    }
    if (token->kind == TokenKind::Number) {
        return token->number;
    }
    return std::unexpected(invalid_type(*token, "a number", pos));
}

template <typename R>
Result<std::string> Deserializer<R>::deserialize_string() {
    Position pos;
    auto token = next_token(pos);
    if (!token) {
        return std::unexpected(token.error());
    }
    if (token->kind == TokenKind::String) {
        return token->text.to_string();
    }
    return std::unexpected(invalid_type(*token, "a string", pos));
}

template <typename R>
Result<char32_t> Deserializer<R>::deserialize_char() {
    Position pos;
    auto token = next_token(pos);
    if (!token) {
        return std::unexpected(token.error());
    }
    if (token->kind == TokenKind::Char) {
        return token->character;
    }
    return std::unexpected(invalid_type(*token, "a character", pos));
}

template <typename R>
Result<std::string> Deserializer<R>::deserialize_keyword() {
    Position pos;
    auto token = next_token(pos);
    if (!token) {
        return std::unexpected(token.error());
    }
    if (token->kind == TokenKind::Keyword) {
        return token->text.to_string();
    }
    return std::unexpected(invalid_type(*token, "a keyword", pos));
}

template <typename R>
Result<std::string> Deserializer<R>::deserialize_symbol() {
    Position pos;
    auto token = next_token(pos);
    if (!token) {
        return std::unexpected(token.error());
    }
    if (token->kind == TokenKind::Symbol) {
        return token->text.to_string();
    }
    return std::unexpected(invalid_type(*token, "a symbol", pos));
}

template <typename R>
Result<std::string> Deserializer<R>::deserialize_identifier() {
    Position pos;
    auto token = next_token(pos);
    if (!token) {
        return std::unexpected(token.error());
    }
    switch (token->kind) {
    case TokenKind::Keyword:
    case TokenKind::String:
    case TokenKind::Symbol:
        return token->text.to_string();
    default:
        return std::unexpected(invalid_type(*token, "a field name", pos));
    }
}

template <typename R>
Result<Value> Deserializer<R>::deserialize_value() {
    if (pending_symbol_) {
        Value symbol = Value::symbol(std::move(*pending_symbol_));
        pending_symbol_.reset();
        return symbol;
    }
    auto peeked = parse_whitespace();
    if (!peeked) {
        return std::unexpected(peeked.error());
    }
    token_pos_ = read_.peek_position();
    return parse_value();
}

template <typename R>
Result<ContainerKind> Deserializer<R>::begin_seq() {
    Position pos;
    auto token = next_token(pos);
    if (!token) {
        return std::unexpected(token.error());
    }
    if (token->kind != TokenKind::Open || token->open == ContainerKind::Map) {
        return std::unexpected(invalid_type(*token, "a sequence", pos));
    }
    auto entered = enter();
    if (!entered) {
        return std::unexpected(entered.error());
    }
    open_.push_back(frame_for(token->open));
    return token->open;
}

template <typename R>
Result<void> Deserializer<R>::begin_map() {
    Position pos;
    auto token = next_token(pos);
    if (!token) {
        return std::unexpected(token.error());
    }
    if (token->kind != TokenKind::Open || token->open != ContainerKind::Map) {
        return std::unexpected(invalid_type(*token, "a map", pos));
    }
    auto entered = enter();
    if (!entered) {
        return std::unexpected(entered.error());
    }
    open_.push_back(frame_for(ContainerKind::Map));
    return {};
}

template <typename R>
Result<bool> Deserializer<R>::advance_in_container() {
    if (open_.empty()) {
        return std::unexpected(Error::data("no open container"));
    }
    auto peeked = parse_whitespace();
    if (!peeked) {
        return std::unexpected(peeked.error());
    }
    if (!*peeked) {
        return std::unexpected(error(open_.back().eof));
    }
    if (**peeked == open_.back().close) {
        read_.discard();
        open_.pop_back();
        leave();
        return false;
    }
    return true;
}

template <typename R>
Result<bool> Deserializer<R>::next_element() {
    return advance_in_container();
}

template <typename R>
Result<bool> Deserializer<R>::next_key() {
    return advance_in_container();
}

template <typename R>
Result<void> Deserializer<R>::next_value() {
    auto peeked = parse_whitespace();
    if (!peeked) {
        return std::unexpected(peeked.error());
    }
    if (!*peeked) {
        return std::unexpected(error(ErrorCode::EofWhileParsingObject));
    }
    if (**peeked == '}') {
        return std::unexpected(error(ErrorCode::ExpectedMapValue));
    }
    return {};
}

template <typename R>
Result<void> Deserializer<R>::skip_value() {
    if (pending_symbol_) {
        pending_symbol_.reset();
        return {};
    }
    return ignore_value();
}

template class Deserializer<SliceRead>;
template class Deserializer<StrRead>;
template class Deserializer<IoRead>;

template <typename R>
StreamDeserializer<R>::StreamDeserializer(R read) : de_(std::move(read)) {}

template <typename R>
Result<std::optional<Value>> StreamDeserializer<R>::next() {
    if (failed_) {
        return std::optional<Value>{};
    }
    auto done = de_.at_end();
    if (!done) {
        failed_ = true;
        return std::unexpected(done.error());
    }
    if (*done) {
        return std::optional<Value>{};
    }
    auto value = de_.parse_value();
    if (!value) {
        failed_ = true;
        return std::unexpected(value.error());
    }
    return std::optional<Value>(std::move(*value));
}

template <typename R>
std::size_t StreamDeserializer<R>::byte_offset() const {
    return de_.byte_offset();
}

template class StreamDeserializer<SliceRead>;
template class StreamDeserializer<StrRead>;
template class StreamDeserializer<IoRead>;

} // namespace ednkit::edn
