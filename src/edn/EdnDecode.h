#ifndef EDNKIT_EDN_EDNDECODE_H
#define EDNKIT_EDN_EDNDECODE_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "Error.h"
#include "Read.h"
#include "Value.h"
#include "Visitor.h"

namespace ednkit::edn {

/// Recursive descent decoder over one of the byte sources (SliceRead, StrRead,
/// IoRead). Offers three ways to consume a document: build a Value, drive a
/// Visitor, or pull typed tokens one at a time for the Deserialize bridge.
template <typename R>
class Deserializer {
public:
    enum class Option : std::uint32_t {
        UnboundedDepth = 0x01,
    };

    static constexpr std::size_t kDefaultRecursionLimit = 128;

    explicit Deserializer(R read);
    Deserializer(const Deserializer &) = delete;
    Deserializer &operator=(const Deserializer &) = delete;
    Deserializer(Deserializer &&) = delete;
    Deserializer &operator=(Deserializer &&) = delete;

    void set_option(Option opt, bool enabled = true);
    void set_recursion_limit(std::size_t limit);

    [[nodiscard]] Result<Value> parse_value();
    [[nodiscard]] Result<void> deserialize_any(Visitor &visitor);
    /// Consumes one value without materializing it.
    [[nodiscard]] Result<void> ignore_value();
    /// Only whitespace may follow the last value.
    [[nodiscard]] Result<void> end();
    /// Skips whitespace; true when the input is exhausted.
    [[nodiscard]] Result<bool> at_end();

    [[nodiscard]] Result<void> deserialize_nil();
    /// Consumes a nil and returns true; otherwise leaves the next value for the
    /// following pull call.
    [[nodiscard]] Result<bool> try_nil();
    [[nodiscard]] Result<bool> deserialize_bool();
    [[nodiscard]] Result<Number> deserialize_number();
    [[nodiscard]] Result<std::string> deserialize_string();
    [[nodiscard]] Result<char32_t> deserialize_char();
    [[nodiscard]] Result<std::string> deserialize_keyword();
    [[nodiscard]] Result<std::string> deserialize_symbol();
    /// Keyword, string or symbol text, as used for record field names.
    [[nodiscard]] Result<std::string> deserialize_identifier();
    [[nodiscard]] Result<Value> deserialize_value();

    /// Opens a list, vector or set.
    [[nodiscard]] Result<ContainerKind> begin_seq();
    /// True when another element follows; false once the closing delimiter was consumed.
    [[nodiscard]] Result<bool> next_element();
    [[nodiscard]] Result<void> begin_map();
    /// True when another key follows; false once '}' was consumed.
    [[nodiscard]] Result<bool> next_key();
    /// Checks that the key just read has a value.
    [[nodiscard]] Result<void> next_value();
    [[nodiscard]] Result<void> skip_value();

    /// Attaches the position of the current token to a data error.
    [[nodiscard]] Error fix_position(Error err) const;
    [[nodiscard]] std::size_t byte_offset() const;

private:
    struct OpenFrame {
        std::uint8_t close;
        ErrorCode eof;
    };

    enum class TokenKind : std::uint8_t { Nil, Bool, Number, String, Char, Keyword, Symbol, Open };

    /// One scalar, or the opening delimiter of a container. `text` borrows the
    /// input, scratch_ or held_ and is only valid until the next token.
    struct Token {
        TokenKind kind = TokenKind::Nil;
        bool boolean = false;
        Number number;
        char32_t character = 0;
        Reference text = Reference::borrowed({});
        ContainerKind open = ContainerKind::List;
    };

    [[nodiscard]] Error error(ErrorCode code) const;
    [[nodiscard]] Error peek_error(ErrorCode code) const;

    [[nodiscard]] Result<std::optional<std::uint8_t>> parse_whitespace();
    [[nodiscard]] Result<Token> parse_token();
    [[nodiscard]] static OpenFrame frame_for(ContainerKind kind);
    [[nodiscard]] static Value token_value(const Token &token);
    [[nodiscard]] Result<void> enter();
    void leave();
    [[nodiscard]] bool bounded() const;

    [[nodiscard]] Result<Value::Sequence> parse_elements(std::uint8_t close, ErrorCode eof);
    [[nodiscard]] Result<Map> parse_entries();
    [[nodiscard]] Result<Number> parse_number(bool negative);
    [[nodiscard]] Result<Number> parse_symbolic_number();
    [[nodiscard]] Result<std::size_t> scan_digits();
    [[nodiscard]] Result<char32_t> parse_char();
    [[nodiscard]] Result<char32_t> parse_utf8_char(std::uint8_t lead);
    [[nodiscard]] Result<void> check_char_end();

    [[nodiscard]] Result<void> visit_elements(Visitor &visitor, ContainerKind kind, std::uint8_t close,
                                              ErrorCode eof);
    [[nodiscard]] Result<void> ignore_elements(std::uint8_t close, ErrorCode eof, bool pairs);

    [[nodiscard]] Result<Token> next_token(Position &pos);
    [[nodiscard]] Error invalid_type(const Token &found, const char *expected, Position pos) const;
    [[nodiscard]] Result<bool> advance_in_container();

    R read_;
    std::string scratch_;
    std::size_t remaining_depth_ = kDefaultRecursionLimit;
    std::uint32_t options_ = 0;
    std::vector<OpenFrame> open_;
    // symbol read by try_nil, handed to the next pull call
    std::optional<std::string> pending_symbol_;
    std::string held_;
    Position token_pos_{};
};

extern template class Deserializer<SliceRead>;
extern template class Deserializer<StrRead>;
extern template class Deserializer<IoRead>;

/// Yields consecutive top-level values of one input, e.g. `1 [2] {:a 3}`.
template <typename R>
class StreamDeserializer {
public:
    explicit StreamDeserializer(R read);

    /// Next value, or an empty optional at end of input. After an error the
    /// stream stays exhausted.
    [[nodiscard]] Result<std::optional<Value>> next();
    [[nodiscard]] std::size_t byte_offset() const;

private:
    Deserializer<R> de_;
    bool failed_ = false;
};

extern template class StreamDeserializer<SliceRead>;
extern template class StreamDeserializer<StrRead>;
extern template class StreamDeserializer<IoRead>;

} // namespace ednkit::edn

#endif // EDNKIT_EDN_EDNDECODE_H
