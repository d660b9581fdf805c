#ifndef EDNKIT_EDN_ERROR_H
#define EDNKIT_EDN_ERROR_H

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

#include "common/IoError.h"

namespace ednkit::edn {

enum class Category : std::uint8_t {
    Io,
    Syntax,
    Data,
    Eof,
};

enum class ErrorCode : std::uint8_t {
    Message,
    Io,
    EofWhileParsingList,
    EofWhileParsingVector,
    EofWhileParsingSet,
    EofWhileParsingObject,
    EofWhileParsingString,
    EofWhileParsingValue,
    EofWhileParsingChar,
    ExpectedMapValue,
    ExpectedSomeValue,
    ExpectedSetOpen,
    InvalidKeyword,
    InvalidSymbol,
    InvalidCharacter,
    InvalidEscape,
    InvalidNumber,
    NumberOutOfRange,
    InvalidUnicodeCodePoint,
    ControlCharacterWhileParsingString,
    LoneLeadingSurrogateInHexEscape,
    UnexpectedEndOfHexEscape,
    TrailingCharacters,
    RecursionLimitExceeded,
};

std::string_view error_code_message(ErrorCode code) noexcept;

/// 1-based line, 0-based byte column.
struct Position {
    std::size_t line = 0;
    std::size_t column = 0;
};

class Error {
public:
    static Error syntax(ErrorCode code, std::size_t line, std::size_t column);
    static Error syntax(ErrorCode code, Position pos);
    static Error io(common::IoErr err);
    static Error data(std::string message);

    static Error invalid_type(std::string_view found, std::string_view expected);
    static Error invalid_value(std::string_view found, std::string_view expected);
    static Error invalid_length(std::size_t len, std::string_view expected);
    static Error missing_field(std::string_view field);

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] std::size_t line() const noexcept { return line_; }
    [[nodiscard]] std::size_t column() const noexcept { return column_; }
    [[nodiscard]] common::IoErr io_error() const noexcept { return io_; }

    [[nodiscard]] Category classify() const noexcept;
    [[nodiscard]] bool is_io() const noexcept { return classify() == Category::Io; }
    [[nodiscard]] bool is_syntax() const noexcept { return classify() == Category::Syntax; }
    [[nodiscard]] bool is_data() const noexcept { return classify() == Category::Data; }
    [[nodiscard]] bool is_eof() const noexcept { return classify() == Category::Eof; }

    /// Message without the position suffix.
    [[nodiscard]] std::string message() const;
    /// "<message> at line L column C", or the bare message when no position is known.
    [[nodiscard]] std::string to_string() const;
    /// Error("<message>", line: L, column: C)
    [[nodiscard]] std::string debug_string() const;

    /// Attaches `pos` to a data error raised without one; other errors are returned unchanged.
    [[nodiscard]] Error fix_position(Position pos) const;

private:
    Error(ErrorCode code, std::size_t line, std::size_t column);

    ErrorCode code_;
    std::size_t line_ = 0;
    std::size_t column_ = 0;
    common::IoErr io_ = common::IoErr::None;
    std::string text_;
};

template <typename T>
using Result = std::expected<T, Error>;

} // namespace ednkit::edn

#endif // EDNKIT_EDN_ERROR_H
