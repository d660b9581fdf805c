#include "Error.h"

#include <utility>

namespace ednkit::edn {

std::string_view error_code_message(ErrorCode code) noexcept {
    switch (code) {
    case ErrorCode::Message:
        return "data error";
    case ErrorCode::Io:
        return "io error";
    case ErrorCode::EofWhileParsingList:
        return "EOF while parsing a list";
    case ErrorCode::EofWhileParsingVector:
        return "EOF while parsing a vector";
    case ErrorCode::EofWhileParsingSet:
        return "EOF while parsing a set";
    case ErrorCode::EofWhileParsingObject:
        return "EOF while parsing an object";
    case ErrorCode::EofWhileParsingString:
        return "EOF while parsing a string";
    case ErrorCode::EofWhileParsingValue:
        return "EOF while parsing a value";
    case ErrorCode::EofWhileParsingChar:
        return "EOF while parsing a character";
    case ErrorCode::ExpectedMapValue:
        return "map key must be followed by a value";
    case ErrorCode::ExpectedSomeValue:
        return "expected value";
    case ErrorCode::ExpectedSetOpen:
        return "expected `{` or `#` after `#`";
    case ErrorCode::InvalidKeyword:
        return "invalid keyword";
    case ErrorCode::InvalidSymbol:
        return "invalid symbol";
    case ErrorCode::InvalidCharacter:
        return "invalid character literal";
    case ErrorCode::InvalidEscape:
        return "invalid escape";
    case ErrorCode::InvalidNumber:
        return "invalid number";
    case ErrorCode::NumberOutOfRange:
        return "number out of range";
    case ErrorCode::InvalidUnicodeCodePoint:
        return "invalid unicode code point";
    case ErrorCode::ControlCharacterWhileParsingString:
        return "control character (\\u0000-\\u001F) found while parsing a string";
    case ErrorCode::LoneLeadingSurrogateInHexEscape:
        return "lone leading surrogate in hex escape";
    case ErrorCode::UnexpectedEndOfHexEscape:
        return "unexpected end of hex escape";
    case ErrorCode::TrailingCharacters:
        return "trailing characters";
    case ErrorCode::RecursionLimitExceeded:
        return "recursion limit exceeded";
    }
    return "unknown error";
}

Error::Error(ErrorCode code, std::size_t line, std::size_t column) : code_(code), line_(line), column_(column) {}

Error Error::syntax(ErrorCode code, std::size_t line, std::size_t column) { return Error(code, line, column); }

Error Error::syntax(ErrorCode code, Position pos) { return Error(code, pos.line, pos.column); }

Error Error::io(common::IoErr err) {
    Error error(ErrorCode::Io, 0, 0);
    error.io_ = err;
    return error;
}

Error Error::data(std::string message) {
    Error error(ErrorCode::Message, 0, 0);
    error.text_ = std::move(message);
    return error;
}

Error Error::invalid_type(std::string_view found, std::string_view expected) {
    std::string message = "invalid type: ";
    message.append(found);
    message.append(", expected ");
    message.append(expected);
    return data(std::move(message));
}

Error Error::invalid_value(std::string_view found, std::string_view expected) {
    std::string message = "invalid value: ";
    message.append(found);
    message.append(", expected ");
    message.append(expected);
    return data(std::move(message));
}

Error Error::invalid_length(std::size_t len, std::string_view expected) {
    std::string message = "invalid length ";
    message.append(std::to_string(len));
    message.append(", expected ");
    message.append(expected);
    return data(std::move(message));
}

Error Error::missing_field(std::string_view field) {
    std::string message = "missing field `";
    message.append(field);
    message.push_back('`');
    return data(std::move(message));
}

Category Error::classify() const noexcept {
    switch (code_) {
    case ErrorCode::Message:
        return Category::Data;
    case ErrorCode::Io:
        return Category::Io;
    case ErrorCode::EofWhileParsingList:
    case ErrorCode::EofWhileParsingVector:
    case ErrorCode::EofWhileParsingSet:
    case ErrorCode::EofWhileParsingObject:
    case ErrorCode::EofWhileParsingString:
    case ErrorCode::EofWhileParsingValue:
    case ErrorCode::EofWhileParsingChar:
        return Category::Eof;
    default:
        return Category::Syntax;
    }
}

std::string Error::message() const {
    if (code_ == ErrorCode::Message) {
        return text_;
    }
    if (code_ == ErrorCode::Io) {
        std::string out = "io error: ";
        out.append(common::io_err_name(io_));
        return out;
    }
    return std::string(error_code_message(code_));
}

std::string Error::to_string() const {
    std::string out = message();
    if (line_ == 0) {
        return out;
    }
    out.append(" at line ");
    out.append(std::to_string(line_));
    out.append(" column ");
    out.append(std::to_string(column_));
    return out;
}

std::string Error::debug_string() const {
    std::string out = "Error(\"";
    out.append(message());
    out.append("\", line: ");
    out.append(std::to_string(line_));
    out.append(", column: ");
    out.append(std::to_string(column_));
    out.push_back(')');
    return out;
}

Error Error::fix_position(Position pos) const {
    Error copy = *this;
    if (code_ == ErrorCode::Message && line_ == 0) {
        copy.line_ = pos.line;
        copy.column_ = pos.column;
    }
    return copy;
}

} // namespace ednkit::edn
