#include "Read.h"

#include <algorithm>
#include <cerrno>
#include <unistd.h>

#include "Tables.h"
#include "Utf.h"

namespace ednkit::edn {
namespace {

template <typename R>
Error read_error(const R &read, ErrorCode code) {
    return Error::syntax(code, read.position());
}

template <typename R>
Result<void> parse_unicode_escape(R &read, std::string &scratch) {
    auto first = read.decode_hex_escape();
    if (!first) {
        return std::unexpected(first.error());
    }
    std::uint32_t n = *first;
    if (n >= 0xDC00 && n <= 0xDFFF) {
        return std::unexpected(read_error(read, ErrorCode::LoneLeadingSurrogateInHexEscape));
    }
    if (n < 0xD800 || n > 0xDBFF) {
        utf8_append(n, scratch);
        return {};
    }
    // high surrogate, the low half must follow as another \u escape
    for (std::uint8_t want : {static_cast<std::uint8_t>('\\'), static_cast<std::uint8_t>('u')}) {
        auto ch = read.next();
        if (!ch) {
            return std::unexpected(ch.error());
        }
        if (!*ch) {
            return std::unexpected(read_error(read, ErrorCode::EofWhileParsingString));
        }
        if (**ch != want) {
            return std::unexpected(read_error(read, ErrorCode::UnexpectedEndOfHexEscape));
        }
    }
    auto second = read.decode_hex_escape();
    if (!second) {
        return std::unexpected(second.error());
    }
    std::uint32_t n2 = *second;
    if (n2 < 0xDC00 || n2 > 0xDFFF) {
        return std::unexpected(read_error(read, ErrorCode::InvalidUnicodeCodePoint));
    }
    std::uint32_t codepoint = (((n - 0xD800) << 10) | (n2 - 0xDC00)) + 0x10000;
    utf8_append(codepoint, scratch);
    return {};
}

/// Backslash already consumed.
template <typename R>
Result<void> parse_escape(R &read, std::string &scratch) {
    auto ch = read.next();
    if (!ch) {
        return std::unexpected(ch.error());
    }
    if (!*ch) {
        return std::unexpected(read_error(read, ErrorCode::EofWhileParsingString));
    }
    switch (**ch) {
    case '"':
        scratch.push_back('"');
        break;
    case '\\':
        scratch.push_back('\\');
        break;
    case '/':
        scratch.push_back('/');
        break;
    case 'b':
        scratch.push_back('\b');
        break;
    case 'f':
        scratch.push_back('\f');
        break;
    case 'n':
        scratch.push_back('\n');
        break;
    case 'r':
        scratch.push_back('\r');
        break;
    case 't':
        scratch.push_back('\t');
        break;
    case 'u':
        return parse_unicode_escape(read, scratch);
    default:
        return std::unexpected(read_error(read, ErrorCode::InvalidEscape));
    }
    return {};
}

/// Skips an escape without decoding it; only the shape is checked.
template <typename R>
Result<void> ignore_escape(R &read) {
    auto ch = read.next();
    if (!ch) {
        return std::unexpected(ch.error());
    }
    if (!*ch) {
        return std::unexpected(read_error(read, ErrorCode::EofWhileParsingString));
    }
    switch (**ch) {
    case '"':
    case '\\':
    case '/':
    case 'b':
    case 'f':
    case 'n':
    case 'r':
    case 't':
        return {};
    case 'u': {
        auto hex = read.decode_hex_escape();
        if (!hex) {
            return std::unexpected(hex.error());
        }
        return {};
    }
    default:
        return std::unexpected(read_error(read, ErrorCode::InvalidEscape));
    }
}

} // namespace

FdReader::FdReader(int fd) : fd_(fd) {}

common::IoResult<std::size_t> FdReader::read(char *buf, std::size_t len) {
    while (true) {
        ssize_t n = ::read(fd_, buf, len);
        if (n >= 0) {
            return static_cast<std::size_t>(n);
        }
        if (errno == EINTR) {
            continue;
        }
        return std::unexpected(common::io_err_from_errno(errno));
    }
}

FileReader::FileReader(std::FILE *file) : file_(file) {}

common::IoResult<std::size_t> FileReader::read(char *buf, std::size_t len) {
    if (!file_) {
        return std::unexpected(common::IoErr::BadFd);
    }
    std::size_t n = std::fread(buf, 1, len, file_);
    if (n == 0 && std::ferror(file_)) {
        int err = errno;
        return std::unexpected(err != 0 ? common::io_err_from_errno(err) : common::IoErr::Unknown);
    }
    return n;
}

SliceRead::SliceRead(std::string_view bytes) : SliceRead(bytes.data(), bytes.size(), true) {}

SliceRead::SliceRead(const std::uint8_t *data, std::size_t len)
    : SliceRead(reinterpret_cast<const char *>(data), len, true) {}

SliceRead::SliceRead(const char *data, std::size_t len, bool validate_utf8)
    : data_(data), len_(len), validate_utf8_(validate_utf8) {}

Result<std::optional<std::uint8_t>> SliceRead::next() {
    if (index_ < len_) {
        return static_cast<std::uint8_t>(data_[index_++]);
    }
    return std::optional<std::uint8_t>{};
}

Result<std::optional<std::uint8_t>> SliceRead::peek() {
    if (index_ < len_) {
        return static_cast<std::uint8_t>(data_[index_]);
    }
    return std::optional<std::uint8_t>{};
}

void SliceRead::discard() { index_ += 1; }

Position SliceRead::position() const { return position_of_index(index_); }

Position SliceRead::peek_position() const { return position_of_index(std::min(len_, index_ + 1)); }

std::size_t SliceRead::byte_offset() const { return index_; }

Position SliceRead::position_of_index(std::size_t index) const {
    Position pos{1, 0};
    for (std::size_t i = 0; i < index; ++i) {
        if (data_[i] == '\n') {
            pos.line += 1;
            pos.column = 0;
        } else {
            pos.column += 1;
        }
    }
    return pos;
}

Result<Reference> SliceRead::finish_str(Reference text) {
    if (validate_utf8_ && !utf8_validate(text.view().data(), text.view().size())) {
        return std::unexpected(read_error(*this, ErrorCode::InvalidUnicodeCodePoint));
    }
    return text;
}

Result<Reference> SliceRead::parse_str(std::string &scratch) {
    scratch.clear();
    bool copied = false;
    std::size_t start = index_;
    while (true) {
        while (index_ < len_ && !kEscape[static_cast<std::uint8_t>(data_[index_])]) {
            index_ += 1;
        }
        if (index_ == len_) {
            return std::unexpected(read_error(*this, ErrorCode::EofWhileParsingString));
        }
        switch (data_[index_]) {
        case '"': {
            if (!copied) {
                std::string_view borrowed(data_ + start, index_ - start);
                index_ += 1;
                return finish_str(Reference::borrowed(borrowed));
            }
            scratch.append(data_ + start, index_ - start);
            index_ += 1;
            return finish_str(Reference::copied(scratch));
        }
        case '\\': {
            scratch.append(data_ + start, index_ - start);
            copied = true;
            index_ += 1;
            auto escaped = parse_escape(*this, scratch);
            if (!escaped) {
                return std::unexpected(escaped.error());
            }
            start = index_;
            break;
        }
        default:
            return std::unexpected(read_error(*this, ErrorCode::ControlCharacterWhileParsingString));
        }
    }
}

Result<void> SliceRead::ignore_str() {
    while (true) {
        while (index_ < len_ && !kEscape[static_cast<std::uint8_t>(data_[index_])]) {
            index_ += 1;
        }
        if (index_ == len_) {
            return std::unexpected(read_error(*this, ErrorCode::EofWhileParsingString));
        }
        switch (data_[index_]) {
        case '"':
            index_ += 1;
            return {};
        case '\\': {
            index_ += 1;
            auto escaped = ignore_escape(*this);
            if (!escaped) {
                return std::unexpected(escaped.error());
            }
            break;
        }
        default:
            return std::unexpected(read_error(*this, ErrorCode::ControlCharacterWhileParsingString));
        }
    }
}

Result<Reference> SliceRead::scan_symbol(std::size_t start, ErrorCode invalid) {
    while (index_ < len_) {
        auto ch = static_cast<std::uint8_t>(data_[index_]);
        if (kSymbolByte[ch]) {
            index_ += 1;
            continue;
        }
        if (is_delimiter(ch)) {
            break;
        }
        return std::unexpected(read_error(*this, invalid));
    }
    return Reference::borrowed(std::string_view(data_ + start, index_ - start));
}

Result<Reference> SliceRead::parse_symbol(std::string & /*scratch*/, std::uint8_t /*first*/) {
    return scan_symbol(index_ - 1, ErrorCode::InvalidSymbol);
}

Result<Reference> SliceRead::parse_keyword(std::string & /*scratch*/) {
    if (index_ == len_ || !kSymbolByte[static_cast<std::uint8_t>(data_[index_])]) {
        return std::unexpected(read_error(*this, ErrorCode::InvalidKeyword));
    }
    return scan_symbol(index_, ErrorCode::InvalidKeyword);
}

Result<std::optional<Reference>> SliceRead::parse_reserved_or_symbol(std::string & /*scratch*/,
                                                                     std::string_view reserved) {
    std::size_t start = index_ - 1;
    std::size_t offset = 1;
    while (true) {
        if (index_ == len_) {
            if (offset == reserved.size()) {
                return std::optional<Reference>{};
            }
            return std::optional<Reference>(Reference::borrowed(std::string_view(data_ + start, index_ - start)));
        }
        auto ch = static_cast<std::uint8_t>(data_[index_]);
        if (offset < reserved.size() && ch == static_cast<std::uint8_t>(reserved[offset])) {
            index_ += 1;
            offset += 1;
            continue;
        }
        if (is_delimiter(ch)) {
            if (offset == reserved.size()) {
                return std::optional<Reference>{};
            }
            return std::optional<Reference>(Reference::borrowed(std::string_view(data_ + start, index_ - start)));
        }
        auto symbol = scan_symbol(start, ErrorCode::InvalidSymbol);
        if (!symbol) {
            return std::unexpected(symbol.error());
        }
        return std::optional<Reference>(*symbol);
    }
}

Result<std::uint16_t> SliceRead::decode_hex_escape() {
    if (len_ - index_ < 4) {
        index_ = len_;
        return std::unexpected(read_error(*this, ErrorCode::EofWhileParsingString));
    }
    std::uint16_t n = 0;
    for (int i = 0; i < 4; ++i) {
        std::uint8_t value = kHexValue[static_cast<std::uint8_t>(data_[index_])];
        index_ += 1;
        if (value == 255) {
            return std::unexpected(read_error(*this, ErrorCode::InvalidEscape));
        }
        n = static_cast<std::uint16_t>(n * 16 + value);
    }
    return n;
}

StrRead::StrRead(std::string_view text) : SliceRead(text.data(), text.size(), false) {}

IoRead::IoRead(Reader &reader) : reader_(reader) {}

Result<bool> IoRead::fill() {
    if (eof_) {
        return false;
    }
    auto n = reader_.read(buffer_.data(), buffer_.size());
    if (!n) {
        return std::unexpected(Error::io(n.error()));
    }
    if (*n == 0) {
        eof_ = true;
        return false;
    }
    buffer_pos_ = 0;
    buffer_len_ = *n;
    return true;
}

Result<std::optional<std::uint8_t>> IoRead::next_raw() {
    if (buffer_pos_ == buffer_len_) {
        auto filled = fill();
        if (!filled) {
            return std::unexpected(filled.error());
        }
        if (!*filled) {
            return std::optional<std::uint8_t>{};
        }
    }
    return static_cast<std::uint8_t>(buffer_[buffer_pos_++]);
}

void IoRead::advance_position(std::uint8_t ch) {
    offset_ += 1;
    if (ch == '\n') {
        line_ += 1;
        column_ = 0;
    } else {
        column_ += 1;
    }
}

Result<std::optional<std::uint8_t>> IoRead::next() {
    if (peeked_) {
        std::uint8_t ch = *peeked_;
        peeked_.reset();
        advance_position(ch);
        return ch;
    }
    auto ch = next_raw();
    if (ch && *ch) {
        advance_position(**ch);
    }
    return ch;
}

Result<std::optional<std::uint8_t>> IoRead::peek() {
    if (peeked_) {
        return peeked_;
    }
    auto ch = next_raw();
    if (ch) {
        peeked_ = *ch;
    }
    return ch;
}

void IoRead::discard() {
    if (peeked_) {
        advance_position(*peeked_);
        peeked_.reset();
    }
}

Position IoRead::position() const { return Position{line_, column_}; }

Position IoRead::peek_position() const {
    if (!peeked_) {
        return position();
    }
    if (*peeked_ == '\n') {
        return Position{line_ + 1, 0};
    }
    return Position{line_, column_ + 1};
}

std::size_t IoRead::byte_offset() const { return offset_; }

void IoRead::take_plain_run(std::string *out) {
    if (peeked_) {
        return;
    }
    std::size_t start = buffer_pos_;
    while (buffer_pos_ < buffer_len_ && !kEscape[static_cast<std::uint8_t>(buffer_[buffer_pos_])]) {
        buffer_pos_ += 1;
    }
    std::size_t n = buffer_pos_ - start;
    if (out) {
        out->append(buffer_.data() + start, n);
    }
    // escape bytes include '\n', so the run stays on one line
    offset_ += n;
    column_ += n;
}

Result<Reference> IoRead::parse_str(std::string &scratch) {
    scratch.clear();
    while (true) {
        take_plain_run(&scratch);
        auto ch = peek();
        if (!ch) {
            return std::unexpected(ch.error());
        }
        if (!*ch) {
            return std::unexpected(read_error(*this, ErrorCode::EofWhileParsingString));
        }
        std::uint8_t byte = **ch;
        if (byte == '"') {
            discard();
            if (!utf8_validate(scratch.data(), scratch.size())) {
                return std::unexpected(read_error(*this, ErrorCode::InvalidUnicodeCodePoint));
            }
            return Reference::copied(scratch);
        }
        if (byte == '\\') {
            discard();
            auto escaped = parse_escape(*this, scratch);
            if (!escaped) {
                return std::unexpected(escaped.error());
            }
            continue;
        }
        if (byte < 0x20) {
            return std::unexpected(read_error(*this, ErrorCode::ControlCharacterWhileParsingString));
        }
        discard();
        scratch.push_back(static_cast<char>(byte));
    }
}

Result<void> IoRead::ignore_str() {
    while (true) {
        take_plain_run(nullptr);
        auto ch = peek();
        if (!ch) {
            return std::unexpected(ch.error());
        }
        if (!*ch) {
            return std::unexpected(read_error(*this, ErrorCode::EofWhileParsingString));
        }
        std::uint8_t byte = **ch;
        if (byte == '"') {
            discard();
            return {};
        }
        if (byte == '\\') {
            discard();
            auto escaped = ignore_escape(*this);
            if (!escaped) {
                return std::unexpected(escaped.error());
            }
            continue;
        }
        if (byte < 0x20) {
            return std::unexpected(read_error(*this, ErrorCode::ControlCharacterWhileParsingString));
        }
        discard();
    }
}

Result<Reference> IoRead::scan_symbol(std::string &scratch, ErrorCode invalid) {
    while (true) {
        auto ch = peek();
        if (!ch) {
            return std::unexpected(ch.error());
        }
        if (!*ch || is_delimiter(**ch)) {
            return Reference::copied(scratch);
        }
        if (!kSymbolByte[**ch]) {
            return std::unexpected(read_error(*this, invalid));
        }
        discard();
        scratch.push_back(static_cast<char>(**ch));
    }
}

Result<Reference> IoRead::parse_symbol(std::string &scratch, std::uint8_t first) {
    scratch.clear();
    scratch.push_back(static_cast<char>(first));
    return scan_symbol(scratch, ErrorCode::InvalidSymbol);
}

Result<Reference> IoRead::parse_keyword(std::string &scratch) {
    scratch.clear();
    auto ch = peek();
    if (!ch) {
        return std::unexpected(ch.error());
    }
    if (!*ch || !kSymbolByte[**ch]) {
        return std::unexpected(read_error(*this, ErrorCode::InvalidKeyword));
    }
    return scan_symbol(scratch, ErrorCode::InvalidKeyword);
}

Result<std::optional<Reference>> IoRead::parse_reserved_or_symbol(std::string &scratch, std::string_view reserved) {
    scratch.clear();
    scratch.push_back(reserved[0]);
    std::size_t offset = 1;
    while (true) {
        auto ch = peek();
        if (!ch) {
            return std::unexpected(ch.error());
        }
        if (!*ch || is_delimiter(**ch)) {
            if (offset == reserved.size()) {
                return std::optional<Reference>{};
            }
            return std::optional<Reference>(Reference::copied(scratch));
        }
        std::uint8_t byte = **ch;
        if (offset < reserved.size() && byte == static_cast<std::uint8_t>(reserved[offset])) {
            discard();
            scratch.push_back(static_cast<char>(byte));
            offset += 1;
            continue;
        }
        auto symbol = scan_symbol(scratch, ErrorCode::InvalidSymbol);
        if (!symbol) {
            return std::unexpected(symbol.error());
        }
        return std::optional<Reference>(*symbol);
    }
}

Result<std::uint16_t> IoRead::decode_hex_escape() {
    std::uint16_t n = 0;
    for (int i = 0; i < 4; ++i) {
        auto ch = next();
        if (!ch) {
            return std::unexpected(ch.error());
        }
        if (!*ch) {
            return std::unexpected(read_error(*this, ErrorCode::EofWhileParsingString));
        }
        std::uint8_t value = kHexValue[**ch];
        if (value == 255) {
            return std::unexpected(read_error(*this, ErrorCode::InvalidEscape));
        }
        n = static_cast<std::uint16_t>(n * 16 + value);
    }
    return n;
}

} // namespace ednkit::edn
