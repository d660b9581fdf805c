#ifndef EDNKIT_EDN_READ_H
#define EDNKIT_EDN_READ_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <optional>
#include <string>
#include <string_view>

#include "Error.h"
#include "common/IoError.h"

namespace ednkit::edn {

/// Text produced by a scanner primitive: either a view into the caller's input
/// (valid as long as the input is) or a view into the scratch buffer (valid until
/// the next scanner call).
class Reference {
public:
    enum class Kind : std::uint8_t {
        Borrowed,
        Copied,
    };

    static Reference borrowed(std::string_view text) { return Reference(Kind::Borrowed, text); }
    static Reference copied(std::string_view text) { return Reference(Kind::Copied, text); }

    [[nodiscard]] Kind kind() const { return kind_; }
    [[nodiscard]] bool is_borrowed() const { return kind_ == Kind::Borrowed; }
    [[nodiscard]] std::string_view view() const { return text_; }
    [[nodiscard]] std::string to_string() const { return std::string(text_); }

private:
    Reference(Kind kind, std::string_view text) : kind_(kind), text_(text) {}

    Kind kind_;
    std::string_view text_;
};

/// Blocking pull source used by IoRead.
class Reader {
public:
    virtual ~Reader() = default;
    /// Reads up to `len` bytes; 0 signals end of input.
    [[nodiscard]] virtual common::IoResult<std::size_t> read(char *buf, std::size_t len) = 0;
};

class FdReader final : public Reader {
public:
    explicit FdReader(int fd);
    [[nodiscard]] common::IoResult<std::size_t> read(char *buf, std::size_t len) override;

private:
    int fd_;
};

class FileReader final : public Reader {
public:
    explicit FileReader(std::FILE *file);
    [[nodiscard]] common::IoResult<std::size_t> read(char *buf, std::size_t len) override;

private:
    std::FILE *file_;
};

/// Byte slice source. Scanned text is returned as a borrowed view whenever no
/// escape had to be decoded.
class SliceRead {
public:
    explicit SliceRead(std::string_view bytes);
    SliceRead(const std::uint8_t *data, std::size_t len);

    [[nodiscard]] Result<std::optional<std::uint8_t>> next();
    [[nodiscard]] Result<std::optional<std::uint8_t>> peek();
    /// Consumes the byte returned by the last peek().
    void discard();

    [[nodiscard]] Position position() const;
    [[nodiscard]] Position peek_position() const;
    [[nodiscard]] std::size_t byte_offset() const;

    /// Opening quote already consumed.
    [[nodiscard]] Result<Reference> parse_str(std::string &scratch);
    [[nodiscard]] Result<void> ignore_str();
    /// `first` is the already consumed leading byte of the symbol.
    [[nodiscard]] Result<Reference> parse_symbol(std::string &scratch, std::uint8_t first);
    /// Leading ':' already consumed.
    [[nodiscard]] Result<Reference> parse_keyword(std::string &scratch);
    /// First byte of `reserved` already consumed. Empty optional when the
    /// reserved word itself was read, otherwise the symbol that shares its prefix.
    [[nodiscard]] Result<std::optional<Reference>> parse_reserved_or_symbol(std::string &scratch,
                                                                            std::string_view reserved);
    [[nodiscard]] Result<std::uint16_t> decode_hex_escape();

protected:
    SliceRead(const char *data, std::size_t len, bool validate_utf8);

private:
    [[nodiscard]] Position position_of_index(std::size_t index) const;
    [[nodiscard]] Result<Reference> scan_symbol(std::size_t start, ErrorCode invalid);
    [[nodiscard]] Result<Reference> finish_str(Reference text);

    const char *data_;
    std::size_t len_;
    std::size_t index_ = 0;
    bool validate_utf8_;
};

/// Source over text already known to be valid UTF-8.
class StrRead final : public SliceRead {
public:
    explicit StrRead(std::string_view text);
};

/// Buffered source over a Reader. Every scanned token is copied into scratch.
class IoRead {
public:
    explicit IoRead(Reader &reader);
    IoRead(const IoRead &) = delete;
    IoRead &operator=(const IoRead &) = delete;
    IoRead(IoRead &&) = default;

    [[nodiscard]] Result<std::optional<std::uint8_t>> next();
    [[nodiscard]] Result<std::optional<std::uint8_t>> peek();
    void discard();

    [[nodiscard]] Position position() const;
    [[nodiscard]] Position peek_position() const;
    [[nodiscard]] std::size_t byte_offset() const;

    [[nodiscard]] Result<Reference> parse_str(std::string &scratch);
    [[nodiscard]] Result<void> ignore_str();
    [[nodiscard]] Result<Reference> parse_symbol(std::string &scratch, std::uint8_t first);
    [[nodiscard]] Result<Reference> parse_keyword(std::string &scratch);
    [[nodiscard]] Result<std::optional<Reference>> parse_reserved_or_symbol(std::string &scratch,
                                                                            std::string_view reserved);
    [[nodiscard]] Result<std::uint16_t> decode_hex_escape();

private:
    static constexpr std::size_t kBufferSize = 4096;

    [[nodiscard]] Result<bool> fill();
    [[nodiscard]] Result<std::optional<std::uint8_t>> next_raw();
    void advance_position(std::uint8_t ch);
    void take_plain_run(std::string *out);
    [[nodiscard]] Result<Reference> scan_symbol(std::string &scratch, ErrorCode invalid);

    Reader &reader_;
    std::array<char, kBufferSize> buffer_{};
    std::size_t buffer_pos_ = 0;
    std::size_t buffer_len_ = 0;
    bool eof_ = false;
    std::optional<std::uint8_t> peeked_;
    std::size_t line_ = 1;
    std::size_t column_ = 0;
    std::size_t offset_ = 0;
};

} // namespace ednkit::edn

#endif // EDNKIT_EDN_READ_H
