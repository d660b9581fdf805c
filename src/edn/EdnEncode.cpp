#include "EdnEncode.h"

#include <cerrno>
#include <charconv>
#include <system_error>
#include <unistd.h>

#include "Tables.h"
#include "Utf.h"

namespace ednkit::edn {

common::IoResult<void> StringSink::write(const char *data, std::size_t len) {
    out_.append(data, len);
    return {};
}

FdSink::FdSink(int fd) : fd_(fd) {}

common::IoResult<void> FdSink::write(const char *data, std::size_t len) {
    while (len > 0) {
        ssize_t n = ::write(fd_, data, len);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return std::unexpected(common::io_err_from_errno(errno));
        }
        data += n;
        len -= static_cast<std::size_t>(n);
    }
    return {};
}

FileSink::FileSink(std::FILE *file) : file_(file) {}

common::IoResult<void> FileSink::write(const char *data, std::size_t len) {
    if (!file_) {
        return std::unexpected(common::IoErr::BadFd);
    }
    if (std::fwrite(data, 1, len, file_) != len) {
        int err = errno;
        return std::unexpected(err != 0 ? common::io_err_from_errno(err) : common::IoErr::Unknown);
    }
    return {};
}

common::IoResult<void> FileSink::flush() {
    if (!file_) {
        return std::unexpected(common::IoErr::BadFd);
    }
    if (std::fflush(file_) != 0) {
        return std::unexpected(common::io_err_from_errno(errno));
    }
    return {};
}

Generator::Generator(OutputSink &sink) : sink_(sink) { clear(); }

void Generator::clear() {
    frames_.clear();
    frames_.push_back(Frame{State::Start, '\0'});
    io_error_ = common::IoErr::None;
}

void Generator::set_option(Option opt, bool enabled) {
    auto bit = static_cast<std::uint32_t>(opt);
    if (enabled) {
        options_ |= bit;
    } else {
        options_ &= ~bit;
    }
}

void Generator::set_indent_string(const std::string &indent) {
    indent_string_ = indent;
    set_option(Option::IndentString, true);
}

Generator::State Generator::get_state() const { return current_state(); }

Generator::Result Generator::list_open() { return open("(", State::SeqStart, ')'); }

Generator::Result Generator::list_close() { return close(')', false); }

Generator::Result Generator::vector_open() { return open("[", State::SeqStart, ']'); }

Generator::Result Generator::vector_close() { return close(']', false); }

Generator::Result Generator::set_open() { return open("#{", State::SeqStart, '}'); }

Generator::Result Generator::set_close() { return close('}', false); }

Generator::Result Generator::map_open() { return open("{", State::MapStart, '}'); }

Generator::Result Generator::map_close() { return close('}', true); }

Generator::Result Generator::open(std::string_view opener, State start, char close) {
    Result result = prefix_for_value();
    if (result != Result::OK) {
        return result;
    }
    result = append(opener);
    if (result != Result::OK) {
        return result;
    }
    frames_.push_back(Frame{start, close});
    return Result::OK;
}

Generator::Result Generator::close(char close, bool map) {
    State state = current_state();
    if (frames_.size() < 2 || frames_.back().close != close) {
        return set_error(Result::ErrorState);
    }
    bool in_map = state == State::MapStart || state == State::MapKey;
    bool in_seq = state == State::SeqStart || state == State::InSeq;
    if ((map && !in_map) || (!map && !in_seq)) {
        return set_error(Result::ErrorState);
    }
    if (has_option(Option::Beauty) && (state == State::InSeq || state == State::MapKey)) {
        Result result = append_newline_indent(frames_.size() - 2);
        if (result != Result::OK) {
            return result;
        }
    }
    Result result = append(close);
    if (result != Result::OK) {
        return result;
    }
    frames_.pop_back();
    return finish_value();
}

Generator::Result Generator::nil_value() {
    Result result = prefix_for_value();
    if (result != Result::OK) {
        return result;
    }
    result = append("nil", 3);
    if (result != Result::OK) {
        return result;
    }
    return finish_value();
}

Generator::Result Generator::bool_value(bool value) {
    Result result = prefix_for_value();
    if (result != Result::OK) {
        return result;
    }
    if (value) {
        result = append("true", 4);
    } else {
        result = append("false", 5);
    }
    if (result != Result::OK) {
        return result;
    }
    return finish_value();
}

Generator::Result Generator::integer(std::int64_t value) {
    Result result = prefix_for_value();
    if (result != Result::OK) {
        return result;
    }
    char buf[32];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    if (ec != std::errc()) {
        return set_error(Result::ErrorState);
    }
    result = append(buf, static_cast<std::size_t>(ptr - buf));
    if (result != Result::OK) {
        return result;
    }
    return finish_value();
}

Generator::Result Generator::unsigned_integer(std::uint64_t value) {
    Result result = prefix_for_value();
    if (result != Result::OK) {
        return result;
    }
    char buf[32];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    if (ec != std::errc()) {
        return set_error(Result::ErrorState);
    }
    result = append(buf, static_cast<std::size_t>(ptr - buf));
    if (result != Result::OK) {
        return result;
    }
    return finish_value();
}

Generator::Result Generator::double_value(double value) {
    Result result = prefix_for_value();
    if (result != Result::OK) {
        return result;
    }
    result = append(format_f64(value));
    if (result != Result::OK) {
        return result;
    }
    return finish_value();
}

Generator::Result Generator::number(const Number &value) {
    switch (value.kind()) {
    case Number::Kind::PosInt:
        return unsigned_integer(*value.as_u64());
    case Number::Kind::NegInt:
        return integer(*value.as_i64());
    case Number::Kind::Float:
        return double_value(*value.as_f64());
    }
    return set_error(Result::ErrorState);
}

Generator::Result Generator::string(const char *str, std::size_t len) {
    Result result = prefix_for_value();
    if (result != Result::OK) {
        return result;
    }
    result = write_string(str, len);
    if (result != Result::OK) {
        return result;
    }
    return finish_value();
}

Generator::Result Generator::string(std::string_view str) { return string(str.data(), str.size()); }

Generator::Result Generator::character(char32_t value) {
    if (!is_scalar_value(static_cast<std::uint32_t>(value))) {
        return set_error(Result::InvalidToken);
    }
    Result result = prefix_for_value();
    if (result != Result::OK) {
        return result;
    }
    switch (value) {
    case U'\n':
        result = append("\\newline");
        break;
    case U'\r':
        result = append("\\return");
        break;
    case U'\t':
        result = append("\\tab");
        break;
    case U' ':
        result = append("\\space");
        break;
    default:
        if (value < 0x20 || value == 0x7F) {
            char buf[6] = {'\\', 'u', '0', '0', '0', '0'};
            const char *hex = "0123456789ABCDEF";
            buf[4] = hex[(value >> 4) & 0x0F];
            buf[5] = hex[value & 0x0F];
            result = append(buf, sizeof(buf));
        } else {
            std::string text = "\\";
            utf8_append(static_cast<std::uint32_t>(value), text);
            result = append(text);
        }
        break;
    }
    if (result != Result::OK) {
        return result;
    }
    return finish_value();
}

Generator::Result Generator::keyword(std::string_view name) {
    if (!is_keyword_name(name)) {
        return set_error(Result::InvalidToken);
    }
    return write_token(':', name);
}

Generator::Result Generator::symbol(std::string_view name) {
    if (!is_symbol_name(name)) {
        return set_error(Result::InvalidToken);
    }
    return write_token('\0', name);
}

Generator::Result Generator::write_token(char lead, std::string_view body) {
    Result result = prefix_for_value();
    if (result != Result::OK) {
        return result;
    }
    if (lead != '\0') {
        result = append(lead);
        if (result != Result::OK) {
            return result;
        }
    }
    result = append(body);
    if (result != Result::OK) {
        return result;
    }
    return finish_value();
}

bool Generator::has_option(Option opt) const { return (options_ & static_cast<std::uint32_t>(opt)) != 0; }

Generator::Result Generator::append(const char *data, std::size_t len) {
    if (len == 0) {
        return Result::OK;
    }
    auto written = sink_.write(data, len);
    if (!written) {
        io_error_ = written.error();
        return set_error(Result::IoError);
    }
    return Result::OK;
}

Generator::Result Generator::append(char ch) { return append(&ch, 1); }

Generator::Result Generator::append(std::string_view text) { return append(text.data(), text.size()); }

Generator::Result Generator::append_newline_indent(std::size_t level) {
    Result result = append('\n');
    if (result != Result::OK) {
        return result;
    }
    if (indent_string_.empty()) {
        return Result::OK;
    }
    for (std::size_t i = 0; i < level; ++i) {
        result = append(indent_string_.data(), indent_string_.size());
        if (result != Result::OK) {
            return result;
        }
    }
    return Result::OK;
}

Generator::Result Generator::prefix_for_value() {
    State state = current_state();
    if (state == State::Error) {
        return Result::ErrorState;
    }
    if (state == State::Complete) {
        return Result::GenerateComplete;
    }
    bool beauty = has_option(Option::Beauty);
    std::size_t level = frames_.size() - 1;
    switch (state) {
    case State::SeqStart:
    case State::MapStart:
        if (beauty) {
            return append_newline_indent(level);
        }
        return Result::OK;
    case State::InSeq:
    case State::MapKey:
        if (beauty) {
            return append_newline_indent(level);
        }
        return append(' ');
    case State::MapValue:
        return append(' ');
    default:
        return Result::OK;
    }
}

Generator::Result Generator::write_string(const char *str, std::size_t len) {
    if (!str && len > 0) {
        return set_error(Result::ErrorState);
    }
    Result result = append('\"');
    if (result != Result::OK) {
        return result;
    }
    const auto *data = reinterpret_cast<const unsigned char *>(str);
    std::size_t run = 0;
    for (std::size_t i = 0; i < len; ++i) {
        unsigned char ch = data[i];
        if (ch >= 0x20 && ch != '\"' && ch != '\\') {
            continue;
        }
        result = append(str + run, i - run);
        if (result != Result::OK) {
            return result;
        }
        run = i + 1;
        switch (ch) {
        case '\"':
            result = append("\\\"", 2);
            break;
        case '\\':
            result = append("\\\\", 2);
            break;
        case '\b':
            result = append("\\b", 2);
            break;
        case '\f':
            result = append("\\f", 2);
            break;
        case '\n':
            result = append("\\n", 2);
            break;
        case '\r':
            result = append("\\r", 2);
            break;
        case '\t':
            result = append("\\t", 2);
            break;
        default: {
            char buf[6] = {'\\', 'u', '0', '0', '0', '0'};
            const char *hex = "0123456789ABCDEF";
            buf[4] = hex[(ch >> 4) & 0x0F];
            buf[5] = hex[ch & 0x0F];
            result = append(buf, sizeof(buf));
            break;
        }
        }
        if (result != Result::OK) {
            return result;
        }
    }
    result = append(str + run, len - run);
    if (result != Result::OK) {
        return result;
    }
    return append('\"');
}

Generator::Result Generator::finish_value() {
    State &state = current_state();
    switch (state) {
    case State::Start:
        state = State::Complete;
        return Result::OK;
    case State::SeqStart:
    case State::InSeq:
        state = State::InSeq;
        return Result::OK;
    case State::MapStart:
    case State::MapKey:
        state = State::MapValue;
        return Result::OK;
    case State::MapValue:
        state = State::MapKey;
        return Result::OK;
    case State::Complete:
        return Result::GenerateComplete;
    case State::Error:
        return Result::ErrorState;
    }
    return set_error(Result::ErrorState);
}

Generator::Result Generator::set_error(Result result) {
    current_state() = State::Error;
    return result;
}

Generator::State &Generator::current_state() { return frames_.back().state; }

const Generator::State &Generator::current_state() const { return frames_.back().state; }

Result<void> generator_result(const Generator &gen, Generator::Result result) {
    switch (result) {
    case Generator::Result::OK:
        return {};
    case Generator::Result::IoError:
        return std::unexpected(Error::io(gen.io_error()));
    case Generator::Result::ErrorState:
        return std::unexpected(Error::data("generator call out of order"));
    case Generator::Result::GenerateComplete:
        return std::unexpected(Error::data("top-level value already complete"));
    case Generator::Result::InvalidToken:
        return std::unexpected(Error::data("keyword, symbol or character cannot be written as EDN"));
    }
    return std::unexpected(Error::data("unknown generator status"));
}

} // namespace ednkit::edn
