#ifndef EDNKIT_EDN_EDNENCODE_H
#define EDNKIT_EDN_EDNENCODE_H

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "Error.h"
#include "Number.h"
#include "common/IoError.h"

namespace ednkit::edn {

class OutputSink {
public:
    virtual ~OutputSink() = default;
    [[nodiscard]] virtual common::IoResult<void> write(const char *data, std::size_t len) = 0;
    [[nodiscard]] virtual common::IoResult<void> flush() { return {}; }
};

class StringSink final : public OutputSink {
public:
    [[nodiscard]] common::IoResult<void> write(const char *data, std::size_t len) override;

    [[nodiscard]] const std::string &str() const { return out_; }
    std::string take() { return std::move(out_); }
    void clear() { out_.clear(); }

private:
    std::string out_;
};

/// Writes straight to a file descriptor; short writes are retried.
class FdSink final : public OutputSink {
public:
    explicit FdSink(int fd);
    [[nodiscard]] common::IoResult<void> write(const char *data, std::size_t len) override;

private:
    int fd_;
};

class FileSink final : public OutputSink {
public:
    explicit FileSink(std::FILE *file);
    [[nodiscard]] common::IoResult<void> write(const char *data, std::size_t len) override;
    [[nodiscard]] common::IoResult<void> flush() override;

private:
    std::FILE *file_;
};

/// Streaming text generator. Containers are opened and closed explicitly; any
/// value may stand in key position of a map.
class Generator {
public:
    enum class State { Start, MapStart, MapKey, MapValue, SeqStart, InSeq, Complete, Error };
    enum class Result {
        OK = 0,
        /** a call did not fit the current state, e.g. closing the wrong container */
        ErrorState,
        /** a complete top-level value has already been generated */
        GenerateComplete,
        /** the sink rejected a write, see io_error() */
        IoError,
        /** a keyword, symbol or character that would not read back as itself */
        InvalidToken,
    };

    enum class Option : std::uint32_t {
        /** one element per line, indented */
        Beauty = 0x01,
        /** set through set_indent_string(), two spaces by default */
        IndentString = 0x02,
    };

    explicit Generator(OutputSink &sink);
    Generator(const Generator &) = delete;
    Generator &operator=(const Generator &) = delete;
    Generator(Generator &&) = delete;
    Generator &operator=(Generator &&) = delete;

    void clear();
    void set_option(Option opt, bool enabled = true);
    void set_indent_string(const std::string &indent);

    [[nodiscard]] State get_state() const;
    [[nodiscard]] common::IoErr io_error() const { return io_error_; }

    Result list_open();
    Result list_close();
    Result vector_open();
    Result vector_close();
    Result set_open();
    Result set_close();
    Result map_open();
    Result map_close();

    Result nil_value();
    Result bool_value(bool value);
    Result integer(std::int64_t value);
    Result unsigned_integer(std::uint64_t value);
    Result double_value(double value);
    Result number(const Number &value);
    Result string(const char *str, std::size_t len);
    Result string(std::string_view str);
    Result character(char32_t value);
    Result keyword(std::string_view name);
    Result symbol(std::string_view name);

private:
    struct Frame {
        State state;
        char close;
    };

    [[nodiscard]] bool has_option(Option opt) const;
    [[nodiscard]] Result append(const char *data, std::size_t len);
    [[nodiscard]] Result append(char ch);
    [[nodiscard]] Result append(std::string_view text);
    [[nodiscard]] Result append_newline_indent(std::size_t level);
    [[nodiscard]] Result prefix_for_value();
    [[nodiscard]] Result write_string(const char *str, std::size_t len);
    [[nodiscard]] Result write_token(char lead, std::string_view body);
    [[nodiscard]] Result open(std::string_view opener, State start, char close);
    [[nodiscard]] Result close(char close, bool map);
    [[nodiscard]] Result finish_value();
    [[nodiscard]] Result set_error(Result result);
    [[nodiscard]] State &current_state();
    [[nodiscard]] const State &current_state() const;

    OutputSink &sink_;
    std::vector<Frame> frames_;
    std::uint32_t options_ = 0;
    std::string indent_string_ = "  ";
    common::IoErr io_error_ = common::IoErr::None;
};

/// Maps a generator status onto an Error: sink failures become Io errors, misuse a data error.
[[nodiscard]] edn::Result<void> generator_result(const Generator &gen, Generator::Result result);

} // namespace ednkit::edn

#endif // EDNKIT_EDN_EDNENCODE_H
