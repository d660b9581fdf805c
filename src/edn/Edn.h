#ifndef EDNKIT_EDN_EDN_H
#define EDNKIT_EDN_EDN_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "Bridge.h"
#include "EdnDecode.h"
#include "EdnEncode.h"
#include "Error.h"
#include "Read.h"
#include "Serializer.h"
#include "Value.h"
#include "ValueDeserializer.h"
#include "ValueEncode.h"
#include "Visitor.h"

namespace ednkit::edn {

/// Parses exactly one value; only whitespace may follow it.
[[nodiscard]] Result<Value> from_str(std::string_view text);
/// Same as from_str but over raw bytes, which are validated as UTF-8.
[[nodiscard]] Result<Value> from_slice(const std::uint8_t *data, std::size_t len);
[[nodiscard]] Result<Value> from_reader(Reader &reader);
/// Drives `visitor` with the tokens of one value.
[[nodiscard]] Result<void> visit_str(std::string_view text, Visitor &visitor);

namespace detail {

template <typename T, typename R>
Result<T> decode_one(R read) {
    Deserializer<R> de{std::move(read)};
    auto value = Deserialize<T>::deserialize(de);
    if (!value) {
        return std::unexpected(value.error());
    }
    auto ended = de.end();
    if (!ended) {
        return std::unexpected(ended.error());
    }
    return value;
}

template <typename T>
Result<void> encode_to(OutputSink &sink, const T &value, bool pretty) {
    Generator gen(sink);
    if (pretty) {
        gen.set_option(Generator::Option::Beauty);
    }
    Serializer ser(gen);
    auto written = Serialize<T>::serialize(ser, value);
    if (!written) {
        return written;
    }
    auto flushed = sink.flush();
    if (!flushed) {
        return std::unexpected(Error::io(flushed.error()));
    }
    return {};
}

} // namespace detail

template <typename T>
Result<T> from_str(std::string_view text) {
    return detail::decode_one<T>(StrRead(text));
}

template <typename T>
Result<T> from_slice(const std::uint8_t *data, std::size_t len) {
    return detail::decode_one<T>(SliceRead(data, len));
}

template <typename T>
Result<T> from_reader(Reader &reader) {
    return detail::decode_one<T>(IoRead(reader));
}

template <typename T>
Result<T> from_value(const Value &value) {
    ValueDeserializer de(value);
    return Deserialize<T>::deserialize(de);
}

template <typename T>
Result<Value> to_value(const T &value) {
    ValueSerializer ser;
    auto written = Serialize<T>::serialize(ser, value);
    if (!written) {
        return std::unexpected(written.error());
    }
    return ser.take();
}

template <typename T>
Result<void> to_writer(OutputSink &sink, const T &value) {
    return detail::encode_to(sink, value, false);
}

template <typename T>
Result<void> to_writer_pretty(OutputSink &sink, const T &value) {
    return detail::encode_to(sink, value, true);
}

template <typename T>
Result<std::string> to_string(const T &value) {
    StringSink sink;
    auto written = to_writer(sink, value);
    if (!written) {
        return std::unexpected(written.error());
    }
    return sink.take();
}

template <typename T>
Result<std::string> to_string_pretty(const T &value) {
    StringSink sink;
    auto written = to_writer_pretty(sink, value);
    if (!written) {
        return std::unexpected(written.error());
    }
    return sink.take();
}

} // namespace ednkit::edn

#endif // EDNKIT_EDN_EDN_H
