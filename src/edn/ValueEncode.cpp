#include "ValueEncode.h"

#include <cstdio>
#include <ostream>

#include "common/Assert.h"

namespace ednkit::edn {
namespace {

Generator::Result encode_items(Generator &gen, const Value::Sequence &items) {
    for (const Value &item : items) {
        Generator::Result result = encode_value(gen, item);
        if (result != Generator::Result::OK) {
            return result;
        }
    }
    return Generator::Result::OK;
}

Generator::Result encode_map(Generator &gen, const Map &map) {
    Generator::Result result = gen.map_open();
    if (result != Generator::Result::OK) {
        return result;
    }
    for (const auto &[key, value] : map) {
        result = encode_value(gen, key);
        if (result != Generator::Result::OK) {
            return result;
        }
        result = encode_value(gen, value);
        if (result != Generator::Result::OK) {
            return result;
        }
    }
    return gen.map_close();
}

} // namespace

Generator::Result encode_value(Generator &gen, const Value &value) {
    switch (value.type()) {
    case ValueType::Nil:
        return gen.nil_value();
    case ValueType::Bool:
        return gen.bool_value(*value.as_bool());
    case ValueType::Number:
        return gen.number(*value.as_number());
    case ValueType::String:
        return gen.string(*value.as_str());
    case ValueType::Char:
        return gen.character(*value.as_char());
    case ValueType::Keyword:
        return gen.keyword(*value.as_keyword());
    case ValueType::Symbol:
        return gen.symbol(*value.as_symbol());
    case ValueType::Vector: {
        Generator::Result result = gen.vector_open();
        if (result != Generator::Result::OK) {
            return result;
        }
        result = encode_items(gen, *value.as_vector());
        if (result != Generator::Result::OK) {
            return result;
        }
        return gen.vector_close();
    }
    case ValueType::List: {
        Generator::Result result = gen.list_open();
        if (result != Generator::Result::OK) {
            return result;
        }
        result = encode_items(gen, *value.as_list());
        if (result != Generator::Result::OK) {
            return result;
        }
        return gen.list_close();
    }
    case ValueType::Set: {
        Generator::Result result = gen.set_open();
        if (result != Generator::Result::OK) {
            return result;
        }
        result = encode_items(gen, *value.as_set());
        if (result != Generator::Result::OK) {
            return result;
        }
        return gen.set_close();
    }
    case ValueType::Object:
        return encode_map(gen, *value.as_object());
    }
    return Generator::Result::ErrorState;
}

Result<void> write_value(OutputSink &sink, const Value &value, bool pretty) {
    Generator gen(sink);
    gen.set_option(Generator::Option::Beauty, pretty);
    auto written = generator_result(gen, encode_value(gen, value));
    if (!written) {
        return written;
    }
    auto flushed = sink.flush();
    if (!flushed) {
        return std::unexpected(Error::io(flushed.error()));
    }
    return {};
}

std::string Value::to_string() const {
    StringSink sink;
    auto written = write_value(sink, *this, false);
    EDNKIT_ASSERT_MSG(written.has_value(), "string sink cannot fail");
    return sink.take();
}

std::string Value::to_string_pretty() const {
    StringSink sink;
    auto written = write_value(sink, *this, true);
    EDNKIT_ASSERT_MSG(written.has_value(), "string sink cannot fail");
    return sink.take();
}

void Value::print_to_stderr() const {
    FileSink sink(stderr);
    auto written = write_value(sink, *this, true);
    if (!written) {
        std::fprintf(stderr, "<unprintable value: %s>\n", written.error().to_string().c_str());
        return;
    }
    std::fputc('\n', stderr);
}

std::ostream &operator<<(std::ostream &os, const Value &value) { return os << value.to_string(); }

} // namespace ednkit::edn
