#include "Edn.h"

namespace ednkit::edn {
namespace {

template <typename R>
Result<Value> parse_one(R read) {
    Deserializer<R> de{std::move(read)};
    auto value = de.parse_value();
    if (!value) {
        return value;
    }
    auto ended = de.end();
    if (!ended) {
        return std::unexpected(ended.error());
    }
    return value;
}

} // namespace

Result<Value> from_str(std::string_view text) { return parse_one(StrRead(text)); }

Result<Value> from_slice(const std::uint8_t *data, std::size_t len) { return parse_one(SliceRead(data, len)); }

Result<Value> from_reader(Reader &reader) { return parse_one(IoRead(reader)); }

Result<void> visit_str(std::string_view text, Visitor &visitor) {
    Deserializer<StrRead> de{StrRead(text)};
    auto visited = de.deserialize_any(visitor);
    if (!visited) {
        return visited;
    }
    return de.end();
}

} // namespace ednkit::edn
