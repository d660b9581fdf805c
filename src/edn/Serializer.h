#ifndef EDNKIT_EDN_SERIALIZER_H
#define EDNKIT_EDN_SERIALIZER_H

#include <cstdint>
#include <string_view>
#include <vector>

#include "EdnEncode.h"
#include "Error.h"
#include "Value.h"
#include "Visitor.h"

namespace ednkit::edn {

/// Serialize<T> target writing text through a Generator.
class Serializer {
public:
    explicit Serializer(Generator &gen);
    Serializer(const Serializer &) = delete;
    Serializer &operator=(const Serializer &) = delete;

    [[nodiscard]] Result<void> serialize_nil();
    [[nodiscard]] Result<void> serialize_bool(bool value);
    [[nodiscard]] Result<void> serialize_i64(std::int64_t value);
    [[nodiscard]] Result<void> serialize_u64(std::uint64_t value);
    [[nodiscard]] Result<void> serialize_f64(double value);
    [[nodiscard]] Result<void> serialize_string(std::string_view value);
    [[nodiscard]] Result<void> serialize_char(char32_t value);
    [[nodiscard]] Result<void> serialize_keyword(std::string_view name);
    [[nodiscard]] Result<void> serialize_symbol(std::string_view name);
    [[nodiscard]] Result<void> serialize_value(const Value &value);

    /// `kind` is List, Vector or Set.
    [[nodiscard]] Result<void> begin_seq(ContainerKind kind);
    [[nodiscard]] Result<void> end_seq();
    [[nodiscard]] Result<void> begin_map();
    [[nodiscard]] Result<void> end_map();

private:
    [[nodiscard]] Result<void> check(Generator::Result result) const;

    Generator &gen_;
    std::vector<ContainerKind> open_;
};

/// Serialize<T> target producing a Value tree.
class ValueSerializer {
public:
    ValueSerializer() = default;
    ValueSerializer(const ValueSerializer &) = delete;
    ValueSerializer &operator=(const ValueSerializer &) = delete;

    [[nodiscard]] Result<void> serialize_nil();
    [[nodiscard]] Result<void> serialize_bool(bool value);
    [[nodiscard]] Result<void> serialize_i64(std::int64_t value);
    [[nodiscard]] Result<void> serialize_u64(std::uint64_t value);
    [[nodiscard]] Result<void> serialize_f64(double value);
    [[nodiscard]] Result<void> serialize_string(std::string_view value);
    [[nodiscard]] Result<void> serialize_char(char32_t value);
    [[nodiscard]] Result<void> serialize_keyword(std::string_view name);
    [[nodiscard]] Result<void> serialize_symbol(std::string_view name);
    [[nodiscard]] Result<void> serialize_value(const Value &value);

    [[nodiscard]] Result<void> begin_seq(ContainerKind kind);
    [[nodiscard]] Result<void> end_seq();
    [[nodiscard]] Result<void> begin_map();
    [[nodiscard]] Result<void> end_map();

    /// The built value; fails while a container is still open or nothing was written.
    [[nodiscard]] Result<Value> take();

private:
    [[nodiscard]] Result<void> end(ContainerKind kind);

    ValueBuilder builder_;
    std::vector<ContainerKind> open_;
};

} // namespace ednkit::edn

#endif // EDNKIT_EDN_SERIALIZER_H
