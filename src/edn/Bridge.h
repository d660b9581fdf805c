#ifndef EDNKIT_EDN_BRIDGE_H
#define EDNKIT_EDN_BRIDGE_H

#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include "Error.h"
#include "Value.h"
#include "Visitor.h"

namespace ednkit::edn {

/// Binds a record member to its keyword name, e.g. `field("port", &Config::port)`.
template <typename T, typename M>
struct Field {
    using record_type = T;
    using member_type = M;

    std::string_view name;
    M T::*member;
};

template <typename T, typename M>
constexpr Field<T, M> field(std::string_view name, M T::*member) {
    return Field<T, M>{name, member};
}

template <typename D>
concept EdnDeserializer = requires(D &de, Error err) {
    { de.deserialize_nil() } -> std::same_as<Result<void>>;
    { de.try_nil() } -> std::same_as<Result<bool>>;
    { de.deserialize_bool() } -> std::same_as<Result<bool>>;
    { de.deserialize_number() } -> std::same_as<Result<Number>>;
    { de.deserialize_string() } -> std::same_as<Result<std::string>>;
    { de.deserialize_char() } -> std::same_as<Result<char32_t>>;
    { de.deserialize_keyword() } -> std::same_as<Result<std::string>>;
    { de.deserialize_symbol() } -> std::same_as<Result<std::string>>;
    { de.deserialize_identifier() } -> std::same_as<Result<std::string>>;
    { de.deserialize_value() } -> std::same_as<Result<Value>>;
    { de.begin_seq() } -> std::same_as<Result<ContainerKind>>;
    { de.next_element() } -> std::same_as<Result<bool>>;
    { de.begin_map() } -> std::same_as<Result<void>>;
    { de.next_key() } -> std::same_as<Result<bool>>;
    { de.next_value() } -> std::same_as<Result<void>>;
    { de.skip_value() } -> std::same_as<Result<void>>;
    { de.fix_position(err) } -> std::same_as<Error>;
};

template <typename S>
concept EdnSerializer = requires(S &ser, const Value &value, std::string_view text) {
    { ser.serialize_nil() } -> std::same_as<Result<void>>;
    { ser.serialize_bool(true) } -> std::same_as<Result<void>>;
    { ser.serialize_i64(std::int64_t{0}) } -> std::same_as<Result<void>>;
    { ser.serialize_u64(std::uint64_t{0}) } -> std::same_as<Result<void>>;
    { ser.serialize_f64(0.0) } -> std::same_as<Result<void>>;
    { ser.serialize_string(text) } -> std::same_as<Result<void>>;
    { ser.serialize_char(U'a') } -> std::same_as<Result<void>>;
    { ser.serialize_keyword(text) } -> std::same_as<Result<void>>;
    { ser.serialize_symbol(text) } -> std::same_as<Result<void>>;
    { ser.serialize_value(value) } -> std::same_as<Result<void>>;
    { ser.begin_seq(ContainerKind::Vector) } -> std::same_as<Result<void>>;
    { ser.end_seq() } -> std::same_as<Result<void>>;
    { ser.begin_map() } -> std::same_as<Result<void>>;
    { ser.end_map() } -> std::same_as<Result<void>>;
};

template <typename T>
struct Deserialize;

template <typename T>
struct Serialize;

namespace detail {

template <typename T>
concept Record = requires { T::edn_fields(); };

template <typename T>
struct IsOptional : std::false_type {};

template <typename T>
struct IsOptional<std::optional<T>> : std::true_type {};

template <Integer T>
constexpr const char *integer_name() {
    if constexpr (std::is_signed_v<T>) {
        switch (sizeof(T)) {
        case 1:
            return "i8";
        case 2:
            return "i16";
        case 4:
            return "i32";
        default:
            return "i64";
        }
    } else {
        switch (sizeof(T)) {
        case 1:
            return "u8";
        case 2:
            return "u16";
        case 4:
            return "u32";
        default:
            return "u64";
        }
    }
}

template <typename D, typename Seq>
Result<Seq> read_elements(D &de) {
    auto kind = de.begin_seq();
    if (!kind) {
        return std::unexpected(kind.error());
    }
    Seq out;
    while (true) {
        auto more = de.next_element();
        if (!more) {
            return std::unexpected(more.error());
        }
        if (!*more) {
            return out;
        }
        auto item = Deserialize<typename Seq::value_type>::deserialize(de);
        if (!item) {
            return std::unexpected(item.error());
        }
        if constexpr (requires { out.push_back(std::move(*item)); }) {
            out.push_back(std::move(*item));
        } else {
            out.insert(std::move(*item));
        }
    }
}

template <typename S, typename Range>
Result<void> write_elements(S &ser, ContainerKind kind, const Range &items) {
    auto begun = ser.begin_seq(kind);
    if (!begun) {
        return begun;
    }
    for (const auto &item : items) {
        auto written = Serialize<std::remove_cvref_t<decltype(item)>>::serialize(ser, item);
        if (!written) {
            return written;
        }
    }
    return ser.end_seq();
}

} // namespace detail

template <>
struct Deserialize<bool> {
    template <EdnDeserializer D>
    static Result<bool> deserialize(D &de) {
        return de.deserialize_bool();
    }
};

template <detail::Integer T>
struct Deserialize<T> {
    template <EdnDeserializer D>
    static Result<T> deserialize(D &de) {
        auto n = de.deserialize_number();
        if (!n) {
            return std::unexpected(n.error());
        }
        if (n->is_f64()) {
            return std::unexpected(
                    de.fix_position(Error::invalid_type(describe_unexpected(Value(*n)), detail::integer_name<T>())));
        }
        if constexpr (std::is_signed_v<T>) {
            auto v = n->as_i64();
            if (v && *v >= std::numeric_limits<T>::min() && *v <= std::numeric_limits<T>::max()) {
                return static_cast<T>(*v);
            }
        } else {
            auto v = n->as_u64();
            if (v && *v <= std::numeric_limits<T>::max()) {
                return static_cast<T>(*v);
            }
        }
        return std::unexpected(
                de.fix_position(Error::invalid_value(describe_unexpected(Value(*n)), detail::integer_name<T>())));
    }
};

template <std::floating_point T>
struct Deserialize<T> {
    template <EdnDeserializer D>
    static Result<T> deserialize(D &de) {
        auto n = de.deserialize_number();
        if (!n) {
            return std::unexpected(n.error());
        }
        return static_cast<T>(*n->as_f64());
    }
};

template <>
struct Deserialize<std::string> {
    template <EdnDeserializer D>
    static Result<std::string> deserialize(D &de) {
        return de.deserialize_string();
    }
};

template <>
struct Deserialize<char32_t> {
    template <EdnDeserializer D>
    static Result<char32_t> deserialize(D &de) {
        return de.deserialize_char();
    }
};

template <>
struct Deserialize<Keyword> {
    template <EdnDeserializer D>
    static Result<Keyword> deserialize(D &de) {
        auto name = de.deserialize_keyword();
        if (!name) {
            return std::unexpected(name.error());
        }
        return Keyword{std::move(*name)};
    }
};

template <>
struct Deserialize<Symbol> {
    template <EdnDeserializer D>
    static Result<Symbol> deserialize(D &de) {
        auto name = de.deserialize_symbol();
        if (!name) {
            return std::unexpected(name.error());
        }
        return Symbol{std::move(*name)};
    }
};

template <>
struct Deserialize<Value> {
    template <EdnDeserializer D>
    static Result<Value> deserialize(D &de) {
        return de.deserialize_value();
    }
};

template <typename T>
struct Deserialize<std::optional<T>> {
    template <EdnDeserializer D>
    static Result<std::optional<T>> deserialize(D &de) {
        auto nil = de.try_nil();
        if (!nil) {
            return std::unexpected(nil.error());
        }
        if (*nil) {
            return std::optional<T>{};
        }
        auto value = Deserialize<T>::deserialize(de);
        if (!value) {
            return std::unexpected(value.error());
        }
        return std::optional<T>(std::move(*value));
    }
};

/// Accepts a list, vector or set.
template <typename T>
struct Deserialize<std::vector<T>> {
    template <EdnDeserializer D>
    static Result<std::vector<T>> deserialize(D &de) {
        return detail::read_elements<D, std::vector<T>>(de);
    }
};

template <typename T>
struct Deserialize<std::set<T>> {
    template <EdnDeserializer D>
    static Result<std::set<T>> deserialize(D &de) {
        return detail::read_elements<D, std::set<T>>(de);
    }
};

template <typename K, typename V>
struct Deserialize<std::map<K, V>> {
    template <EdnDeserializer D>
    static Result<std::map<K, V>> deserialize(D &de) {
        auto begun = de.begin_map();
        if (!begun) {
            return std::unexpected(begun.error());
        }
        std::map<K, V> out;
        while (true) {
            auto more = de.next_key();
            if (!more) {
                return std::unexpected(more.error());
            }
            if (!*more) {
                return out;
            }
            auto key = Deserialize<K>::deserialize(de);
            if (!key) {
                return std::unexpected(key.error());
            }
            auto has_value = de.next_value();
            if (!has_value) {
                return std::unexpected(has_value.error());
            }
            auto value = Deserialize<V>::deserialize(de);
            if (!value) {
                return std::unexpected(value.error());
            }
            out.insert_or_assign(std::move(*key), std::move(*value));
        }
    }
};

/// Records read from a map keyed by keywords (strings and symbols are accepted
/// too). Unknown keys are skipped; a missing member is an error unless it is
/// an optional.
template <detail::Record T>
struct Deserialize<T> {
    template <EdnDeserializer D>
    static Result<T> deserialize(D &de) {
        constexpr auto fields = T::edn_fields();
        constexpr std::size_t count = std::tuple_size_v<std::remove_cvref_t<decltype(fields)>>;

        auto begun = de.begin_map();
        if (!begun) {
            return std::unexpected(begun.error());
        }
        T out{};
        std::array<bool, count> seen{};
        while (true) {
            auto more = de.next_key();
            if (!more) {
                return std::unexpected(more.error());
            }
            if (!*more) {
                break;
            }
            auto key = de.deserialize_identifier();
            if (!key) {
                return std::unexpected(key.error());
            }
            auto has_value = de.next_value();
            if (!has_value) {
                return std::unexpected(has_value.error());
            }
            Result<bool> matched = false;
            std::size_t index = 0;
            auto read_one = [&](const auto &f) {
                std::size_t current = index++;
                if (!matched || *matched || f.name != *key) {
                    return;
                }
                using M = typename std::remove_cvref_t<decltype(f)>::member_type;
                auto value = Deserialize<M>::deserialize(de);
                if (!value) {
                    matched = std::unexpected(value.error());
                    return;
                }
                out.*(f.member) = std::move(*value);
                seen[current] = true;
                matched = true;
            };
            std::apply([&](const auto &...f) { (read_one(f), ...); }, fields);
            if (!matched) {
                return std::unexpected(matched.error());
            }
            if (!*matched) {
                auto skipped = de.skip_value();
                if (!skipped) {
                    return std::unexpected(skipped.error());
                }
            }
        }

        std::optional<std::string_view> missing;
        std::size_t index = 0;
        auto check_one = [&](const auto &f) {
            std::size_t current = index++;
            using M = typename std::remove_cvref_t<decltype(f)>::member_type;
            if (!missing && !seen[current] && !detail::IsOptional<M>::value) {
                missing = f.name;
            }
        };
        std::apply([&](const auto &...f) { (check_one(f), ...); }, fields);
        if (missing) {
            return std::unexpected(de.fix_position(Error::missing_field(*missing)));
        }
        return out;
    }
};

template <>
struct Serialize<bool> {
    template <EdnSerializer S>
    static Result<void> serialize(S &ser, bool value) {
        return ser.serialize_bool(value);
    }
};

template <detail::Integer T>
struct Serialize<T> {
    template <EdnSerializer S>
    static Result<void> serialize(S &ser, T value) {
        if constexpr (std::is_signed_v<T>) {
            return ser.serialize_i64(static_cast<std::int64_t>(value));
        } else {
            return ser.serialize_u64(static_cast<std::uint64_t>(value));
        }
    }
};

template <std::floating_point T>
struct Serialize<T> {
    template <EdnSerializer S>
    static Result<void> serialize(S &ser, T value) {
        return ser.serialize_f64(static_cast<double>(value));
    }
};

template <>
struct Serialize<std::string> {
    template <EdnSerializer S>
    static Result<void> serialize(S &ser, const std::string &value) {
        return ser.serialize_string(value);
    }
};

template <>
struct Serialize<std::string_view> {
    template <EdnSerializer S>
    static Result<void> serialize(S &ser, std::string_view value) {
        return ser.serialize_string(value);
    }
};

template <>
struct Serialize<char32_t> {
    template <EdnSerializer S>
    static Result<void> serialize(S &ser, char32_t value) {
        return ser.serialize_char(value);
    }
};

template <>
struct Serialize<Keyword> {
    template <EdnSerializer S>
    static Result<void> serialize(S &ser, const Keyword &value) {
        return ser.serialize_keyword(value.name);
    }
};

template <>
struct Serialize<Symbol> {
    template <EdnSerializer S>
    static Result<void> serialize(S &ser, const Symbol &value) {
        return ser.serialize_symbol(value.name);
    }
};

template <>
struct Serialize<Value> {
    template <EdnSerializer S>
    static Result<void> serialize(S &ser, const Value &value) {
        return ser.serialize_value(value);
    }
};

template <typename T>
struct Serialize<std::optional<T>> {
    template <EdnSerializer S>
    static Result<void> serialize(S &ser, const std::optional<T> &value) {
        if (!value) {
            return ser.serialize_nil();
        }
        return Serialize<T>::serialize(ser, *value);
    }
};

template <typename T>
struct Serialize<std::vector<T>> {
    template <EdnSerializer S>
    static Result<void> serialize(S &ser, const std::vector<T> &value) {
        return detail::write_elements(ser, ContainerKind::Vector, value);
    }
};

template <typename T>
struct Serialize<std::set<T>> {
    template <EdnSerializer S>
    static Result<void> serialize(S &ser, const std::set<T> &value) {
        return detail::write_elements(ser, ContainerKind::Set, value);
    }
};

template <typename K, typename V>
struct Serialize<std::map<K, V>> {
    template <EdnSerializer S>
    static Result<void> serialize(S &ser, const std::map<K, V> &value) {
        auto begun = ser.begin_map();
        if (!begun) {
            return begun;
        }
        for (const auto &[key, item] : value) {
            auto written = Serialize<K>::serialize(ser, key);
            if (!written) {
                return written;
            }
            written = Serialize<V>::serialize(ser, item);
            if (!written) {
                return written;
            }
        }
        return ser.end_map();
    }
};

template <detail::Record T>
struct Serialize<T> {
    template <EdnSerializer S>
    static Result<void> serialize(S &ser, const T &value) {
        auto begun = ser.begin_map();
        if (!begun) {
            return begun;
        }
        Result<void> status;
        auto write_one = [&](const auto &f) {
            if (!status) {
                return;
            }
            auto key = ser.serialize_keyword(f.name);
            if (!key) {
                status = std::unexpected(key.error());
                return;
            }
            using M = typename std::remove_cvref_t<decltype(f)>::member_type;
            auto written = Serialize<M>::serialize(ser, value.*(f.member));
            if (!written) {
                status = std::unexpected(written.error());
            }
        };
        std::apply([&](const auto &...f) { (write_one(f), ...); }, T::edn_fields());
        if (!status) {
            return status;
        }
        return ser.end_map();
    }
};

} // namespace ednkit::edn

#endif // EDNKIT_EDN_BRIDGE_H
