#include "Serializer.h"

#include "ValueEncode.h"

namespace ednkit::edn {

Serializer::Serializer(Generator &gen) : gen_(gen) {}

Result<void> Serializer::check(Generator::Result result) const { return generator_result(gen_, result); }

Result<void> Serializer::serialize_nil() { return check(gen_.nil_value()); }

Result<void> Serializer::serialize_bool(bool value) { return check(gen_.bool_value(value)); }

Result<void> Serializer::serialize_i64(std::int64_t value) { return check(gen_.integer(value)); }

Result<void> Serializer::serialize_u64(std::uint64_t value) { return check(gen_.unsigned_integer(value)); }

Result<void> Serializer::serialize_f64(double value) { return check(gen_.double_value(value)); }

Result<void> Serializer::serialize_string(std::string_view value) { return check(gen_.string(value)); }

Result<void> Serializer::serialize_char(char32_t value) { return check(gen_.character(value)); }

Result<void> Serializer::serialize_keyword(std::string_view name) { return check(gen_.keyword(name)); }

Result<void> Serializer::serialize_symbol(std::string_view name) { return check(gen_.symbol(name)); }

Result<void> Serializer::serialize_value(const Value &value) { return check(encode_value(gen_, value)); }

Result<void> Serializer::begin_seq(ContainerKind kind) {
    Generator::Result result = Generator::Result::ErrorState;
    switch (kind) {
    case ContainerKind::List:
        result = gen_.list_open();
        break;
    case ContainerKind::Vector:
        result = gen_.vector_open();
        break;
    case ContainerKind::Set:
        result = gen_.set_open();
        break;
    case ContainerKind::Map:
        return std::unexpected(Error::data("begin_seq called with a map"));
    }
    auto opened = check(result);
    if (!opened) {
        return opened;
    }
    open_.push_back(kind);
    return {};
}

Result<void> Serializer::end_seq() {
    if (open_.empty() || open_.back() == ContainerKind::Map) {
        return std::unexpected(Error::data("end_seq without an open sequence"));
    }
    ContainerKind kind = open_.back();
    open_.pop_back();
    switch (kind) {
    case ContainerKind::List:
        return check(gen_.list_close());
    case ContainerKind::Vector:
        return check(gen_.vector_close());
    default:
        return check(gen_.set_close());
    }
}

Result<void> Serializer::begin_map() {
    auto opened = check(gen_.map_open());
    if (!opened) {
        return opened;
    }
    open_.push_back(ContainerKind::Map);
    return {};
}

Result<void> Serializer::end_map() {
    if (open_.empty() || open_.back() != ContainerKind::Map) {
        return std::unexpected(Error::data("end_map without an open map"));
    }
    open_.pop_back();
    return check(gen_.map_close());
}

Result<void> ValueSerializer::serialize_nil() { return builder_.visit_nil(); }

Result<void> ValueSerializer::serialize_bool(bool value) { return builder_.visit_bool(value); }

Result<void> ValueSerializer::serialize_i64(std::int64_t value) {
    return builder_.visit_number(Number::from_i64(value));
}

Result<void> ValueSerializer::serialize_u64(std::uint64_t value) {
    return builder_.visit_number(Number::from_u64(value));
}

Result<void> ValueSerializer::serialize_f64(double value) { return builder_.visit_number(Number::from_f64(value)); }

Result<void> ValueSerializer::serialize_string(std::string_view value) {
    return builder_.visit_string(Reference::borrowed(value));
}

Result<void> ValueSerializer::serialize_char(char32_t value) { return builder_.visit_char(value); }

Result<void> ValueSerializer::serialize_keyword(std::string_view name) {
    return builder_.visit_keyword(Reference::borrowed(name));
}

Result<void> ValueSerializer::serialize_symbol(std::string_view name) {
    return builder_.visit_symbol(Reference::borrowed(name));
}

Result<void> ValueSerializer::serialize_value(const Value &value) {
    switch (value.type()) {
    case ValueType::Nil:
        return serialize_nil();
    case ValueType::Bool:
        return serialize_bool(*value.as_bool());
    case ValueType::Number:
        return builder_.visit_number(*value.as_number());
    case ValueType::String:
        return serialize_string(*value.as_str());
    case ValueType::Char:
        return serialize_char(*value.as_char());
    case ValueType::Keyword:
        return serialize_keyword(*value.as_keyword());
    case ValueType::Symbol:
        return serialize_symbol(*value.as_symbol());
    case ValueType::Vector:
    case ValueType::List:
    case ValueType::Set: {
        ContainerKind kind = value.is_vector() ? ContainerKind::Vector
                                               : (value.is_list() ? ContainerKind::List : ContainerKind::Set);
        auto begun = begin_seq(kind);
        if (!begun) {
            return begun;
        }
        for (const Value &item : *value.as_sequence()) {
            auto written = serialize_value(item);
            if (!written) {
                return written;
            }
        }
        return end_seq();
    }
    case ValueType::Object: {
        auto begun = begin_map();
        if (!begun) {
            return begun;
        }
        for (const auto &[key, item] : *value.as_object()) {
            auto written = serialize_value(key);
            if (!written) {
                return written;
            }
            written = serialize_value(item);
            if (!written) {
                return written;
            }
        }
        return end_map();
    }
    }
    return std::unexpected(Error::data("unknown value type"));
}

Result<void> ValueSerializer::begin_seq(ContainerKind kind) {
    if (kind == ContainerKind::Map) {
        return std::unexpected(Error::data("begin_seq called with a map"));
    }
    auto begun = builder_.begin(kind);
    if (!begun) {
        return begun;
    }
    open_.push_back(kind);
    return {};
}

Result<void> ValueSerializer::end_seq() {
    if (open_.empty() || open_.back() == ContainerKind::Map) {
        return std::unexpected(Error::data("end_seq without an open sequence"));
    }
    return end(open_.back());
}

Result<void> ValueSerializer::begin_map() {
    auto begun = builder_.begin(ContainerKind::Map);
    if (!begun) {
        return begun;
    }
    open_.push_back(ContainerKind::Map);
    return {};
}

Result<void> ValueSerializer::end_map() {
    if (open_.empty() || open_.back() != ContainerKind::Map) {
        return std::unexpected(Error::data("end_map without an open map"));
    }
    return end(ContainerKind::Map);
}

Result<void> ValueSerializer::end(ContainerKind kind) {
    open_.pop_back();
    return builder_.end(kind);
}

Result<Value> ValueSerializer::take() {
    if (!open_.empty() || !builder_.complete()) {
        return std::unexpected(Error::data("value is incomplete"));
    }
    return builder_.take();
}

} // namespace ednkit::edn
