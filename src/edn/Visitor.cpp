#include "Visitor.h"

#include <utility>

#include "Tables.h"
#include "Utf.h"

namespace ednkit::edn {

const char *container_kind_name(ContainerKind kind) noexcept {
    switch (kind) {
    case ContainerKind::List:
        return "list";
    case ContainerKind::Vector:
        return "vector";
    case ContainerKind::Set:
        return "set";
    case ContainerKind::Map:
        return "map";
    }
    return "container";
}

Result<void> ValueBuilder::push(Value value) {
    if (!frames_.empty()) {
        frames_.back().items.push_back(std::move(value));
        return {};
    }
    if (root_) {
        return std::unexpected(Error::data("more than one top-level value"));
    }
    root_ = std::move(value);
    return {};
}

Result<void> ValueBuilder::visit_nil() { return push(Value()); }

Result<void> ValueBuilder::visit_bool(bool value) { return push(Value(value)); }

Result<void> ValueBuilder::visit_number(const Number &value) { return push(Value(value)); }

Result<void> ValueBuilder::visit_string(const Reference &value) { return push(Value(value.to_string())); }

Result<void> ValueBuilder::visit_char(char32_t value) {
    if (!is_scalar_value(static_cast<std::uint32_t>(value))) {
        return std::unexpected(Error::data("character is not a Unicode scalar value"));
    }
    return push(Value::character(value));
}

Result<void> ValueBuilder::visit_keyword(const Reference &name) {
    if (!is_keyword_name(name.view())) {
        return std::unexpected(Error::data("invalid keyword name `" + name.to_string() + "`"));
    }
    return push(Value::keyword(name.to_string()));
}

Result<void> ValueBuilder::visit_symbol(const Reference &name) {
    if (!is_symbol_name(name.view())) {
        return std::unexpected(Error::data("invalid symbol name `" + name.to_string() + "`"));
    }
    return push(Value::symbol(name.to_string()));
}

Result<void> ValueBuilder::begin(ContainerKind kind) {
    frames_.push_back(Frame{kind, {}});
    return {};
}

Result<void> ValueBuilder::end(ContainerKind kind) {
    if (frames_.empty() || frames_.back().kind != kind) {
        return std::unexpected(Error::data(std::string("unbalanced end of ") + container_kind_name(kind)));
    }
    Frame frame = std::move(frames_.back());
    frames_.pop_back();
    switch (kind) {
    case ContainerKind::List:
        return push(Value::list(std::move(frame.items)));
    case ContainerKind::Vector:
        return push(Value::vector(std::move(frame.items)));
    case ContainerKind::Set:
        return push(Value::set(std::move(frame.items)));
    case ContainerKind::Map: {
        if (frame.items.size() % 2 != 0) {
            return std::unexpected(Error::data("map key without a value"));
        }
        Map map;
        for (std::size_t i = 0; i < frame.items.size(); i += 2) {
            map.insert(std::move(frame.items[i]), std::move(frame.items[i + 1]));
        }
        return push(Value(std::move(map)));
    }
    }
    return {};
}

bool ValueBuilder::complete() const { return frames_.empty() && root_.has_value(); }

Value ValueBuilder::take() {
    if (!complete()) {
        return Value();
    }
    Value out = std::move(*root_);
    root_.reset();
    return out;
}

} // namespace ednkit::edn
