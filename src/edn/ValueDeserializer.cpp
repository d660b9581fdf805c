#include "ValueDeserializer.h"

namespace ednkit::edn {
namespace {

Error invalid_type(const Value &found, const char *expected) {
    return Error::invalid_type(describe_unexpected(found), expected);
}

std::size_t container_size(const Value &container) {
    if (const Map *map = container.as_object()) {
        return map->size();
    }
    return container.as_sequence()->size();
}

} // namespace

ValueDeserializer::ValueDeserializer(const Value &root) : root_(root) {}

Result<const Value *> ValueDeserializer::peek_node() const {
    if (frames_.empty()) {
        if (root_taken_) {
            return std::unexpected(Error::data("no value left to read"));
        }
        return &root_;
    }
    const Frame &frame = frames_.back();
    if (frame.index >= container_size(*frame.container)) {
        return std::unexpected(Error::data("no element left in container"));
    }
    if (const Map *map = frame.container->as_object()) {
        const Map::Entry &entry = map->entry_at(frame.index);
        return frame.at_value ? &entry.second : &entry.first;
    }
    return &(*frame.container->as_sequence())[frame.index];
}

Result<const Value *> ValueDeserializer::next_node() {
    auto node = peek_node();
    if (!node) {
        return node;
    }
    if (frames_.empty()) {
        root_taken_ = true;
        return node;
    }
    Frame &frame = frames_.back();
    if (frame.container->is_object()) {
        if (frame.at_value) {
            frame.index += 1;
        }
        frame.at_value = !frame.at_value;
    } else {
        frame.index += 1;
    }
    return node;
}

Result<void> ValueDeserializer::deserialize_nil() {
    auto node = next_node();
    if (!node) {
        return std::unexpected(node.error());
    }
    if (!(*node)->is_nil()) {
        return std::unexpected(invalid_type(**node, "nil"));
    }
    return {};
}

Result<bool> ValueDeserializer::try_nil() {
    auto node = peek_node();
    if (!node) {
        return std::unexpected(node.error());
    }
    if (!(*node)->is_nil()) {
        return false;
    }
    auto taken = next_node();
    if (!taken) {
        return std::unexpected(taken.error());
    }
    return true;
}

Result<bool> ValueDeserializer::deserialize_bool() {
    auto node = next_node();
    if (!node) {
        return std::unexpected(node.error());
    }
    if (auto b = (*node)->as_bool()) {
        return *b;
    }
    return std::unexpected(invalid_type(**node, "a boolean"));
}

Result<Number> ValueDeserializer::deserialize_number() {
    auto node = next_node();
    if (!node) {
        return std::unexpected(node.error());
    }
    if (const Number *n = (*node)->as_number()) {
        return *n;
    }
    return std::unexpected(invalid_type(**node, "a number"));
}

Result<std::string> ValueDeserializer::deserialize_string() {
    auto node = next_node();
    if (!node) {
        return std::unexpected(node.error());
    }
    if (const std::string *text = (*node)->as_str()) {
        return *text;
    }
    return std::unexpected(invalid_type(**node, "a string"));
}

Result<char32_t> ValueDeserializer::deserialize_char() {
    auto node = next_node();
    if (!node) {
        return std::unexpected(node.error());
    }
    if (auto c = (*node)->as_char()) {
        return *c;
    }
    return std::unexpected(invalid_type(**node, "a character"));
}

Result<std::string> ValueDeserializer::deserialize_keyword() {
    auto node = next_node();
    if (!node) {
        return std::unexpected(node.error());
    }
    if (const std::string *name = (*node)->as_keyword()) {
        return *name;
    }
    return std::unexpected(invalid_type(**node, "a keyword"));
}

Result<std::string> ValueDeserializer::deserialize_symbol() {
    auto node = next_node();
    if (!node) {
        return std::unexpected(node.error());
    }
    if (const std::string *name = (*node)->as_symbol()) {
        return *name;
    }
    return std::unexpected(invalid_type(**node, "a symbol"));
}

Result<std::string> ValueDeserializer::deserialize_identifier() {
    auto node = next_node();
    if (!node) {
        return std::unexpected(node.error());
    }
    const Value &value = **node;
    if (const std::string *name = value.as_keyword()) {
        return *name;
    }
    if (const std::string *name = value.as_str()) {
        return *name;
    }
    if (const std::string *name = value.as_symbol()) {
        return *name;
    }
    return std::unexpected(invalid_type(value, "a field name"));
}

Result<Value> ValueDeserializer::deserialize_value() {
    auto node = next_node();
    if (!node) {
        return std::unexpected(node.error());
    }
    return **node;
}

Result<ContainerKind> ValueDeserializer::begin_seq() {
    auto node = next_node();
    if (!node) {
        return std::unexpected(node.error());
    }
    const Value &value = **node;
    if (!value.is_sequence()) {
        return std::unexpected(invalid_type(value, "a sequence"));
    }
    frames_.push_back(Frame{&value});
    if (value.is_vector()) {
        return ContainerKind::Vector;
    }
    return value.is_list() ? ContainerKind::List : ContainerKind::Set;
}

Result<void> ValueDeserializer::begin_map() {
    auto node = next_node();
    if (!node) {
        return std::unexpected(node.error());
    }
    const Value &value = **node;
    if (!value.is_object()) {
        return std::unexpected(invalid_type(value, "a map"));
    }
    frames_.push_back(Frame{&value});
    return {};
}

Result<bool> ValueDeserializer::advance_in_container() {
    if (frames_.empty()) {
        return std::unexpected(Error::data("no open container"));
    }
    const Frame &frame = frames_.back();
    if (frame.index < container_size(*frame.container)) {
        return true;
    }
    frames_.pop_back();
    return false;
}

Result<bool> ValueDeserializer::next_element() { return advance_in_container(); }

Result<bool> ValueDeserializer::next_key() { return advance_in_container(); }

Result<void> ValueDeserializer::next_value() {
    if (frames_.empty() || !frames_.back().at_value) {
        return std::unexpected(Error::data("map value requested before its key"));
    }
    return {};
}

Result<void> ValueDeserializer::skip_value() {
    auto node = next_node();
    if (!node) {
        return std::unexpected(node.error());
    }
    return {};
}

} // namespace ednkit::edn
