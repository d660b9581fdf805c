#ifndef EDNKIT_EDN_VALUEDESERIALIZER_H
#define EDNKIT_EDN_VALUEDESERIALIZER_H

#include <cstddef>
#include <string>
#include <vector>

#include "Error.h"
#include "Value.h"
#include "Visitor.h"

namespace ednkit::edn {

/// Pull-style reader over an existing Value tree, offering the same primitives
/// as the text Deserializer so Deserialize<T> works on both.
class ValueDeserializer {
public:
    explicit ValueDeserializer(const Value &root);
    ValueDeserializer(const ValueDeserializer &) = delete;
    ValueDeserializer &operator=(const ValueDeserializer &) = delete;

    [[nodiscard]] Result<void> deserialize_nil();
    [[nodiscard]] Result<bool> try_nil();
    [[nodiscard]] Result<bool> deserialize_bool();
    [[nodiscard]] Result<Number> deserialize_number();
    [[nodiscard]] Result<std::string> deserialize_string();
    [[nodiscard]] Result<char32_t> deserialize_char();
    [[nodiscard]] Result<std::string> deserialize_keyword();
    [[nodiscard]] Result<std::string> deserialize_symbol();
    [[nodiscard]] Result<std::string> deserialize_identifier();
    [[nodiscard]] Result<Value> deserialize_value();

    [[nodiscard]] Result<ContainerKind> begin_seq();
    [[nodiscard]] Result<bool> next_element();
    [[nodiscard]] Result<void> begin_map();
    [[nodiscard]] Result<bool> next_key();
    [[nodiscard]] Result<void> next_value();
    [[nodiscard]] Result<void> skip_value();

    /// A tree has no text positions; errors pass through unchanged.
    [[nodiscard]] Error fix_position(Error err) const { return err; }

private:
    struct Frame {
        const Value *container;
        std::size_t index = 0;
        bool at_value = false;
    };

    [[nodiscard]] Result<const Value *> peek_node() const;
    [[nodiscard]] Result<const Value *> next_node();
    [[nodiscard]] Result<bool> advance_in_container();

    const Value &root_;
    bool root_taken_ = false;
    std::vector<Frame> frames_;
};

} // namespace ednkit::edn

#endif // EDNKIT_EDN_VALUEDESERIALIZER_H
