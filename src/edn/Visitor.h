#ifndef EDNKIT_EDN_VISITOR_H
#define EDNKIT_EDN_VISITOR_H

#include <cstdint>
#include <optional>
#include <vector>

#include "Error.h"
#include "Read.h"
#include "Value.h"

namespace ednkit::edn {

enum class ContainerKind : std::uint8_t {
    List,
    Vector,
    Set,
    Map,
};

[[nodiscard]] const char *container_kind_name(ContainerKind kind) noexcept;

/// Receives one event per token while a document is decoded. Containers are
/// bracketed by begin/end; map contents arrive as alternating key and value.
/// Text arguments may borrow from the input or the decoder's scratch buffer
/// and must be copied if kept.
class Visitor {
public:
    virtual ~Visitor() = default;

    [[nodiscard]] virtual Result<void> visit_nil() = 0;
    [[nodiscard]] virtual Result<void> visit_bool(bool value) = 0;
    [[nodiscard]] virtual Result<void> visit_number(const Number &value) = 0;
    [[nodiscard]] virtual Result<void> visit_string(const Reference &value) = 0;
    [[nodiscard]] virtual Result<void> visit_char(char32_t value) = 0;
    [[nodiscard]] virtual Result<void> visit_keyword(const Reference &name) = 0;
    [[nodiscard]] virtual Result<void> visit_symbol(const Reference &name) = 0;
    [[nodiscard]] virtual Result<void> begin(ContainerKind kind) = 0;
    [[nodiscard]] virtual Result<void> end(ContainerKind kind) = 0;
};

/// Folds the event stream back into a Value.
class ValueBuilder final : public Visitor {
public:
    [[nodiscard]] Result<void> visit_nil() override;
    [[nodiscard]] Result<void> visit_bool(bool value) override;
    [[nodiscard]] Result<void> visit_number(const Number &value) override;
    [[nodiscard]] Result<void> visit_string(const Reference &value) override;
    [[nodiscard]] Result<void> visit_char(char32_t value) override;
    [[nodiscard]] Result<void> visit_keyword(const Reference &name) override;
    [[nodiscard]] Result<void> visit_symbol(const Reference &name) override;
    [[nodiscard]] Result<void> begin(ContainerKind kind) override;
    [[nodiscard]] Result<void> end(ContainerKind kind) override;

    [[nodiscard]] bool complete() const;
    /// The finished value; nil when nothing complete was built.
    Value take();

private:
    struct Frame {
        ContainerKind kind;
        Value::Sequence items;
    };

    [[nodiscard]] Result<void> push(Value value);

    std::vector<Frame> frames_;
    std::optional<Value> root_;
};

} // namespace ednkit::edn

#endif // EDNKIT_EDN_VISITOR_H
