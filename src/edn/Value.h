#ifndef EDNKIT_EDN_VALUE_H
#define EDNKIT_EDN_VALUE_H

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include "Error.h"
#include "Number.h"

namespace ednkit::edn {

enum class ValueType : std::uint8_t {
    Nil,
    Bool,
    Number,
    String,
    Char,
    Keyword,
    Symbol,
    Vector,
    List,
    Set,
    Object,
};

struct Keyword {
    std::string name;

    /// Parses ":name".
    static Result<Keyword> parse(std::string_view text);
    bool operator==(const Keyword &) const = default;
};

struct Symbol {
    std::string name;

    static Result<Symbol> parse(std::string_view text);
    bool operator==(const Symbol &) const = default;
};

class Value;

/// Insertion ordered associative container keyed by any Value.
class Map {
public:
    using Entry = std::pair<Value, Value>;
    using Entries = std::vector<Entry>;
    using const_iterator = Entries::const_iterator;

    Map();
    Map(const Map &other);
    Map(Map &&other) noexcept;
    Map &operator=(const Map &other);
    Map &operator=(Map &&other) noexcept;
    ~Map();

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] bool empty() const;
    void clear();

    /// Last write wins; a replaced entry keeps its original position.
    std::optional<Value> insert(Value key, Value value);
    [[nodiscard]] const Value *get(const Value &key) const;
    [[nodiscard]] Value *get_mut(const Value &key);
    [[nodiscard]] bool contains(const Value &key) const;
    std::optional<Value> remove(const Value &key);
    /// Value stored under `key`, inserting nil first if absent.
    Value &entry(Value key);
    [[nodiscard]] const Entry &entry_at(std::size_t index) const;
    [[nodiscard]] Value &value_at(std::size_t index);

    /// Calls fn(const Value &key, Value &value) in insertion order. Keys stay
    /// immutable so the index remains valid.
    template <typename F>
    void for_each_mut(F &&fn);

    [[nodiscard]] const_iterator begin() const;
    [[nodiscard]] const_iterator end() const;

    bool operator==(const Map &other) const;
    [[nodiscard]] std::size_t hash() const noexcept;

private:
    [[nodiscard]] std::optional<std::size_t> find(const Value &key, std::size_t key_hash) const;
    void rebuild_index();

    Entries entries_;
    std::unordered_multimap<std::size_t, std::size_t> index_;
};

namespace detail {

template <typename T>
concept CharLike = std::same_as<T, char> || std::same_as<T, wchar_t> || std::same_as<T, char8_t> ||
                   std::same_as<T, char16_t> || std::same_as<T, char32_t>;

template <typename T>
concept Integer = std::integral<T> && !std::same_as<T, bool> && !CharLike<T>;

} // namespace detail

class Value {
public:
    using Sequence = std::vector<Value>;

    Value() = default;
    Value(std::nullptr_t) {}
    Value(bool value) : type_(ValueType::Bool), data_(value) {}
    template <detail::Integer T>
    Value(T value) : type_(ValueType::Number) {
        if constexpr (std::signed_integral<T>) {
            data_ = Number::from_i64(static_cast<std::int64_t>(value));
        } else {
            data_ = Number::from_u64(static_cast<std::uint64_t>(value));
        }
    }
    template <std::floating_point T>
    Value(T value) : type_(ValueType::Number), data_(Number::from_f64(static_cast<double>(value))) {}
    Value(Number value) : type_(ValueType::Number), data_(value) {}
    Value(const char *value) : type_(ValueType::String), data_(std::string(value)) {}
    Value(std::string value) : type_(ValueType::String), data_(std::move(value)) {}
    Value(std::string_view value) : type_(ValueType::String), data_(std::string(value)) {}
    /// Characters, keywords and symbols must read back as themselves: a Unicode
    /// scalar value, a non-empty keyword body, a symbol that is neither a number
    /// nor a reserved word. Anything else panics.
    Value(char32_t value);
    Value(Keyword value);
    Value(Symbol value);
    Value(Sequence items) : type_(ValueType::Vector), data_(std::move(items)) {}
    Value(Map map) : type_(ValueType::Object), data_(std::move(map)) {}

    static Value character(char32_t value) { return Value(value); }
    static Value keyword(std::string name);
    static Value symbol(std::string name);
    static Value vector(Sequence items);
    static Value list(Sequence items);
    static Value set(Sequence items);
    static Value object(Map map);

    [[nodiscard]] ValueType type() const { return type_; }
    [[nodiscard]] const char *type_name() const;

    [[nodiscard]] bool is_nil() const { return type_ == ValueType::Nil; }
    [[nodiscard]] bool is_bool() const { return type_ == ValueType::Bool; }
    [[nodiscard]] bool is_number() const { return type_ == ValueType::Number; }
    [[nodiscard]] bool is_i64() const;
    [[nodiscard]] bool is_u64() const;
    [[nodiscard]] bool is_f64() const;
    [[nodiscard]] bool is_string() const { return type_ == ValueType::String; }
    [[nodiscard]] bool is_char() const { return type_ == ValueType::Char; }
    [[nodiscard]] bool is_keyword() const { return type_ == ValueType::Keyword; }
    [[nodiscard]] bool is_symbol() const { return type_ == ValueType::Symbol; }
    [[nodiscard]] bool is_vector() const { return type_ == ValueType::Vector; }
    [[nodiscard]] bool is_list() const { return type_ == ValueType::List; }
    [[nodiscard]] bool is_set() const { return type_ == ValueType::Set; }
    [[nodiscard]] bool is_object() const { return type_ == ValueType::Object; }
    /// Vector, List or Set.
    [[nodiscard]] bool is_sequence() const;

    [[nodiscard]] std::optional<bool> as_bool() const;
    [[nodiscard]] const Number *as_number() const;
    [[nodiscard]] std::optional<std::int64_t> as_i64() const;
    [[nodiscard]] std::optional<std::uint64_t> as_u64() const;
    [[nodiscard]] std::optional<double> as_f64() const;
    [[nodiscard]] const std::string *as_str() const;
    [[nodiscard]] std::optional<char32_t> as_char() const;
    [[nodiscard]] const std::string *as_keyword() const;
    [[nodiscard]] const std::string *as_symbol() const;
    [[nodiscard]] const Sequence *as_vector() const;
    [[nodiscard]] Sequence *as_vector_mut();
    [[nodiscard]] const Sequence *as_list() const;
    [[nodiscard]] Sequence *as_list_mut();
    [[nodiscard]] const Sequence *as_set() const;
    [[nodiscard]] Sequence *as_set_mut();
    /// Elements of a Vector, List or Set.
    [[nodiscard]] const Sequence *as_sequence() const;
    [[nodiscard]] Sequence *as_sequence_mut();
    [[nodiscard]] const Map *as_object() const;
    [[nodiscard]] Map *as_object_mut();

    /// Element of a Vector or List; null when out of range or not indexable.
    [[nodiscard]] const Value *get(std::size_t index) const;
    [[nodiscard]] Value *get_mut(std::size_t index);
    /// Entry of an Object under the String key `key`.
    [[nodiscard]] const Value *get(std::string_view key) const;
    [[nodiscard]] Value *get_mut(std::string_view key);
    template <std::same_as<char> C>
    [[nodiscard]] const Value *get(const C *key) const {
        return get(std::string_view(key));
    }
    template <std::same_as<char> C>
    [[nodiscard]] Value *get_mut(const C *key) {
        return get_mut(std::string_view(key));
    }
    /// Entry of an Object under an arbitrary key.
    [[nodiscard]] const Value *get_key(const Value &key) const;
    [[nodiscard]] Value *get_key_mut(const Value &key);

    /// Read access; a missing element reads as nil.
    const Value &operator[](std::size_t index) const;
    const Value &operator[](std::string_view key) const;
    template <std::same_as<char> C>
    const Value &operator[](const C *key) const {
        return (*this)[std::string_view(key)];
    }

    /// Write access. Nil turns into an Object on string access and missing keys
    /// are inserted as nil. Any other type mismatch, or an index out of range,
    /// is a programming error and panics.
    Value &operator[](std::size_t index);
    Value &operator[](std::string_view key);
    template <std::same_as<char> C>
    Value &operator[](const C *key) {
        return (*this)[std::string_view(key)];
    }
    /// Write access by arbitrary key, same rules as string access.
    Value &index_or_insert(Value key);

    /// Slash separated path lookup, `~1` and `~0` escape '/' and '~'.
    [[nodiscard]] const Value *pointer(std::string_view path) const;
    [[nodiscard]] Value *pointer_mut(std::string_view path);

    /// Moves the value out, leaving nil behind.
    Value take();

    [[nodiscard]] std::string to_string() const;
    [[nodiscard]] std::string to_string_pretty() const;
    void print_to_stderr() const;

    bool operator==(const Value &other) const;
    [[nodiscard]] std::size_t hash() const noexcept;

private:
    Value(ValueType type, Sequence items) : type_(type), data_(std::move(items)) {}
    Value(ValueType type, std::string text) : type_(type), data_(std::move(text)) {}

    [[nodiscard]] const std::string *text_if(ValueType type) const;
    [[nodiscard]] const Sequence *items_if(ValueType type) const;
    [[nodiscard]] Sequence *items_if(ValueType type);

    ValueType type_ = ValueType::Nil;
    std::variant<std::monostate, bool, Number, std::string, char32_t, Sequence, Map> data_;
};

template <typename F>
void Map::for_each_mut(F &&fn) {
    for (Entry &entry : entries_) {
        fn(static_cast<const Value &>(entry.first), entry.second);
    }
}

struct ValueHash {
    std::size_t operator()(const Value &value) const noexcept { return value.hash(); }
};

/// Short description used in type mismatch errors, e.g. "integer `42`".
[[nodiscard]] std::string describe_unexpected(const Value &value);

std::ostream &operator<<(std::ostream &os, const Value &value);

} // namespace ednkit::edn

template <>
struct std::hash<ednkit::edn::Value> {
    std::size_t operator()(const ednkit::edn::Value &value) const noexcept { return value.hash(); }
};

#endif // EDNKIT_EDN_VALUE_H
