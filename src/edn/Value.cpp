#include "Value.h"

#include <functional>

#include "Tables.h"
#include "Utf.h"
#include "common/Assert.h"

namespace ednkit::edn {
namespace {

std::size_t mix(std::size_t seed, std::size_t value) {
    return seed ^ (value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2));
}

/// Order-independent comparison of two element lists.
bool same_elements(const Value::Sequence &lhs, const Value::Sequence &rhs) {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    std::unordered_multimap<std::size_t, std::size_t> buckets;
    buckets.reserve(rhs.size());
    for (std::size_t i = 0; i < rhs.size(); ++i) {
        buckets.emplace(rhs[i].hash(), i);
    }
    for (const Value &item : lhs) {
        auto [first, last] = buckets.equal_range(item.hash());
        bool matched = false;
        for (auto it = first; it != last; ++it) {
            if (rhs[it->second] == item) {
                buckets.erase(it);
                matched = true;
                break;
            }
        }
        if (!matched) {
            return false;
        }
    }
    return true;
}

} // namespace

Result<Keyword> Keyword::parse(std::string_view text) {
    if (text.size() < 2 || text[0] != ':') {
        return std::unexpected(Error::syntax(ErrorCode::InvalidKeyword, 1, text.empty() ? 0 : 1));
    }
    std::string_view body = text.substr(1);
    std::size_t bad = first_non_symbol_byte(body);
    if (bad != body.size()) {
        return std::unexpected(Error::syntax(ErrorCode::InvalidKeyword, 1, bad + 1));
    }
    return Keyword{std::string(body)};
}

Result<Symbol> Symbol::parse(std::string_view text) {
    if (text.empty() || starts_number(text) || text == "true" || text == "false" || text == "nil") {
        return std::unexpected(Error::syntax(ErrorCode::InvalidSymbol, 1, 0));
    }
    std::size_t bad = first_non_symbol_byte(text);
    if (bad != text.size()) {
        return std::unexpected(Error::syntax(ErrorCode::InvalidSymbol, 1, bad));
    }
    return Symbol{std::string(text)};
}

Map::Map() = default;
Map::Map(const Map &other) = default;
Map::Map(Map &&other) noexcept = default;
Map &Map::operator=(const Map &other) = default;
Map &Map::operator=(Map &&other) noexcept = default;
Map::~Map() = default;

std::size_t Map::size() const { return entries_.size(); }

bool Map::empty() const { return entries_.empty(); }

void Map::clear() {
    entries_.clear();
    index_.clear();
}

std::optional<std::size_t> Map::find(const Value &key, std::size_t key_hash) const {
    auto [first, last] = index_.equal_range(key_hash);
    for (auto it = first; it != last; ++it) {
        if (entries_[it->second].first == key) {
            return it->second;
        }
    }
    return std::nullopt;
}

void Map::rebuild_index() {
    index_.clear();
    for (std::size_t i = 0; i < entries_.size(); ++i) {
        index_.emplace(entries_[i].first.hash(), i);
    }
}

std::optional<Value> Map::insert(Value key, Value value) {
    std::size_t key_hash = key.hash();
    if (auto pos = find(key, key_hash)) {
        return std::exchange(entries_[*pos].second, std::move(value));
    }
    entries_.emplace_back(std::move(key), std::move(value));
    index_.emplace(key_hash, entries_.size() - 1);
    return std::nullopt;
}

const Value *Map::get(const Value &key) const {
    auto pos = find(key, key.hash());
    if (!pos) {
        return nullptr;
    }
    return &entries_[*pos].second;
}

Value *Map::get_mut(const Value &key) {
    auto pos = find(key, key.hash());
    if (!pos) {
        return nullptr;
    }
    return &entries_[*pos].second;
}

bool Map::contains(const Value &key) const { return find(key, key.hash()).has_value(); }

std::optional<Value> Map::remove(const Value &key) {
    auto pos = find(key, key.hash());
    if (!pos) {
        return std::nullopt;
    }
    Value removed = std::move(entries_[*pos].second);
    entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(*pos));
    rebuild_index();
    return removed;
}

Value &Map::entry(Value key) {
    std::size_t key_hash = key.hash();
    if (auto pos = find(key, key_hash)) {
        return entries_[*pos].second;
    }
    entries_.emplace_back(std::move(key), Value());
    index_.emplace(key_hash, entries_.size() - 1);
    return entries_.back().second;
}

const Map::Entry &Map::entry_at(std::size_t index) const { return entries_[index]; }

Value &Map::value_at(std::size_t index) { return entries_[index].second; }

Map::const_iterator Map::begin() const { return entries_.begin(); }

Map::const_iterator Map::end() const { return entries_.end(); }

bool Map::operator==(const Map &other) const {
    if (entries_.size() != other.entries_.size()) {
        return false;
    }
    for (const auto &[key, value] : entries_) {
        const Value *found = other.get(key);
        if (!found || !(*found == value)) {
            return false;
        }
    }
    return true;
}

std::size_t Map::hash() const noexcept {
    std::size_t sum = 0;
    for (const auto &[key, value] : entries_) {
        sum += mix(key.hash(), value.hash());
    }
    return sum;
}

Value::Value(char32_t value) : type_(ValueType::Char), data_(value) {
    EDNKIT_ASSERT_MSG(is_scalar_value(static_cast<std::uint32_t>(value)), "EDN character must be a Unicode scalar value");
}

Value::Value(Keyword value) : Value(keyword(std::move(value.name))) {}

Value::Value(Symbol value) : Value(symbol(std::move(value.name))) {}

Value Value::keyword(std::string name) {
    EDNKIT_ASSERT_MSG(is_keyword_name(name), "invalid EDN keyword name");
    return Value(ValueType::Keyword, std::move(name));
}

Value Value::symbol(std::string name) {
    EDNKIT_ASSERT_MSG(is_symbol_name(name), "invalid EDN symbol name");
    return Value(ValueType::Symbol, std::move(name));
}

Value Value::vector(Sequence items) { return Value(ValueType::Vector, std::move(items)); }

Value Value::list(Sequence items) { return Value(ValueType::List, std::move(items)); }

Value Value::set(Sequence items) { return Value(ValueType::Set, std::move(items)); }

Value Value::object(Map map) { return Value(std::move(map)); }

const char *Value::type_name() const {
    switch (type_) {
    case ValueType::Nil:
        return "nil";
    case ValueType::Bool:
        return "boolean";
    case ValueType::Number:
        return "number";
    case ValueType::String:
        return "string";
    case ValueType::Char:
        return "character";
    case ValueType::Keyword:
        return "keyword";
    case ValueType::Symbol:
        return "symbol";
    case ValueType::Vector:
        return "vector";
    case ValueType::List:
        return "list";
    case ValueType::Set:
        return "set";
    case ValueType::Object:
        return "map";
    }
    return "unknown";
}

bool Value::is_i64() const {
    const Number *n = as_number();
    return n && n->is_i64();
}

bool Value::is_u64() const {
    const Number *n = as_number();
    return n && n->is_u64();
}

bool Value::is_f64() const {
    const Number *n = as_number();
    return n && n->is_f64();
}

bool Value::is_sequence() const {
    return type_ == ValueType::Vector || type_ == ValueType::List || type_ == ValueType::Set;
}

std::optional<bool> Value::as_bool() const {
    if (const bool *b = std::get_if<bool>(&data_)) {
        return *b;
    }
    return std::nullopt;
}

const Number *Value::as_number() const { return std::get_if<Number>(&data_); }

std::optional<std::int64_t> Value::as_i64() const {
    const Number *n = as_number();
    return n ? n->as_i64() : std::nullopt;
}

std::optional<std::uint64_t> Value::as_u64() const {
    const Number *n = as_number();
    return n ? n->as_u64() : std::nullopt;
}

std::optional<double> Value::as_f64() const {
    const Number *n = as_number();
    return n ? n->as_f64() : std::nullopt;
}

const std::string *Value::text_if(ValueType type) const {
    if (type_ != type) {
        return nullptr;
    }
    return std::get_if<std::string>(&data_);
}

const std::string *Value::as_str() const { return text_if(ValueType::String); }

std::optional<char32_t> Value::as_char() const {
    if (const char32_t *c = std::get_if<char32_t>(&data_)) {
        return *c;
    }
    return std::nullopt;
}

const std::string *Value::as_keyword() const { return text_if(ValueType::Keyword); }

const std::string *Value::as_symbol() const { return text_if(ValueType::Symbol); }

const Value::Sequence *Value::items_if(ValueType type) const {
    if (type_ != type) {
        return nullptr;
    }
    return std::get_if<Sequence>(&data_);
}

Value::Sequence *Value::items_if(ValueType type) {
    if (type_ != type) {
        return nullptr;
    }
    return std::get_if<Sequence>(&data_);
}

const Value::Sequence *Value::as_vector() const { return items_if(ValueType::Vector); }

Value::Sequence *Value::as_vector_mut() { return items_if(ValueType::Vector); }

const Value::Sequence *Value::as_list() const { return items_if(ValueType::List); }

Value::Sequence *Value::as_list_mut() { return items_if(ValueType::List); }

const Value::Sequence *Value::as_set() const { return items_if(ValueType::Set); }

Value::Sequence *Value::as_set_mut() { return items_if(ValueType::Set); }

const Value::Sequence *Value::as_sequence() const { return std::get_if<Sequence>(&data_); }

Value::Sequence *Value::as_sequence_mut() { return std::get_if<Sequence>(&data_); }

const Map *Value::as_object() const { return std::get_if<Map>(&data_); }

Map *Value::as_object_mut() { return std::get_if<Map>(&data_); }

Value Value::take() { return std::exchange(*this, Value()); }

bool Value::operator==(const Value &other) const {
    if (type_ != other.type_) {
        return false;
    }
    if (type_ == ValueType::Set) {
        return same_elements(std::get<Sequence>(data_), std::get<Sequence>(other.data_));
    }
    return data_ == other.data_;
}

std::size_t Value::hash() const noexcept {
    std::size_t seed = static_cast<std::size_t>(type_);
    switch (type_) {
    case ValueType::Nil:
        return seed;
    case ValueType::Bool:
        return mix(seed, std::get<bool>(data_) ? 1 : 0);
    case ValueType::Number:
        return mix(seed, std::get<Number>(data_).hash());
    case ValueType::String:
    case ValueType::Keyword:
    case ValueType::Symbol:
        return mix(seed, std::hash<std::string>{}(std::get<std::string>(data_)));
    case ValueType::Char:
        return mix(seed, std::get<char32_t>(data_));
    case ValueType::Vector:
    case ValueType::List:
        for (const Value &item : std::get<Sequence>(data_)) {
            seed = mix(seed, item.hash());
        }
        return seed;
    case ValueType::Set: {
        std::size_t sum = 0;
        for (const Value &item : std::get<Sequence>(data_)) {
            sum += item.hash();
        }
        return mix(seed, sum);
    }
    case ValueType::Object:
        return mix(seed, std::get<Map>(data_).hash());
    }
    return seed;
}

std::string describe_unexpected(const Value &value) {
    std::string out;
    switch (value.type()) {
    case ValueType::Bool:
        out = "boolean `";
        out.append(*value.as_bool() ? "true" : "false");
        out.push_back('`');
        return out;
    case ValueType::Number: {
        const Number *n = value.as_number();
        out = n->is_f64() ? "floating point `" : "integer `";
        out.append(n->to_string());
        out.push_back('`');
        return out;
    }
    case ValueType::String:
        out = "string \"";
        out.append(*value.as_str());
        out.push_back('"');
        return out;
    case ValueType::Char:
        out = "character `";
        utf8_append(*value.as_char(), out);
        out.push_back('`');
        return out;
    case ValueType::Keyword:
        out = "keyword `:";
        out.append(*value.as_keyword());
        out.push_back('`');
        return out;
    case ValueType::Symbol:
        out = "symbol `";
        out.append(*value.as_symbol());
        out.push_back('`');
        return out;
    default:
        return value.type_name();
    }
}

} // namespace ednkit::edn
