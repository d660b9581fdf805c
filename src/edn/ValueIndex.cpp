#include "Value.h"

#include <charconv>
#include <string>
#include <system_error>
#include <utility>

#include "Tables.h"
#include "common/Assert.h"

namespace ednkit::edn {
namespace {

const Value &nil_value() {
    static const Value kNil;
    return kNil;
}

std::optional<std::size_t> parse_index(std::string_view token) {
    if (token.empty() || token[0] == '+' || (token[0] == '0' && token.size() > 1)) {
        return std::nullopt;
    }
    std::size_t index = 0;
    auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), index);
    if (ec != std::errc() || ptr != token.data() + token.size()) {
        return std::nullopt;
    }
    return index;
}

std::string unescape_token(std::string_view raw) {
    std::string token;
    token.reserve(raw.size());
    for (std::size_t i = 0; i < raw.size(); ++i) {
        if (raw[i] == '~' && i + 1 < raw.size() && (raw[i + 1] == '0' || raw[i + 1] == '1')) {
            token.push_back(raw[i + 1] == '1' ? '/' : '~');
            ++i;
            continue;
        }
        token.push_back(raw[i]);
    }
    return token;
}

const Value *step(const Value &target, const std::string &token) {
    if (const Map *map = target.as_object()) {
        if (const Value *found = map->get(Value(token))) {
            return found;
        }
        if (!is_keyword_name(token)) {
            return nullptr;
        }
        return map->get(Value::keyword(token));
    }
    if (target.is_vector() || target.is_list()) {
        auto index = parse_index(token);
        if (!index) {
            return nullptr;
        }
        return target.get(*index);
    }
    return nullptr;
}

} // namespace

const Value *Value::get(std::size_t index) const {
    if (type_ != ValueType::Vector && type_ != ValueType::List) {
        return nullptr;
    }
    const Sequence &items = std::get<Sequence>(data_);
    return index < items.size() ? &items[index] : nullptr;
}

Value *Value::get_mut(std::size_t index) { return const_cast<Value *>(std::as_const(*this).get(index)); }

const Value *Value::get(std::string_view key) const {
    const Map *map = as_object();
    return map ? map->get(Value(key)) : nullptr;
}

Value *Value::get_mut(std::string_view key) {
    Map *map = as_object_mut();
    return map ? map->get_mut(Value(key)) : nullptr;
}

const Value *Value::get_key(const Value &key) const {
    const Map *map = as_object();
    return map ? map->get(key) : nullptr;
}

Value *Value::get_key_mut(const Value &key) {
    Map *map = as_object_mut();
    return map ? map->get_mut(key) : nullptr;
}

const Value &Value::operator[](std::size_t index) const {
    const Value *found = get(index);
    return found ? *found : nil_value();
}

const Value &Value::operator[](std::string_view key) const {
    const Value *found = get(key);
    return found ? *found : nil_value();
}

Value &Value::operator[](std::size_t index) {
    if (type_ != ValueType::Vector && type_ != ValueType::List) {
        std::string message = "cannot access index " + std::to_string(index) + " of EDN " + type_name();
        EDNKIT_PANIC(message.c_str());
    }
    Sequence &items = std::get<Sequence>(data_);
    if (index >= items.size()) {
        std::string message = "cannot access index " + std::to_string(index) + " of EDN " + type_name() +
                              " of length " + std::to_string(items.size());
        EDNKIT_PANIC(message.c_str());
    }
    return items[index];
}

Value &Value::operator[](std::string_view key) { return index_or_insert(Value(key)); }

Value &Value::index_or_insert(Value key) {
    if (type_ == ValueType::Nil) {
        *this = Value(Map());
    }
    Map *map = as_object_mut();
    if (!map) {
        std::string message = "cannot access key " + key.to_string() + " in EDN " + type_name();
        EDNKIT_PANIC(message.c_str());
    }
    return map->entry(std::move(key));
}

const Value *Value::pointer(std::string_view path) const {
    if (path.empty()) {
        return this;
    }
    if (path[0] != '/') {
        return nullptr;
    }
    const Value *target = this;
    std::size_t pos = 1;
    while (target) {
        std::size_t slash = path.find('/', pos);
        std::string_view raw = slash == std::string_view::npos ? path.substr(pos) : path.substr(pos, slash - pos);
        target = step(*target, unescape_token(raw));
        if (slash == std::string_view::npos) {
            break;
        }
        pos = slash + 1;
    }
    return target;
}

Value *Value::pointer_mut(std::string_view path) {
    return const_cast<Value *>(std::as_const(*this).pointer(path));
}

} // namespace ednkit::edn
