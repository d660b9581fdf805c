#include "Number.h"

#include <bit>
#include <charconv>
#include <cmath>
#include <functional>
#include <limits>
#include <system_error>

namespace ednkit::edn {

Number Number::from_u64(std::uint64_t value) {
    Number n;
    n.kind_ = Kind::PosInt;
    n.u_ = value;
    return n;
}

Number Number::from_i64(std::int64_t value) {
    if (value >= 0) {
        return from_u64(static_cast<std::uint64_t>(value));
    }
    Number n;
    n.kind_ = Kind::NegInt;
    n.i_ = value;
    return n;
}

Number Number::from_f64(double value) {
    Number n;
    n.kind_ = Kind::Float;
    n.f_ = value;
    return n;
}

bool Number::is_i64() const {
    switch (kind_) {
    case Kind::PosInt:
        return u_ <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
    case Kind::NegInt:
        return true;
    case Kind::Float:
        return false;
    }
    return false;
}

bool Number::is_u64() const { return kind_ == Kind::PosInt; }

std::optional<std::int64_t> Number::as_i64() const {
    if (!is_i64()) {
        return std::nullopt;
    }
    return kind_ == Kind::PosInt ? static_cast<std::int64_t>(u_) : i_;
}

std::optional<std::uint64_t> Number::as_u64() const {
    if (kind_ != Kind::PosInt) {
        return std::nullopt;
    }
    return u_;
}

std::optional<double> Number::as_f64() const {
    switch (kind_) {
    case Kind::PosInt:
        return static_cast<double>(u_);
    case Kind::NegInt:
        return static_cast<double>(i_);
    case Kind::Float:
        return f_;
    }
    return std::nullopt;
}

std::string Number::to_string() const {
    switch (kind_) {
    case Kind::PosInt:
        return std::to_string(u_);
    case Kind::NegInt:
        return std::to_string(i_);
    case Kind::Float:
        return format_f64(f_);
    }
    return {};
}

std::size_t Number::hash() const noexcept {
    switch (kind_) {
    case Kind::PosInt:
        return std::hash<std::uint64_t>{}(u_);
    case Kind::NegInt:
        return std::hash<std::int64_t>{}(i_) ^ 0x9e3779b97f4a7c15ULL;
    case Kind::Float: {
        if (std::isnan(f_)) {
            return 0x7ff8000000000000ULL;
        }
        double normalized = f_ == 0.0 ? 0.0 : f_;
        return std::hash<std::uint64_t>{}(std::bit_cast<std::uint64_t>(normalized)) ^ 0x517cc1b727220a95ULL;
    }
    }
    return 0;
}

bool Number::operator==(const Number &other) const {
    if (kind_ != other.kind_) {
        return false;
    }
    switch (kind_) {
    case Kind::PosInt:
        return u_ == other.u_;
    case Kind::NegInt:
        return i_ == other.i_;
    case Kind::Float:
        return f_ == other.f_ || (std::isnan(f_) && std::isnan(other.f_));
    }
    return false;
}

std::string format_f64(double value) {
    if (std::isnan(value)) {
        return "##NaN";
    }
    if (std::isinf(value)) {
        return value > 0 ? "##Inf" : "##-Inf";
    }
    char buf[64];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    if (ec != std::errc()) {
        return "##NaN";
    }
    std::string out(buf, ptr);
    if (out.find_first_of(".eE") == std::string::npos) {
        out.append(".0");
    }
    return out;
}

} // namespace ednkit::edn
