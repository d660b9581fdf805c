#ifndef EDNKIT_EDN_NUMBER_H
#define EDNKIT_EDN_NUMBER_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace ednkit::edn {

/// Integer or floating point number; the kind read from text is preserved.
class Number {
public:
    enum class Kind : std::uint8_t {
        PosInt,
        NegInt,
        Float,
    };

    Number() = default;

    static Number from_u64(std::uint64_t value);
    /// Non-negative values are stored as PosInt.
    static Number from_i64(std::int64_t value);
    static Number from_f64(double value);

    [[nodiscard]] Kind kind() const { return kind_; }
    [[nodiscard]] bool is_i64() const;
    [[nodiscard]] bool is_u64() const;
    [[nodiscard]] bool is_f64() const { return kind_ == Kind::Float; }

    [[nodiscard]] std::optional<std::int64_t> as_i64() const;
    [[nodiscard]] std::optional<std::uint64_t> as_u64() const;
    /// Integers convert with the usual loss of precision.
    [[nodiscard]] std::optional<double> as_f64() const;

    [[nodiscard]] std::string to_string() const;
    [[nodiscard]] std::size_t hash() const noexcept;

    /// Same kind and same value. NaN equals NaN and -0.0 equals 0.0.
    bool operator==(const Number &other) const;

private:
    Kind kind_ = Kind::PosInt;
    union {
        std::uint64_t u_ = 0;
        std::int64_t i_;
        double f_;
    };
};

/// Shortest text that reads back as the same double. Always carries a '.' or an
/// exponent; non-finite values use the ##Inf, ##-Inf and ##NaN forms.
[[nodiscard]] std::string format_f64(double value);

} // namespace ednkit::edn

#endif // EDNKIT_EDN_NUMBER_H
