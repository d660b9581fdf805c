#ifndef EDNKIT_EDN_UTF_H
#define EDNKIT_EDN_UTF_H

#include <cstddef>
#include <cstdint>
#include <string>

namespace ednkit::edn {

[[nodiscard]] bool utf8_next_codepoint(const char *data, std::size_t len, std::size_t &pos, std::uint32_t &codepoint);
[[nodiscard]] bool utf8_validate(const char *data, std::size_t len);
/// Total sequence length announced by a leading byte, 0 when `lead` cannot start a sequence.
[[nodiscard]] std::size_t utf8_sequence_length(std::uint8_t lead) noexcept;
[[nodiscard]] bool is_scalar_value(std::uint32_t codepoint) noexcept;
/// Appends the encoding of `codepoint`; non-scalar values are written as U+FFFD.
void utf8_append(std::uint32_t codepoint, std::string &out);

} // namespace ednkit::edn

#endif // EDNKIT_EDN_UTF_H
