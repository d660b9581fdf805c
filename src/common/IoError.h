#ifndef EDNKIT_COMMON_IO_ERROR_H
#define EDNKIT_COMMON_IO_ERROR_H

#include <cstdint>
#include <expected>
#include <string_view>

namespace ednkit::common {

enum class IoErr : std::uint16_t {
    None = 0,
    WouldBlock,
    Interrupted,
    Invalid,
    BadFd,
    NotFound,
    Permission,
    BrokenPipe,
    NoMem,
    NoSpace,
    NotSupported,
    Unknown,
};

template <typename E>
using IoResult = std::expected<E, IoErr>;

IoErr io_err_from_errno(int err) noexcept;
std::string_view io_err_name(IoErr err) noexcept;

} // namespace ednkit::common

#endif // EDNKIT_COMMON_IO_ERROR_H
