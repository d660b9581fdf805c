#include "IoError.h"

#include <cerrno>

namespace ednkit::common {

IoErr io_err_from_errno(int err) noexcept {
    switch (err) {
    case 0:
        return IoErr::None;
    case EAGAIN:
#if EAGAIN != EWOULDBLOCK
    case EWOULDBLOCK:
#endif
        return IoErr::WouldBlock;
    case EINTR:
        return IoErr::Interrupted;
    case EINVAL:
        return IoErr::Invalid;
    case EBADF:
        return IoErr::BadFd;
    case ENOENT:
        return IoErr::NotFound;
    case EACCES:
    case EPERM:
        return IoErr::Permission;
    case EPIPE:
        return IoErr::BrokenPipe;
    case ENOMEM:
        return IoErr::NoMem;
    case ENOSPC:
        return IoErr::NoSpace;
#ifdef ENOTSUP
    case ENOTSUP:
        return IoErr::NotSupported;
#endif
#if defined(EOPNOTSUPP) && (!defined(ENOTSUP) || EOPNOTSUPP != ENOTSUP)
    case EOPNOTSUPP:
        return IoErr::NotSupported;
#endif
    default:
        return IoErr::Unknown;
    }
}

std::string_view io_err_name(IoErr err) noexcept {
    switch (err) {
    case IoErr::None:
        return "none";
    case IoErr::WouldBlock:
        return "would_block";
    case IoErr::Interrupted:
        return "interrupted";
    case IoErr::Invalid:
        return "invalid";
    case IoErr::BadFd:
        return "bad_fd";
    case IoErr::NotFound:
        return "not_found";
    case IoErr::Permission:
        return "permission";
    case IoErr::BrokenPipe:
        return "broken_pipe";
    case IoErr::NoMem:
        return "no_mem";
    case IoErr::NoSpace:
        return "no_space";
    case IoErr::NotSupported:
        return "not_supported";
    case IoErr::Unknown:
    default:
        return "unknown";
    }
}

} // namespace ednkit::common
