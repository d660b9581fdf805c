#ifndef EDNKIT_COMMON_ASSERT_H
#define EDNKIT_COMMON_ASSERT_H

#include <cstdlib>
#include <cstdio>

#if defined(__cpp_lib_stacktrace)
#include <iostream>
#include <stacktrace>
#endif

namespace ednkit::common {

inline void dump_stacktrace() {
#if defined(__cpp_lib_stacktrace)
    std::fprintf(stderr, "stacktrace:\n");
    std::cerr << std::stacktrace::current() << '\n';
#else
    std::fprintf(stderr, "stacktrace: unavailable\n");
#endif
    std::fflush(stderr);
}

[[noreturn]] inline void panic_assert(const char *expr, const char *file, int line, const char *func) {
    std::fprintf(stderr, "EDNKIT_ASSERT failed: %s\n  at %s:%d (%s)\n", expr, file, line, func);
    dump_stacktrace();
    std::abort();
}

[[noreturn]] inline void panic_assert_msg(const char *expr,
                                          const char *message,
                                          const char *file,
                                          int line,
                                          const char *func) {
    std::fprintf(stderr,
                 "EDNKIT_ASSERT failed: %s\n  message: %s\n  at %s:%d (%s)\n",
                 expr,
                 message,
                 file,
                 line,
                 func);
    dump_stacktrace();
    std::abort();
}

[[noreturn]] inline void panic_message(const char *message, const char *file, int line, const char *func) {
    std::fprintf(stderr, "EDNKIT_PANIC: %s\n  at %s:%d (%s)\n", message, file, line, func);
    dump_stacktrace();
    std::abort();
}

} // namespace ednkit::common

#define EDNKIT_ASSERT(expr) \
    do { \
        if (!(expr)) { \
            ::ednkit::common::panic_assert(#expr, __FILE__, __LINE__, __func__); \
        } \
    } while (false)

#define EDNKIT_ASSERT_MSG(expr, message) \
    do { \
        if (!(expr)) { \
            ::ednkit::common::panic_assert_msg(#expr, (message), __FILE__, __LINE__, __func__); \
        } \
    } while (false)

#define EDNKIT_PANIC(message) \
    do { \
        ::ednkit::common::panic_message((message), __FILE__, __LINE__, __func__); \
    } while (false)

#endif // EDNKIT_COMMON_ASSERT_H
