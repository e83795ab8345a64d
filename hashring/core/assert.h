#pragma once

#include <hashring/core/likely.h>

#ifdef __cplusplus
extern "C"
{
#endif

[[noreturn]] void hashring_assertion_failed(
    char const *expr, char const *function, char const *file, long line,
    char const *msg);

#define HASHRING_ASSERTION_FAILED_WITH_MSG(expr, msg)                          \
    /* msg must be a static string at a fixed address so that reporting */    \
    /* the failure cannot fault on a bad pointer */                           \
    static_assert(__builtin_constant_p(msg));                                  \
    hashring_assertion_failed(                                                 \
        #expr, __extension__ __PRETTY_FUNCTION__, __FILE__, __LINE__, msg);

/// Assert, aborting the process upon failure; accepts an optional message,
/// which must be a compile-time-constant string
#define HASHRING_ASSERT(expr, ...)                                             \
    if (HASHRING_LIKELY(expr)) { /* likeliest */                               \
    }                                                                          \
    else {                                                                     \
        __VA_OPT__(HASHRING_ASSERTION_FAILED_WITH_MSG(#expr, __VA_ARGS__);)    \
        __VA_OPT__(__builtin_unreachable();)                                   \
        hashring_assertion_failed(                                             \
            #expr,                                                             \
            __extension__ __PRETTY_FUNCTION__,                                 \
            __FILE__,                                                          \
            __LINE__,                                                          \
            nullptr);                                                          \
    }

/// Abort; accepts an optional message, which must be a compile-time-constant
/// string
#define HASHRING_ABORT(...)                                                    \
    __VA_OPT__(HASHRING_ASSERTION_FAILED_WITH_MSG(nullptr, __VA_ARGS__);)      \
    __VA_OPT__(__builtin_unreachable();)                                       \
    hashring_assertion_failed(                                                 \
        nullptr,                                                               \
        __extension__ __PRETTY_FUNCTION__,                                     \
        __FILE__,                                                              \
        __LINE__,                                                              \
        nullptr);

#ifdef __cplusplus
}
#endif
