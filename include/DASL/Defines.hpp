#pragma once

#include <cstdio>
#include <cstdlib>

#if defined(__GNUC__) || defined(__clang__)
#define DASL_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
#define DASL_UNLIKELY(x) (x)
#endif

#ifndef DASL_API
#if defined(_WIN32) || defined(__CYGWIN__)
#if defined(DASL_SHARED_BUILD)
#define DASL_API __declspec(dllexport)
#elif defined(DASL_SHARED)
#define DASL_API __declspec(dllimport)
#else
#define DASL_API
#endif
#else
#if defined(DASL_SHARED_BUILD) || defined(DASL_SHARED)
#define DASL_API __attribute__((visibility("default")))
#else
#define DASL_API
#endif
#endif
#endif

#define DASL_ABORT(msg)                                                        \
    do                                                                         \
    {                                                                          \
        std::fprintf(stderr, "%s:%d: %s\n", __FILE__, __LINE__, (msg));        \
        std::abort();                                                          \
    } while (false)

#if defined(NDEBUG)
#define DASL_ASSERT(expr) ((void) 0)
#else
#define DASL_ASSERT(expr)                                                      \
    do                                                                         \
    {                                                                          \
        if (!(expr))                                                           \
            DASL_ABORT("assertion failed: " #expr);                            \
    } while (false)
#endif

namespace DASL
{

    [[noreturn]] inline void Unreachable()
    {
#if defined(_MSC_VER) && !defined(__clang__)// MSVC
        __assume(false);
#else// GCC, Clang
        __builtin_unreachable();
#endif
    }

}// namespace DASL
