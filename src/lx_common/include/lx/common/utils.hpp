#ifndef HEADER_GUARD_LX_COMMON_UTILS_HPP
#define HEADER_GUARD_LX_COMMON_UTILS_HPP

#include <cstdarg>
#include <string>
#include <utility>

#ifndef LX_CAT
#define _LX_CAT(x, y) x##y
#define LX_CAT(x, y) _LX_CAT(x, y)
#endif // LX_CAT

#define LX_AR_SIZE(AR) (sizeof(AR) / sizeof((AR)[0]))

#if defined(__GNUC__) || defined(__clang__)
#define LX_PRINTF_LIKE(FMT_POS, ARGS_POS) __attribute__((__format__(__printf__, FMT_POS, ARGS_POS)))
#else
#define LX_PRINTF_LIKE(...)
#endif

#ifndef defer
struct _DeferDummy {};
template <class F>
struct _Deferrer {
    F f;
    ~_Deferrer() {
        f();
    }
};
template <class F>
_Deferrer<F> operator*(_DeferDummy, F &&f) {
    return {std::forward<F>(f)};
}
#define defer auto LX_CAT(__defer, __LINE__) = _DeferDummy{} *[&]()
#endif // defer

LX_PRINTF_LIKE(1, 0) std::string string_vformat(char const *fmt, va_list ap);
LX_PRINTF_LIKE(1, 2) std::string string_format(char const *fmt, ...);

#endif // HEADER_GUARD_LX_COMMON_UTILS_HPP
