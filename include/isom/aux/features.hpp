////////////////////////////////////////////////////////////////////////////////
//
// isom/aux/features.hpp
//
////////////////////////////////////////////////////////////////////////////////


#ifndef ISOM_INCLUDED_2C6D0B4E_8F31_4A7C_B9E2_5D14C3A7F086
#define ISOM_INCLUDED_2C6D0B4E_8F31_4A7C_B9E2_5D14C3A7F086


#if !defined(__GNUC__) && !defined(__clang__)
# error "isom requires GCC or Clang"
#endif


#if defined(ISOM_DEBUG)
# include <cassert>
# define ISOM_ASSERT(...) assert(__VA_ARGS__)
#else
# define ISOM_ASSERT(...) static_cast<void>(0)
#endif


#define ISOM_LIKELY(...)   __builtin_expect(!!(__VA_ARGS__), 1)
#define ISOM_UNLIKELY(...) __builtin_expect(!!(__VA_ARGS__), 0)

#define ISOM_EXPORT   __attribute__((visibility("default")))
#define ISOM_INLINE   __attribute__((always_inline)) inline
#define ISOM_NOINLINE __attribute__((noinline))
#define ISOM_READONLY __attribute__((pure))

#define ISOM_PRINTF_FORMAT(fmt, args) \
    __attribute__((format(printf, fmt, args)))


#endif  // ISOM_INCLUDED_2C6D0B4E_8F31_4A7C_B9E2_5D14C3A7F086
