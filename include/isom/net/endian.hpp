////////////////////////////////////////////////////////////////////////////////
//
// isom/net/endian.hpp
//
////////////////////////////////////////////////////////////////////////////////


#ifndef ISOM_INCLUDED_3E7C2B90_D4A1_4F56_8B0E_91F6A5C3D278
#define ISOM_INCLUDED_3E7C2B90_D4A1_4F56_8B0E_91F6A5C3D278


#include <isom/stddef.hpp>
#include <isom/type_traits.hpp>


#if !defined(__BYTE_ORDER__) \
 || (__BYTE_ORDER__ != __ORDER_LITTLE_ENDIAN__ && \
     __BYTE_ORDER__ != __ORDER_BIG_ENDIAN__)
# error "unrecognized and/or unsupported byte order"
#endif


namespace isom {

enum class endian {
    little = __ORDER_LITTLE_ENDIAN__,
    big    = __ORDER_BIG_ENDIAN__,
    host   = __BYTE_ORDER__,
};

constexpr auto BE = endian::big;
constexpr auto LE = endian::little;


namespace net {

template<typename T>
ISOM_INLINE constexpr T byte_swap(T const x) noexcept
{
    static_assert(is_integral_v<T>, "");
    auto const u = static_cast<make_unsigned_t<T>>(x);

    if constexpr (sizeof(T) == 1) {
        return static_cast<T>(u);
    }
    else if constexpr (sizeof(T) == 2) {
        return static_cast<T>(__builtin_bswap16(u));
    }
    else if constexpr (sizeof(T) == 4) {
        return static_cast<T>(__builtin_bswap32(u));
    }
    else {
        static_assert(sizeof(T) == 8, "");
        return static_cast<T>(__builtin_bswap64(u));
    }
}

// Converts between byte order 'E' and the host byte order; the operation
// is its own inverse.
template<endian E, typename T>
ISOM_INLINE constexpr T to_host(T const x) noexcept
{
    if constexpr (E == endian::host) {
        return x;
    }
    else {
        return net::byte_swap(x);
    }
}

}}    // namespace isom::net


#endif  // ISOM_INCLUDED_3E7C2B90_D4A1_4F56_8B0E_91F6A5C3D278
