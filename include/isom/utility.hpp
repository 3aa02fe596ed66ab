////////////////////////////////////////////////////////////////////////////////
//
// isom/utility.hpp
//
////////////////////////////////////////////////////////////////////////////////


#ifndef ISOM_INCLUDED_5B27E0C9_C6A4_4D1F_9A83_0E6F4B2D71A8
#define ISOM_INCLUDED_5B27E0C9_C6A4_4D1F_9A83_0E6F4B2D71A8


#include <isom/stddef.hpp>
#include <isom/type_traits.hpp>

#include <cstddef>


#define ISOM_DEFINE_ENUM_FLAG_OPERATORS(E)                                  \
    ISOM_INLINE constexpr E operator~(E const x) noexcept                   \
    { return E(~::isom::as_underlying(x)); }                                \
    ISOM_INLINE constexpr E operator&(E const x, E const y) noexcept        \
    { return E(::isom::as_underlying(x) & ::isom::as_underlying(y)); }      \
    ISOM_INLINE constexpr E operator|(E const x, E const y) noexcept        \
    { return E(::isom::as_underlying(x) | ::isom::as_underlying(y)); }      \
    ISOM_INLINE E& operator&=(E& x, E const y) noexcept                     \
    { return x = (x & y); }                                                 \
    ISOM_INLINE E& operator|=(E& x, E const y) noexcept                     \
    { return x = (x | y); }                                                 \
    static_assert(true, "")


namespace isom {

template<typename T>
ISOM_INLINE constexpr auto as_underlying(T const x) noexcept
{
    static_assert(is_enum_v<T>, "argument must be an enum type");
    return static_cast<underlying_type_t<T>>(x);
}

template<typename E>
ISOM_INLINE constexpr bool has_flag(E const x, E const flag) noexcept
{
    return (as_underlying(x) & as_underlying(flag)) != 0;
}


constexpr uint32 operator"" _4cc(char const* const s, std::size_t) noexcept
{
    return (uint32{static_cast<uint8>(s[0])} << 24)
         | (uint32{static_cast<uint8>(s[1])} << 16)
         | (uint32{static_cast<uint8>(s[2])} <<  8)
         | (uint32{static_cast<uint8>(s[3])} <<  0);
}


// Printable form of a four-character code; bytes outside of the ASCII
// graphic range are shown as '.'.
struct fourcc_string
{
    char str[5];

    char const* c_str() const noexcept
    { return str; }
};

constexpr fourcc_string to_fourcc_string(uint32 const x) noexcept
{
    fourcc_string s{};
    for (auto i = 0; i != 4; ++i) {
        auto const c = static_cast<uint8>(x >> (24 - 8 * i));
        s.str[i] = (c >= 0x20 && c < 0x7f) ? static_cast<char>(c) : '.';
    }
    return s;
}

}     // namespace isom


#endif  // ISOM_INCLUDED_5B27E0C9_C6A4_4D1F_9A83_0E6F4B2D71A8
