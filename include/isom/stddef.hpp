////////////////////////////////////////////////////////////////////////////////
//
// isom/stddef.hpp
//
////////////////////////////////////////////////////////////////////////////////


#ifndef ISOM_INCLUDED_7E0A93D5_41C2_4B68_A0F7_38C95E1D2B64
#define ISOM_INCLUDED_7E0A93D5_41C2_4B68_A0F7_38C95E1D2B64


#include <isom/aux/features.hpp>

#include <cstddef>
#include <cstdint>


namespace isom {

using schar  = signed char;
using uchar  = unsigned char;
using ullong = unsigned long long;

using int8   = std::int8_t;
using int16  = std::int16_t;
using int32  = std::int32_t;
using int64  = std::int64_t;
using uint8  = std::uint8_t;
using uint16 = std::uint16_t;
using uint32 = std::uint32_t;
using uint64 = std::uint64_t;


inline namespace literals {

constexpr std::size_t operator"" _sz(ullong const x) noexcept
{ return static_cast<std::size_t>(x); }

}}    // inline namespace isom::literals


#endif  // ISOM_INCLUDED_7E0A93D5_41C2_4B68_A0F7_38C95E1D2B64
