////////////////////////////////////////////////////////////////////////////////
//
// isom/type_traits.hpp
//
////////////////////////////////////////////////////////////////////////////////


#ifndef ISOM_INCLUDED_A4F1C8E2_0D93_4B57_86AE_F21B7C6D9035
#define ISOM_INCLUDED_A4F1C8E2_0D93_4B57_86AE_F21B7C6D9035


#include <isom/stddef.hpp>

#include <type_traits>


namespace isom {

using std::enable_if_t;
using std::decay_t;
using std::remove_cv_t;
using std::remove_reference_t;
using std::make_signed_t;
using std::make_unsigned_t;
using std::underlying_type_t;

using std::is_integral_v;
using std::is_enum_v;
using std::is_same_v;
using std::is_trivially_copyable_v;
using std::is_trivially_destructible_v;
using std::is_nothrow_default_constructible_v;

// Types a byte buffer may be viewed as.
template<typename T> constexpr bool is_byte_v = false;
template<> constexpr bool is_byte_v<char>  = true;
template<> constexpr bool is_byte_v<schar> = true;
template<> constexpr bool is_byte_v<uchar> = true;

}     // namespace isom


#endif  // ISOM_INCLUDED_A4F1C8E2_0D93_4B57_86AE_F21B7C6D9035
