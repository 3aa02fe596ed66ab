////////////////////////////////////////////////////////////////////////////////
//
// isom/io/memory.hpp
//
////////////////////////////////////////////////////////////////////////////////


#ifndef ISOM_INCLUDED_61B4D8F0_9A2E_4C37_A5D1_0E83C7F29B46
#define ISOM_INCLUDED_61B4D8F0_9A2E_4C37_A5D1_0E83C7F29B46


#include <isom/net/endian.hpp>
#include <isom/stddef.hpp>
#include <isom/type_traits.hpp>

#include <cstddef>
#include <cstring>
#include <utility>


namespace isom {
namespace io {

// Unaligned access to integers stored in byte order 'E'.
template<typename T, endian E>
ISOM_READONLY
ISOM_INLINE T load(void const* const p) noexcept
{
    static_assert(is_trivially_copyable_v<T>, "");

    T v;
    std::memcpy(&v, p, sizeof(T));
    return net::to_host<E>(v);
}

template<endian E, typename T>
ISOM_INLINE void store(void* const p, T const v) noexcept
{
    static_assert(is_trivially_copyable_v<T>, "");

    auto const x = net::to_host<E>(v);
    std::memcpy(p, &x, sizeof(T));
}

template<endian E, typename T>
ISOM_INLINE void load_n(void const* const src, std::size_t const n,
                        T* const dst) noexcept
{
    auto const bytes = static_cast<uchar const*>(src);
    for (auto i = 0_sz; i != n; ++i) {
        dst[i] = io::load<T,E>(bytes + i * sizeof(T));
    }
}


namespace aux {

template<std::size_t N>
struct ignore_ {};

template<typename T, typename U>
struct alias_ { U& u; };


template<typename T>
struct field_
{
    static constexpr std::size_t size = sizeof(T);

    template<endian E>
    static void load(uchar const* const p, T& dst) noexcept
    { dst = io::load<T,E>(p); }
};

template<typename T, std::size_t N>
struct field_<T[N]>
{
    static constexpr std::size_t size = sizeof(T) * N;

    template<endian E>
    static void load(uchar const* const p, T(&dst)[N]) noexcept
    { io::load_n<E>(p, N, dst); }
};

template<typename T, typename U>
struct field_<alias_<T, U>>
{
    static constexpr std::size_t size = sizeof(T);

    template<endian E>
    static void load(uchar const* const p, alias_<T, U> const& dst) noexcept
    { dst.u = io::load<T,E>(p); }
};

template<std::size_t N>
struct field_<ignore_<N>>
{
    static constexpr std::size_t size = N;

    template<endian E>
    static void load(uchar const*, ignore_<N> const&) noexcept
    {}
};

template<typename T>
using field_t = field_<remove_cv_t<remove_reference_t<T>>>;

}     // namespace aux


// Skips 'N' bytes in gather().
template<std::size_t N>
constexpr io::aux::ignore_<N> ignore{};

// Reads a 'T' from the stream and stores it into a (wider) 'U'.
template<typename T, typename U>
ISOM_INLINE constexpr auto alias(U& u) noexcept
{ return io::aux::alias_<T, U>{u}; }

template<typename... T>
constexpr std::size_t packed_size = (aux::field_t<T>::size + ... + 0);

// Reads consecutive packed fields, in order, starting at 'src'.
template<endian E, typename... T>
ISOM_INLINE void gather(void const* const src, T&&... t) noexcept
{
    auto p = static_cast<uchar const*>(src);
    ((aux::field_t<T>::template load<E>(p, t), p += aux::field_t<T>::size),
     ...);
}

}}    // namespace isom::io


#endif  // ISOM_INCLUDED_61B4D8F0_9A2E_4C37_A5D1_0E83C7F29B46
