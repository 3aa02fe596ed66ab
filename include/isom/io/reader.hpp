////////////////////////////////////////////////////////////////////////////////
//
// isom/io/reader.hpp
//
////////////////////////////////////////////////////////////////////////////////


#ifndef ISOM_INCLUDED_C07A5E3B_B8D2_4961_AF40_2D9E61B83C5A
#define ISOM_INCLUDED_C07A5E3B_B8D2_4961_AF40_2D9E61B83C5A


#include <isom/error.hpp>
#include <isom/io/memory.hpp>
#include <isom/stddef.hpp>
#include <isom/type_traits.hpp>

#include <algorithm>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>


namespace isom {
namespace io {

// Bounded big/little-endian cursor over a byte buffer it does not own.
// Every reader remembers the absolute position of its first byte so that
// sub-readers created by slice() can report offsets in the root buffer.
class reader
{
public:
    using value_type = uint8;
    using pointer    = uint8 const*;
    using size_type  = std::size_t;

    constexpr reader() = default;

    constexpr reader(void const* const p, size_type const n,
                     uint64 const base = 0) noexcept :
        data_{static_cast<pointer>(p)},
        size_{n},
        base_{base}
    {}

    template<typename T, size_type N, typename = enable_if_t<is_byte_v<T>>>
    constexpr reader(T const(&buf)[N]) noexcept :
        reader{buf, N}
    {}

    template<
        typename Container,
        typename = enable_if_t<
            !is_same_v<reader, decay_t<Container>> &&
            is_byte_v<typename decay_t<Container>::value_type>
        >
    >
    constexpr reader(Container const& c) noexcept :
        reader{c.data(), c.size()}
    {}

    ISOM_INLINE size_type size() const noexcept
    { return size_; }

    ISOM_INLINE size_type tell() const noexcept
    { return cursor_; }

    ISOM_INLINE size_type remain() const noexcept
    { return size() - tell(); }

    ISOM_INLINE uint64 base() const noexcept
    { return base_; }

    ISOM_INLINE uint64 offset() const noexcept
    { return base() + tell(); }

    ISOM_INLINE pointer data() const noexcept
    { return data_; }

    ISOM_INLINE pointer peek() const noexcept
    { return data() + tell(); }

    ISOM_INLINE pointer read_n(size_type const n)
    {
        check_read_available(n);
        return data() + std::exchange(cursor_, cursor_ + n);
    }

    template<typename T, typename = enable_if_t<is_byte_v<T>>>
    ISOM_INLINE void read(T* const dst, size_type const n)
    { std::copy_n(read_n(n), n, reinterpret_cast<uint8*>(dst)); }

    template<endian E, typename T>
    ISOM_INLINE void read(T* const dst, size_type const n)
    {
        check_read_available(n, sizeof(T));
        io::load_n<E>(read_n(n * sizeof(T)), n, dst);
    }

    template<typename T, size_type N, typename = enable_if_t<is_byte_v<T>>>
    ISOM_INLINE void read(T(&dst)[N])
    { read(dst, N); }

    template<typename T, typename = enable_if_t<is_byte_v<T>>>
    ISOM_INLINE T read()
    { return static_cast<T>(*read_n(1)); }

    template<typename T, endian E>
    ISOM_INLINE T read()
    { return io::load<T,E>(read_n(sizeof(T))); }

    template<endian E>
    ISOM_INLINE uint32 read_u24()
    {
        auto const p = read_n(3);
        return (E == endian::big)
             ? (uint32{p[0]} << 16) | (uint32{p[1]} << 8) | uint32{p[2]}
             : (uint32{p[2]} << 16) | (uint32{p[1]} << 8) | uint32{p[0]};
    }

    // 16.16 signed fixed point.
    ISOM_INLINE double read_fixed16()
    { return read<int32,BE>() / 65536.0; }

    // 8.8 signed fixed point.
    ISOM_INLINE double read_fixed8()
    { return read<int16,BE>() / 256.0; }

    ISOM_INLINE uint32 read_4cc()
    { return read<uint32,BE>(); }

    // Three 5-bit letters packed into 15 bits, each biased by 0x60.
    std::string read_iso639()
    {
        auto const packed = read<uint16,BE>();
        return std::string{
            static_cast<char>(((packed >> 10) & 0x1f) + 0x60),
            static_cast<char>(((packed >>  5) & 0x1f) + 0x60),
            static_cast<char>(((packed >>  0) & 0x1f) + 0x60),
        };
    }

    std::string read_utf8(size_type const n)
    {
        auto const p = reinterpret_cast<char const*>(read_n(n));
        return std::string(p, n);
    }

    // Fixed-size field whose first byte holds the length of the string.
    std::string_view read_pascal_string(size_type const field_size)
    {
        auto const p = read_n(field_size);
        if (field_size != 0) {
            auto const len = size_type{p[0]};
            if (len < field_size) {
                return {reinterpret_cast<char const*>(p + 1), len};
            }
            raise(errc::invalid_data_format,
                  "io::reader: pascal string length %zu exceeds field of "
                  "%zu bytes", len, field_size);
        }
        return {};
    }

    ISOM_INLINE uint32 peek32() const
    {
        check_read_available(4);
        return io::load<uint32,BE>(peek());
    }

    ISOM_INLINE void seek(size_type const pos)
    {
        if (pos <= size()) {
            cursor_ = pos;
            return;
        }

        raise(errc::end_of_file,
              "io::reader: cannot seek to byte %zu of %zu",
              pos, size());
    }

    ISOM_INLINE void skip(size_type const n)
    {
        if (n <= remain()) {
            cursor_ += n;
            return;
        }

        raise(errc::end_of_file,
              "io::reader: cannot skip %zu of %zu bytes", n, remain());
    }

    ISOM_INLINE void rewind() noexcept
    { cursor_ = 0; }

    ISOM_INLINE reader slice(size_type const n) const
    {
        if (n <= remain()) {
            return reader{peek(), n, offset()};
        }

        raise(errc::end_of_file,
              "io::reader: cannot slice %zu of %zu bytes",
              n, remain());
    }

    template<endian E, typename... T>
    ISOM_INLINE void gather(T&&... t)
    {
        io::gather<E>(read_n(io::packed_size<T...>),
                      std::forward<T>(t)...);
    }

private:
    ISOM_INLINE void check_read_available(size_type const n) const
    {
        if (ISOM_UNLIKELY(n > remain())) {
            raise(errc::end_of_file,
                  "io::reader: cannot read %zu of %zu bytes", n, remain());
        }
    }

    ISOM_INLINE void check_read_available(size_type const n,
                                          size_type const width) const
    {
        if (ISOM_UNLIKELY(n > remain() / width)) {
            raise(errc::end_of_file,
                  "io::reader: cannot read %zu records of %zu bytes "
                  "from %zu bytes", n, width, remain());
        }
    }

    pointer   data_{};
    size_type size_{};
    size_type cursor_{};
    uint64    base_{};
};

}}    // namespace isom::io


#endif  // ISOM_INCLUDED_C07A5E3B_B8D2_4961_AF40_2D9E61B83C5A
