////////////////////////////////////////////////////////////////////////////////
//
// isom/range.hpp
//
////////////////////////////////////////////////////////////////////////////////


#ifndef ISOM_INCLUDED_D8E5A271_6C0B_4F3E_92D4_B7A1E0C65F39
#define ISOM_INCLUDED_D8E5A271_6C0B_4F3E_92D4_B7A1E0C65F39


#include <isom/stddef.hpp>
#include <isom/type_traits.hpp>

#include <iterator>
#include <utility>


namespace isom {

template<typename T>
class iterator_range
{
public:
    using iterator        = T;
    using value_type      = typename std::iterator_traits<T>::value_type;
    using reference       = typename std::iterator_traits<T>::reference;
    using difference_type = typename std::iterator_traits<T>::difference_type;
    using size_type       = make_unsigned_t<difference_type>;

    iterator_range() = default;

    constexpr iterator_range(iterator b, iterator e) :
        beg_(std::move(b)),
        end_(std::move(e))
    {}

    constexpr iterator begin() const
    { return beg_; }

    constexpr iterator end() const
    { return end_; }

    constexpr bool empty() const
    { return (beg_ == end_); }

    constexpr size_type size() const
    { return static_cast<size_type>(std::distance(beg_, end_)); }

    constexpr reference operator[](difference_type const n) const
    { return *std::next(beg_, n); }

private:
    iterator beg_{};
    iterator end_{};
};


template<typename T>
ISOM_INLINE constexpr auto make_range(T first, T last)
{
    return iterator_range<T>(std::move(first), std::move(last));
}

template<typename T, typename Size>
ISOM_INLINE constexpr auto make_range(T const first, Size const n)
{
    return iterator_range<T>(first, std::next(first, n));
}


namespace aux {

template<typename T>
class integral_iterator_
{
public:
    static_assert(is_integral_v<T>, "");

    using iterator_category = std::forward_iterator_tag;
    using difference_type   = std::make_signed_t<T>;
    using value_type        = T;
    using reference         = T const&;
    using pointer           = T const*;

    constexpr explicit integral_iterator_(T const v) noexcept :
        val_(v)
    {}

    constexpr reference operator*() const noexcept
    { return val_; }

    constexpr auto& operator++() noexcept
    { return (++val_, *this); }

    constexpr auto operator++(int) noexcept
    {
        auto ret = *this;
        return (++(*this), ret);
    }

    constexpr friend bool operator==(integral_iterator_ const x,
                                     integral_iterator_ const y) noexcept
    { return (*x == *y); }

    constexpr friend bool operator!=(integral_iterator_ const x,
                                     integral_iterator_ const y) noexcept
    { return (*x != *y); }

private:
    value_type val_;
};

}     // namespace aux


template<typename T>
ISOM_INLINE constexpr auto xrange(T const start, T const stop) noexcept
{
    return make_range(aux::integral_iterator_<T>{start},
                      aux::integral_iterator_<T>{stop});
}

template<typename T>
ISOM_INLINE constexpr auto xrange(T const stop) noexcept
{
    return xrange(T{0}, stop);
}

}     // namespace isom


#endif  // ISOM_INCLUDED_D8E5A271_6C0B_4F3E_92D4_B7A1E0C65F39
