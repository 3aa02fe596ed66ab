////////////////////////////////////////////////////////////////////////////////
//
// isom/cxp/map.hpp
//
////////////////////////////////////////////////////////////////////////////////


#ifndef ISOM_INCLUDED_84E2F6A1_3B5C_4D09_9C7E_A6D013F58B2E
#define ISOM_INCLUDED_84E2F6A1_3B5C_4D09_9C7E_A6D013F58B2E


#include <isom/stddef.hpp>

#include <algorithm>
#include <cstddef>
#include <functional>
#include <utility>


namespace isom {
namespace cxp {

// Immutable sorted table usable as a constant expression. The values must
// be listed in key order; use cxp::is_sorted() in a static_assert to check.
template<
    typename Key,
    typename T,
    std::size_t Size,
    typename Compare = std::less<>
>
class map
{
public:
    using mapped_type     = T;
    using key_type        = Key;
    using key_compare     = Compare;
    using value_type      = std::pair<key_type, mapped_type>;
    using const_reference = value_type const&;
    using const_iterator  = value_type const*;
    using iterator        = value_type const*;
    using size_type       = std::size_t;

    struct value_compare
    {
        constexpr bool operator()(value_type const& x,
                                  value_type const& y) const
        { return key_compare()(x.first, y.first); }

        constexpr bool operator()(value_type const& x,
                                  key_type const& y) const
        { return key_compare()(x.first, y); }

        constexpr bool operator()(key_type const& x,
                                  value_type const& y) const
        { return key_compare()(x, y.first); }
    };

    constexpr size_type size() const noexcept
    { return Size; }

    constexpr const_iterator begin() const noexcept
    { return values_; }

    constexpr const_iterator end() const noexcept
    { return values_ + size(); }

    const_iterator find(key_type const& k) const
    {
        auto const it = std::lower_bound(begin(), end(), k, value_compare());
        return (it != end() && !value_compare()(k, *it)) ? it : end();
    }

    value_type values_[Size];
};


template<typename Key, typename T, std::size_t N, typename Compare>
constexpr bool is_sorted(cxp::map<Key, T, N, Compare> const& m)
{
    using value_compare = typename cxp::map<Key, T, N, Compare>::value_compare;

    auto first = m.begin();
    auto const last = m.end();
    if (first != last) {
        for (auto next = first; ++next != last; first = next) {
            if (value_compare()(*next, *first)) {
                return false;
            }
        }
    }
    return true;
}

}}    // namespace isom::cxp


#endif  // ISOM_INCLUDED_84E2F6A1_3B5C_4D09_9C7E_A6D013F58B2E
