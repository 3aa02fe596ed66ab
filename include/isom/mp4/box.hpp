////////////////////////////////////////////////////////////////////////////////
//
// isom/mp4/box.hpp
//
////////////////////////////////////////////////////////////////////////////////


#ifndef ISOM_INCLUDED_B1C94F27_6E08_4A3D_8D52_E7F0A913C64B
#define ISOM_INCLUDED_B1C94F27_6E08_4A3D_8D52_E7F0A913C64B


#include <isom/error.hpp>
#include <isom/io/reader.hpp>
#include <isom/range.hpp>
#include <isom/stddef.hpp>
#include <isom/type_traits.hpp>
#include <isom/utility.hpp>

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>


namespace isom {
namespace mp4 {

using byte_range = iterator_range<uchar const*>;


template<typename T>
class array
{
public:
    static_assert(is_trivially_copyable_v<T>, "");

    using iterator       = T*;
    using const_iterator = T const*;

    array() = default;

    array(array&& x) noexcept :
        buf_{std::exchange(x.buf_, nullptr)},
        len_{std::exchange(x.len_, 0)}
    {}

    array& operator=(array&& x) & noexcept
    {
        array{std::move(x)}.swap(*this);
        return *this;
    }

    ~array()
    {
        std::free(buf_);
    }

    void swap(array& x) noexcept
    {
        using std::swap;
        swap(buf_, x.buf_);
        swap(len_, x.len_);
    }

    uint32 size() const noexcept
    { return len_; }

    bool empty() const noexcept
    { return (size() == 0); }

    T* data() noexcept
    { return buf_; }

    T const* data() const noexcept
    { return buf_; }

    iterator begin() noexcept
    { return data(); }

    iterator end() noexcept
    { return data() + size(); }

    const_iterator begin() const noexcept
    { return data(); }

    const_iterator end() const noexcept
    { return data() + size(); }

    T& operator[](uint32 const i) noexcept
    {
        ISOM_ASSERT(i < size());
        return data()[i];
    }

    T const& operator[](uint32 const i) const noexcept
    {
        ISOM_ASSERT(i < size());
        return data()[i];
    }

    T const& back() const noexcept
    {
        ISOM_ASSERT(!empty());
        return data()[size() - 1];
    }

    void resize(uint32 const n)
    {
        if (ISOM_LIKELY(n != 0)) {
            auto const p = static_cast<T*>(std::malloc(n * sizeof(T)));
            if (ISOM_UNLIKELY(p == nullptr)) {
                raise_bad_alloc();
            }
            std::free(std::exchange(buf_, p));
            len_ = n;
        }
    }

    void assign(io::reader& r, uint32 const n)
    {
        if (ISOM_UNLIKELY(n > r.remain() / sizeof(T))) {
            raise(errc::invalid_data_format,
                  "MP4 table of %u entries does not fit in %zu bytes",
                  n, r.remain());
        }
        resize(n);
        r.read<BE>(data(), n);
    }

private:
    T*     buf_{};
    uint32 len_{};
};


namespace media_handler {
    constexpr auto audio = "soun"_4cc;
    constexpr auto video = "vide"_4cc;
}


struct ftyp_box_data
{
    uint32             major_brand;
    uint32             minor_version;
    mp4::array<uint32> compatible_brands;

    bool compatible_with(uint32 const brand) const noexcept
    {
        if (brand == major_brand) {
            return true;
        }

        auto const first = compatible_brands.begin();
        auto const last  = compatible_brands.end();
        return std::find(first, last, brand) != last;
    }
};

struct mvhd_box_data
{
    uint32 creation_time;
    uint32 modification_time;
    uint32 time_scale;
    uint32 duration;            // longest track's duration (in movie TS)
    double rate;                // preferred playback rate
    double volume;              // preferred playback volume
    int32  matrix[9];
    uint32 next_track_id;
};

struct tkhd_box_data
{
    uint32 creation_time;
    uint32 modification_time;
    uint32 track_id;            // unique and non-zero
    uint32 duration;
    int16  layer;
    int16  alternate_group;
    double volume;
    int32  matrix[9];
    double width;
    double height;
};

struct mdhd_box_data
{
    uint32 creation_time;
    uint32 modification_time;
    uint32 time_scale;
    uint32 duration;
    char   language[4];
};

struct hdlr_box_data
{
    uint32      handler_type;
    std::string name;
};

struct stsd_box_data
{
    uint32 entry_count;
};

struct avc1_box_data
{
    uint16      data_reference_index;
    uint16      width;
    uint16      height;
    double      horizontal_resolution;
    double      vertical_resolution;
    uint16      frame_count;
    std::string compressor_name;
    uint16      depth;
    uint16      color_table_id;
};

struct mp4a_box_data
{
    uint16 data_reference_index;
    uint16 version;
    uint16 channel_count;
    uint16 sample_size;
    uint16 compression_id;
    uint16 packet_size;
    uint32 sample_rate;
};

struct avcC_box_data
{
    uint8 configuration_version;
    uint8 profile_indication;
    uint8 profile_compatibility;
    uint8 level_indication;
    uint8 length_size;          // bytes in each NAL unit length prefix

    std::vector<mp4::byte_range> sps;
    std::vector<mp4::byte_range> pps;
};

struct btrt_box_data
{
    uint32 buffer_size_db;
    uint32 max_bitrate;
    uint32 avg_bitrate;
};

struct stts_box_data
{
    struct entry_type
    {
        uint32 sample_count;
        uint32 sample_delta;
        uint32 first_sample;
        uint64 first_time;
    };

    mp4::array<entry_type> entries;
    uint64                 total_time;
    uint64                 total_samples;
};

struct stss_box_data
{
    mp4::array<uint32> entries;     // 1-based sample numbers
};

struct stsc_box_data
{
    struct entry_type
    {
        uint32 first_sample;
        uint32 first_chunk;
        uint32 samples_per_chunk;
        uint32 sample_description_index;
    };

    mp4::array<entry_type> entries;
};

struct stsz_box_data
{
    uint32             sample_size;
    uint32             sample_count;
    mp4::array<uint32> entries;
};

struct stco_box_data
{
    mp4::array<uint64> entries;
};

struct smhd_box_data
{
    double balance;
};

struct mdat_box_data
{
    mp4::byte_range payload;
};


enum class parse_options : uint32 {
    none              = 0x0,
    check_consistency = 0x1,
    strict            = 0x2,
};
ISOM_DEFINE_ENUM_FLAG_OPERATORS(parse_options);


struct box_header
{
    uint64 fpos;
    uint64 size;
    uint32 type;
    uint8  header_size;
};


class root_box;

class box
{
public:
    using child_list = std::vector<std::unique_ptr<box>>;

    box(box const&) = delete;
    box& operator=(box const&) = delete;

    explicit box(mp4::box_header const& h, mp4::box* const p) noexcept :
        parent_(p),
        header_(h)
    {}

    ISOM_NOINLINE
    ~box();

    // Looks up a descendant by path. Segments are four-character codes
    // separated by '/' or '.', each optionally followed by an index into
    // the children of that type ("trak[1]"). ".." selects the parent and a
    // leading '/' restarts from the root.
    ISOM_NOINLINE ISOM_READONLY
    box const* find(std::string_view) const noexcept;

    box* find(std::string_view const path) noexcept
    { return const_cast<box*>(const_cast<box const&>(*this).find(path)); }

    box const* find_first_of(std::string_view const first) const noexcept
    { return find(first); }

    template<typename... Rest>
    box const* find_first_of(std::string_view const first,
                             Rest const... rest) const noexcept
    {
        auto found = find(first);
        if (found == nullptr) {
            found = find_first_of(rest...);
        }
        return found;
    }

    mp4::box const& operator[](std::string_view const path) const
    {
        if (auto found = find(path)) {
            return *found;
        }
        raise(errc::invalid_data_format, "MP4 box='%.*s' is not present",
              static_cast<int>(path.size()), path.data());
    }

    auto equal_range(uint32 const type) const noexcept
    {
        auto const found = children_.find(type);
        if (found == children_.end()) {
            return make_range(empty_.cbegin(), empty_.cend());
        }
        return make_range(found->second.cbegin(), found->second.cend());
    }

    std::size_t count(uint32 const type) const noexcept
    {
        auto const found = children_.find(type);
        return (found != children_.end()) ? found->second.size() : 0;
    }

    // Children in the order they appear in the file.
    std::vector<mp4::box const*> const& children() const noexcept
    { return in_order_; }

    ISOM_INLINE uint32 type() const noexcept
    { return header_.type; }

    ISOM_INLINE uint32 header_size() const noexcept
    { return header_.header_size; }

    ISOM_INLINE uint64 size() const noexcept
    { return header_.size; }

    ISOM_INLINE uint64 payload_size() const noexcept
    { return header_.size - header_size(); }

    ISOM_INLINE uint64 start_position() const noexcept
    { return header_.fpos; }

    ISOM_INLINE uint64 end_position() const noexcept
    { return start_position() + size(); }

    ISOM_INLINE bool is_full_box() const noexcept
    { return full_box_; }

    ISOM_INLINE uint8 version() const noexcept
    { return version_and_flags_[0]; }

    ISOM_INLINE uint32 flags() const noexcept
    {
        return (uint32{version_and_flags_[1]} << 16)
             | (uint32{version_and_flags_[2]} <<  8)
             | (uint32{version_and_flags_[3]} <<  0);
    }

    ISOM_INLINE mp4::box* up() noexcept
    { return parent_; }

    ISOM_INLINE mp4::box const* up() const noexcept
    { return parent_; }

    mp4::root_box const& root() const noexcept;

    mp4::box& add_child(mp4::box_header const&);

    void read_version_and_flags(io::reader& r)
    {
        r.read(version_and_flags_);
        full_box_ = true;
    }

    template<typename T>
    ISOM_INLINE auto construct()
    noexcept(is_nothrow_default_constructible_v<T>) ->
        enable_if_t<!is_trivially_destructible_v<T>, T&>;

    template<typename T>
    ISOM_INLINE auto construct()
    noexcept(is_nothrow_default_constructible_v<T>) ->
        enable_if_t<is_trivially_destructible_v<T>, T&>;

    union {
        char box_data = {};
        ftyp_box_data ftyp;
        mvhd_box_data mvhd;
        tkhd_box_data tkhd;
        mdhd_box_data mdhd;
        hdlr_box_data hdlr;
        stsd_box_data stsd;
        avc1_box_data avc1;
        mp4a_box_data mp4a;
        avcC_box_data avcC;
        btrt_box_data btrt;
        stts_box_data stts;
        stss_box_data stss;
        stsc_box_data stsc;
        stsz_box_data stsz;
        stco_box_data stco;
        smhd_box_data smhd;
        mdat_box_data mdat;
    };

private:
    static child_list const empty_;

    void (*destroy_)(void const*) noexcept = nullptr;
    mp4::box*       const parent_;
    mp4::box_header const header_;
    uint8                 version_and_flags_[4]{};
    bool                  full_box_{false};
    std::map<uint32, child_list> children_;
    std::vector<mp4::box const*> in_order_;
};


class root_box final :
    public box
{
public:
    explicit root_box(io::reader, mp4::parse_options = parse_options::none);

    mp4::parse_options get_options() const noexcept
    { return options_; }

    void print(std::FILE*) const;

private:
    mp4::parse_options const options_;
};

}}    // namespace isom::mp4


#endif  // ISOM_INCLUDED_B1C94F27_6E08_4A3D_8D52_E7F0A913C64B
