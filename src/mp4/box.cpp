////////////////////////////////////////////////////////////////////////////////
//
// mp4/box.cpp
//
////////////////////////////////////////////////////////////////////////////////


#include <isom/cxp/map.hpp>
#include <isom/error.hpp>
#include <isom/io/memory.hpp>
#include <isom/io/reader.hpp>
#include <isom/mp4/box.hpp>
#include <isom/range.hpp>
#include <isom/stddef.hpp>
#include <isom/utility.hpp>

#include <algorithm>
#include <cinttypes>
#include <cstdio>
#include <memory>
#include <new>
#include <utility>


namespace isom {
namespace mp4 {

template<typename T>
static void type_erased_delete_(void const* const p) noexcept
{
    static_cast<T const*>(p)->~T();
}


template<typename T>
ISOM_INLINE auto box::construct()
noexcept(is_nothrow_default_constructible_v<T>) ->
    enable_if_t<!is_trivially_destructible_v<T>, T&>
{
    ::new(static_cast<void*>(&box_data)) T{};
    destroy_ = type_erased_delete_<T>;
    return reinterpret_cast<T&>(box_data);
}

template<typename T>
ISOM_INLINE auto box::construct()
noexcept(is_nothrow_default_constructible_v<T>) ->
    enable_if_t<is_trivially_destructible_v<T>, T&>
{
    return *(::new(static_cast<void*>(&box_data)) T{});
}


namespace {

enum child_rule : uint8 {
    required = 0x1,
    unique   = 0x2,
};

struct child_layout
{
    uint32 type;
    uint8  rules;
};


// Counts the children of a container as they are read and verifies,
// once the container is complete, that every required child is present
// and that no unique child occurs twice.
struct box_checker
{
    void update(mp4::box const& box) noexcept
    {
        for (auto const i : xrange(count)) {
            if (children[i].type == box.type()) {
                state[i] += 1;
                break;
            }
        }
    }

    void finish(mp4::box const& parent) const
    {
        for (auto const i : xrange(count)) {
            char const* what = nullptr;
            if ((children[i].rules & required) && state[i] == 0) {
                what = "not present";
            }
            else if ((children[i].rules & unique) && state[i] > 1) {
                what = "not unique";
            }

            if (ISOM_UNLIKELY(what != nullptr)) {
                raise(errc::invalid_data_format,
                      "MP4 box '%s' in '%s' is %s",
                      to_fourcc_string(children[i].type).c_str(),
                      to_fourcc_string(parent.type()).c_str(), what);
            }
        }
    }

    mp4::child_layout const* children;
    uint32*                state;
    uint32                 count;
};


mp4::box_header read_box_header(io::reader& r)
{
    mp4::box_header header;
    header.header_size = 8;
    header.fpos = r.offset();

    if (r.remain() < header.header_size) {
        raise(errc::invalid_data_format,
              "MP4 box header at offset %" PRIu64 " is truncated "
              "(%zu bytes left)", header.fpos, r.remain());
    }

    r.gather<BE>(io::alias<uint32>(header.size), header.type);

    if (header.size == 1) {
        raise(errc::unsupported_format,
              "MP4 box '%s' at offset %" PRIu64 " has a 64-bit size",
              to_fourcc_string(header.type).c_str(), header.fpos);
    }
    if (header.size < header.header_size) {
        raise(errc::invalid_data_format,
              "MP4 box '%s' at offset %" PRIu64 " cannot be smaller than "
              "its header", to_fourcc_string(header.type).c_str(),
              header.fpos);
    }
    if (header.size - header.header_size > r.remain()) {
        raise(errc::invalid_data_format,
              "MP4 box '%s' at offset %" PRIu64 " declares %" PRIu64
              " bytes but only %zu remain in its parent",
              to_fourcc_string(header.type).c_str(), header.fpos,
              header.size, r.remain() + header.header_size);
    }
    return header;
}

// Rejects a table header whose entry count cannot fit in the rest of the
// box before anything is allocated for it.
void check_entry_count(mp4::box const& box, io::reader const& r,
                       uint64 const count, uint64 const record_size)
{
    if (ISOM_UNLIKELY(count * record_size > r.remain())) {
        raise(errc::invalid_data_format,
              "MP4 '%s' table of %" PRIu64 " entries does not fit in "
              "%zu bytes", to_fourcc_string(box.type()).c_str(), count,
              r.remain());
    }
}

void read_full_box_v0(mp4::box& box, io::reader& r)
{
    box.read_version_and_flags(r);
    if (box.version() != 0) {
        raise(errc::unsupported_format,
              "MP4 '%s' box version %u is not supported",
              to_fourcc_string(box.type()).c_str(), box.version());
    }
}

void read_container(mp4::box&, io::reader&, mp4::box_checker);

template<uint32 N>
ISOM_INLINE void read_container(mp4::box& parent, io::reader& r,
                                mp4::child_layout const(&rules)[N])
{
    uint32 counts[N] = {};
    return read_container(parent, r, box_checker{rules, counts, N});
}

ISOM_INLINE void read_container(mp4::box& parent, io::reader& r)
{
    return mp4::read_container(parent, r, box_checker{});
}

void read_ftyp(mp4::box& box, io::reader& r)
{
    auto&& ftyp = box.construct<ftyp_box_data>();
    r.gather<BE>(ftyp.major_brand,
                 ftyp.minor_version);

    auto const compatible_brand_count = static_cast<uint32>(r.remain() / 4);
    ftyp.compatible_brands.assign(r, compatible_brand_count);
}

void read_mvhd(mp4::box& box, io::reader& r)
{
    read_full_box_v0(box, r);

    auto&& mvhd = box.construct<mvhd_box_data>();
    r.gather<BE>(mvhd.creation_time,
                 mvhd.modification_time,
                 mvhd.time_scale,
                 mvhd.duration);

    mvhd.rate   = r.read_fixed16();
    mvhd.volume = r.read_fixed8();

    r.gather<BE>(io::ignore<10>,
                 mvhd.matrix,
                 io::ignore<24>,            // pre-defined
                 mvhd.next_track_id);
}

void read_tkhd(mp4::box& box, io::reader& r)
{
    read_full_box_v0(box, r);

    auto&& tkhd = box.construct<tkhd_box_data>();
    r.gather<BE>(tkhd.creation_time,
                 tkhd.modification_time,
                 tkhd.track_id,
                 io::ignore<4>,             // reserved
                 tkhd.duration,
                 io::ignore<8>,
                 tkhd.layer,
                 tkhd.alternate_group);

    tkhd.volume = r.read_fixed8();
    r.gather<BE>(io::ignore<2>,
                 tkhd.matrix);

    tkhd.width  = r.read_fixed16();
    tkhd.height = r.read_fixed16();
}

void read_mdhd(mp4::box& box, io::reader& r)
{
    read_full_box_v0(box, r);

    auto&& mdhd = box.construct<mdhd_box_data>();
    r.gather<BE>(mdhd.creation_time,
                 mdhd.modification_time,
                 mdhd.time_scale,
                 mdhd.duration);

    auto const language = r.read_iso639();
    std::copy_n(language.data(), 3, mdhd.language);
    mdhd.language[3] = '\0';
    r.skip(2);
}

void read_hdlr(mp4::box& box, io::reader& r)
{
    box.read_version_and_flags(r);

    auto&& hdlr = box.construct<hdlr_box_data>();
    r.gather<BE>(io::ignore<4>,
                 hdlr.handler_type,
                 io::ignore<12>);

    if (r.remain() != 0) {
        hdlr.name = r.read_utf8(r.remain());
        hdlr.name.erase(hdlr.name.find_last_not_of('\0') + 1);
    }
}

void read_stsd(mp4::box& box, io::reader& r)
{
    box.read_version_and_flags(r);

    auto&& stsd = box.construct<stsd_box_data>();
    stsd.entry_count = r.read<uint32,BE>();
    mp4::read_container(box, r);
}

void read_avc1(mp4::box& box, io::reader& r)
{
    auto&& avc1 = box.construct<avc1_box_data>();
    uint16 version;
    uint16 revision;
    uint32 reserved;

    r.gather<BE>(io::ignore<6>,
                 avc1.data_reference_index,
                 version,
                 revision,
                 io::ignore<12>,            // vendor, temporal/spatial quality
                 avc1.width,
                 avc1.height);

    avc1.horizontal_resolution = r.read_fixed16();
    avc1.vertical_resolution   = r.read_fixed16();

    r.gather<BE>(reserved,
                 avc1.frame_count);
    avc1.compressor_name = std::string{r.read_pascal_string(32)};
    r.gather<BE>(avc1.depth,
                 avc1.color_table_id);

    if (version != 0 || revision != 0 || reserved != 0) {
        raise(errc::unsupported_format,
              "MP4 'avc1' sample entry has unexpected version=%u "
              "revision=%u reserved=%#x", version, revision, reserved);
    }
    if (avc1.color_table_id != 0xffff) {
        raise(errc::unsupported_format,
              "MP4 'avc1' sample entry has a color table (id=%#x)",
              avc1.color_table_id);
    }
    mp4::read_container(box, r);
}

void read_mp4a(mp4::box& box, io::reader& r)
{
    auto&& mp4a = box.construct<mp4a_box_data>();
    uint32 sample_rate;

    r.gather<BE>(io::ignore<6>,
                 mp4a.data_reference_index,
                 mp4a.version,
                 io::ignore<6>,             // revision, vendor
                 mp4a.channel_count,
                 mp4a.sample_size,
                 mp4a.compression_id,
                 mp4a.packet_size,
                 sample_rate);
    mp4a.sample_rate = sample_rate >> 16;

    if (mp4a.version != 0) {
        raise(errc::unsupported_format,
              "MP4 'mp4a' sound description version %u is not supported",
              mp4a.version);
    }
    mp4::read_container(box, r);
}

void read_avcC(mp4::box& box, io::reader& r)
{
    auto&& avcC = box.construct<avcC_box_data>();
    uint8 length_size_minus_one;

    r.gather<BE>(avcC.configuration_version,
                 avcC.profile_indication,
                 avcC.profile_compatibility,
                 avcC.level_indication,
                 length_size_minus_one);

    avcC.length_size = static_cast<uint8>((length_size_minus_one & 0x3) + 1);
    if (avcC.length_size != 4) {
        raise(errc::unsupported_format,
              "MP4 'avcC' NAL unit length size of %u bytes is not supported",
              avcC.length_size);
    }

    auto const read_parameter_sets = [&r](std::vector<mp4::byte_range>& v) {
        auto count = r.read<uint8>() & 0x1f;
        v.reserve(static_cast<std::size_t>(count));
        for (; count != 0; --count) {
            auto const length = r.read<uint16,BE>();
            auto const p = r.read_n(length);
            v.push_back(make_range(p, p + length));
        }
    };

    read_parameter_sets(avcC.sps);
    read_parameter_sets(avcC.pps);
    r.skip(r.remain());
}

void read_btrt(mp4::box& box, io::reader& r)
{
    auto&& btrt = box.construct<btrt_box_data>();
    r.gather<BE>(btrt.buffer_size_db,
                 btrt.max_bitrate,
                 btrt.avg_bitrate);
}

void read_stts(mp4::box& box, io::reader& r)
{
    box.read_version_and_flags(r);

    auto&& stts = box.construct<stts_box_data>();
    auto const stts_entry_count = r.read<uint32,BE>();

    check_entry_count(box, r, stts_entry_count, 8);
    stts.entries.resize(stts_entry_count);

    auto sample = uint64{0};
    auto time   = uint64{0};
    for (auto&& entry : stts.entries) {
        r.gather<BE>(entry.sample_count,
                     entry.sample_delta);

        entry.first_sample = static_cast<uint32>(sample);
        entry.first_time   = time;

        sample += entry.sample_count;
        time   += uint64{entry.sample_count} * entry.sample_delta;

        if (ISOM_UNLIKELY(sample > UINT32_MAX)) {
            raise(errc::invalid_data_format,
                  "MP4 'stts' box describes more than 2^32-1 samples");
        }
    }

    stts.total_samples = sample;
    stts.total_time    = time;
}

void read_stss(mp4::box& box, io::reader& r)
{
    box.read_version_and_flags(r);

    auto&& stss = box.construct<stss_box_data>();
    stss.entries.assign(r, r.read<uint32,BE>());
}

void read_stsz(mp4::box& box, io::reader& r)
{
    box.read_version_and_flags(r);

    auto&& stsz = box.construct<stsz_box_data>();
    r.gather<BE>(stsz.sample_size,
                 stsz.sample_count);

    if (stsz.sample_size == 0) {
        stsz.entries.assign(r, stsz.sample_count);
    }
}

void read_stz2(mp4::box& box, io::reader& r)
{
    // XXX: intentionally constructing 'stsz_box_data' as there is no
    //      independent 'stz2_box_data' type.

    box.read_version_and_flags(r);

    auto&& stz2 = box.construct<stsz_box_data>();
    uint8 stz2_field_size;
    r.gather<BE>(io::ignore<3>,
                 stz2_field_size,
                 stz2.sample_count);

    stz2.sample_size = 0;

    switch (stz2_field_size) {
    case 16:
        check_entry_count(box, r, stz2.sample_count, 2);
        stz2.entries.resize(stz2.sample_count);
        for (auto&& entry : stz2.entries) {
            entry = r.read<uint16,BE>();
        }
        break;
    case 8:
        check_entry_count(box, r, stz2.sample_count, 1);
        stz2.entries.resize(stz2.sample_count);
        for (auto&& entry : stz2.entries) {
            entry = r.read<uint8>();
        }
        break;
    case 4:
        check_entry_count(box, r, (uint64{stz2.sample_count} + 1) / 2, 1);
        stz2.entries.resize(stz2.sample_count);
        for (auto i = uint32{0}; (i + 2) <= stz2.sample_count; i += 2) {
            auto const byte = r.read<uint8>();
            stz2.entries[i + 0] = (uint32{byte} >> 4) & 0xf;
            stz2.entries[i + 1] = (uint32{byte} >> 0) & 0xf;
        }
        if (stz2.sample_count & 1) {
            stz2.entries[stz2.sample_count - 1] =
                (uint32{r.read<uint8>()} >> 4) & 0xf;
        }
        break;
    default:
        raise(errc::invalid_data_format,
              "MP4 'stz2' field size of %u bits is invalid",
              stz2_field_size);
    }
}

void read_stsc(mp4::box& box, io::reader& r)
{
    box.read_version_and_flags(r);

    auto&& stsc = box.construct<stsc_box_data>();
    auto const stsc_entry_count = r.read<uint32,BE>();

    check_entry_count(box, r, stsc_entry_count, 12);
    stsc.entries.resize(stsc_entry_count);
    for (auto&& entry : stsc.entries) {
        r.gather<BE>(entry.first_chunk,
                     entry.samples_per_chunk,
                     entry.sample_description_index);
    }

    if (!stsc.entries.empty() && stsc.entries[0].first_chunk != 1) {
        raise(errc::invalid_data_format,
              "MP4 'stsc' table must start at chunk 1 (found %" PRIu32 ")",
              stsc.entries[0].first_chunk);
    }

    auto sample = uint64{0};
    auto const last = stsc.entries.end();
    for (auto first = stsc.entries.begin(); first != last; ++first) {
        first->first_sample = static_cast<uint32>(sample);
        if ((first + 1) != last) {
            if (first[1].first_chunk <= first[0].first_chunk) {
                raise(errc::invalid_data_format,
                      "MP4 'stsc' chunk numbers must be increasing "
                      "(%" PRIu32 " follows %" PRIu32 ")",
                      first[1].first_chunk, first[0].first_chunk);
            }
            sample += uint64{first[1].first_chunk - first[0].first_chunk}
                    * first[0].samples_per_chunk;
            if (ISOM_UNLIKELY(sample > UINT32_MAX)) {
                raise(errc::invalid_data_format,
                      "MP4 'stsc' box describes more than 2^32-1 samples");
            }
        }
    }
}

void read_stco(mp4::box& box, io::reader& r)
{
    box.read_version_and_flags(r);

    auto&& stco = box.construct<stco_box_data>();
    auto const stco_entry_count = r.read<uint32,BE>();

    check_entry_count(box, r, stco_entry_count, 4);
    stco.entries.resize(stco_entry_count);
    for (auto&& entry : stco.entries) {
        entry = r.read<uint32,BE>();
    }
}

void read_co64(mp4::box& box, io::reader& r)
{
    // XXX: intentionally constructing 'stco_box_data' as there is no
    //      independent 'co64_box_data' type.

    box.read_version_and_flags(r);

    auto&& co64 = box.construct<stco_box_data>();
    co64.entries.assign(r, r.read<uint32,BE>());
}

void read_smhd(mp4::box& box, io::reader& r)
{
    box.read_version_and_flags(r);

    auto&& smhd = box.construct<smhd_box_data>();
    smhd.balance = r.read_fixed8();
    r.skip(2);
}

void read_mdat(mp4::box& box, io::reader& r)
{
    auto&& mdat = box.construct<mdat_box_data>();
    auto const n = r.remain();
    auto const p = r.read_n(n);
    mdat.payload = make_range(p, p + n);
}

void read_mdia(mp4::box& box, io::reader& r)
{
    static constexpr mp4::child_layout const layout[] {
        { "hdlr"_4cc, required|unique },
        { "mdhd"_4cc, required|unique },
        { "minf"_4cc, required|unique },
    };
    mp4::read_container(box, r, layout);
}

void read_minf(mp4::box& box, io::reader& r)
{
    static constexpr mp4::child_layout const layout[] {
        { "smhd"_4cc,          unique },
        { "stbl"_4cc, required|unique },
    };
    mp4::read_container(box, r, layout);
}

void read_moov(mp4::box& box, io::reader& r)
{
    static constexpr mp4::child_layout const layout[] {
        { "mvhd"_4cc, required|unique },
    };
    mp4::read_container(box, r, layout);
}

void read_stbl(mp4::box& box, io::reader& r)
{
    static constexpr mp4::child_layout const layout[] {
        { "co64"_4cc,          unique },
        { "stco"_4cc,          unique },
        { "stsz"_4cc,          unique },
        { "stz2"_4cc,          unique },
        { "stsc"_4cc, required|unique },
        { "stsd"_4cc, required|unique },
        { "stts"_4cc, required|unique },
        { "stss"_4cc,          unique },
    };
    mp4::read_container(box, r, layout);

    if (!box.find_first_of("stco", "co64")) {
        raise(errc::invalid_data_format, "MP4 'stbl.stco' box is missing");
    }
    if (!box.find_first_of("stsz", "stz2")) {
        raise(errc::invalid_data_format, "MP4 'stbl.stsz' box is missing");
    }
}

void read_trak(mp4::box& box, io::reader& r)
{
    static constexpr mp4::child_layout const layout[] {
        { "mdia"_4cc, required|unique },
        { "tkhd"_4cc, required|unique },
    };
    mp4::read_container(box, r, layout);
}


struct box_path
{
public:
    constexpr box_path(uint32 const hi, uint32 const lo) noexcept :
        id{(uint64{hi} << 32) | lo}
    {}

    constexpr box_path(char const(&s)[5]) noexcept :
        box_path{0, fourcc_(s)}
    {}

    constexpr box_path(char const(&s)[10]) noexcept :
        box_path{fourcc_(s), fourcc_(s + 5)}
    {}

private:
    static constexpr uint32 fourcc_(char const* const s) noexcept
    {
        return (uint32{static_cast<uint8>(s[0])} << 24)
             | (uint32{static_cast<uint8>(s[1])} << 16)
             | (uint32{static_cast<uint8>(s[2])} <<  8)
             | (uint32{static_cast<uint8>(s[3])} <<  0);
    }

    uint64 id;

    friend constexpr bool operator<(box_path const& x,
                                    box_path const& y) noexcept
    { return (x.id < y.id); }
};


using box_reader = void (*)(mp4::box&, io::reader&);

// Keyed by (parent type, child type); the root has type zero.
constexpr cxp::map<mp4::box_path, mp4::box_reader, 25> box_readers {{
    {      "ftyp", read_ftyp      },
    {      "mdat", read_mdat      },
    {      "moov", read_moov      },
    { "avc1/avcC", read_avcC      },
    { "avc1/btrt", read_btrt      },
    { "mdia/hdlr", read_hdlr      },
    { "mdia/mdhd", read_mdhd      },
    { "mdia/minf", read_minf      },
    { "minf/smhd", read_smhd      },
    { "minf/stbl", read_stbl      },
    { "moov/mvhd", read_mvhd      },
    { "moov/trak", read_trak      },
    { "mp4a/btrt", read_btrt      },
    { "stbl/co64", read_co64      },
    { "stbl/stco", read_stco      },
    { "stbl/stsc", read_stsc      },
    { "stbl/stsd", read_stsd      },
    { "stbl/stss", read_stss      },
    { "stbl/stsz", read_stsz      },
    { "stbl/stts", read_stts      },
    { "stbl/stz2", read_stz2      },
    { "stsd/avc1", read_avc1      },
    { "stsd/mp4a", read_mp4a      },
    { "trak/mdia", read_mdia      },
    { "trak/tkhd", read_tkhd      },
}};

static_assert(cxp::is_sorted(box_readers), "");


void read_container(mp4::box& parent, io::reader& r, mp4::box_checker check)
{
    auto const strict = has_flag(parent.root().get_options(),
                                 parse_options::strict);

    while (r.remain() >= 4 && r.peek32() != 0) {
        auto const header = mp4::read_box_header(r);
        auto&& box = parent.add_child(header);
        auto payload = r.slice(header.size - header.header_size);

        auto query = mp4::box_path{parent.type(), header.type};
        auto found = mp4::box_readers.find(query);
        if (found != mp4::box_readers.end()) {
            try {
                found->second(box, payload);
            }
            catch (isom::error const& e) {
                if (e.code() != errc::end_of_file) {
                    throw;
                }
                raise(errc::invalid_data_format,
                      "MP4 box '%s' at offset %" PRIu64 " is truncated (%s)",
                      to_fourcc_string(header.type).c_str(), header.fpos,
                      e.what());
            }

            if (payload.remain() != 0) {
                if (strict) {
                    raise(errc::invalid_data_format,
                          "MP4 box '%s' at offset %" PRIu64 " has %zu "
                          "unread bytes", to_fourcc_string(header.type).c_str(),
                          header.fpos, payload.remain());
                }
                std::fprintf(stderr,
                             "[MP4] skipping %zu unread bytes in '%s' box "
                             "at offset %" PRIu64 "\n", payload.remain(),
                             to_fourcc_string(header.type).c_str(),
                             header.fpos);
            }
        }

        check.update(box);
        r.skip(payload.size());
    }

    // A zero size or a few bytes of padding end the container.
    r.skip(r.remain());
    check.finish(parent);
}


void print_box(std::FILE* const out, mp4::box const& box, int const indent)
{
    std::fprintf(out, "%*s[%s] @%" PRIu64 ":%" PRIu64 "\n",
                 indent, "", to_fourcc_string(box.type()).c_str(),
                 box.start_position(), box.end_position());

    for (auto const child : box.children()) {
        print_box(out, *child, indent + 4);
    }
}

}     // namespace <unnamed>


box::child_list const box::empty_;

box const* box::find(std::string_view p) const noexcept
{
    auto x = this;
    if (!p.empty() && p[0] == '/') {
        p.remove_prefix(1);
        while (x->up() != nullptr) {
            x = x->up();
        }
    }

    while (!p.empty()) {
        if (p.size() >= 2 && p[0] == '.' && p[1] == '.' &&
            (p.size() == 2 || p[2] == '/' || p[2] == '.')) {
            if (!x->up()) {
                return nullptr;
            }
            x = x->up();
            p.remove_prefix(2);
        }
        else {
            if (p.size() < 4) {
                return nullptr;
            }
            auto const type = io::load<uint32,BE>(p.data());
            p.remove_prefix(4);

            auto index = std::size_t{0};
            if (!p.empty() && p[0] == '[') {
                auto const close = p.find(']');
                if (close == p.npos || close == 1) {
                    return nullptr;
                }
                for (auto const c : p.substr(1, close - 1)) {
                    if (c < '0' || c > '9') {
                        return nullptr;
                    }
                    if (index > (SIZE_MAX - 9) / 10) {
                        return nullptr;
                    }
                    index = index * 10 + static_cast<std::size_t>(c - '0');
                }
                p.remove_prefix(close + 1);
            }

            auto const found = x->children_.find(type);
            if (found == x->children_.end() || index >= found->second.size()) {
                return nullptr;
            }
            x = found->second[index].get();
        }

        if (!p.empty()) {
            if (p[0] != '/' && p[0] != '.') {
                return nullptr;
            }
            p.remove_prefix(1);
        }
    }
    return x;
}

box::~box()
{
    if (destroy_) {
        destroy_(&box_data);
    }
}

mp4::root_box const& box::root() const noexcept
{
    auto x = this;
    while (x->up() != nullptr) {
        x = x->up();
    }
    return static_cast<mp4::root_box const&>(*x);
}

mp4::box& box::add_child(mp4::box_header const& header)
{
    auto child = std::make_unique<mp4::box>(header, this);
    auto&& ret = *child;

    children_[header.type].push_back(std::move(child));
    in_order_.push_back(&ret);
    return ret;
}


root_box::root_box(io::reader r, mp4::parse_options const options) :
    box(mp4::box_header{r.offset(), r.remain(), 0, 0}, nullptr),
    options_(options)
{
    static constexpr mp4::child_layout const layout[] {
        { "ftyp"_4cc, unique },
        { "moov"_4cc, unique },
    };
    mp4::read_container(*this, r, layout);
}

void root_box::print(std::FILE* const out) const
{
    std::fputs("[MP4] {\n", out);
    for (auto const child : children()) {
        print_box(out, *child, 4);
    }
    std::fputs("}\n", out);
}

}}    // namespace isom::mp4
