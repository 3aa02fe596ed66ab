////////////////////////////////////////////////////////////////////////////////
//
// isom/mp4/track.hpp
//
////////////////////////////////////////////////////////////////////////////////


#ifndef ISOM_INCLUDED_47D0E3A8_1F6B_4C92_B5E7_08A2D6C9F31E
#define ISOM_INCLUDED_47D0E3A8_1F6B_4C92_B5E7_08A2D6C9F31E


#include <isom/io/reader.hpp>
#include <isom/mp4/box.hpp>
#include <isom/stddef.hpp>

#include <string>
#include <string_view>


namespace isom {
namespace mp4 {

struct chunk_position
{
    uint32 index;               // 0-based chunk
    uint32 offset;              // 0-based position of the sample in the chunk
};


// Sample index over one 'trak' box. All queries are computed from the
// immutable sample tables and leave the track unchanged, so a track may be
// shared between threads. Sample and chunk numbers are 0-based.
class track
{
public:
    track(mp4::box const& trak, io::reader const& data,
          mp4::parse_options = parse_options::none);

    uint32 get_id() const noexcept
    { return tkhd.track_id; }

    uint32 get_handler_type() const noexcept
    { return hdlr.handler_type; }

    std::string const& get_handler_name() const noexcept
    { return hdlr.name; }

    std::string_view get_language() const noexcept
    { return mdhd.language; }

    // Display size from the track header, truncated to whole pixels.
    uint32 get_width() const noexcept
    { return static_cast<uint32>(tkhd.width); }

    uint32 get_height() const noexcept
    { return static_cast<uint32>(tkhd.height); }

    uint32 get_sample_count() const noexcept
    { return stsz.sample_count; }

    uint32 get_chunk_count() const noexcept
    { return stco.entries.size(); }

    uint32 get_time_scale() const noexcept
    { return mdhd.time_scale; }

    uint64 sample_to_size(uint32 start, uint32 length) const;
    mp4::chunk_position sample_to_chunk(uint32 sample) const;
    uint64 chunk_to_offset(uint32 chunk) const;
    uint64 sample_to_offset(uint32 sample) const;
    uint32 get_samples_per_chunk(uint32 chunk) const;

    uint32 time_to_sample(uint64 time) const;
    uint32 get_sample_duration(uint32 sample) const;
    uint64 get_total_time() const;

    double get_total_time_in_seconds() const
    { return time_to_seconds(get_total_time()); }

    double time_to_seconds(uint64 time) const;
    uint64 seconds_to_time(double seconds) const;

    bool is_sync_sample(uint32 sample) const;
    uint32 get_sync_sample_before(uint32 sample) const;

    // The bytes of one sample, bounded to the file buffer.
    io::reader get_sample_data(uint32 sample) const;

    mp4::box const& get_trak() const noexcept
    { return trak; }

    mp4::box const* find(std::string_view const path) const noexcept
    { return trak.find(path); }

private:
    void check_sample(uint32 sample) const;

    mp4::box const& trak;
    mp4::box const& stbl;
    mp4::tkhd_box_data const& tkhd;
    mp4::mdhd_box_data const& mdhd;
    mp4::hdlr_box_data const& hdlr;
    mp4::stco_box_data const& stco;
    mp4::stsz_box_data const& stsz;
    mp4::stsc_box_data const& stsc;
    mp4::stts_box_data const& stts;
    mp4::stss_box_data const* stss;
    io::reader                data;
    mp4::parse_options        options;
};

}}    // namespace isom::mp4


#endif  // ISOM_INCLUDED_47D0E3A8_1F6B_4C92_B5E7_08A2D6C9F31E
