////////////////////////////////////////////////////////////////////////////////
//
// isom/mp4/file.hpp
//
////////////////////////////////////////////////////////////////////////////////


#ifndef ISOM_INCLUDED_5A2E91C7_0D34_4B8F_9E61_C3F7B2A4D805
#define ISOM_INCLUDED_5A2E91C7_0D34_4B8F_9E61_C3F7B2A4D805


#include <isom/io/reader.hpp>
#include <isom/mp4/box.hpp>
#include <isom/mp4/track.hpp>
#include <isom/stddef.hpp>

#include <cstddef>
#include <cstdio>
#include <map>
#include <string_view>
#include <vector>


namespace isom {
namespace mp4 {

// Position of one sample in the file, as reported by trace_samples().
struct sample_location
{
    uint32 track_id;
    uint32 sample;
    uint64 offset;
    uint64 size;
};


// A parsed ISO base media file. The byte buffer is borrowed and must
// outlive the file object; every track and every range produced from it
// points into that buffer.
class file
{
public:
    explicit file(io::reader, mp4::parse_options = parse_options::none);

    file(file const&) = delete;
    file& operator=(file const&) = delete;

    mp4::root_box const& get_root() const noexcept
    { return root_; }

    mp4::box const* find(std::string_view const path) const noexcept
    { return root_.find(path); }

    io::reader const& get_data() const noexcept
    { return data_; }

    std::map<uint32, mp4::track> const& get_tracks() const noexcept
    { return tracks_; }

    mp4::track const* find_track(uint32 id) const noexcept;
    mp4::track const* find_track_with_handler(uint32 type) const noexcept;

    uint32 get_time_scale() const noexcept
    { return mvhd_.time_scale; }

    uint32 get_duration() const noexcept
    { return mvhd_.duration; }

    uint32 get_major_brand() const noexcept;

    // Samples of all tracks ordered by file offset, at most 'count' of them
    // from each track.
    std::vector<mp4::sample_location> trace_samples(uint32 count) const;

    void print(std::FILE*) const;

private:
    io::reader                   data_;
    mp4::root_box                root_;
    mp4::mvhd_box_data const&    mvhd_;
    std::map<uint32, mp4::track> tracks_;
};

}}    // namespace isom::mp4


#endif  // ISOM_INCLUDED_5A2E91C7_0D34_4B8F_9E61_C3F7B2A4D805
