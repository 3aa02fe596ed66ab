////////////////////////////////////////////////////////////////////////////////
//
// mp4/file.cpp
//
////////////////////////////////////////////////////////////////////////////////


#include <isom/error.hpp>
#include <isom/io/reader.hpp>
#include <isom/mp4/box.hpp>
#include <isom/mp4/file.hpp>
#include <isom/mp4/track.hpp>
#include <isom/range.hpp>
#include <isom/stddef.hpp>
#include <isom/utility.hpp>

#include <algorithm>
#include <cinttypes>
#include <cstdio>
#include <tuple>
#include <utility>


namespace isom {
namespace mp4 {
namespace {

inline auto& get_mvhd(mp4::root_box const& root)
{
    auto const moov = root.find("moov");
    if (ISOM_UNLIKELY(moov == nullptr)) {
        raise(errc::invalid_data_format, "MP4 file has no 'moov' box");
    }
    return (*moov)["mvhd"].mvhd;
}

}     // namespace <unnamed>


file::file(io::reader r, mp4::parse_options const options) :
    data_(r),
    root_(r, options),
    mvhd_(get_mvhd(root_))
{
    for (auto&& trak : root_["moov"].equal_range("trak"_4cc)) {
        auto&& t = mp4::track{*trak, data_, options};
        auto const id = t.get_id();

        auto const inserted = tracks_.emplace(id, std::move(t)).second;
        if (ISOM_UNLIKELY(!inserted)) {
            raise(errc::invalid_data_format,
                  "MP4 track ID %" PRIu32 " is not unique", id);
        }
    }
}

mp4::track const* file::find_track(uint32 const id) const noexcept
{
    auto const found = tracks_.find(id);
    return (found != tracks_.end()) ? &found->second : nullptr;
}

mp4::track const* file::find_track_with_handler(uint32 const type)
const noexcept
{
    for (auto&& entry : tracks_) {
        if (entry.second.get_handler_type() == type) {
            return &entry.second;
        }
    }
    return nullptr;
}

uint32 file::get_major_brand() const noexcept
{
    if (auto const ftyp = root_.find("ftyp")) {
        return ftyp->ftyp.major_brand;
    }
    return 0;
}

std::vector<mp4::sample_location> file::trace_samples(uint32 const count)
const
{
    std::vector<mp4::sample_location> samples;
    for (auto&& entry : tracks_) {
        auto&& t = entry.second;
        auto const n = std::min(count, t.get_sample_count());
        for (auto const s : xrange(n)) {
            mp4::sample_location loc;
            loc.track_id = t.get_id();
            loc.sample   = s;
            loc.offset   = t.sample_to_offset(s);
            loc.size     = t.sample_to_size(s, 1);
            samples.push_back(loc);
        }
    }

    std::stable_sort(
        samples.begin(), samples.end(),
        [](auto const& x, auto const& y) noexcept {
            return std::tie(x.offset, x.track_id)
                 < std::tie(y.offset, y.track_id);
        });
    return samples;
}

void file::print(std::FILE* const out) const
{
    root_.print(out);
}

}}    // namespace isom::mp4
