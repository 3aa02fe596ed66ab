////////////////////////////////////////////////////////////////////////////////
//
// mp4/track.cpp
//
////////////////////////////////////////////////////////////////////////////////


#include <isom/error.hpp>
#include <isom/io/reader.hpp>
#include <isom/mp4/box.hpp>
#include <isom/mp4/track.hpp>
#include <isom/stddef.hpp>
#include <isom/utility.hpp>

#include <algorithm>
#include <cinttypes>
#include <cmath>
#include <cstdio>
#include <numeric>


namespace isom {
namespace mp4 {
namespace {

inline auto& stsc_entry_for_sample(mp4::stsc_box_data const& stsc,
                                   uint32 const sample_number)
{
    if (ISOM_UNLIKELY(stsc.entries.empty())) {
        raise(errc::invalid_data_format, "MP4 'stsc' table is empty");
    }

    auto const found = std::upper_bound(
        stsc.entries.begin(), stsc.entries.end(), sample_number,
        [](uint32 const x, auto const& entry) noexcept {
            return x < entry.first_sample;
        });
    ISOM_ASSERT(found != stsc.entries.begin());
    return found[-1];
}

inline auto& stsc_entry_for_chunk(mp4::stsc_box_data const& stsc,
                                  uint32 const chunk_number)
{
    if (ISOM_UNLIKELY(stsc.entries.empty())) {
        raise(errc::invalid_data_format, "MP4 'stsc' table is empty");
    }

    // 'first_chunk' is 1-based.
    auto const found = std::upper_bound(
        stsc.entries.begin(), stsc.entries.end(), chunk_number + 1,
        [](uint32 const x, auto const& entry) noexcept {
            return x < entry.first_chunk;
        });
    return found[-1];
}

inline auto& stts_entry_for_time(mp4::stts_box_data const& stts,
                                 uint64 const time) noexcept
{
    auto const found = std::upper_bound(
        stts.entries.begin(), stts.entries.end(), time,
        [](uint64 const x, auto const& entry) noexcept {
            return x < entry.first_time;
        });
    ISOM_ASSERT(found != stts.entries.begin());
    return found[-1];
}

inline auto& stts_entry_for_sample(mp4::stts_box_data const& stts,
                                   uint32 const sample_number) noexcept
{
    auto const found = std::upper_bound(
        stts.entries.begin(), stts.entries.end(), sample_number,
        [](uint32 const x, auto const& entry) noexcept {
            return x < entry.first_sample;
        });
    return found[-1];
}

}     // namespace <unnamed>


track::track(mp4::box const& t, io::reader const& d,
             mp4::parse_options const o) :
    trak(t),
    stbl(trak["mdia/minf/stbl"]),
    tkhd(trak["tkhd"].tkhd),
    mdhd(trak["mdia/mdhd"].mdhd),
    hdlr(trak["mdia/hdlr"].hdlr),
    stco(stbl.find_first_of("stco", "co64")->stco),
    stsz(stbl.find_first_of("stsz", "stz2")->stsz),
    stsc(stbl["stsc"].stsc),
    stts(stbl["stts"].stts),
    stss(nullptr),
    data(d),
    options(o)
{
    if (auto const found = stbl.find("stss")) {
        stss = &found->stss;
    }

    if (has_flag(options, parse_options::check_consistency)) {
        if (stts.total_samples != stsz.sample_count) {
            std::fprintf(stderr,
                         "[MP4] track %" PRIu32 ": 'stts' describes %" PRIu64
                         " samples but 'stsz' holds %" PRIu32 "\n",
                         get_id(), stts.total_samples, stsz.sample_count);
        }
    }
}

void track::check_sample(uint32 const sample) const
{
    if (ISOM_UNLIKELY(sample >= get_sample_count())) {
        raise(errc::out_of_bounds,
              "MP4 track %" PRIu32 ": sample %" PRIu32 " is beyond the "
              "sample count of %" PRIu32, get_id(), sample,
              get_sample_count());
    }
}

uint64 track::sample_to_size(uint32 const start, uint32 const length) const
{
    if (length == 0) {
        return 0;
    }
    if (ISOM_UNLIKELY(start > get_sample_count() ||
                      length > get_sample_count() - start)) {
        raise(errc::out_of_bounds,
              "MP4 track %" PRIu32 ": samples [%" PRIu32 ", %" PRIu64 ") "
              "are beyond the sample count of %" PRIu32, get_id(), start,
              uint64{start} + length, get_sample_count());
    }

    if (stsz.sample_size != 0) {
        return uint64{stsz.sample_size} * length;
    }
    return std::accumulate(stsz.entries.begin() + start,
                           stsz.entries.begin() + start + length,
                           uint64{0});
}

mp4::chunk_position track::sample_to_chunk(uint32 const sample) const
{
    check_sample(sample);

    auto const& entry = stsc_entry_for_sample(stsc, sample);
    auto const spc = entry.samples_per_chunk;
    if (ISOM_UNLIKELY(spc == 0)) {
        raise(errc::invalid_data_format,
              "MP4 track %" PRIu32 ": 'stsc' entry for sample %" PRIu32
              " has no samples per chunk", get_id(), sample);
    }

    auto const delta = sample - entry.first_sample;
    auto const chunk = uint64{entry.first_chunk - 1} + (delta / spc);
    if (ISOM_UNLIKELY(chunk >= stco.entries.size())) {
        raise(errc::out_of_bounds,
              "MP4 track %" PRIu32 ": invalid chunk number: %" PRIu64
              "/%" PRIu32, get_id(), chunk + 1, stco.entries.size());
    }

    mp4::chunk_position pos;
    pos.index  = static_cast<uint32>(chunk);
    pos.offset = delta % spc;
    return pos;
}

uint64 track::chunk_to_offset(uint32 const chunk) const
{
    if (ISOM_UNLIKELY(chunk >= stco.entries.size())) {
        raise(errc::out_of_bounds,
              "MP4 track %" PRIu32 ": invalid chunk number: %" PRIu32
              "/%" PRIu32, get_id(), chunk + 1, stco.entries.size());
    }
    return stco.entries[chunk];
}

uint64 track::sample_to_offset(uint32 const sample) const
{
    auto const pos = sample_to_chunk(sample);
    return chunk_to_offset(pos.index)
         + sample_to_size(sample - pos.offset, pos.offset);
}

uint32 track::get_samples_per_chunk(uint32 const chunk) const
{
    if (ISOM_UNLIKELY(chunk >= stco.entries.size())) {
        raise(errc::out_of_bounds,
              "MP4 track %" PRIu32 ": invalid chunk number: %" PRIu32
              "/%" PRIu32, get_id(), chunk + 1, stco.entries.size());
    }
    return stsc_entry_for_chunk(stsc, chunk).samples_per_chunk;
}

uint32 track::time_to_sample(uint64 const time) const
{
    if (ISOM_UNLIKELY(time >= stts.total_time)) {
        raise(errc::out_of_bounds,
              "MP4 track %" PRIu32 ": time %" PRIu64 " is beyond the "
              "track duration of %" PRIu64, get_id(), time,
              stts.total_time);
    }

    auto const& entry = stts_entry_for_time(stts, time);
    auto const sample = entry.first_sample
                      + (time - entry.first_time) / entry.sample_delta;
    if (ISOM_UNLIKELY(sample >= get_sample_count())) {
        raise(errc::out_of_bounds,
              "MP4 track %" PRIu32 ": time %" PRIu64 " maps to sample %"
              PRIu64 " beyond the sample count of %" PRIu32, get_id(),
              time, sample, get_sample_count());
    }
    return static_cast<uint32>(sample);
}

uint32 track::get_sample_duration(uint32 const sample) const
{
    if (ISOM_UNLIKELY(sample >= stts.total_samples)) {
        raise(errc::out_of_bounds,
              "MP4 track %" PRIu32 ": sample %" PRIu32 " has no duration",
              get_id(), sample);
    }
    return stts_entry_for_sample(stts, sample).sample_delta;
}

uint64 track::get_total_time() const
{
    if (has_flag(options, parse_options::check_consistency)) {
        if (stts.total_time != mdhd.duration) {
            std::fprintf(stderr,
                         "[MP4] track %" PRIu32 ": 'stts' duration %" PRIu64
                         " does not match 'mdhd' duration %" PRIu32 "\n",
                         get_id(), stts.total_time, mdhd.duration);
        }
    }
    return stts.total_time;
}

double track::time_to_seconds(uint64 const time) const
{
    if (ISOM_UNLIKELY(get_time_scale() == 0)) {
        raise(errc::invalid_data_format,
              "MP4 track %" PRIu32 " has a time scale of zero", get_id());
    }
    return static_cast<double>(time) / get_time_scale();
}

uint64 track::seconds_to_time(double const seconds) const
{
    if (ISOM_UNLIKELY(get_time_scale() == 0)) {
        raise(errc::invalid_data_format,
              "MP4 track %" PRIu32 " has a time scale of zero", get_id());
    }
    if (ISOM_UNLIKELY(!(seconds >= 0.0))) {
        raise(errc::invalid_argument,
              "MP4 track %" PRIu32 ": cannot convert %f seconds",
              get_id(), seconds);
    }
    return static_cast<uint64>(std::llround(seconds * get_time_scale()));
}

bool track::is_sync_sample(uint32 const sample) const
{
    check_sample(sample);
    if (stss == nullptr) {
        return true;
    }
    return std::binary_search(stss->entries.begin(), stss->entries.end(),
                              sample + 1);
}

uint32 track::get_sync_sample_before(uint32 const sample) const
{
    check_sample(sample);
    if (stss == nullptr) {
        return sample;
    }

    auto const first = stss->entries.begin();
    auto const found = std::upper_bound(first, stss->entries.end(),
                                        sample + 1);
    if (ISOM_UNLIKELY(found == first || found[-1] == 0)) {
        raise(errc::out_of_bounds,
              "MP4 track %" PRIu32 ": no sync sample at or before %" PRIu32,
              get_id(), sample);
    }
    return found[-1] - 1;
}

io::reader track::get_sample_data(uint32 const sample) const
{
    auto const offset = sample_to_offset(sample);
    auto const size   = sample_to_size(sample, 1);

    if (ISOM_UNLIKELY(offset < data.base() ||
                      offset - data.base() > data.size() ||
                      size > data.size() - (offset - data.base()))) {
        raise(errc::invalid_data_format,
              "MP4 track %" PRIu32 ": sample %" PRIu32 " at [%" PRIu64
              ", %" PRIu64 ") lies outside of the file", get_id(), sample,
              offset, offset + size);
    }

    auto const p = data.data() + (offset - data.base());
    return io::reader{p, static_cast<std::size_t>(size), offset};
}

}}    // namespace isom::mp4
