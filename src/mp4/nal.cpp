////////////////////////////////////////////////////////////////////////////////
//
// mp4/nal.cpp
//
////////////////////////////////////////////////////////////////////////////////


#include <isom/error.hpp>
#include <isom/io/reader.hpp>
#include <isom/mp4/box.hpp>
#include <isom/mp4/nal.hpp>
#include <isom/mp4/track.hpp>
#include <isom/stddef.hpp>

#include <cinttypes>


namespace isom {
namespace mp4 {

std::vector<mp4::byte_range> split_nal_units(io::reader r)
{
    std::vector<mp4::byte_range> units;
    while (r.remain() != 0) {
        if (ISOM_UNLIKELY(r.remain() < 4)) {
            raise(errc::invalid_data_format,
                  "NAL unit length prefix at offset %" PRIu64 " is "
                  "truncated", r.offset());
        }

        auto const length = r.read<uint32,BE>();
        if (ISOM_UNLIKELY(length > r.remain())) {
            raise(errc::invalid_data_format,
                  "NAL unit at offset %" PRIu64 " claims %" PRIu32 " bytes, "
                  "but only %zu remain", r.offset(), length, r.remain());
        }

        auto const p = r.read_n(length);
        units.emplace_back(p, p + length);
    }
    return units;
}

std::vector<mp4::byte_range> get_sample_nal_units(mp4::track const& t,
                                                  uint32 const sample)
{
    return mp4::split_nal_units(t.get_sample_data(sample));
}

mp4::avcC_box_data const& get_avc_config(mp4::track const& t)
{
    auto const avcC = t.find("mdia/minf/stbl/stsd/avc1/avcC");
    if (ISOM_UNLIKELY(avcC == nullptr)) {
        raise(errc::unsupported_format,
              "MP4 track %" PRIu32 " has no AVC decoder configuration",
              t.get_id());
    }
    return avcC->avcC;
}

void feed_parameter_sets(mp4::avcC_box_data const& avcC,
                         mp4::nal_sink& sink)
{
    for (auto&& sps : avcC.sps) {
        sink.decode(sps.begin(), sps.size());
    }
    for (auto&& pps : avcC.pps) {
        sink.decode(pps.begin(), pps.size());
    }
}

void feed_sample(mp4::track const& t, uint32 const sample,
                 mp4::nal_sink& sink)
{
    for (auto&& nal : mp4::get_sample_nal_units(t, sample)) {
        sink.decode(nal.begin(), nal.size());
    }
}

}}    // namespace isom::mp4
