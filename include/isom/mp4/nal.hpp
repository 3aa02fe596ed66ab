////////////////////////////////////////////////////////////////////////////////
//
// isom/mp4/nal.hpp
//
////////////////////////////////////////////////////////////////////////////////


#ifndef ISOM_INCLUDED_E3B70A5D_92C4_4E1F_A86B_7D05F1C2E948
#define ISOM_INCLUDED_E3B70A5D_92C4_4E1F_A86B_7D05F1C2E948


#include <isom/io/reader.hpp>
#include <isom/mp4/box.hpp>
#include <isom/mp4/track.hpp>
#include <isom/stddef.hpp>

#include <cstddef>
#include <vector>


namespace isom {
namespace mp4 {

// Receives raw NAL unit payloads, without length prefix or start code.
class nal_sink
{
public:
    virtual void decode(uchar const*, std::size_t) = 0;

protected:
    ~nal_sink() = default;
};


inline uint8 get_nal_unit_type(mp4::byte_range const nal) noexcept
{ return nal.empty() ? 0 : (nal[0] & 0x1f); }

// Splits a buffer of 4-byte big-endian length prefixed NAL units.
std::vector<mp4::byte_range> split_nal_units(io::reader);

std::vector<mp4::byte_range> get_sample_nal_units(mp4::track const&,
                                                  uint32 sample);

mp4::avcC_box_data const& get_avc_config(mp4::track const&);

// Every SPS, then every PPS. Must reach the decoder before any picture.
void feed_parameter_sets(mp4::avcC_box_data const&, mp4::nal_sink&);

void feed_sample(mp4::track const&, uint32 sample, mp4::nal_sink&);

}}    // namespace isom::mp4


#endif  // ISOM_INCLUDED_E3B70A5D_92C4_4E1F_A86B_7D05F1C2E948
