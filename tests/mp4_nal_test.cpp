////////////////////////////////////////////////////////////////////////////////
//
// tests/mp4_nal_test.cpp
//
////////////////////////////////////////////////////////////////////////////////


#include <isom/error.hpp>
#include <isom/io/reader.hpp>
#include <isom/mp4/box.hpp>
#include <isom/mp4/file.hpp>
#include <isom/mp4/nal.hpp>
#include <isom/stddef.hpp>
#include <isom/utility.hpp>

#include "mp4_writer.hpp"

#include <iterator>
#include <vector>

#include <gtest/gtest.h>


using namespace ::isom;
using namespace ::isom::test;


namespace {

constexpr uint8 two_units[] {
    0x00, 0x00, 0x00, 0x02, 0xaa, 0xbb,
    0x00, 0x00, 0x00, 0x01, 0xcc,
};

class recording_sink final :
    public mp4::nal_sink
{
public:
    void decode(uchar const* const p, std::size_t const n) override
    { units.emplace_back(p, p + n); }

    std::vector<std::vector<uint8>> units;
};

std::vector<uint8> make_stream()
{
    avc_config config;
    config.sps = {{ 0x67, 0x42, 0xc0, 0x1e }};
    config.pps = {{ 0x68, 0xce, 0x3c, 0x80 }};

    // Sample 0 holds an IDR slice, sample 1 two NAL units.
    std::vector<uint8> payload {
        0x00, 0x00, 0x00, 0x03, 0x65, 0x88, 0x84,
    };
    payload.insert(payload.end(), std::begin(two_units), std::end(two_units));

    track_layout video;
    video.id            = 1;
    video.handler       = "vide";
    video.duration      = 200;
    video.sample_entry  = make_avc1(320, 240, config);
    video.stts          = {{ 2, 100 }};
    video.stsc          = {{ 1, 2 }};
    video.sample_count  = 2;
    video.sample_sizes  = { 7, 11 };
    video.chunk_offsets = { mdat_payload_offset() };
    video.sync_samples  = { 1 };

    track_layout audio;
    audio.id            = 2;
    audio.handler       = "soun";
    audio.time_scale    = 44100;
    audio.sample_entry  = make_mp4a(2, 44100);
    audio.stts          = {{ 1, 1024 }};
    audio.stsc          = {{ 1, 1 }};
    audio.sample_size   = 4;
    audio.sample_count  = 1;
    audio.chunk_offsets = { mdat_payload_offset() };

    return make_file(payload, { video, audio });
}

}     // namespace <unnamed>


TEST(mp4_nal_test, split)
{
    auto const units = mp4::split_nal_units(io::reader{two_units});
    ASSERT_EQ(units.size(), 2);
    ASSERT_EQ(units[0].size(), 2);
    ASSERT_EQ(units[0][0], 0xaa);
    ASSERT_EQ(units[0][1], 0xbb);
    ASSERT_EQ(units[1].size(), 1);
    ASSERT_EQ(units[1][0], 0xcc);
    ASSERT_EQ(units[1].end(), std::end(two_units));

    ASSERT_TRUE(mp4::split_nal_units(io::reader{}).empty());
}

TEST(mp4_nal_test, split_overrun)
{
    constexpr uint8 long_unit[] { 0x00, 0x00, 0x00, 0x05, 0x01, 0x02 };
    ASSERT_EQ(thrown_code([&] { mp4::split_nal_units(io::reader{long_unit}); }),
              errc::invalid_data_format);

    constexpr uint8 short_prefix[] { 0x00, 0x00, 0x00, 0x01, 0xaa, 0x00 };
    ASSERT_EQ(thrown_code([&] {
        mp4::split_nal_units(io::reader{short_prefix});
    }), errc::invalid_data_format);
}

TEST(mp4_nal_test, nal_unit_type)
{
    constexpr uint8 idr[] { 0x65, 0x88 };
    ASSERT_EQ(mp4::get_nal_unit_type(make_range(idr, 2)), 5);
    ASSERT_EQ(mp4::get_nal_unit_type(mp4::byte_range{}), 0);
}

TEST(mp4_nal_test, sample_nal_units)
{
    auto const buf = make_stream();
    mp4::file f{io::reader{buf}};

    auto const video = f.find_track_with_handler(mp4::media_handler::video);
    ASSERT_NE(video, nullptr);

    auto const first = mp4::get_sample_nal_units(*video, 0);
    ASSERT_EQ(first.size(), 1);
    ASSERT_EQ(mp4::get_nal_unit_type(first[0]), 5);

    auto const second = mp4::get_sample_nal_units(*video, 1);
    ASSERT_EQ(second.size(), 2);
    ASSERT_EQ(second[0].size(), 2);
    ASSERT_EQ(second[0][0], 0xaa);
    ASSERT_EQ(second[1].size(), 1);
    ASSERT_EQ(second[1][0], 0xcc);
    ASSERT_EQ(second[1].end(),
              buf.data() + video->sample_to_offset(1)
                         + video->sample_to_size(1, 1));
}

TEST(mp4_nal_test, feed_decoder)
{
    auto const buf = make_stream();
    mp4::file f{io::reader{buf}};
    auto&& video = *f.find_track_with_handler(mp4::media_handler::video);

    recording_sink sink;
    mp4::feed_parameter_sets(mp4::get_avc_config(video), sink);
    for (auto const sample : xrange(video.get_sample_count())) {
        mp4::feed_sample(video, sample, sink);
    }

    std::vector<std::vector<uint8>> const expected {
        { 0x67, 0x42, 0xc0, 0x1e },
        { 0x68, 0xce, 0x3c, 0x80 },
        { 0x65, 0x88, 0x84 },
        { 0xaa, 0xbb },
        { 0xcc },
    };
    ASSERT_EQ(sink.units, expected);
}

TEST(mp4_nal_test, no_avc_config)
{
    auto const buf = make_stream();
    mp4::file f{io::reader{buf}};

    auto const audio = f.find_track_with_handler(mp4::media_handler::audio);
    ASSERT_NE(audio, nullptr);
    ASSERT_EQ(thrown_code([&] { mp4::get_avc_config(*audio); }),
              errc::unsupported_format);
}
