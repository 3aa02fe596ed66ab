////////////////////////////////////////////////////////////////////////////////
//
// tests/mp4_box_test.cpp
//
////////////////////////////////////////////////////////////////////////////////


#include <isom/error.hpp>
#include <isom/io/reader.hpp>
#include <isom/mp4/box.hpp>
#include <isom/stddef.hpp>
#include <isom/utility.hpp>

#include "mp4_writer.hpp"

#include <cstdio>
#include <cstring>
#include <vector>

#include <gtest/gtest.h>


using namespace ::isom;
using namespace ::isom::test;


namespace {

track_layout video_layout()
{
    avc_config config;
    config.sps = {{ 0x67, 0x42, 0xc0, 0x1e }};
    config.pps = {{ 0x68, 0xce, 0x3c }, { 0x68, 0xce, 0x3d }};

    track_layout t;
    t.id            = 1;
    t.handler       = "vide";
    t.duration      = 300;
    t.sample_entry  = make_avc1(320, 240, config);
    t.stts          = {{ 3, 100 }};
    t.stsc          = {{ 1, 3 }};
    t.sample_count  = 3;
    t.sample_sizes  = { 4, 5, 6 };
    t.chunk_offsets = { mdat_payload_offset() };
    t.sync_samples  = { 1 };
    return t;
}

track_layout audio_layout()
{
    track_layout t;
    t.id            = 2;
    t.handler       = "soun";
    t.width         = 0;
    t.height        = 0;
    t.time_scale    = 44100;
    t.duration      = 2048;
    t.sample_entry  = make_mp4a(2, 44100);
    t.stts          = {{ 2, 1024 }};
    t.stsc          = {{ 1, 2 }};
    t.sample_size   = 8;
    t.sample_count  = 2;
    t.chunk_offsets = { mdat_payload_offset() + 15 };
    return t;
}

std::vector<uint8> const& sample_file()
{
    static auto const buf = make_file(std::vector<uint8>(31, 0xee),
                                      { video_layout(), audio_layout() });
    return buf;
}

errc parse_code(std::vector<uint8> const& buf,
                mp4::parse_options const options = mp4::parse_options::none)
{
    return thrown_code([&] { mp4::root_box{io::reader{buf}, options}; });
}

}     // namespace <unnamed>


TEST(mp4_box_test, parse_file)
{
    mp4::root_box root{io::reader{sample_file()}};

    auto&& ftyp = root["ftyp"].ftyp;
    ASSERT_EQ(ftyp.major_brand, "isom"_4cc);
    ASSERT_EQ(ftyp.minor_version, 0x200);
    ASSERT_TRUE(ftyp.compatible_with("avc1"_4cc));
    ASSERT_FALSE(ftyp.compatible_with("mp42"_4cc));

    auto&& mvhd = root["moov/mvhd"].mvhd;
    ASSERT_EQ(mvhd.time_scale, 1000);
    ASSERT_DOUBLE_EQ(mvhd.rate, 1.0);
    ASSERT_DOUBLE_EQ(mvhd.volume, 1.0);
    ASSERT_EQ(mvhd.matrix[8], 0x40000000);
    ASSERT_EQ(mvhd.next_track_id, 3);

    auto&& trak = root["moov/trak"];
    auto&& tkhd = trak["tkhd"];
    ASSERT_TRUE(tkhd.is_full_box());
    ASSERT_EQ(tkhd.version(), 0);
    ASSERT_EQ(tkhd.flags(), 7);
    ASSERT_EQ(tkhd.tkhd.track_id, 1);
    ASSERT_DOUBLE_EQ(tkhd.tkhd.width, 320.0);
    ASSERT_DOUBLE_EQ(tkhd.tkhd.height, 240.0);

    ASSERT_EQ(trak["mdia/mdhd"].mdhd.time_scale, 1000);
    ASSERT_STREQ(trak["mdia/mdhd"].mdhd.language, "und");
    ASSERT_EQ(trak["mdia/hdlr"].hdlr.handler_type, mp4::media_handler::video);
    ASSERT_EQ(trak["mdia/hdlr"].hdlr.name, "isom test handler");

    auto&& stsd = trak["mdia/minf/stbl/stsd"];
    ASSERT_EQ(stsd.stsd.entry_count, 1);

    auto&& avc1 = stsd["avc1"].avc1;
    ASSERT_EQ(avc1.data_reference_index, 1);
    ASSERT_EQ(avc1.width, 320);
    ASSERT_EQ(avc1.height, 240);
    ASSERT_DOUBLE_EQ(avc1.horizontal_resolution, 72.0);
    ASSERT_EQ(avc1.compressor_name, "AVC Coding");
    ASSERT_EQ(avc1.depth, 0x18);

    auto&& avcC = stsd["avc1/avcC"].avcC;
    ASSERT_EQ(avcC.configuration_version, 1);
    ASSERT_EQ(avcC.profile_indication, 0x42);
    ASSERT_EQ(avcC.level_indication, 0x1e);
    ASSERT_EQ(avcC.length_size, 4);
    ASSERT_EQ(avcC.sps.size(), 1);
    ASSERT_EQ(avcC.pps.size(), 2);
    ASSERT_EQ(avcC.sps[0].size(), 4);
    ASSERT_EQ(avcC.sps[0][0], 0x67);
    ASSERT_EQ(avcC.pps[1][2], 0x3d);

    auto&& mp4a = root["moov/trak[1]/mdia/minf/stbl/stsd/mp4a"].mp4a;
    ASSERT_EQ(mp4a.channel_count, 2);
    ASSERT_EQ(mp4a.sample_size, 16);
    ASSERT_EQ(mp4a.sample_rate, 44100);

    auto&& mdat = root["mdat"];
    ASSERT_EQ(mdat.start_position(), 24);
    ASSERT_EQ(mdat.payload_size(), 31);
    ASSERT_EQ(mdat.mdat.payload.size(), 31);
    ASSERT_EQ(mdat.mdat.payload[0], 0xee);
}

TEST(mp4_box_test, sample_tables)
{
    mp4::root_box root{io::reader{sample_file()}};
    auto&& stbl = root["moov/trak/mdia/minf/stbl"];

    auto&& stts = stbl["stts"].stts;
    ASSERT_EQ(stts.entries.size(), 1);
    ASSERT_EQ(stts.total_samples, 3);
    ASSERT_EQ(stts.total_time, 300);

    auto&& stsc = stbl["stsc"].stsc;
    ASSERT_EQ(stsc.entries.size(), 1);
    ASSERT_EQ(stsc.entries[0].first_chunk, 1);
    ASSERT_EQ(stsc.entries[0].samples_per_chunk, 3);
    ASSERT_EQ(stsc.entries[0].sample_description_index, 1);
    ASSERT_EQ(stsc.entries[0].first_sample, 0);

    auto&& stsz = stbl["stsz"].stsz;
    ASSERT_EQ(stsz.sample_size, 0);
    ASSERT_EQ(stsz.sample_count, 3);
    ASSERT_EQ(stsz.entries[2], 6);

    ASSERT_EQ(stbl["stco"].stco.entries[0], 32);
    ASSERT_EQ(stbl["stss"].stss.entries[0], 1);

    auto&& audio = root["moov/trak[1]/mdia/minf/stbl/stsz"].stsz;
    ASSERT_EQ(audio.sample_size, 8);
    ASSERT_TRUE(audio.entries.empty());
}

TEST(mp4_box_test, path_queries)
{
    mp4::root_box root{io::reader{sample_file()}};

    auto const moov = root.find("moov");
    ASSERT_NE(moov, nullptr);
    ASSERT_EQ(moov->count("trak"_4cc), 2);
    ASSERT_EQ(moov->equal_range("trak"_4cc).size(), 2);
    ASSERT_TRUE(moov->equal_range("udta"_4cc).empty());

    auto const stsd = root.find("moov.trak[0].mdia.minf.stbl.stsd");
    ASSERT_NE(stsd, nullptr);
    ASSERT_EQ(stsd, root.find("moov/trak/mdia/minf/stbl/stsd"));
    ASSERT_EQ(stsd->up()->type(), "stbl"_4cc);

    auto const hdlr = stsd->find("../../../hdlr");
    ASSERT_NE(hdlr, nullptr);
    ASSERT_EQ(hdlr->hdlr.handler_type, mp4::media_handler::video);
    ASSERT_EQ(stsd->find("/moov/trak[1]"), root.find("moov/trak[1]"));
    ASSERT_EQ(&stsd->root(), &root);

    ASSERT_EQ(root.find("moov/trak[2]"), nullptr);
    ASSERT_EQ(root.find("moov/trak[x]"), nullptr);
    ASSERT_EQ(root.find("moov/trak[]"), nullptr);
    ASSERT_EQ(root.find("moov/trak[18446744073709551616]"), nullptr);
    ASSERT_EQ(root.find("moov/trak[18446744073709551617]/mdia"), nullptr);
    ASSERT_EQ(root.find("moov/trak[000001]"), root.find("moov/trak[1]"));
    ASSERT_EQ(root.find("moov/tr"), nullptr);
    ASSERT_EQ(root.find(".."), nullptr);
    ASSERT_EQ(root.find("moov")->find_first_of("udta", "mvhd"),
              root.find("moov/mvhd"));

    auto const code = thrown_code([&] { root["moov/udta"]; });
    ASSERT_EQ(code, errc::invalid_data_format);
}

TEST(mp4_box_test, document_order)
{
    mp4::root_box root{io::reader{sample_file()}};

    auto&& top = root.children();
    ASSERT_EQ(top.size(), 3);
    ASSERT_EQ(top[0]->type(), "ftyp"_4cc);
    ASSERT_EQ(top[1]->type(), "mdat"_4cc);
    ASSERT_EQ(top[2]->type(), "moov"_4cc);
    ASSERT_EQ(top[2]->end_position(), sample_file().size());

    auto prev = uint64{0};
    for (auto const box : top) {
        ASSERT_EQ(box->start_position(), prev);
        prev = box->end_position();
    }
}

TEST(mp4_box_test, unknown_box_is_skipped)
{
    writer w;
    w.u32(20).fourcc("abcd").zeros(12)
     .bytes(make_ftyp().data());

    mp4::root_box root{io::reader{w.data()}};
    ASSERT_EQ(root.children().size(), 2);

    auto&& unknown = *root.children()[0];
    ASSERT_EQ(unknown.type(), "abcd"_4cc);
    ASSERT_EQ(unknown.size(), 20);
    ASSERT_EQ(unknown.payload_size(), 12);
    ASSERT_FALSE(unknown.is_full_box());

    auto&& ftyp = *root.children()[1];
    ASSERT_EQ(ftyp.type(), "ftyp"_4cc);
    ASSERT_EQ(ftyp.start_position(), 20);
    ASSERT_EQ(ftyp.ftyp.major_brand, "isom"_4cc);
}

TEST(mp4_box_test, unknown_child_is_skipped)
{
    writer moov;
    moov.bytes(make_mvhd(1000, 0).data())
        .u32(20).fourcc("abcd").zeros(12)
        .bytes(make_trak(video_layout()).data());

    writer w;
    w.bytes(make_ftyp().data()).box("moov", moov);

    mp4::root_box root{io::reader{w.data()}};
    auto&& children = root["moov"].children();
    ASSERT_EQ(children.size(), 3);

    auto&& mvhd = *children[0];
    auto&& unknown = *children[1];
    ASSERT_EQ(unknown.type(), "abcd"_4cc);
    ASSERT_EQ(unknown.start_position(), mvhd.end_position());
    ASSERT_EQ(unknown.size(), 20);

    auto&& trak = *children[2];
    ASSERT_EQ(trak.type(), "trak"_4cc);
    ASSERT_EQ(trak.start_position(), unknown.start_position() + 20);
    ASSERT_EQ(root.find("moov/trak/tkhd")->tkhd.track_id, 1);
}

TEST(mp4_box_test, zero_size_ends_container)
{
    writer w;
    w.bytes(make_ftyp().data()).u32(0).fourcc("mdat").zeros(4);

    mp4::root_box root{io::reader{w.data()}};
    ASSERT_EQ(root.children().size(), 1);
}

TEST(mp4_box_test, unsupported_version)
{
    writer moov;
    moov.bytes(make_mvhd(1000, 0).data())
        .box("trak", make_tkhd(1, 320, 240, 1));

    writer w;
    w.box("moov", moov);
    ASSERT_EQ(parse_code(w.data()), errc::unsupported_format);
}

TEST(mp4_box_test, large_size_rejected)
{
    writer w;
    w.u32(1).fourcc("mdat").u64(16);
    ASSERT_EQ(parse_code(w.data()), errc::unsupported_format);
}

TEST(mp4_box_test, malformed_sizes)
{
    writer tiny;
    tiny.u32(4).fourcc("free");
    ASSERT_EQ(parse_code(tiny.data()), errc::invalid_data_format);

    writer beyond_buffer;
    beyond_buffer.u32(100).fourcc("moov").zeros(20);
    ASSERT_EQ(parse_code(beyond_buffer.data()), errc::invalid_data_format);

    writer beyond_parent;
    beyond_parent.box("moov", writer{}.u32(40).fourcc("mvhd").zeros(8));
    ASSERT_EQ(parse_code(beyond_parent.data()), errc::invalid_data_format);

    writer truncated_header;
    truncated_header.bytes(make_ftyp().data()).u32(16).fourcc("fr");
    ASSERT_EQ(parse_code(truncated_header.data()),
              errc::invalid_data_format);
}

TEST(mp4_box_test, truncated_contents)
{
    writer w;
    w.box("moov", writer{}.full_box("mvhd", 0, 0, writer{}.zeros(20)));
    ASSERT_EQ(parse_code(w.data()), errc::invalid_data_format);
}

TEST(mp4_box_test, avc_length_size)
{
    auto t = video_layout();
    avc_config config;
    config.length_size_minus_one = 1;
    t.sample_entry = make_avc1(320, 240, config);

    auto const buf = make_file(std::vector<uint8>(15), { t });
    ASSERT_EQ(parse_code(buf), errc::unsupported_format);
}

TEST(mp4_box_test, stsc_validation)
{
    auto t = video_layout();
    t.stsc = {{ 2, 3 }};
    ASSERT_EQ(parse_code(make_file(std::vector<uint8>(15), { t })),
              errc::invalid_data_format);

    t.stsc = {{ 1, 1 }, { 1, 2 }};
    ASSERT_EQ(parse_code(make_file(std::vector<uint8>(15), { t })),
              errc::invalid_data_format);
}

TEST(mp4_box_test, table_count_exceeds_box)
{
    auto const stts = writer{}.full_box(
        "stts", 0, 0, writer{}.u32(1000).u32(1).u32(1));
    auto const w = nest(stts, { "moov", "trak", "mdia", "minf", "stbl" });
    ASSERT_EQ(parse_code(w.data()), errc::invalid_data_format);
}

TEST(mp4_box_test, child_rules)
{
    auto const missing = nest(writer{}, { "moov", "trak" });
    ASSERT_EQ(parse_code(missing.data()), errc::invalid_data_format);

    writer moov;
    moov.bytes(make_mvhd(1000, 0).data())
        .bytes(make_mvhd(1000, 0).data());
    ASSERT_EQ(parse_code(writer{}.box("moov", moov).data()),
              errc::invalid_data_format);

    writer no_chunks;
    no_chunks.bytes(make_stsd(make_mp4a(2, 44100)).data())
             .bytes(make_stts({}).data())
             .bytes(make_stsc({}).data())
             .bytes(make_stsz(0, 0).data());
    auto const w = nest(no_chunks, { "moov", "trak", "mdia", "minf", "stbl" });
    ASSERT_EQ(parse_code(w.data()), errc::invalid_data_format);
}

TEST(mp4_box_test, trailing_bytes)
{
    writer mvhd;
    mvhd.u32(0).u32(0).u32(1000).u32(0)
        .u32(0x00010000).u16(0x0100).zeros(10)
        .bytes(make_matrix().data())
        .zeros(24).u32(2)
        .zeros(4);

    writer w;
    w.box("moov", writer{}.full_box("mvhd", 0, 0, mvhd));

    mp4::root_box root{io::reader{w.data()}};
    ASSERT_EQ(root["moov/mvhd"].mvhd.next_track_id, 2);
    ASSERT_EQ(root["moov/mvhd"].payload_size(), 104);

    ASSERT_EQ(parse_code(w.data(), mp4::parse_options::strict),
              errc::invalid_data_format);
}

TEST(mp4_box_test, compact_sample_sizes)
{
    auto t = video_layout();
    t.sample_count    = 5;
    t.sample_sizes    = { 1, 2, 3, 4, 5 };
    t.stz2_field_size = 4;
    t.stts            = {{ 5, 100 }};
    t.stsc            = {{ 1, 5 }};

    auto const buf = make_file(std::vector<uint8>(15), { t });
    mp4::root_box root{io::reader{buf}};

    auto&& stsz = root["moov/trak/mdia/minf/stbl"].find_first_of("stsz",
                                                                 "stz2");
    ASSERT_NE(stsz, nullptr);
    ASSERT_EQ(stsz->type(), "stz2"_4cc);
    ASSERT_EQ(stsz->stsz.sample_size, 0);
    ASSERT_EQ(stsz->stsz.sample_count, 5);
    for (auto i = 0u; i < 5; ++i) {
        ASSERT_EQ(stsz->stsz.entries[i], i + 1);
    }
}

TEST(mp4_box_test, print)
{
    mp4::root_box root{io::reader{sample_file()}};

    auto const out = std::tmpfile();
    ASSERT_NE(out, nullptr);
    root.print(out);
    std::rewind(out);

    char line[64];
    ASSERT_NE(std::fgets(line, sizeof(line), out), nullptr);
    ASSERT_STREQ(line, "[MP4] {\n");
    ASSERT_NE(std::fgets(line, sizeof(line), out), nullptr);
    ASSERT_STREQ(line, "    [ftyp] @0:24\n");
    std::fclose(out);
}
