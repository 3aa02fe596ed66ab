////////////////////////////////////////////////////////////////////////////////
//
// main.cpp
//
////////////////////////////////////////////////////////////////////////////////


#include <isom/error.hpp>
#include <isom/io/reader.hpp>
#include <isom/mp4/box.hpp>
#include <isom/mp4/file.hpp>
#include <isom/mp4/nal.hpp>
#include <isom/mp4/track.hpp>
#include <isom/stddef.hpp>
#include <isom/utility.hpp>

#include <cerrno>
#include <chrono>
#include <cinttypes>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <vector>

#include <fcntl.h>
#include <getopt.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>


namespace isom {
namespace {

struct options
{
    bool   print_boxes{false};
    bool   trace{false};
    uint32 trace_count{100};
    bool   list_nal_units{false};
    uint32 nal_sample{0};
    mp4::parse_options parse{mp4::parse_options::none};
};

class file_descriptor
{
public:
    explicit file_descriptor(char const* const path) :
        fd_{::open(path, O_RDONLY | O_CLOEXEC)}
    {
        if (ISOM_UNLIKELY(fd_ == -1)) {
            if (errno == ENOENT) {
                raise(errc::file_not_found, "%s", path);
            }
            if (errno == EACCES) {
                raise(errc::access_denied, "%s", path);
            }
            raise_current_system_error();
        }
    }

    ~file_descriptor()
    { ::close(fd_); }

    file_descriptor(file_descriptor const&) = delete;
    file_descriptor& operator=(file_descriptor const&) = delete;

    int get() const noexcept
    { return fd_; }

private:
    int const fd_;
};

std::vector<uint8> load_file(char const* const path)
{
    file_descriptor fd{path};

    struct ::stat st;
    if (ISOM_UNLIKELY(::fstat(fd.get(), &st) != 0)) {
        raise_current_system_error();
    }
    if (ISOM_UNLIKELY(st.st_size < 0)) {
        raise(errc::read_fault, "%s has a negative size", path);
    }

    std::vector<uint8> buf(static_cast<std::size_t>(st.st_size));
    auto pos = 0_sz;
    while (pos < buf.size()) {
        auto const ret = ::read(fd.get(), buf.data() + pos, buf.size() - pos);
        if (ISOM_UNLIKELY(ret <= 0)) {
            if (ret == 0) {
                raise(errc::read_fault,
                      "%s ended after %zu of %zu bytes",
                      path, pos, buf.size());
            }
            if (errno == EINTR) {
                continue;
            }
            raise_current_system_error();
        }
        pos += static_cast<std::size_t>(ret);
    }
    return buf;
}

bool parse_uint32(char const* const s, uint32& out) noexcept
{
    char* end;
    errno = 0;
    auto const value = std::strtoul(s, &end, 10);
    if (end == s || *end != '\0' || errno != 0 || value > UINT32_MAX) {
        return false;
    }
    out = static_cast<uint32>(value);
    return true;
}

void list_tracks(mp4::file const& f)
{
    std::printf("brand: %s, duration: %" PRIu32 "/%" PRIu32 "\n",
                to_fourcc_string(f.get_major_brand()).c_str(),
                f.get_duration(), f.get_time_scale());

    for (auto&& entry : f.get_tracks()) {
        auto&& t = entry.second;
        std::printf("track %" PRIu32 ": %s \"%s\" %" PRIu32 "x%" PRIu32
                    ", %" PRIu32 " samples in %" PRIu32 " chunks, "
                    "%.3f seconds\n", t.get_id(),
                    to_fourcc_string(t.get_handler_type()).c_str(),
                    t.get_handler_name().c_str(), t.get_width(),
                    t.get_height(), t.get_sample_count(),
                    t.get_chunk_count(), t.get_total_time_in_seconds());
    }
}

void trace_samples(mp4::file const& f, uint32 const count)
{
    for (auto&& loc : f.trace_samples(count)) {
        std::printf("track %" PRIu32 " sample %" PRIu32 ": offset %" PRIu64
                    ", size %" PRIu64 "\n", loc.track_id, loc.sample,
                    loc.offset, loc.size);
    }
}

class nal_printer final :
    public mp4::nal_sink
{
public:
    void decode(uchar const* const p, std::size_t const n) override
    {
        std::printf("    NAL type %u, %zu bytes\n",
                    (n != 0) ? (p[0] & 0x1fu) : 0u, n);
    }
};

void list_nal_units(mp4::file const& f, uint32 const sample)
{
    auto const t = f.find_track_with_handler(mp4::media_handler::video);
    if (t == nullptr) {
        raise(errc::unsupported_format, "file has no video track");
    }

    nal_printer printer;
    std::printf("track %" PRIu32 " sample %" PRIu32 "%s:\n", t->get_id(),
                sample, t->is_sync_sample(sample) ? " (sync)" : "");
    mp4::feed_parameter_sets(mp4::get_avc_config(*t), printer);
    mp4::feed_sample(*t, sample, printer);
}

void usage(char const* const argv0)
{
    std::fprintf(stderr,
                 "usage: %s [-b] [-t] [-s N] [-n SAMPLE] [-c] FILE\n"
                 "  -b         print the box tree\n"
                 "  -t         trace the first samples of every track\n"
                 "  -s N       number of samples to trace (default 100)\n"
                 "  -n SAMPLE  list the NAL units of a video sample\n"
                 "  -c         check table consistency\n", argv0);
}

int run(int const argc, char** const argv)
{
    options opts;

    int opt;
    while ((opt = ::getopt(argc, argv, "bts:n:c")) != -1) {
        switch (opt) {
        case 'b':
            opts.print_boxes = true;
            break;
        case 't':
            opts.trace = true;
            break;
        case 's':
            if (!parse_uint32(optarg, opts.trace_count)) {
                usage(argv[0]);
                return EXIT_FAILURE;
            }
            break;
        case 'n':
            if (!parse_uint32(optarg, opts.nal_sample)) {
                usage(argv[0]);
                return EXIT_FAILURE;
            }
            opts.list_nal_units = true;
            break;
        case 'c':
            opts.parse |= mp4::parse_options::check_consistency;
            break;
        default:
            usage(argv[0]);
            return EXIT_FAILURE;
        }
    }
    if (optind + 1 != argc) {
        usage(argv[0]);
        return EXIT_FAILURE;
    }

    auto const path = argv[optind];
    auto const buf  = load_file(path);

    using clock = std::chrono::steady_clock;
    auto const start = clock::now();
    mp4::file f{io::reader{buf}, opts.parse};
    auto const elapsed = std::chrono::duration_cast<
        std::chrono::milliseconds>(clock::now() - start);
    std::fprintf(stderr, "[MP4] parsed stream in %lld ms\n",
                 static_cast<long long>(elapsed.count()));

    list_tracks(f);
    if (opts.print_boxes) {
        f.print(stdout);
    }
    if (opts.trace) {
        trace_samples(f, opts.trace_count);
    }
    if (opts.list_nal_units) {
        list_nal_units(f, opts.nal_sample);
    }
    return EXIT_SUCCESS;
}

}     // namespace <unnamed>
}     // namespace isom


int main(int argc, char** argv)
{
    try {
        return ::isom::run(argc, argv);
    }
    catch (std::exception const& e) {
        std::fprintf(stderr, "isom-dump: %s\n", e.what());
        return EXIT_FAILURE;
    }
}
