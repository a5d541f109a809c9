#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "proto/chunker.hpp"
#include "proto/frame.hpp"
#include "util/constants.hpp"
#include "util/digest.hpp"
#include "util/exitcodes.hpp"
#include "util/hex.hpp"
#include "util/log.hpp"

namespace fs = std::filesystem;

namespace
{

// attempts per frame before split gives up on a chunk
constexpr std::uint8_t WRITE_ATTEMPTS = 3;

struct Options
{
    std::size_t  frame_size = constants::DEFAULT_FRAME_SIZE;
    std::uint8_t topic      = constants::DEFAULT_TOPIC;
};

// --------------------------------------------------------------------
// CLI usage
// --------------------------------------------------------------------
static void print_usage()
{
    std::fprintf(stderr, "Usage:\n"
                         "  chunkctl [--frame-size N] [--topic T] <command> [args]\n"
                         "\n"
                         "Commands:\n"
                         "  header <file>\n"
                         "  plan <file>\n"
                         "  split <file> <outdir>\n"
                         "  join <indir> <outfile>\n"
                         "  meta <hex>\n"
                         "\n"
                         "Environment:\n"
                         "  CHUNKWIRE_FRAME_SIZE, CHUNKWIRE_TOPIC, CHUNKWIRE_LOG_LEVEL\n");
}

static bool read_file(const std::string &path, std::vector<std::uint8_t> &out)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
        LOG_ERROR("cannot open %s: %s", path.c_str(), std::strerror(errno));
        return false;
    }
    out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    if (in.bad())
    {
        LOG_ERROR("read failed: %s", path.c_str());
        return false;
    }
    return true;
}

static bool write_file(const fs::path &path, const std::vector<std::uint8_t> &bytes)
{
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out)
    {
        LOG_WARN("cannot open %s for writing", path.string().c_str());
        return false;
    }
    out.write(reinterpret_cast<const char *>(bytes.data()),
              static_cast<std::streamsize>(bytes.size()));
    out.flush();
    return static_cast<bool>(out);
}

static std::string frame_name(std::size_t index)
{
    char buf[32];
    std::snprintf(buf, sizeof(buf), "frame_%06zu.bin", index);
    return buf;
}

// "frame_000012.bin" -> 12
static bool parse_frame_name(const std::string &name, std::size_t &index)
{
    const std::string pre = "frame_";
    const std::string suf = ".bin";
    if (name.size() <= pre.size() + suf.size() || name.compare(0, pre.size(), pre) != 0 ||
        name.compare(name.size() - suf.size(), suf.size(), suf) != 0)
        return false;
    const std::string  digits = name.substr(pre.size(), name.size() - pre.size() - suf.size());
    unsigned long long v      = 0;
    if (digits.find_first_not_of("0123456789") != std::string::npos ||
        !constants::parse_uint(digits.c_str(), SIZE_MAX, v))
        return false;
    index = static_cast<std::size_t>(v);
    return true;
}

static std::optional<chunk::Chunker> make_chunker(const Options                   &opt,
                                                  const std::vector<std::uint8_t> &payload)
{
    auto c = chunk::Chunker::create(opt.frame_size, opt.topic, payload);
    if (!c)
        std::fprintf(stderr, "error: frame size %zu must be larger than %zu\n", opt.frame_size,
                     chunk::HEADER_SIZE);
    return c;
}

static int cmd_header(const Options &opt, const std::string &path)
{
    std::vector<std::uint8_t> payload;
    if (!read_file(path, payload))
        return exitc::io_error;
    auto c = make_chunker(opt, payload);
    if (!c)
        return exitc::bad_args;
    const auto h = c->header();
    std::printf("%s\n", hex::encode(h.data(), h.size()).c_str());
    return exitc::ok;
}

static int cmd_plan(const Options &opt, const std::string &path)
{
    std::vector<std::uint8_t> payload;
    if (!read_file(path, payload))
        return exitc::io_error;
    auto c = make_chunker(opt, payload);
    if (!c)
        return exitc::bad_args;

    const auto h = c->header();
    std::printf("topic=0x%02x length=%zu frame_size=%zu chunks=%zu\n", c->topic(), c->size(),
                c->max_frame_size(), c->chunk_count());
    std::printf("header=%s\n", hex::encode(h.data(), h.size()).c_str());
    std::printf("blake2b=%s\n", digest::blake2b_hex(payload.data(), payload.size()).c_str());
    while (auto v = c->next())
    {
        std::printf("%zu %zu %zu\n", v->index, c->offset(v->index), v->size);
    }
    return exitc::ok;
}

static int cmd_split(const Options &opt, const std::string &path, const std::string &outdir)
{
    std::vector<std::uint8_t> payload;
    if (!read_file(path, payload))
        return exitc::io_error;
    auto c = make_chunker(opt, payload);
    if (!c)
        return exitc::bad_args;

    std::error_code ec;
    fs::create_directories(outdir, ec);
    if (ec)
    {
        LOG_ERROR("cannot create %s: %s", outdir.c_str(), ec.message().c_str());
        return exitc::io_error;
    }

    std::size_t written = 0;
    while (auto v = c->next())
    {
        const auto     frame = frame::make_frame(*c, *v);
        const fs::path dst   = fs::path(outdir) / frame_name(v->index);

        c->status.to_send(v->index);
        while (!write_file(dst, frame))
        {
            std::uint8_t      tries = 0;
            chunk::ChunkError err   = c->status.increase_retry(tries);
            if (err != chunk::ChunkError::None || tries >= WRITE_ATTEMPTS)
            {
                LOG_ERROR("giving up on chunk %zu after %u retries (%s)", v->index,
                          static_cast<unsigned>(c->status.retry()), chunk::error_name(err));
                return exitc::io_error;
            }
        }
        if (c->status.to_received(v->index) != chunk::ChunkError::None)
            return exitc::bad_frame;
        ++written;
    }
    LOG_SYSTEM("wrote %zu frames to %s", written, outdir.c_str());
    std::printf("blake2b=%s\n", digest::blake2b_hex(payload.data(), payload.size()).c_str());
    return exitc::ok;
}

static int cmd_join(const Options &opt, const std::string &indir, const std::string &outfile)
{
    std::error_code ec;
    if (!fs::is_directory(indir, ec))
    {
        std::fprintf(stderr, "error: not a directory: %s\n", indir.c_str());
        return exitc::io_error;
    }
    if (chunk::validate_frame_size(opt.frame_size) != chunk::ChunkError::None)
    {
        std::fprintf(stderr, "error: frame size %zu must be larger than %zu\n", opt.frame_size,
                     chunk::HEADER_SIZE);
        return exitc::bad_args;
    }

    frame::Reassembler r(opt.frame_size);
    std::size_t        seen = 0;
    for (const auto &entry : fs::directory_iterator(indir, ec))
    {
        std::size_t     index = 0;
        std::error_code fec;
        if (!entry.is_regular_file(fec) ||
            !parse_frame_name(entry.path().filename().string(), index))
            continue;
        std::vector<std::uint8_t> bytes;
        if (!read_file(entry.path().string(), bytes))
            return exitc::io_error;
        chunk::ChunkError err = r.feed(index, bytes);
        if (err != chunk::ChunkError::None)
        {
            std::fprintf(stderr, "error: %s: %s\n", entry.path().filename().string().c_str(),
                         chunk::error_name(err));
            return exitc::bad_frame;
        }
        ++seen;
    }
    if (ec)
    {
        LOG_ERROR("cannot list %s: %s", indir.c_str(), ec.message().c_str());
        return exitc::io_error;
    }

    if (!r.complete())
    {
        if (seen == 0)
        {
            std::fprintf(stderr, "error: no frames in %s\n", indir.c_str());
            return exitc::incomplete;
        }
        const auto miss = r.missing();
        std::fprintf(stderr, "error: %zu of %zu frames missing (first: %zu)\n", miss.size(),
                     r.expected(), miss.empty() ? 0 : miss.front());
        return exitc::incomplete;
    }
    if (!r.topic())
    {
        std::fprintf(stderr, "error: header frame missing\n");
        return exitc::incomplete;
    }

    const std::uint8_t topic   = *r.topic();
    auto               payload = r.take();
    if (!payload || !write_file(outfile, *payload))
    {
        LOG_ERROR("cannot write %s", outfile.c_str());
        return exitc::io_error;
    }
    if (topic != opt.topic)
        LOG_WARN("topic 0x%02x differs from configured 0x%02x", topic, opt.topic);
    LOG_SYSTEM("joined %zu frames into %s (%zu bytes)", seen, outfile.c_str(), payload->size());
    std::printf("topic=0x%02x length=%zu\n", topic, payload->size());
    std::printf("blake2b=%s\n", digest::blake2b_hex(payload->data(), payload->size()).c_str());
    return exitc::ok;
}

static int cmd_meta(const std::string &text)
{
    auto bytes = hex::decode(text);
    if (!bytes)
    {
        std::fprintf(stderr, "error: invalid hex: %s\n", text.c_str());
        return exitc::bad_args;
    }
    std::uint64_t     v   = 0;
    chunk::ChunkError err = chunk::Chunker::meta(bytes->data(), bytes->size(), v);
    if (err != chunk::ChunkError::None)
    {
        std::fprintf(stderr, "error: %s (need %zu bytes, got %zu)\n", chunk::error_name(err),
                     chunk::META_SIZE, bytes->size());
        return exitc::bad_frame;
    }
    std::printf("%llu\n", static_cast<unsigned long long>(v));
    return exitc::ok;
}

static int run_cmd(const Options &opt, const std::string &cmd, const std::vector<std::string> &args)
{
    // args[0] is the command itself
    auto need = [&](std::size_t n) -> bool {
        if (args.size() == n + 1)
            return true;
        print_usage();
        return false;
    };

    std::unordered_map<std::string, std::function<int()>> cmd_map = {
        {"header", [&]() -> int { return need(1) ? cmd_header(opt, args[1]) : exitc::bad_args; }},
        {"plan", [&]() -> int { return need(1) ? cmd_plan(opt, args[1]) : exitc::bad_args; }},
        {"split",
         [&]() -> int { return need(2) ? cmd_split(opt, args[1], args[2]) : exitc::bad_args; }},
        {"join",
         [&]() -> int { return need(2) ? cmd_join(opt, args[1], args[2]) : exitc::bad_args; }},
        {"meta", [&]() -> int { return need(1) ? cmd_meta(args[1]) : exitc::bad_args; }},
    };

    auto it = cmd_map.find(cmd);
    if (it == cmd_map.end())
    {
        std::fprintf(stderr, "Unknown command: %s\n", cmd.c_str());
        print_usage();
        return exitc::bad_args;
    }
    LOG_DEBUG("Running command: %s", cmd.c_str());
    return it->second();
}
}  // namespace

int main(int argc, char **argv)
{
    if (!chunkwire::init_log_from_env(constants::ENV_LOG_LEVEL))
        LOG_WARN("Unknown %s='%s', using info", constants::ENV_LOG_LEVEL,
                 std::getenv(constants::ENV_LOG_LEVEL));

    if (argc < 2)
    {
        print_usage();
        return exitc::bad_args;
    }

    // env first, flags override
    Options opt;
    opt.frame_size = constants::frame_size_from_env();
    opt.topic      = constants::topic_from_env();

    std::vector<std::string> args;
    args.reserve(argc - 1);

    for (int i = 1; i < argc; ++i)
    {
        std::string        a = argv[i];
        unsigned long long v = 0;
        if (a == "--help" || a == "-h")
        {
            print_usage();
            return exitc::ok;
        }
        if (a == "--frame-size" && i + 1 < argc)
        {
            if (!constants::parse_uint(argv[++i], constants::MAX_FRAME_SIZE, v))
            {
                std::fprintf(stderr, "error: invalid --frame-size: %s\n", argv[i]);
                return exitc::bad_args;
            }
            opt.frame_size = static_cast<std::size_t>(v);
        }
        else if (a == "--topic" && i + 1 < argc)
        {
            if (!constants::parse_uint(argv[++i], 0xFF, v))
            {
                std::fprintf(stderr, "error: invalid --topic: %s\n", argv[i]);
                return exitc::bad_args;
            }
            opt.topic = static_cast<std::uint8_t>(v);
        }
        else
        {
            args.push_back(std::move(a));
        }
    }
    if (args.empty())
    {
        print_usage();
        return exitc::bad_args;
    }

    return run_cmd(opt, args[0], args);
}
