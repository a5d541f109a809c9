#include <algorithm>
#include <cstdint>
#include <limits>

#include "proto/chunker.hpp"
#include "util/log.hpp"

namespace chunk
{

static_assert(sizeof(std::size_t) <= META_SIZE, "payload length must fit the length field");

void put_u64_le(std::uint64_t v, std::uint8_t *out)
{
    for (std::size_t i = 0; i < META_SIZE; ++i)
        out[i] = static_cast<std::uint8_t>(v >> (8 * i));
}

std::uint64_t get_u64_le(const std::uint8_t *in)
{
    std::uint64_t v = 0;
    for (std::size_t i = 0; i < META_SIZE; ++i)
        v |= static_cast<std::uint64_t>(in[i]) << (8 * i);
    return v;
}

ChunkError validate_frame_size(std::size_t max_frame_size)
{
    if (max_frame_size <= HEADER_SIZE)
        return ChunkError::InvalidConfig;
    return ChunkError::None;
}

Chunker::Chunker(std::size_t         max_frame_size,
                 std::uint8_t        topic,
                 const std::uint8_t *data,
                 std::size_t         len)
    : data_(data), len_(len), max_frame_size_(max_frame_size), topic_(topic)
{
}

std::optional<Chunker> Chunker::create(std::size_t         max_frame_size,
                                       std::uint8_t        topic,
                                       const std::uint8_t *data,
                                       std::size_t         len)
{
    if (validate_frame_size(max_frame_size) != ChunkError::None)
    {
        LOG_ERROR("Chunker::create: max_frame_size %zu leaves no room for data (header is %zu)",
                  max_frame_size, HEADER_SIZE);
        return std::nullopt;
    }
    if (!data && len != 0)
    {
        LOG_ERROR("Chunker::create: null payload with length %zu", len);
        return std::nullopt;
    }
    return Chunker(max_frame_size, topic, data, len);
}

std::optional<Chunker> Chunker::create(std::size_t                      max_frame_size,
                                       std::uint8_t                     topic,
                                       const std::vector<std::uint8_t> &data)
{
    return create(max_frame_size, topic, data.data(), data.size());
}

ChunkError Chunker::meta(const std::uint8_t *bytes, std::size_t len, std::uint64_t &out)
{
    if (!bytes || len < META_SIZE)
    {
        LOG_DEBUG("meta: need %zu bytes, got %zu", META_SIZE, len);
        return ChunkError::InvalidMetaSize;
    }
    out = get_u64_le(bytes);
    return ChunkError::None;
}

Header Chunker::header() const
{
    Header h{};
    h[0] = topic_;
    put_u64_le(static_cast<std::uint64_t>(len_), h.data() + 1);
    return h;
}

std::size_t Chunker::offset(std::size_t index) const
{
    /*
     * M = 250, META_SIZE = 8, HEADER_SIZE = 9
     * 0 -> 0
     * 1 -> 250 - 9             = 241
     * 2 -> 241 + (250 - 8)     = 483
     * N -> 241 + (N - 1) * 242
     */
    if (index == 0)
        return 0;
    const std::size_t first = first_capacity();
    const std::size_t step  = next_capacity();
    const std::size_t max_v = std::numeric_limits<std::size_t>::max();
    if (index - 1 > (max_v - first) / step)
        return max_v;  // saturate: far past any real payload
    return first + (index - 1) * step;
}

std::size_t Chunker::chunk_count() const
{
    const std::size_t first = first_capacity();
    if (len_ <= first)
        return 1;  // an empty payload still yields the header frame
    const std::size_t step = next_capacity();
    return 1 + (len_ - first + step - 1) / step;
}

std::optional<Range> Chunker::range(std::size_t index) const
{
    // index past the end, including the empty slot after an exact-multiple payload
    if (index >= chunk_count())
        return std::nullopt;

    const std::size_t start = offset(index);
    const std::size_t cap   = index == 0 ? first_capacity() : next_capacity();
    Range             r;
    r.start = start;
    r.end   = start + std::min(cap, len_ - start);
    return r;
}

std::optional<ChunkView> Chunker::chunk(std::optional<std::size_t> index) const
{
    const std::size_t i = index.value_or(cursor_);
    auto              r = range(i);
    if (!r)
        return std::nullopt;
    ChunkView c;
    c.data  = data_ ? data_ + r->start : nullptr;
    c.size  = r->end - r->start;
    c.index = i;
    return c;
}

std::optional<ChunkView> Chunker::next()
{
    auto c = chunk(cursor_);
    if (!c)
        return std::nullopt;
    ++cursor_;
    return c;
}

}  // namespace chunk
