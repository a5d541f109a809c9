#include <algorithm>
#include <cstring>
#include <limits>

#include "proto/frame.hpp"
#include "util/log.hpp"

namespace frame
{

using chunk::ChunkError;
using chunk::Chunker;
using chunk::HEADER_SIZE;
using chunk::META_SIZE;

namespace
{

// Same arithmetic as Chunker::chunk_count/range, for a length not yet backed by a buffer
std::size_t chunk_count_for(const Chunker &layout, std::size_t len)
{
    if (len <= layout.first_capacity())
        return 1;
    const std::size_t rest = len - layout.first_capacity();
    return 1 + (rest + layout.next_capacity() - 1) / layout.next_capacity();
}

chunk::Range range_for(const Chunker &layout, std::size_t len, std::size_t index)
{
    const std::size_t start = std::min(layout.offset(index), len);
    const std::size_t cap   = index == 0 ? layout.first_capacity() : layout.next_capacity();
    return {start, start + std::min(cap, len - start)};
}

}  // namespace

Frame make_frame(const Chunker &c, const chunk::ChunkView &v)
{
    const std::size_t prefix = v.index == 0 ? HEADER_SIZE : META_SIZE;
    Frame             out(prefix + v.size);
    if (v.index == 0)
    {
        const auto h = c.header();
        std::memcpy(out.data(), h.data(), h.size());
    }
    else
    {
        // remaining bytes from this chunk to the end of the payload
        chunk::put_u64_le(static_cast<std::uint64_t>(c.size() - c.offset(v.index)), out.data());
    }
    if (v.size)
        std::memcpy(out.data() + prefix, v.data, v.size);
    return out;
}

std::vector<Frame> make_frames(const Chunker &c)
{
    std::vector<Frame> out;
    out.reserve(c.chunk_count());
    for (std::size_t i = 0; i < c.chunk_count(); ++i)
    {
        auto v = c.chunk(i);
        if (!v)
            break;
        out.push_back(make_frame(c, *v));
    }
    return out;
}

ChunkError parse_header(const Frame &f, HeaderInfo &out)
{
    if (f.size() < HEADER_SIZE)
    {
        LOG_ERROR("parse_header: frame too short! (%zu)", f.size());
        return ChunkError::InvalidMetaSize;
    }
    std::uint64_t total = 0;
    ChunkError    err   = Chunker::meta(f.data() + 1, f.size() - 1, total);
    if (err != ChunkError::None)
        return err;
    out.topic = f[0];
    out.total = total;
    return ChunkError::None;
}

Reassembler::Reassembler(std::size_t max_frame_size, std::uint64_t max_payload)
    : max_frame_size_(max_frame_size),
      max_payload_(max_payload),
      layout_(Chunker::create(max_frame_size, 0, nullptr, 0))
{
}

ChunkError Reassembler::feed(std::size_t index, const Frame &f)
{
    if (!layout_)
    {
        LOG_ERROR("Reassembler::feed: unusable max_frame_size %zu", max_frame_size_);
        return ChunkError::InvalidConfig;
    }
    if (f.size() > max_frame_size_)
    {
        LOG_ERROR("Reassembler::feed: frame %zu is %zu bytes, limit %zu", index, f.size(),
                  max_frame_size_);
        return ChunkError::InvalidConfig;
    }

    // recover the payload length this frame claims
    std::size_t   prefix = META_SIZE;
    std::uint64_t total  = 0;
    if (index == 0)
    {
        HeaderInfo h;
        ChunkError err = parse_header(f, h);
        if (err != ChunkError::None)
            return err;
        prefix = HEADER_SIZE;
        total  = h.total;
    }
    else
    {
        std::uint64_t remaining = 0;
        ChunkError    err       = Chunker::meta(f.data(), f.size(), remaining);
        if (err != ChunkError::None)
        {
            LOG_ERROR("Reassembler::feed: frame %zu too short for size prefix (%zu)", index,
                      f.size());
            return err;
        }
        const std::uint64_t off = layout_->offset(index);
        if (off > std::numeric_limits<std::uint64_t>::max() - remaining)
        {
            LOG_ERROR("Reassembler::feed: frame %zu declares an impossible length", index);
            return ChunkError::ProtocolViolation;
        }
        total = off + remaining;
    }

    if (total_ && *total_ != total)
    {
        LOG_ERROR("Reassembler::feed: frame %zu declares length %llu, expected %llu", index,
                  static_cast<unsigned long long>(total),
                  static_cast<unsigned long long>(*total_));
        return ChunkError::ProtocolViolation;
    }
    if (!total_ && (total > max_payload_ || total > std::numeric_limits<std::size_t>::max()))
    {
        LOG_ERROR("Reassembler::feed: declared length %llu over limit %llu",
                  static_cast<unsigned long long>(total),
                  static_cast<unsigned long long>(max_payload_));
        return ChunkError::ProtocolViolation;
    }

    // checked against the claimed length before anything is committed
    const std::size_t len   = static_cast<std::size_t>(total);
    const std::size_t count = chunk_count_for(*layout_, len);
    if (index >= count)
    {
        LOG_ERROR("Reassembler::feed: index %zu out of range (%zu chunks)", index, count);
        return ChunkError::ProtocolViolation;
    }
    const chunk::Range r        = range_for(*layout_, len, index);
    const std::size_t  data_len = f.size() - prefix;
    if (data_len != r.end - r.start)
    {
        LOG_ERROR("Reassembler::feed: frame %zu carries %zu bytes, expected %zu", index, data_len,
                  r.end - r.start);
        return ChunkError::ProtocolViolation;
    }

    if (!total_)
    {
        buf_.assign(len, 0);
        total_ = total;
        have_.assign(count, false);
        received_ = 0;
    }

    if (have_[index])
    {
        LOG_DEBUG("Reassembler::feed: duplicate chunk (index=%zu)", index);
        return ChunkError::None;
    }
    std::copy(f.begin() + prefix, f.end(), buf_.begin() + r.start);
    have_[index] = true;
    ++received_;
    if (index == 0)
        topic_ = f[0];
    return ChunkError::None;
}

bool Reassembler::complete() const
{
    return total_ && received_ == have_.size();
}

std::optional<std::vector<std::uint8_t>> Reassembler::take()
{
    if (!complete())
        return std::nullopt;
    std::vector<std::uint8_t> out = std::move(buf_);
    reset();
    return out;
}

void Reassembler::reset()
{
    topic_.reset();
    total_.reset();
    buf_.clear();
    have_.clear();
    received_ = 0;
}

std::vector<std::size_t> Reassembler::missing() const
{
    std::vector<std::size_t> out;
    for (std::size_t i = 0; i < have_.size(); ++i)
    {
        if (!have_[i])
            out.push_back(i);
    }
    return out;
}

}  // namespace frame
