#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "proto/chunk_error.hpp"
#include "proto/chunk_status.hpp"

/*
Framing of one payload over a channel limited to max_frame_size bytes per message:

  frame 0 : [topic 1B][total len u64 LE][data: max_frame_size - HEADER_SIZE bytes]
  frame N : [remaining u64 LE][data: max_frame_size - META_SIZE bytes]

Frame 0 carries only the header, no size prefix of its own, so chunk N >= 1
starts at (M - HEADER_SIZE) + (N - 1) * (M - META_SIZE), i.e. 241 for M = 250.

The Chunker only computes boundaries and header bytes over a borrowed buffer;
proto/frame.hpp glues header/prefix and data into wire frames.
*/

namespace chunk
{

// Length fields are always 8 bytes, independent of the build's word size
inline constexpr std::size_t META_SIZE   = sizeof(std::uint64_t);
inline constexpr std::size_t HEADER_SIZE = META_SIZE + 1;

using Header = std::array<std::uint8_t, HEADER_SIZE>;

// [start, end) byte offsets into the payload
struct Range
{
    std::size_t start{0};
    std::size_t end{0};
};

// Borrowed slice of the payload plus the chunk index it belongs to
struct ChunkView
{
    const std::uint8_t *data{nullptr};
    std::size_t         size{0};
    std::size_t         index{0};

    std::vector<std::uint8_t> to_vector() const
    {
        return std::vector<std::uint8_t>(data, data + size);
    }
};

void          put_u64_le(std::uint64_t v, std::uint8_t *out);
std::uint64_t get_u64_le(const std::uint8_t *in);

// InvalidConfig unless at least one data byte fits after the header
ChunkError validate_frame_size(std::size_t max_frame_size);

class Chunker
{
  public:
    // The payload is borrowed: it must outlive the Chunker and stay unchanged.
    static std::optional<Chunker> create(std::size_t         max_frame_size,
                                         std::uint8_t        topic,
                                         const std::uint8_t *data,
                                         std::size_t         len);
    static std::optional<Chunker> create(std::size_t                      max_frame_size,
                                         std::uint8_t                     topic,
                                         const std::vector<std::uint8_t> &data);
    static std::optional<Chunker> create(std::size_t, std::uint8_t,
                                         std::vector<std::uint8_t> &&) = delete;

    // Decode the first META_SIZE bytes of a received slice as u64 LE
    static ChunkError meta(const std::uint8_t *bytes, std::size_t len, std::uint64_t &out);

    Header header() const;

    // Pure boundary arithmetic, independent of the cursor
    std::size_t              offset(std::size_t index) const;
    std::optional<Range>     range(std::size_t index) const;
    std::optional<ChunkView> chunk(std::optional<std::size_t> index = std::nullopt) const;
    std::size_t              chunk_count() const;

    // Sequential production: returns chunk(cursor) and advances; nullopt once exhausted
    std::optional<ChunkView> next();
    std::size_t              cursor() const { return cursor_; }

    std::size_t         max_frame_size() const { return max_frame_size_; }
    std::size_t         first_capacity() const { return max_frame_size_ - HEADER_SIZE; }
    std::size_t         next_capacity() const { return max_frame_size_ - META_SIZE; }
    std::uint8_t        topic() const { return topic_; }
    const std::uint8_t *data() const { return data_; }
    std::size_t         size() const { return len_; }

    // For callers that move one chunk at a time
    ChunkStatus status;

  private:
    Chunker(std::size_t max_frame_size, std::uint8_t topic, const std::uint8_t *data,
            std::size_t len);

    const std::uint8_t *data_{nullptr};
    std::size_t         len_{0};
    std::size_t         max_frame_size_{0};
    std::uint8_t        topic_{0};
    std::size_t         cursor_{0};
};

}  // namespace chunk
