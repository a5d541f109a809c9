#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "proto/chunk_error.hpp"
#include "proto/chunker.hpp"

/*
TX:
Chunker::create(max_frame_size, topic, payload)
  -> for each chunk (next() or chunk(i)):
       make_frame(chunker, chunk)   // [header | data] for 0, [remaining | data] after
         -> transport sends one frame per message

RX:
transport delivers (index, frame)
  -> Reassembler.feed(index, frame)  // validates prefix against the framing, stores data
      -> complete() ? take() -> payload
*/

namespace frame
{

using Frame = std::vector<std::uint8_t>;

// Anything above this is treated as a corrupt length field
inline constexpr std::uint64_t DEFAULT_MAX_PAYLOAD = 64ull * 1024 * 1024;

struct HeaderInfo
{
    std::uint8_t  topic{0};
    std::uint64_t total{0};
};

// TX
Frame              make_frame(const chunk::Chunker &c, const chunk::ChunkView &v);
std::vector<Frame> make_frames(const chunk::Chunker &c);
// RX
chunk::ChunkError  parse_header(const Frame &f, HeaderInfo &out);

class Reassembler
{
  public:
    explicit Reassembler(std::size_t   max_frame_size,
                         std::uint64_t max_payload = DEFAULT_MAX_PAYLOAD);
    Reassembler(const Reassembler &)            = delete;
    Reassembler &operator=(const Reassembler &) = delete;

    // Frames may arrive in any order; duplicates are ignored
    chunk::ChunkError feed(std::size_t index, const Frame &f);

    bool complete() const;
    // Complete payload, then ready for the next transfer. nullopt while incomplete.
    std::optional<std::vector<std::uint8_t>> take();
    void                                     reset();

    std::optional<std::uint8_t>  topic() const { return topic_; }
    std::optional<std::uint64_t> total() const { return total_; }
    std::size_t                  received() const { return received_; }
    std::size_t                  expected() const { return have_.size(); }
    std::vector<std::size_t>     missing() const;

  private:
    std::size_t                   max_frame_size_;
    std::uint64_t                 max_payload_;
    std::optional<chunk::Chunker> layout_;  // arithmetic only, empty payload
    std::optional<std::uint8_t>   topic_;
    std::optional<std::uint64_t>  total_;
    std::vector<std::uint8_t>     buf_;
    std::vector<bool>             have_;
    std::size_t                   received_ = 0;
};

}  // namespace frame
