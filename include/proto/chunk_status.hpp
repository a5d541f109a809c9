#pragma once
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>

#include "proto/chunk_error.hpp"

namespace chunk
{

enum class Session
{
    Sent,
    Received,
};

const char *session_name(Session s);

/*
Per-chunk transfer tracking, one instance per in-flight chunk:

  (unset) --to_send(n)--> Sent(n) --to_received(n)--> Received(n)
                            ^  |
                            +--+ increase_retry() on timeout / retransmit

to_send() may be called from any state and restarts the transfer of that chunk.
*/
class ChunkStatus
{
  public:
    static constexpr std::uint8_t MAX_RETRY = std::numeric_limits<std::uint8_t>::max();

    void       to_send(std::size_t number);
    ChunkError to_received(std::size_t number);
    // On success `out` holds the new counter value; untouched on OverflowRetryCounter
    ChunkError increase_retry(std::uint8_t &out);

    std::optional<std::size_t> number() const { return number_; }
    std::optional<Session>     session() const { return session_; }
    std::uint8_t               retry() const { return retry_; }

  private:
    std::optional<std::size_t> number_;
    std::optional<Session>     session_;
    std::uint8_t               retry_{0};
};

}  // namespace chunk
