#include "proto/chunk_status.hpp"
#include "util/log.hpp"

namespace chunk
{

const char *session_name(Session s)
{
    switch (s)
    {
        case Session::Sent:
            return "Sent";
        case Session::Received:
            return "Received";
    }
    return "?";
}

void ChunkStatus::to_send(std::size_t number)
{
    number_  = number;
    session_ = Session::Sent;
    retry_   = 0;
}

ChunkError ChunkStatus::to_received(std::size_t number)
{
    if (!number_)
    {
        LOG_ERROR("to_received: chunk %zu acknowledged but nothing was sent", number);
        return ChunkError::ProtocolViolation;
    }
    if (*number_ != number)
    {
        LOG_ERROR("to_received: invalid chunk number, current %zu, received %zu", *number_,
                  number);
        return ChunkError::ProtocolViolation;
    }
    session_ = Session::Received;
    retry_   = 0;
    return ChunkError::None;
}

ChunkError ChunkStatus::increase_retry(std::uint8_t &out)
{
    LOG_DEBUG("retry counter: %u", static_cast<unsigned>(retry_));
    if (retry_ == MAX_RETRY)
    {
        LOG_WARN("increase_retry: retry counter overflow (chunk %zu)", number_ ? *number_ : 0);
        return ChunkError::OverflowRetryCounter;
    }
    ++retry_;
    out = retry_;
    return ChunkError::None;
}

}  // namespace chunk
