#pragma once

namespace chunk
{

enum class ChunkError
{
    None = 0,
    InvalidMetaSize,       // buffer shorter than the length prefix
    OverflowRetryCounter,  // retry counter already at its maximum
    ProtocolViolation,     // wrong chunk acknowledged, or frame disagrees with the framing
    InvalidConfig,         // max_frame_size leaves no room for data
};

const char *error_name(ChunkError e);

// ProtocolViolation and InvalidConfig point at a bug in the caller rather than bad input
// or a flaky link; callers should abandon the whole transfer on these.
bool is_contract_violation(ChunkError e);

}  // namespace chunk
