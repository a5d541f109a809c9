#include "proto/chunk_error.hpp"

namespace chunk
{

const char *error_name(ChunkError e)
{
    switch (e)
    {
        case ChunkError::None:
            return "None";
        case ChunkError::InvalidMetaSize:
            return "InvalidMetaSize";
        case ChunkError::OverflowRetryCounter:
            return "OverflowRetryCounter";
        case ChunkError::ProtocolViolation:
            return "ProtocolViolation";
        case ChunkError::InvalidConfig:
            return "InvalidConfig";
    }
    return "?";
}

bool is_contract_violation(ChunkError e)
{
    return e == ChunkError::ProtocolViolation || e == ChunkError::InvalidConfig;
}

}  // namespace chunk
