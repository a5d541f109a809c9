#pragma once
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string>

#include "util/log.hpp"

namespace constants
{

// Environment knobs read by chunkctl
inline constexpr const char *ENV_FRAME_SIZE = "CHUNKWIRE_FRAME_SIZE";
inline constexpr const char *ENV_TOPIC      = "CHUNKWIRE_TOPIC";
inline constexpr const char *ENV_LOG_LEVEL  = "CHUNKWIRE_LOG_LEVEL";

inline constexpr std::size_t  DEFAULT_FRAME_SIZE = 250;
inline constexpr std::uint8_t DEFAULT_TOPIC      = 0;
// keeps a bogus env value from allocating gigabyte frames
inline constexpr std::size_t MAX_FRAME_SIZE = 16 * 1024 * 1024;

// Accepts decimal or 0x-prefixed hex; rejects trailing garbage and values above max_v
inline bool parse_uint(const char *s, unsigned long long max_v, unsigned long long &out)
{
    if (!s || !*s || *s == '-')
        return false;
    char              *end = nullptr;
    unsigned long long v   = std::strtoull(s, &end, 0);
    if (!end || *end != '\0' || v > max_v)
        return false;
    out = v;
    return true;
}

[[maybe_unused]] static std::size_t frame_size_from_env()
{
    const char *e = std::getenv(ENV_FRAME_SIZE);
    if (!e || !*e)
        return DEFAULT_FRAME_SIZE;
    unsigned long long v = 0;
    if (!parse_uint(e, MAX_FRAME_SIZE, v))
    {
        LOG_WARN("Ignoring invalid %s='%s' (expect 1..%zu)", ENV_FRAME_SIZE, e, MAX_FRAME_SIZE);
        return DEFAULT_FRAME_SIZE;
    }
    LOG_INFO("Using frame size %llu (from %s)", v, ENV_FRAME_SIZE);
    return static_cast<std::size_t>(v);
}

[[maybe_unused]] static std::uint8_t topic_from_env()
{
    const char *e = std::getenv(ENV_TOPIC);
    if (!e || !*e)
        return DEFAULT_TOPIC;
    unsigned long long v = 0;
    if (!parse_uint(e, 0xFF, v))
    {
        LOG_WARN("Ignoring invalid %s='%s' (expect 0..255)", ENV_TOPIC, e);
        return DEFAULT_TOPIC;
    }
    return static_cast<std::uint8_t>(v);
}

}  // namespace constants
