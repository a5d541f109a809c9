#include <sodium.h>

#include "util/hex.hpp"
#include "util/log.hpp"

namespace hex
{

std::string encode(const std::uint8_t *data, std::size_t len)
{
    if (!data || len == 0)
        return {};
    std::string out(len * 2 + 1, '\0');  // bin2hex writes a trailing NUL
    sodium_bin2hex(&out[0], out.size(), data, len);
    out.pop_back();
    return out;
}

std::string encode(const std::vector<std::uint8_t> &bytes)
{
    return encode(bytes.data(), bytes.size());
}

std::optional<std::vector<std::uint8_t>> decode(const std::string &text)
{
    std::vector<std::uint8_t> out(text.size() / 2);
    std::size_t               out_len = 0;
    const char               *end     = nullptr;
    if (text.empty())
        return out;
    if (sodium_hex2bin(out.data(), out.size(), text.c_str(), text.size(), ": ", &out_len,
                       &end) != 0)
    {
        LOG_ERROR("hex::decode: invalid hex input (%zu chars)", text.size());
        return std::nullopt;
    }
    // hex2bin stops quietly at the first non-hex char; treat leftovers as an error
    if (end != text.c_str() + text.size())
    {
        LOG_ERROR("hex::decode: trailing garbage at offset %zu",
                  static_cast<std::size_t>(end - text.c_str()));
        return std::nullopt;
    }
    out.resize(out_len);
    return out;
}

}  // namespace hex
