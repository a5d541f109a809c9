#include <sodium.h>

#include "util/digest.hpp"
#include "util/hex.hpp"
#include "util/log.hpp"

namespace digest
{

static_assert(DIGEST_SIZE == crypto_generichash_BYTES, "digest size mismatch");

static bool ensure_sodium_init()
{
    static int ok = (sodium_init() >= 0);  // -1 means failed
    return ok;
}

bool blake2b(const std::uint8_t *data, std::size_t len, Digest &out)
{
    if (!ensure_sodium_init())
    {
        LOG_ERROR("blake2b: sodium_init failed");
        return false;
    }
    static const std::uint8_t empty = 0;
    if (!data)
        data = &empty;
    if (crypto_generichash(out.data(), out.size(), data, len, nullptr, 0) != 0)
    {
        LOG_ERROR("blake2b: crypto_generichash failed (%zu bytes)", len);
        return false;
    }
    return true;
}

std::string blake2b_hex(const std::uint8_t *data, std::size_t len)
{
    Digest d{};
    if (!blake2b(data, len, d))
        return {};
    return hex::encode(d.data(), d.size());
}

}  // namespace digest
