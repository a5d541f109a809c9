#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace digest
{

constexpr std::size_t DIGEST_SIZE = 32;  // crypto_generichash_BYTES

using Digest = std::array<std::uint8_t, DIGEST_SIZE>;

// BLAKE2b-256 (unkeyed) of a payload, used to check split/join round trips
bool        blake2b(const std::uint8_t *data, std::size_t len, Digest &out);
std::string blake2b_hex(const std::uint8_t *data, std::size_t len);

}  // namespace digest
