#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace hex
{

// lowercase, no separators
std::string encode(const std::uint8_t *data, std::size_t len);
std::string encode(const std::vector<std::uint8_t> &bytes);

// Accepts upper/lower case and ':' / ' ' separators. nullopt on odd length or bad digit.
std::optional<std::vector<std::uint8_t>> decode(const std::string &text);

}  // namespace hex
