#pragma once
#include <array>
#include <initializer_list>
#include <optional>
#include <span>
#include <cstdint>

namespace crypto
{

using sha256_t = std::array<uint8_t, 32>;

// SHA-256 over the concatenation of the given parts.
[[nodiscard]] std::optional<sha256_t> sha256(std::initializer_list<std::span<const uint8_t>> parts);

} // namespace crypto
