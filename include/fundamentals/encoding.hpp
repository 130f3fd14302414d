#pragma once
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include <cstdint>

namespace encoding
{

// Standard alphabet with padding, as libsodium's sodium_base64_VARIANT_ORIGINAL.
[[nodiscard]] std::string to_base64(std::span<const uint8_t> data);
[[nodiscard]] std::optional<std::vector<uint8_t>> from_base64(std::string_view text);

[[nodiscard]] std::string to_hex(std::span<const uint8_t> data);

} // namespace encoding
