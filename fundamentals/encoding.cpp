#include "fundamentals/encoding.hpp"

#include <sodium.h>
#include <memory>
#include <stdexcept>

namespace encoding
{

namespace {

void sodium_ready()
{
    static const int rc = sodium_init();
    if (rc < 0)
    {
        throw std::runtime_error("Failed to initialize libsodium");
    }
}

constexpr int b64_variant = sodium_base64_VARIANT_ORIGINAL;

} // namespace

std::string to_base64(std::span<const uint8_t> data)
{
    sodium_ready();

    std::string out(sodium_base64_ENCODED_LEN(data.size(), b64_variant), '\0');
    sodium_bin2base64(out.data(), out.size(), data.data(), data.size(), b64_variant);

    // encoded length includes the terminating NUL
    out.pop_back();
    return out;
}

std::optional<std::vector<uint8_t>> from_base64(std::string_view text)
{
    sodium_ready();

    std::vector<uint8_t> out(text.size() / 4 * 3 + 3);
    size_t bin_len = 0;
    const char* end = nullptr;

    if (sodium_base642bin(out.data(), out.size(),
                          text.data(), text.size(),
                          nullptr, std::addressof(bin_len),
                          std::addressof(end), b64_variant) != 0)
    {
        return std::nullopt;
    }
    if (end != text.data() + text.size())
    {
        return std::nullopt;
    }

    out.resize(bin_len);
    return out;
}

std::string to_hex(std::span<const uint8_t> data)
{
    sodium_ready();

    std::string out(data.size() * 2 + 1, '\0');
    sodium_bin2hex(out.data(), out.size(), data.data(), data.size());
    out.pop_back();
    return out;
}

} // namespace encoding
