#include "crypto/digest.hpp"
#include <openssl/evp.h>
#include <memory>

namespace crypto
{

std::optional<sha256_t> sha256(std::initializer_list<std::span<const uint8_t>> parts)
{
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1)
    {
        return std::nullopt;
    }

    for (auto part : parts)
    {
        if (EVP_DigestUpdate(ctx.get(), part.data(), part.size()) != 1)
        {
            return std::nullopt;
        }
    }

    sha256_t result{};
    if (EVP_DigestFinal_ex(ctx.get(), result.data(), nullptr) != 1)
    {
        return std::nullopt;
    }
    return result;
}

} // namespace crypto
