#pragma once
#include <openssl/crypto.h>
#include <openssl/rand.h>
#include <cstddef>
#include <limits>
#include <memory>
#include <span>

namespace crypto
{

template<class T>
void secure_clear(T& cont)
{
    if constexpr (requires { cont.data(); cont.size(); })
    {
        if (cont.size() != 0)
        {
            OPENSSL_cleanse(cont.data(), cont.size() * sizeof(*cont.data()));
        }
    }
    else
    {
        OPENSSL_cleanse(std::addressof(cont), sizeof(cont));
    }
}

[[nodiscard]] inline bool random_fill(std::span<uint8_t> out)
{
    if (out.size() > static_cast<size_t>(std::numeric_limits<int>::max()))
    {
        return false;
    }
    return RAND_bytes(out.data(), static_cast<int>(out.size())) == 1;
}

} // namespace crypto
