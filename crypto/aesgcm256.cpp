#include "crypto/aesgcm256.hpp"
#include "crypto/utils.hpp"
#include <openssl/evp.h>
#include <openssl/crypto.h>
#include <limits>
#include <memory>

namespace crypto
{

bool AES256GCM::chk_sz(std::span<const uint8_t> key, std::span<const uint8_t> nonce)
{
    return key.size() == key_sz && nonce.size() == nonce_sz;
}

AES256GCM::ctx_ptr AES256GCM::make_ctx(
    bool encrypting,
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce)
{
    ctx_ptr ctx(EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free);
    if (!ctx)
    {
        return ctx_ptr(nullptr, EVP_CIPHER_CTX_free);
    }

    auto init = encrypting ? EVP_EncryptInit_ex : EVP_DecryptInit_ex;

    if (init(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(nonce.size()), nullptr) != 1 ||
        init(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != 1)
    {
        return ctx_ptr(nullptr, EVP_CIPHER_CTX_free);
    }
    return ctx;
}

std::optional<AES256GCM::ciphertext_t> AES256GCM::encrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> plaintext,
    std::span<const uint8_t> aad)
{
    constexpr auto int_max = static_cast<size_t>(std::numeric_limits<int>::max());
    if (!chk_sz(key, nonce) || plaintext.size() > int_max || aad.size() > int_max)
    {
        return std::nullopt;
    }

    auto ctx = make_ctx(true, key, nonce);
    if (!ctx)
    {
        return std::nullopt;
    }

    int len = 0;
    if (!aad.empty() &&
        EVP_EncryptUpdate(ctx.get(), nullptr, std::addressof(len), aad.data(), static_cast<int>(aad.size())) != 1)
    {
        return std::nullopt;
    }

    ciphertext_t result;
    result.data.resize(plaintext.size());

    if (EVP_EncryptUpdate(ctx.get(), result.data.data(), std::addressof(len),
                          plaintext.data(), static_cast<int>(plaintext.size())) != 1)
    {
        return std::nullopt;
    }

    int final_len = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), result.data.data() + len, std::addressof(final_len)) != 1)
    {
        return std::nullopt;
    }

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(result.tag.size()), result.tag.data()) != 1)
    {
        return std::nullopt;
    }

    return result;
}

std::optional<AES256GCM::data_t> AES256GCM::decrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    const ciphertext_t& ct,
    std::span<const uint8_t> aad)
{
    constexpr auto int_max = static_cast<size_t>(std::numeric_limits<int>::max());
    if (!chk_sz(key, nonce) || ct.data.size() > int_max || aad.size() > int_max)
    {
        return std::nullopt;
    }

    auto ctx = make_ctx(false, key, nonce);
    if (!ctx)
    {
        return std::nullopt;
    }

    int len = 0;
    if (!aad.empty() &&
        EVP_DecryptUpdate(ctx.get(), nullptr, std::addressof(len), aad.data(), static_cast<int>(aad.size())) != 1)
    {
        return std::nullopt;
    }

    data_t plaintext(ct.data.size());

    if (EVP_DecryptUpdate(ctx.get(), plaintext.data(), std::addressof(len),
                          ct.data.data(), static_cast<int>(ct.data.size())) != 1)
    {
        secure_clear(plaintext);
        return std::nullopt;
    }

    tag_t tag = ct.tag;
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(tag.size()), tag.data()) != 1)
    {
        secure_clear(plaintext);
        return std::nullopt;
    }

    int final_len = 0;
    if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + len, std::addressof(final_len)) != 1)
    {
        secure_clear(plaintext);
        return std::nullopt;
    }

    return plaintext;
}

std::optional<AES256GCM::nonce_t> AES256GCM::random_nonce()
{
    nonce_t nonce{};
    if (!random_fill(nonce))
    {
        return std::nullopt;
    }
    return nonce;
}

} // namespace crypto
