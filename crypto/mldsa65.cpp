#include "crypto/mldsa65.hpp"
#include "crypto/utils.hpp"
#include <stdexcept>

namespace crypto
{

MlDsa65::MlDsa65()
    : sig(OQS_SIG_new(algorithm), OQS_SIG_free)
{
    if (!sig)
    {
        throw std::runtime_error("ML-DSA-65 not available in liboqs");
    }
}

std::optional<MlDsa65::keypair_t> MlDsa65::generate_keypair() const
{
    keypair_t kp;
    kp.public_key.resize(public_key_size);
    kp.secret_key.resize(secret_key_size);

    if (OQS_SIG_keypair(sig.get(), kp.public_key.data(), kp.secret_key.data()) != OQS_SUCCESS)
    {
        secure_clear(kp.secret_key);
        return std::nullopt;
    }
    return kp;
}

std::optional<MlDsa65::signature_t> MlDsa65::sign(
    std::span<const uint8_t> message,
    std::span<const uint8_t> secret_key) const
{
    if (secret_key.size() != secret_key_size)
    {
        return std::nullopt;
    }

    signature_t signature(sig->length_signature);
    size_t sig_len = 0;

    if (OQS_SIG_sign(
            sig.get(),
            signature.data(),
            std::addressof(sig_len),
            message.data(),
            message.size(),
            secret_key.data()) != OQS_SUCCESS)
    {
        return std::nullopt;
    }

    signature.resize(sig_len);
    return signature;
}

bool MlDsa65::verify(
    std::span<const uint8_t> message,
    std::span<const uint8_t> signature,
    std::span<const uint8_t> public_key) const
{
    if (public_key.size() != public_key_size ||
        signature.empty() ||
        signature.size() > sig->length_signature)
    {
        return false;
    }

    return OQS_SIG_verify(
        sig.get(),
        message.data(),
        message.size(),
        signature.data(),
        signature.size(),
        public_key.data()) == OQS_SUCCESS;
}

bool MlDsa65::valid_keypair(const keypair_t& kp)
{
    return kp.public_key.size() == public_key_size && kp.secret_key.size() == secret_key_size;
}

} // namespace crypto
