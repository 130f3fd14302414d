#include "crypto/mlkem768.hpp"
#include "crypto/utils.hpp"
#include <stdexcept>

namespace crypto
{

MlKem768::MlKem768()
    : kem(OQS_KEM_new(algorithm), OQS_KEM_free)
{
    if (!kem)
    {
        throw std::runtime_error("ML-KEM-768 not available in liboqs");
    }
}

std::optional<MlKem768::keypair_t> MlKem768::generate_keypair() const
{
    keypair_t kp;
    kp.public_key.resize(public_key_size);
    kp.secret_key.resize(secret_key_size);

    if (OQS_KEM_keypair(kem.get(), kp.public_key.data(), kp.secret_key.data()) != OQS_SUCCESS)
    {
        secure_clear(kp.secret_key);
        return std::nullopt;
    }
    return kp;
}

std::optional<MlKem768::encaps_result_t> MlKem768::encapsulate(std::span<const uint8_t> public_key) const
{
    if (public_key.size() != public_key_size)
    {
        return std::nullopt;
    }

    encaps_result_t result;
    result.ciphertext.resize(ciphertext_size);

    if (OQS_KEM_encaps(
            kem.get(),
            result.ciphertext.data(),
            result.shared_secret.data(),
            public_key.data()) != OQS_SUCCESS)
    {
        secure_clear(result.shared_secret);
        return std::nullopt;
    }
    return result;
}

// ML-KEM decapsulation is implicitly rejecting: a well-sized but forged
// ciphertext yields a pseudorandom secret, which the AEAD tag then catches.
std::optional<MlKem768::shared_secret_t> MlKem768::decapsulate(
    std::span<const uint8_t> ciphertext,
    std::span<const uint8_t> secret_key) const
{
    if (ciphertext.size() != ciphertext_size || secret_key.size() != secret_key_size)
    {
        return std::nullopt;
    }

    shared_secret_t shared_secret;
    if (OQS_KEM_decaps(
            kem.get(),
            shared_secret.data(),
            ciphertext.data(),
            secret_key.data()) != OQS_SUCCESS)
    {
        secure_clear(shared_secret);
        return std::nullopt;
    }
    return shared_secret;
}

bool MlKem768::valid_keypair(const keypair_t& kp)
{
    return kp.public_key.size() == public_key_size && kp.secret_key.size() == secret_key_size;
}

} // namespace crypto
