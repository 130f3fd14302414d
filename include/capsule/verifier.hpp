#pragma once
#include "capsule/types.hpp"
#include "crypto/mldsa65.hpp"
#include "crypto/mlkem768.hpp"

namespace capsule
{

class DecryptionVerifier
{
public:
    DecryptionVerifier() = default;

    /**
     * Time-lock first, then signature, then decapsulation and AEAD open.
     * A locked capsule is rejected before any cryptographic work.
     */
    [[nodiscard]] Result<PlainResult> decrypt(const Capsule& capsule, const KeyPair& keys, timestamp_t now) const;

    // TimeLockedError carrying the unlock date while `now` is before it.
    [[nodiscard]] static Result<void> ensure_unlocked(const Capsule& capsule, timestamp_t now);

    // Signature check only. Does not consult the time-lock and never decrypts.
    [[nodiscard]] Result<VerifyResult> verify(const Capsule& capsule, const KeyPair& keys, timestamp_t now) const;

private:
    [[nodiscard]] bool signature_ok(const Capsule& capsule, const KeyPair& keys) const;

    crypto::MlKem768 kem;
    crypto::MlDsa65 dsa;
};

} // namespace capsule
