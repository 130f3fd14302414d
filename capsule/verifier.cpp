#include "capsule/verifier.hpp"
#include "capsule/codec.hpp"
#include "capsule/timelock.hpp"
#include "crypto/aesgcm256.hpp"
#include "crypto/utils.hpp"
#include "fundamentals/bytes.hpp"
#include "logger.hpp"

#include <format>

namespace capsule
{

bool DecryptionVerifier::signature_ok(const Capsule& capsule, const KeyPair& keys) const
{
    return dsa.verify(CapsuleCodec::signing_payload(capsule), capsule.signature, keys.sig.public_key);
}

Result<void> DecryptionVerifier::ensure_unlocked(const Capsule& capsule, timestamp_t now)
{
    if (TimeLockGuard::status(capsule, now) == LockStatus::unlockable)
    {
        return {};
    }
    auto date = datetime::format_date(capsule.unlock_date);
    LOG_INFO("Decrypt refused: capsule locked until {}", date);
    return std::unexpected(Error{errc::time_locked, std::format("locked until {}", date), capsule.unlock_date});
}

Result<PlainResult> DecryptionVerifier::decrypt(const Capsule& capsule, const KeyPair& keys, timestamp_t now) const
{
    if (auto open = ensure_unlocked(capsule, now); !open)
    {
        return std::unexpected(open.error());
    }

    if (!signature_ok(capsule, keys))
    {
        LOG_WARN("Signature verification failed; capsule may be tampered");
        return fail(errc::signature_invalid, "signature does not match capsule contents");
    }

    auto secret = kem.decapsulate(capsule.encapsulated_key, keys.kem.secret_key);
    if (!secret)
    {
        return fail(errc::decapsulation, "encapsulated key is malformed");
    }

    auto aad = CapsuleCodec::associated_data(capsule.created_at, capsule.unlock_date);
    auto opened = crypto::AES256GCM::decrypt(*secret, capsule.nonce,
                                             {capsule.ciphertext, capsule.tag}, aad);
    crypto::secure_clear(*secret);
    if (!opened)
    {
        LOG_WARN("Authentication tag mismatch on signed capsule");
        return fail(errc::tag_mismatch, "authentication tag mismatch");
    }

    PlainResult result{bytes::to_string(*opened), capsule.created_at, capsule.unlock_date};
    crypto::secure_clear(*opened);
    return result;
}

Result<VerifyResult> DecryptionVerifier::verify(const Capsule& capsule, const KeyPair& keys, timestamp_t now) const
{
    VerifyResult result{};
    result.created_at = capsule.created_at;
    result.unlock_date = capsule.unlock_date;
    result.status = TimeLockGuard::status(capsule, now);
    result.verified = signature_ok(capsule, keys);
    result.reason = result.verified
        ? "Signature verified - capsule is authentic"
        : "Signature verification failed - capsule may be tampered";

    if (!result.verified)
    {
        LOG_WARN("Verify: signature mismatch for capsule created {}", datetime::format_timestamp(capsule.created_at));
    }
    return result;
}

} // namespace capsule
