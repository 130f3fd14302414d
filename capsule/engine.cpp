#include "capsule/engine.hpp"
#include "capsule/codec.hpp"
#include "capsule/timelock.hpp"
#include "crypto/aesgcm256.hpp"
#include "crypto/utils.hpp"
#include "fundamentals/bytes.hpp"
#include "logger.hpp"

#include <format>

namespace capsule
{

CapsuleEngine::CapsuleEngine(size_t max_message_bytes)
    : max_message(max_message_bytes)
{
}

Result<date_t> CapsuleEngine::validate(std::string_view message, std::string_view unlock_date) const
{
    if (message.empty())
    {
        return fail(errc::validation, "message cannot be empty");
    }
    if (message.size() > max_message)
    {
        return fail(errc::validation, std::format("message exceeds {} bytes", max_message));
    }

    auto date = datetime::parse_date(unlock_date);
    if (!date)
    {
        return fail(errc::validation, "invalid date format, use YYYY-MM-DD");
    }
    return *date;
}

Result<Capsule> CapsuleEngine::create_capsule(
    std::string_view message,
    std::string_view unlock_date,
    const KeyPair& keys,
    timestamp_t now) const
{
    auto date = validate(message, unlock_date);
    if (!date)
    {
        return std::unexpected(date.error());
    }

    Capsule capsule;
    capsule.created_at = std::chrono::floor<std::chrono::seconds>(now);
    capsule.unlock_date = *date;

    if (TimeLockGuard::status(capsule, now) == LockStatus::unlockable)
    {
        LOG_WARN("Unlock date {} is today or in the past; capsule is immediately unlockable",
                 datetime::format_date(capsule.unlock_date));
    }

    auto encaps = kem.encapsulate(keys.kem.public_key);
    if (!encaps)
    {
        return fail(errc::encapsulation, "key encapsulation against the public key failed");
    }
    capsule.encapsulated_key = std::move(encaps->ciphertext);

    auto nonce = crypto::AES256GCM::random_nonce();
    if (!nonce)
    {
        crypto::secure_clear(encaps->shared_secret);
        return fail(errc::encapsulation, "nonce generation failed");
    }
    capsule.nonce = *nonce;

    auto aad = CapsuleCodec::associated_data(capsule.created_at, capsule.unlock_date);
    auto plain = bytes::to_bytes(message);
    auto sealed = crypto::AES256GCM::encrypt(encaps->shared_secret, capsule.nonce, plain, aad);
    crypto::secure_clear(encaps->shared_secret);
    crypto::secure_clear(plain);
    if (!sealed)
    {
        return fail(errc::encapsulation, "symmetric encryption under the derived key failed");
    }
    capsule.ciphertext = std::move(sealed->data);
    capsule.tag = sealed->tag;

    auto signature = dsa.sign(CapsuleCodec::signing_payload(capsule), keys.sig.secret_key);
    if (!signature)
    {
        return fail(errc::signing, std::format("{} signing failed", crypto::MlDsa65::algorithm));
    }
    capsule.signature = std::move(*signature);

    LOG_DEBUG("Sealed {} byte message until {}", message.size(), datetime::format_date(capsule.unlock_date));
    return capsule;
}

} // namespace capsule
