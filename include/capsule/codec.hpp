#pragma once
#include "capsule/types.hpp"
#include "fundamentals/bytes.hpp"

#include <span>

namespace capsule
{

/**
 * Stable on-disk layout of a capsule record:
 *
 *   "QTC1" || 7 x (u32 big-endian length || bytes)
 *
 * fields in order: created_at (ISO-8601 UTC), unlock_date (ISO-8601 date),
 * encapsulated_key, nonce, ciphertext, authentication tag, signature.
 */
class CapsuleCodec
{
public:
    [[nodiscard]] static bytes::buffer_t encode(const Capsule& capsule);
    [[nodiscard]] static Result<Capsule> decode(std::span<const uint8_t> record);

    // AEAD associated data: iso(created_at) || iso(unlock_date), both fixed width.
    [[nodiscard]] static bytes::buffer_t associated_data(timestamp_t created_at, date_t unlock_date);

    // Bytes covered by the capsule signature.
    [[nodiscard]] static bytes::buffer_t signing_payload(const Capsule& capsule);

    static constexpr std::string_view magic = "QTC1";
    static constexpr std::string_view signing_context = "qcapsule-sig-v1";
};

} // namespace capsule
