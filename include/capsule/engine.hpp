#pragma once
#include "capsule/types.hpp"
#include "crypto/mldsa65.hpp"
#include "crypto/mlkem768.hpp"

#include <string_view>

namespace capsule
{

class CapsuleEngine
{
public:
    static constexpr size_t default_max_message = 1024 * 1024;

    explicit CapsuleEngine(size_t max_message_bytes = default_max_message);

    // Input checks only; touches no key material.
    [[nodiscard]] Result<date_t> validate(std::string_view message, std::string_view unlock_date) const;

    /**
     * Seal `message` until `unlock_date`. All cryptographic steps complete
     * before anything is returned; the caller persists the capsule.
     */
    [[nodiscard]] Result<Capsule> create_capsule(
        std::string_view message,
        std::string_view unlock_date,
        const KeyPair& keys,
        timestamp_t now
    ) const;

    [[nodiscard]] size_t max_message_bytes() const { return max_message; }

private:
    size_t max_message;
    crypto::MlKem768 kem;
    crypto::MlDsa65 dsa;
};

} // namespace capsule
