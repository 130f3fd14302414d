#pragma once
#include "crypto/aesgcm256.hpp"
#include "crypto/mldsa65.hpp"
#include "crypto/mlkem768.hpp"
#include "fundamentals/datetime.hpp"

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace capsule
{

using datetime::date_t;
using datetime::timestamp_t;

enum class errc : uint8_t
{
    key_generation,
    keys_not_found,
    key_corruption,
    storage,
    validation,
    encapsulation,
    signing,
    time_locked,
    signature_invalid,
    decapsulation,
    tag_mismatch,
    index_out_of_range,
};

[[nodiscard]] std::string_view to_string(errc code);

struct Error
{
    errc code;
    std::string detail;
    std::optional<date_t> unlock_date; // set for time_locked only

    [[nodiscard]] std::string what() const;
};

template<class T>
using Result = std::expected<T, Error>;

[[nodiscard]] inline std::unexpected<Error> fail(errc code, std::string detail)
{
    return std::unexpected(Error{code, std::move(detail), std::nullopt});
}

struct KeyPair
{
    crypto::MlKem768::keypair_t kem;
    crypto::MlDsa65::keypair_t sig;

    void wipe();
};

struct Capsule
{
    timestamp_t created_at;
    date_t unlock_date;
    std::vector<uint8_t> encapsulated_key;
    crypto::AES256GCM::nonce_t nonce{};
    std::vector<uint8_t> ciphertext;
    crypto::AES256GCM::tag_t tag{};
    std::vector<uint8_t> signature;

    bool operator==(const Capsule&) const = default;
};

enum class LockStatus : uint8_t
{
    locked,
    unlockable,
};

[[nodiscard]] std::string_view to_string(LockStatus status);

struct CapsuleSummary
{
    size_t index;
    timestamp_t created_at;
    date_t unlock_date;
    LockStatus status;
};

struct PlainResult
{
    std::string plaintext;
    timestamp_t created_at;
    date_t unlock_date;
};

struct VerifyResult
{
    bool verified;
    std::string reason;
    timestamp_t created_at;
    date_t unlock_date;
    LockStatus status;
};

} // namespace capsule
