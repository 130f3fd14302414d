#pragma once
#include <oqs/oqs.h>
#include <memory>
#include <vector>
#include <span>
#include <optional>

namespace crypto
{

class MlDsa65
{
public:
    using key_t = std::vector<uint8_t>;
    using signature_t = std::vector<uint8_t>;

    struct keypair_t
    {
        key_t public_key;
        key_t secret_key;
    };

    MlDsa65();
    ~MlDsa65() = default;

    MlDsa65(const MlDsa65&) = delete;
    MlDsa65& operator=(const MlDsa65&) = delete;
    MlDsa65(MlDsa65&&) noexcept = default;
    MlDsa65& operator=(MlDsa65&&) noexcept = default;

    [[nodiscard]] std::optional<keypair_t> generate_keypair() const;
    [[nodiscard]] std::optional<signature_t> sign(
        std::span<const uint8_t> message,
        std::span<const uint8_t> secret_key
    ) const;
    [[nodiscard]] bool verify(
        std::span<const uint8_t> message,
        std::span<const uint8_t> signature,
        std::span<const uint8_t> public_key
    ) const;

    [[nodiscard]] static bool valid_keypair(const keypair_t& kp);

    static constexpr const char* algorithm = "ML-DSA-65";
    static constexpr size_t public_key_size = 1952;
    static constexpr size_t secret_key_size = 4032;
    static constexpr size_t max_signature_size = 3309;

private:
    std::unique_ptr<OQS_SIG, decltype(&OQS_SIG_free)> sig;
};

} // namespace crypto
