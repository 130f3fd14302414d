#pragma once
#include "capsule/types.hpp"
#include "crypto/mldsa65.hpp"
#include "crypto/mlkem768.hpp"

#include <filesystem>
#include <string>

namespace capsule
{

/**
 * Owns the on-disk key material: one ML-KEM-768 pair and one ML-DSA-65 pair,
 * each stored as a JSON artifact (base64 key fields) in a single directory.
 *
 * Regenerating overwrites both artifacts. Capsules sealed under the previous
 * pair can no longer be verified or decrypted.
 */
class KeyStore
{
public:
    explicit KeyStore(std::filesystem::path dir);

    KeyStore(const KeyStore&) = delete;
    KeyStore& operator=(const KeyStore&) = delete;

    [[nodiscard]] Result<KeyPair> generate_keys();
    [[nodiscard]] Result<KeyPair> load_keys() const;
    [[nodiscard]] bool has_keys() const;

    [[nodiscard]] const std::filesystem::path& directory() const { return dir; }
    [[nodiscard]] std::filesystem::path kem_path() const { return dir / kem_file; }
    [[nodiscard]] std::filesystem::path sig_path() const { return dir / sig_file; }

    // Short hex id over both public keys, for display.
    [[nodiscard]] static std::string fingerprint(const KeyPair& keys);

    static constexpr const char* kem_file = "kem_keys.json";
    static constexpr const char* sig_file = "sig_keys.json";

private:
    std::filesystem::path dir;
    crypto::MlKem768 kem;
    crypto::MlDsa65 dsa;
};

} // namespace capsule
