#pragma once
#include "capsule/engine.hpp"
#include "capsule/key_store.hpp"
#include "capsule/types.hpp"
#include "capsule/verifier.hpp"
#include "store/capsule_store.hpp"

#include <functional>
#include <shared_mutex>
#include <string_view>
#include <vector>

namespace capsule
{

/**
 * Facade over the capsule lifecycle for front ends. Indices are 0-based;
 * `now` is supplied by the caller.
 *
 * Key material and the store each have a reader/writer lock: generate and
 * append take them exclusively, everything else shares them.
 */
class CapsuleService
{
public:
    CapsuleService(KeyStore& keys, CapsuleStore& store,
                   size_t max_message_bytes = CapsuleEngine::default_max_message);

    CapsuleService(const CapsuleService&) = delete;
    CapsuleService& operator=(const CapsuleService&) = delete;

    [[nodiscard]] Result<void> generate_keys();
    [[nodiscard]] Result<CapsuleSummary> create_capsule(std::string_view message, std::string_view unlock_date, timestamp_t now);
    [[nodiscard]] Result<std::vector<CapsuleSummary>> list_capsules(timestamp_t now) const;
    [[nodiscard]] Result<PlainResult> decrypt_capsule(size_t index, timestamp_t now) const;
    [[nodiscard]] Result<VerifyResult> verify_capsule(size_t index, timestamp_t now) const;

    [[nodiscard]] bool has_keys() const;
    [[nodiscard]] Result<size_t> capsule_count() const;

private:
    [[nodiscard]] Result<KeyPair> load_keys() const;

    std::reference_wrapper<KeyStore> key_store;
    std::reference_wrapper<CapsuleStore> capsule_store;
    CapsuleEngine engine;
    DecryptionVerifier verifier;

    mutable std::shared_mutex keys_mtx;
    mutable std::shared_mutex store_mtx;
};

} // namespace capsule
