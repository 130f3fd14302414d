#include "capsule/service.hpp"
#include "capsule/timelock.hpp"
#include "logger.hpp"

#include <mutex>

namespace capsule
{

CapsuleService::CapsuleService(KeyStore& keys, CapsuleStore& store, size_t max_message_bytes)
    : key_store(keys)
    , capsule_store(store)
    , engine(max_message_bytes)
{
}

Result<KeyPair> CapsuleService::load_keys() const
{
    std::shared_lock lock(keys_mtx);
    return key_store.get().load_keys();
}

Result<void> CapsuleService::generate_keys()
{
    {
        std::shared_lock lock(store_mtx);
        if (auto count = capsule_store.get().size(); count && *count > 0 && has_keys())
        {
            LOG_WARN("Regenerating keys; {} existing capsule(s) will no longer decrypt or verify", *count);
        }
    }

    std::unique_lock lock(keys_mtx);
    auto keys = key_store.get().generate_keys();
    if (!keys)
    {
        LOG_ERROR("Key generation failed: {}", keys.error().what());
        return std::unexpected(keys.error());
    }
    keys->wipe();
    return {};
}

Result<CapsuleSummary> CapsuleService::create_capsule(std::string_view message, std::string_view unlock_date, timestamp_t now)
{
    if (auto valid = engine.validate(message, unlock_date); !valid)
    {
        return std::unexpected(valid.error());
    }

    auto keys = load_keys();
    if (!keys)
    {
        return std::unexpected(keys.error());
    }

    auto capsule = engine.create_capsule(message, unlock_date, *keys, now);
    keys->wipe();
    if (!capsule)
    {
        LOG_ERROR("Capsule creation failed: {}", capsule.error().what());
        return std::unexpected(capsule.error());
    }

    std::unique_lock lock(store_mtx);
    auto index = capsule_store.get().append(*capsule);
    if (!index)
    {
        LOG_ERROR("Storing capsule failed: {}", index.error().what());
        return std::unexpected(index.error());
    }

    LOG_INFO("Capsule #{} created, locked until {}", *index + 1, datetime::format_date(capsule->unlock_date));
    return CapsuleSummary{*index, capsule->created_at, capsule->unlock_date, TimeLockGuard::status(*capsule, now)};
}

Result<std::vector<CapsuleSummary>> CapsuleService::list_capsules(timestamp_t now) const
{
    std::shared_lock lock(store_mtx);
    auto all = capsule_store.get().list();
    if (!all)
    {
        return std::unexpected(all.error());
    }

    std::vector<CapsuleSummary> out;
    out.reserve(all->size());
    for (size_t i = 0; i < all->size(); ++i)
    {
        const auto& c = (*all)[i];
        out.push_back(CapsuleSummary{i, c.created_at, c.unlock_date, TimeLockGuard::status(c, now)});
    }
    return out;
}

Result<PlainResult> CapsuleService::decrypt_capsule(size_t index, timestamp_t now) const
{
    Result<Capsule> capsule;
    {
        std::shared_lock lock(store_mtx);
        capsule = capsule_store.get().at(index);
    }
    if (!capsule)
    {
        return std::unexpected(capsule.error());
    }

    // Locked capsules are refused before key material is read.
    if (auto open = DecryptionVerifier::ensure_unlocked(*capsule, now); !open)
    {
        return std::unexpected(open.error());
    }

    auto keys = load_keys();
    if (!keys)
    {
        return std::unexpected(keys.error());
    }

    auto result = verifier.decrypt(*capsule, *keys, now);
    keys->wipe();
    return result;
}

Result<VerifyResult> CapsuleService::verify_capsule(size_t index, timestamp_t now) const
{
    Result<Capsule> capsule;
    {
        std::shared_lock lock(store_mtx);
        capsule = capsule_store.get().at(index);
    }
    if (!capsule)
    {
        return std::unexpected(capsule.error());
    }

    auto keys = load_keys();
    if (!keys)
    {
        return std::unexpected(keys.error());
    }

    auto result = verifier.verify(*capsule, *keys, now);
    keys->wipe();
    return result;
}

bool CapsuleService::has_keys() const
{
    std::shared_lock lock(keys_mtx);
    return key_store.get().has_keys();
}

Result<size_t> CapsuleService::capsule_count() const
{
    std::shared_lock lock(store_mtx);
    return capsule_store.get().size();
}

} // namespace capsule
