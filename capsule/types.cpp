#include "capsule/types.hpp"
#include "crypto/utils.hpp"

#include <format>

namespace capsule
{

std::string_view to_string(errc code)
{
    switch (code)
    {
        case errc::key_generation:     return "KeyGenerationError";
        case errc::keys_not_found:     return "KeysNotFoundError";
        case errc::key_corruption:     return "KeyCorruptionError";
        case errc::storage:            return "StorageError";
        case errc::validation:         return "ValidationError";
        case errc::encapsulation:      return "EncapsulationError";
        case errc::signing:            return "SigningError";
        case errc::time_locked:        return "TimeLockedError";
        case errc::signature_invalid:  return "SignatureInvalidError";
        case errc::decapsulation:      return "DecapsulationError";
        case errc::tag_mismatch:       return "TagMismatchError";
        case errc::index_out_of_range: return "IndexOutOfRangeError";
    }
    return "UnknownError";
}

std::string_view to_string(LockStatus status)
{
    return status == LockStatus::unlockable ? "unlocked" : "locked";
}

std::string Error::what() const
{
    if (detail.empty())
    {
        return std::string(to_string(code));
    }
    return std::format("{}: {}", to_string(code), detail);
}

void KeyPair::wipe()
{
    crypto::secure_clear(kem.secret_key);
    crypto::secure_clear(sig.secret_key);
    kem.secret_key.clear();
    sig.secret_key.clear();
}

} // namespace capsule
