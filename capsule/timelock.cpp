#include "capsule/timelock.hpp"

namespace capsule
{

LockStatus TimeLockGuard::status(const Capsule& capsule, timestamp_t now) noexcept
{
    return status(capsule.unlock_date, now);
}

LockStatus TimeLockGuard::status(date_t unlock_date, timestamp_t now) noexcept
{
    auto today = std::chrono::floor<std::chrono::days>(now);
    return today >= std::chrono::sys_days(unlock_date) ? LockStatus::unlockable : LockStatus::locked;
}

} // namespace capsule
