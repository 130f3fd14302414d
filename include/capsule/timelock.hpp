#pragma once
#include "capsule/types.hpp"

namespace capsule
{

/**
 * Sole authority for time-lock decisions. A capsule becomes unlockable at
 * 00:00:00 UTC on its unlock date.
 */
class TimeLockGuard
{
public:
    [[nodiscard]] static LockStatus status(const Capsule& capsule, timestamp_t now) noexcept;
    [[nodiscard]] static LockStatus status(date_t unlock_date, timestamp_t now) noexcept;
};

} // namespace capsule
