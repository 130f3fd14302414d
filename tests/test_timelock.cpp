#include <catch2/catch_test_macros.hpp>

#include "capsule/timelock.hpp"
#include "test_support.hpp"

using namespace capsule;
using test_support::at;

namespace {

date_t ymd(int y, unsigned m, unsigned d)
{
    using namespace std::chrono;
    return year_month_day{year(y), month(m), day(d)};
}

}

TEST_CASE("TimeLockGuard keeps capsule locked before its unlock date")
{
    CHECK(TimeLockGuard::status(ymd(2035, 1, 1), at(2024, 1, 1)) == LockStatus::locked);
    CHECK(TimeLockGuard::status(ymd(2035, 1, 1), at(2034, 12, 31, 23, 59, 59)) == LockStatus::locked);
}

TEST_CASE("TimeLockGuard unlocks at midnight UTC on the unlock date")
{
    CHECK(TimeLockGuard::status(ymd(2035, 1, 1), at(2035, 1, 1)) == LockStatus::unlockable);
    CHECK(TimeLockGuard::status(ymd(2035, 1, 1), at(2035, 1, 1, 12)) == LockStatus::unlockable);
    CHECK(TimeLockGuard::status(ymd(2035, 1, 1), at(2035, 1, 2)) == LockStatus::unlockable);
}

TEST_CASE("TimeLockGuard treats past dates as unlockable")
{
    CHECK(TimeLockGuard::status(ymd(2000, 6, 15), at(2024, 1, 1)) == LockStatus::unlockable);
}

TEST_CASE("TimeLockGuard reads the capsule's unlock date")
{
    Capsule c;
    c.created_at = at(2024, 1, 1);
    c.unlock_date = ymd(2030, 5, 5);

    CHECK(TimeLockGuard::status(c, at(2030, 5, 4)) == LockStatus::locked);
    CHECK(TimeLockGuard::status(c, at(2030, 5, 5)) == LockStatus::unlockable);
}

TEST_CASE("LockStatus names")
{
    CHECK(to_string(LockStatus::locked) == "locked");
    CHECK(to_string(LockStatus::unlockable) == "unlocked");
}
