#include <catch2/catch_test_macros.hpp>

#include "store/capsule_store.hpp"
#include "test_support.hpp"

#include <sqlite3.h>

using namespace capsule;
using test_support::at;

namespace {

Capsule make(uint8_t marker)
{
    using namespace std::chrono;
    Capsule c;
    c.created_at = at(2024, 1, 1, 0, 0, marker);
    c.unlock_date = year_month_day{year(2030), January, day(1)};
    c.encapsulated_key.assign(16, marker);
    c.nonce.fill(marker);
    c.ciphertext = {marker, marker};
    c.tag.fill(marker);
    c.signature.assign(8, marker);
    return c;
}

}

TEST_CASE("CapsuleStore starts empty")
{
    auto store = CapsuleStore::open(":memory:");
    REQUIRE(store.has_value());

    auto n = store->size();
    REQUIRE(n.has_value());
    CHECK(*n == 0);

    auto all = store->list();
    REQUIRE(all.has_value());
    CHECK(all->empty());
}

TEST_CASE("CapsuleStore assigns dense indices in creation order")
{
    auto store = CapsuleStore::open(":memory:");
    REQUIRE(store.has_value());

    for (uint8_t i = 0; i < 3; ++i)
    {
        auto idx = store->append(make(i + 1));
        REQUIRE(idx.has_value());
        CHECK(*idx == i);
    }

    auto all = store->list();
    REQUIRE(all.has_value());
    REQUIRE(all->size() == 3);
    CHECK((*all)[0] == make(1));
    CHECK((*all)[2] == make(3));

    auto second = store->at(1);
    REQUIRE(second.has_value());
    CHECK(*second == make(2));
}

TEST_CASE("CapsuleStore at rejects out-of-range index")
{
    auto store = CapsuleStore::open(":memory:");
    REQUIRE(store.has_value());
    REQUIRE(store->append(make(1)).has_value());

    auto missing = store->at(1);

    REQUIRE(!missing.has_value());
    CHECK(missing.error().code == errc::index_out_of_range);
}

TEST_CASE("CapsuleStore persists across reopen")
{
    test_support::TempDir tmp("store_reopen");
    auto path = (tmp / "capsules.db").string();

    {
        auto store = CapsuleStore::open(path);
        REQUIRE(store.has_value());
        REQUIRE(store->append(make(7)).has_value());
        REQUIRE(store->append(make(8)).has_value());
    }

    auto reopened = CapsuleStore::open(path);
    REQUIRE(reopened.has_value());
    auto n = reopened->size();
    REQUIRE(n.has_value());
    CHECK(*n == 2);

    auto first = reopened->at(0);
    REQUIRE(first.has_value());
    CHECK(*first == make(7));
}

TEST_CASE("CapsuleStore surfaces a corrupt record as StorageError")
{
    test_support::TempDir tmp("store_corrupt");
    auto path = (tmp / "capsules.db").string();

    {
        auto store = CapsuleStore::open(path);
        REQUIRE(store.has_value());
        REQUIRE(store->append(make(1)).has_value());
    }

    sqlite3* raw = nullptr;
    REQUIRE(sqlite3_open(path.c_str(), &raw) == SQLITE_OK);
    REQUIRE(sqlite3_exec(raw, "UPDATE capsules SET record = X'00010203';", nullptr, nullptr, nullptr) == SQLITE_OK);
    sqlite3_close(raw);

    auto store = CapsuleStore::open(path);
    REQUIRE(store.has_value());
    auto rec = store->at(0);

    REQUIRE(!rec.has_value());
    CHECK(rec.error().code == errc::storage);
}

TEST_CASE("CapsuleStore open fails for an unusable path")
{
    auto store = CapsuleStore::open("/nonexistent/dir/capsules.db");

    REQUIRE(!store.has_value());
    CHECK(store.error().code == errc::storage);
}

TEST_CASE("CapsuleStore is movable")
{
    auto opened = CapsuleStore::open(":memory:");
    REQUIRE(opened.has_value());
    CapsuleStore store = std::move(*opened);

    auto idx = store.append(make(3));
    REQUIRE(idx.has_value());
    CHECK(*idx == 0);
}

TEST_CASE("CapsuleStore handles sharing one file get their own row positions")
{
    test_support::TempDir tmp("store_shared");
    auto path = (tmp / "capsules.db").string();
    auto first = CapsuleStore::open(path);
    auto second = CapsuleStore::open(path);
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());

    for (uint8_t i = 0; i < 6; ++i)
    {
        auto& writer = (i % 2 == 0) ? *first : *second;
        auto idx = writer.append(make(i + 1));
        REQUIRE(idx.has_value());
        CHECK(*idx == i);
    }

    auto all = second->list();
    REQUIRE(all.has_value());
    REQUIRE(all->size() == 6);
    for (uint8_t i = 0; i < 6; ++i)
    {
        CHECK((*all)[i] == make(i + 1));
    }

    auto back = first->at(5);
    REQUIRE(back.has_value());
    CHECK(*back == make(6));
}
