#pragma once

#include "capsule/types.hpp"
#include <sqlite3.h>
#include <expected>
#include <string_view>
#include <vector>

namespace capsule
{

/**
 * Append-only, creation-ordered capsule table. Index i is the i-th row by
 * insertion sequence; rows are never updated or deleted, so indices stay
 * stable. Pass ":memory:" for an ephemeral store.
 */
class CapsuleStore
{
public:
    [[nodiscard]] static Result<CapsuleStore> open(std::string_view db_path);
    ~CapsuleStore();

    CapsuleStore(const CapsuleStore&) = delete;
    CapsuleStore& operator=(const CapsuleStore&) = delete;
    CapsuleStore(CapsuleStore&& other) noexcept;
    CapsuleStore& operator=(CapsuleStore&& other) noexcept;

    [[nodiscard]] Result<size_t> append(const Capsule& capsule);
    [[nodiscard]] Result<size_t> size() const;
    [[nodiscard]] Result<Capsule> at(size_t index) const;
    [[nodiscard]] Result<std::vector<Capsule>> list() const;

private:
    explicit CapsuleStore(sqlite3* db);

    [[nodiscard]] bool init_schema();
    [[nodiscard]] std::unexpected<Error> db_error(std::string_view what) const;

    sqlite3* db;
};

}
