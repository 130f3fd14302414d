#include "store/capsule_store.hpp"
#include "capsule/codec.hpp"
#include "logger.hpp"

#include <format>
#include <limits>
#include <memory>
#include <string>

namespace capsule
{

namespace {

struct StmtGuard
{
    sqlite3_stmt* stmt = nullptr;
    ~StmtGuard() { sqlite3_finalize(stmt); }
};

Result<Capsule> decode_row(sqlite3_stmt* stmt)
{
    auto blob = static_cast<const uint8_t*>(sqlite3_column_blob(stmt, 0));
    auto len = sqlite3_column_bytes(stmt, 0);
    if (!blob || len <= 0)
    {
        return fail(errc::storage, "empty capsule record");
    }
    return CapsuleCodec::decode(std::span<const uint8_t>(blob, static_cast<size_t>(len)));
}

}

Result<CapsuleStore> CapsuleStore::open(std::string_view db_path)
{
    sqlite3* handle = nullptr;
    int rc = sqlite3_open(std::string(db_path).c_str(), &handle);
    if (rc != SQLITE_OK)
    {
        std::string err = handle ? sqlite3_errmsg(handle) : "out of memory";
        sqlite3_close(handle);
        return fail(errc::storage, std::format("cannot open capsule store {}: {}", db_path, err));
    }

    CapsuleStore store(handle);

    sqlite3_busy_timeout(handle, 2000);
    sqlite3_exec(handle, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(handle, "PRAGMA synchronous=FULL;", nullptr, nullptr, nullptr);

    if (!store.init_schema())
    {
        return store.db_error("schema init");
    }

    LOG_DEBUG("Opened capsule store {}", db_path);
    return store;
}

CapsuleStore::CapsuleStore(sqlite3* handle)
    : db(handle)
{
}

CapsuleStore::~CapsuleStore()
{
    if (db)
    {
        sqlite3_close(db);
    }
}

CapsuleStore::CapsuleStore(CapsuleStore&& other) noexcept
    : db(other.db)
{
    other.db = nullptr;
}

CapsuleStore& CapsuleStore::operator=(CapsuleStore&& other) noexcept
{
    if (this != &other)
    {
        if (db) sqlite3_close(db);
        db = other.db;
        other.db = nullptr;
    }
    return *this;
}

bool CapsuleStore::init_schema()
{
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS capsules (
            seq INTEGER PRIMARY KEY AUTOINCREMENT,
            record BLOB NOT NULL
        );
    )";

    char* err = nullptr;
    int rc = sqlite3_exec(db, sql, nullptr, nullptr, std::addressof(err));
    if (err)
    {
        LOG_ERROR("Capsule schema init failed: {}", err);
        sqlite3_free(err);
    }
    return rc == SQLITE_OK;
}

std::unexpected<Error> CapsuleStore::db_error(std::string_view what) const
{
    return fail(errc::storage, std::format("{}: {}", what, db ? sqlite3_errmsg(db) : "store closed"));
}

Result<size_t> CapsuleStore::append(const Capsule& capsule)
{
    auto record = CapsuleCodec::encode(capsule);
    if (record.size() > static_cast<size_t>(std::numeric_limits<int>::max()))
    {
        return fail(errc::storage, "capsule record too large");
    }

    if (sqlite3_exec(db, "BEGIN IMMEDIATE;", nullptr, nullptr, nullptr) != SQLITE_OK)
    {
        return db_error("begin append");
    }
    auto rollback = [this](std::unexpected<Error> err) {
        sqlite3_exec(db, "ROLLBACK;", nullptr, nullptr, nullptr);
        return err;
    };

    sqlite3_int64 rowid = 0;
    {
        const char* sql = "INSERT INTO capsules (record) VALUES (?);";
        StmtGuard g;
        if (sqlite3_prepare_v2(db, sql, -1, &g.stmt, nullptr) != SQLITE_OK)
        {
            return rollback(db_error("prepare insert"));
        }

        sqlite3_bind_blob(g.stmt, 1, record.data(), static_cast<int>(record.size()), SQLITE_STATIC);

        if (sqlite3_step(g.stmt) != SQLITE_DONE)
        {
            return rollback(db_error("insert capsule"));
        }
        rowid = sqlite3_last_insert_rowid(db);
    }

    // Position of the new row, counted inside the same write transaction.
    sqlite3_int64 position = 0;
    {
        const char* sql = "SELECT COUNT(*) FROM capsules WHERE seq <= ?;";
        StmtGuard g;
        if (sqlite3_prepare_v2(db, sql, -1, &g.stmt, nullptr) != SQLITE_OK)
        {
            return rollback(db_error("prepare position"));
        }

        sqlite3_bind_int64(g.stmt, 1, rowid);

        if (sqlite3_step(g.stmt) != SQLITE_ROW)
        {
            return rollback(db_error("count position"));
        }
        position = sqlite3_column_int64(g.stmt, 0);
    }

    if (sqlite3_exec(db, "COMMIT;", nullptr, nullptr, nullptr) != SQLITE_OK)
    {
        return rollback(db_error("commit append"));
    }
    return static_cast<size_t>(position - 1);
}

Result<size_t> CapsuleStore::size() const
{
    const char* sql = "SELECT COUNT(*) FROM capsules;";
    StmtGuard g;
    if (sqlite3_prepare_v2(db, sql, -1, &g.stmt, nullptr) != SQLITE_OK)
    {
        return db_error("prepare count");
    }
    if (sqlite3_step(g.stmt) != SQLITE_ROW)
    {
        return db_error("count capsules");
    }
    return static_cast<size_t>(sqlite3_column_int64(g.stmt, 0));
}

Result<Capsule> CapsuleStore::at(size_t index) const
{
    auto count = size();
    if (!count)
    {
        return std::unexpected(count.error());
    }
    if (index >= *count)
    {
        return fail(errc::index_out_of_range, std::format("index {} out of range (store holds {})", index, *count));
    }

    const char* sql = "SELECT record FROM capsules ORDER BY seq LIMIT 1 OFFSET ?;";
    StmtGuard g;
    if (sqlite3_prepare_v2(db, sql, -1, &g.stmt, nullptr) != SQLITE_OK)
    {
        return db_error("prepare select");
    }

    sqlite3_bind_int64(g.stmt, 1, static_cast<sqlite3_int64>(index));

    if (sqlite3_step(g.stmt) != SQLITE_ROW)
    {
        return db_error("select capsule");
    }
    return decode_row(g.stmt);
}

Result<std::vector<Capsule>> CapsuleStore::list() const
{
    const char* sql = "SELECT record FROM capsules ORDER BY seq;";
    StmtGuard g;
    if (sqlite3_prepare_v2(db, sql, -1, &g.stmt, nullptr) != SQLITE_OK)
    {
        return db_error("prepare list");
    }

    std::vector<Capsule> out;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(g.stmt)) == SQLITE_ROW)
    {
        auto capsule = decode_row(g.stmt);
        if (!capsule)
        {
            return std::unexpected(capsule.error());
        }
        out.push_back(std::move(*capsule));
    }
    if (rc != SQLITE_DONE)
    {
        return db_error("list capsules");
    }
    return out;
}

}
