#include <catch2/catch_test_macros.hpp>

#include "capsule/key_store.hpp"
#include "test_support.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

namespace fs = std::filesystem;
using namespace capsule;

namespace {

std::string slurp(const fs::path& p)
{
    std::ifstream in(p);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

void spit(const fs::path& p, std::string_view text)
{
    std::ofstream out(p, std::ios::trunc);
    out << text;
}

}

TEST_CASE("KeyStore reports missing keys as KeysNotFound")
{
    test_support::TempDir tmp("keys_missing");
    KeyStore store(tmp / "keys");

    CHECK(!store.has_keys());
    auto loaded = store.load_keys();

    REQUIRE(!loaded.has_value());
    CHECK(loaded.error().code == errc::keys_not_found);
    CHECK(!fs::exists(tmp / "keys"));
}

TEST_CASE("KeyStore generate then load returns the same keys")
{
    test_support::TempDir tmp("keys_roundtrip");
    KeyStore store(tmp / "keys");

    auto generated = store.generate_keys();
    REQUIRE(generated.has_value());
    CHECK(store.has_keys());
    CHECK(fs::exists(store.kem_path()));
    CHECK(fs::exists(store.sig_path()));

    auto loaded = store.load_keys();
    REQUIRE(loaded.has_value());
    CHECK(loaded->kem.public_key == generated->kem.public_key);
    CHECK(loaded->kem.secret_key == generated->kem.secret_key);
    CHECK(loaded->sig.public_key == generated->sig.public_key);
    CHECK(loaded->sig.secret_key == generated->sig.secret_key);
    CHECK(KeyStore::fingerprint(*loaded) == KeyStore::fingerprint(*generated));
    CHECK(KeyStore::fingerprint(*loaded).size() == 16);
}

TEST_CASE("KeyStore artifacts name their algorithm and are owner-only")
{
    test_support::TempDir tmp("keys_artifacts");
    KeyStore store(tmp.path());
    REQUIRE(store.generate_keys().has_value());

    auto kem_text = slurp(store.kem_path());
    auto sig_text = slurp(store.sig_path());
    CHECK(kem_text.find("\"ML-KEM-768\"") != std::string::npos);
    CHECK(sig_text.find("\"ML-DSA-65\"") != std::string::npos);
    CHECK(kem_text.find("\"public_key\"") != std::string::npos);
    CHECK(kem_text.find("\"secret_key\"") != std::string::npos);

    auto perms = fs::status(store.kem_path()).permissions();
    CHECK((perms & (fs::perms::group_all | fs::perms::others_all)) == fs::perms::none);
    CHECK(!fs::exists(tmp / "kem_keys.json.tmp"));
}

TEST_CASE("KeyStore regenerate replaces both key pairs")
{
    test_support::TempDir tmp("keys_regen");
    KeyStore store(tmp.path());

    auto first = store.generate_keys();
    auto second = store.generate_keys();
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    CHECK(first->kem.public_key != second->kem.public_key);
    CHECK(first->sig.public_key != second->sig.public_key);

    auto loaded = store.load_keys();
    REQUIRE(loaded.has_value());
    CHECK(loaded->kem.public_key == second->kem.public_key);
}

TEST_CASE("KeyStore reports unreadable key material as KeyCorruption")
{
    test_support::TempDir tmp("keys_corrupt");
    KeyStore store(tmp.path());
    REQUIRE(store.generate_keys().has_value());

    SECTION("not JSON")
    {
        spit(store.kem_path(), "garbage");
    }
    SECTION("wrong algorithm")
    {
        spit(store.sig_path(), R"({"algorithm":"Dilithium2","public_key":"AAAA","secret_key":"AAAA"})");
    }
    SECTION("invalid base64")
    {
        spit(store.kem_path(), R"({"algorithm":"ML-KEM-768","public_key":"@@@@","secret_key":"AAAA"})");
    }
    SECTION("invalid public key base64 beside a valid secret key")
    {
        auto good = slurp(store.kem_path());
        auto pos = good.find("\"public_key\":\"");
        REQUIRE(pos != std::string::npos);
        good.replace(pos + 14, 4, "!!!!");
        spit(store.kem_path(), good);
    }
    SECTION("wrong key length")
    {
        spit(store.kem_path(), R"({"algorithm":"ML-KEM-768","public_key":"AAAA","secret_key":"AAAA"})");
    }
    SECTION("missing field")
    {
        spit(store.sig_path(), R"({"algorithm":"ML-DSA-65","public_key":"AAAA"})");
    }

    auto loaded = store.load_keys();

    REQUIRE(!loaded.has_value());
    CHECK(loaded.error().code == errc::key_corruption);
}

TEST_CASE("KeyStore with only one artifact reports KeysNotFound")
{
    test_support::TempDir tmp("keys_half");
    KeyStore store(tmp.path());
    REQUIRE(store.generate_keys().has_value());
    fs::remove(store.sig_path());

    auto loaded = store.load_keys();

    REQUIRE(!loaded.has_value());
    CHECK(loaded.error().code == errc::keys_not_found);
}

TEST_CASE("KeyStore keygen that cannot place the signing artifact keeps the old pair")
{
    test_support::TempDir tmp("keys_rollback");
    KeyStore store(tmp.path());
    auto original = store.generate_keys();
    REQUIRE(original.has_value());
    const auto kem_before = slurp(store.kem_path());

    // A non-empty directory where the signing artifact belongs makes the final rename fail.
    fs::remove(store.sig_path());
    fs::create_directory(store.sig_path());
    spit(store.sig_path() / "occupied", "x");

    auto regenerated = store.generate_keys();

    REQUIRE(!regenerated.has_value());
    CHECK(regenerated.error().code == errc::storage);
    CHECK(slurp(store.kem_path()) == kem_before);
    CHECK(fs::is_directory(store.sig_path()));
    CHECK(!fs::exists(tmp / "kem_keys.json.tmp"));
    CHECK(!fs::exists(tmp / "sig_keys.json.tmp"));
    CHECK(!fs::exists(tmp / "kem_keys.json.bak"));
}

TEST_CASE("KeyStore first keygen that fails leaves no KEM artifact behind")
{
    test_support::TempDir tmp("keys_rollback_fresh");
    KeyStore store(tmp.path());
    fs::create_directory(store.sig_path());
    spit(store.sig_path() / "occupied", "x");

    auto generated = store.generate_keys();

    REQUIRE(!generated.has_value());
    CHECK(generated.error().code == errc::storage);
    CHECK(!fs::exists(store.kem_path()));
    CHECK(!fs::exists(tmp / "kem_keys.json.tmp"));
    CHECK(!fs::exists(tmp / "sig_keys.json.tmp"));
}
