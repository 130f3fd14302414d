#include <catch2/catch_test_macros.hpp>

#include "capsule/codec.hpp"
#include "capsule/engine.hpp"
#include "capsule/verifier.hpp"
#include "test_support.hpp"

#include <string>

using namespace capsule;
using test_support::at;

namespace {

KeyPair fresh_keys()
{
    crypto::MlKem768 kem;
    crypto::MlDsa65 dsa;
    auto kem_kp = kem.generate_keypair();
    auto sig_kp = dsa.generate_keypair();
    REQUIRE(kem_kp.has_value());
    REQUIRE(sig_kp.has_value());
    return KeyPair{std::move(*kem_kp), std::move(*sig_kp)};
}

// Signs the capsule as it stands, so checks past the signature get reached.
void resign(Capsule& c, const KeyPair& keys)
{
    crypto::MlDsa65 dsa;
    auto sig = dsa.sign(CapsuleCodec::signing_payload(c), keys.sig.secret_key);
    REQUIRE(sig.has_value());
    c.signature = std::move(*sig);
}

const auto created = at(2024, 1, 1, 12, 0, 0);
const auto before_unlock = at(2034, 12, 31, 23, 59, 59);
const auto after_unlock = at(2035, 1, 2);

}

TEST_CASE("CapsuleEngine validate rejects bad input")
{
    CapsuleEngine engine(16);

    auto empty = engine.validate("", "2035-01-01");
    REQUIRE(!empty.has_value());
    CHECK(empty.error().code == errc::validation);

    auto big = engine.validate(std::string(17, 'x'), "2035-01-01");
    REQUIRE(!big.has_value());
    CHECK(big.error().code == errc::validation);

    auto bad_date = engine.validate("hi", "01/01/2035");
    REQUIRE(!bad_date.has_value());
    CHECK(bad_date.error().code == errc::validation);

    auto impossible = engine.validate("hi", "2035-02-30");
    REQUIRE(!impossible.has_value());
    CHECK(impossible.error().code == errc::validation);

    CHECK(engine.validate(std::string(16, 'x'), "2035-01-01").has_value());
}

TEST_CASE("CapsuleEngine creates a capsule that decrypts after unlock")
{
    auto keys = fresh_keys();
    CapsuleEngine engine;
    DecryptionVerifier verifier;

    auto capsule = engine.create_capsule("Hello, future world!", "2035-01-01", keys, created);
    REQUIRE(capsule.has_value());
    CHECK(capsule->created_at == created);
    CHECK(datetime::format_date(capsule->unlock_date) == "2035-01-01");
    CHECK(capsule->encapsulated_key.size() == crypto::MlKem768::ciphertext_size);
    CHECK(capsule->ciphertext.size() == std::string("Hello, future world!").size());

    auto plain = verifier.decrypt(*capsule, keys, after_unlock);
    REQUIRE(plain.has_value());
    CHECK(plain->plaintext == "Hello, future world!");
    CHECK(plain->created_at == created);
}

TEST_CASE("CapsuleEngine uses fresh randomness per capsule")
{
    auto keys = fresh_keys();
    CapsuleEngine engine;

    auto a = engine.create_capsule("same message", "2035-01-01", keys, created);
    auto b = engine.create_capsule("same message", "2035-01-01", keys, created);
    REQUIRE(a.has_value());
    REQUIRE(b.has_value());

    CHECK(a->encapsulated_key != b->encapsulated_key);
    CHECK(a->nonce != b->nonce);
    CHECK(a->ciphertext != b->ciphertext);
    CHECK(a->signature != b->signature);
}

TEST_CASE("CapsuleEngine accepts a past unlock date")
{
    auto keys = fresh_keys();
    CapsuleEngine engine;
    DecryptionVerifier verifier;

    auto capsule = engine.create_capsule("already open", "2020-01-01", keys, created);
    REQUIRE(capsule.has_value());

    auto plain = verifier.decrypt(*capsule, keys, created);
    REQUIRE(plain.has_value());
    CHECK(plain->plaintext == "already open");
}

TEST_CASE("DecryptionVerifier refuses locked capsule with its unlock date")
{
    auto keys = fresh_keys();
    CapsuleEngine engine;
    DecryptionVerifier verifier;

    auto capsule = engine.create_capsule("secret", "2035-01-01", keys, created);
    REQUIRE(capsule.has_value());

    auto locked = verifier.decrypt(*capsule, keys, before_unlock);

    REQUIRE(!locked.has_value());
    CHECK(locked.error().code == errc::time_locked);
    REQUIRE(locked.error().unlock_date.has_value());
    CHECK(datetime::format_date(*locked.error().unlock_date) == "2035-01-01");
}

TEST_CASE("DecryptionVerifier detects tampering after unlock")
{
    auto keys = fresh_keys();
    CapsuleEngine engine;
    DecryptionVerifier verifier;

    auto sealed = engine.create_capsule("tamper target", "2030-01-01", keys, created);
    REQUIRE(sealed.has_value());

    Capsule c = *sealed;
    SECTION("ciphertext bit flip")
    {
        c.ciphertext[0] ^= 0x01;
    }
    SECTION("tag bit flip")
    {
        c.tag[0] ^= 0x01;
    }
    SECTION("encapsulated key bit flip")
    {
        c.encapsulated_key[100] ^= 0x01;
    }
    SECTION("signature bit flip")
    {
        c.signature[10] ^= 0x01;
    }
    SECTION("created_at shifted by one second")
    {
        c.created_at += std::chrono::seconds(1);
    }
    SECTION("unlock date moved earlier")
    {
        c.unlock_date = std::chrono::year_month_day{std::chrono::year(2029), std::chrono::January, std::chrono::day(1)};
    }

    auto plain = verifier.decrypt(c, keys, after_unlock);

    REQUIRE(!plain.has_value());
    CHECK(plain.error().code == errc::signature_invalid);

    auto report = verifier.verify(c, keys, after_unlock);
    REQUIRE(report.has_value());
    CHECK(!report->verified);
}

TEST_CASE("DecryptionVerifier verify works before unlock and reports status")
{
    auto keys = fresh_keys();
    CapsuleEngine engine;
    DecryptionVerifier verifier;

    auto capsule = engine.create_capsule("check me", "2035-01-01", keys, created);
    REQUIRE(capsule.has_value());

    auto early = verifier.verify(*capsule, keys, before_unlock);
    REQUIRE(early.has_value());
    CHECK(early->verified);
    CHECK(early->status == LockStatus::locked);
    CHECK(early->reason == "Signature verified - capsule is authentic");

    auto late = verifier.verify(*capsule, keys, after_unlock);
    REQUIRE(late.has_value());
    CHECK(late->verified);
    CHECK(late->status == LockStatus::unlockable);
}

TEST_CASE("DecryptionVerifier verify under another key pair is false")
{
    auto keys = fresh_keys();
    auto other = fresh_keys();
    CapsuleEngine engine;
    DecryptionVerifier verifier;

    auto capsule = engine.create_capsule("orphan", "2030-01-01", keys, created);
    REQUIRE(capsule.has_value());

    auto report = verifier.verify(*capsule, other, after_unlock);
    REQUIRE(report.has_value());
    CHECK(!report->verified);

    auto plain = verifier.decrypt(*capsule, other, after_unlock);
    REQUIRE(!plain.has_value());
    CHECK(plain.error().code == errc::signature_invalid);
}

TEST_CASE("CapsuleEngine reports bad public key as EncapsulationError")
{
    auto keys = fresh_keys();
    keys.kem.public_key.resize(10);
    CapsuleEngine engine;

    auto capsule = engine.create_capsule("x", "2030-01-01", keys, created);

    REQUIRE(!capsule.has_value());
    CHECK(capsule.error().code == errc::encapsulation);
}

TEST_CASE("Error::what names the error kind")
{
    Error err{errc::time_locked, "locked until 2035-01-01", std::nullopt};

    CHECK(err.what() == "TimeLockedError: locked until 2035-01-01");
    CHECK(to_string(errc::index_out_of_range) == "IndexOutOfRangeError");
}

TEST_CASE("DecryptionVerifier reports a signed but altered body as TagMismatch")
{
    auto keys = fresh_keys();
    CapsuleEngine engine;
    DecryptionVerifier verifier;

    auto sealed = engine.create_capsule("tamper target", "2030-01-01", keys, created);
    REQUIRE(sealed.has_value());

    Capsule c = *sealed;
    SECTION("ciphertext bit flip")
    {
        c.ciphertext[0] ^= 0x01;
    }
    SECTION("tag bit flip")
    {
        c.tag[0] ^= 0x01;
    }
    resign(c, keys);

    auto report = verifier.verify(c, keys, after_unlock);
    REQUIRE(report.has_value());
    CHECK(report->verified);

    auto plain = verifier.decrypt(c, keys, after_unlock);
    REQUIRE(!plain.has_value());
    CHECK(plain.error().code == errc::tag_mismatch);
}

TEST_CASE("DecryptionVerifier reports a signed but truncated encapsulated key as DecapsulationError")
{
    auto keys = fresh_keys();
    CapsuleEngine engine;
    DecryptionVerifier verifier;

    auto sealed = engine.create_capsule("short key", "2030-01-01", keys, created);
    REQUIRE(sealed.has_value());

    Capsule c = *sealed;
    SECTION("one byte short")
    {
        c.encapsulated_key.pop_back();
    }
    SECTION("empty")
    {
        c.encapsulated_key.clear();
    }
    resign(c, keys);

    auto plain = verifier.decrypt(c, keys, after_unlock);
    REQUIRE(!plain.has_value());
    CHECK(plain.error().code == errc::decapsulation);
}

TEST_CASE("DecryptionVerifier refuses a locked capsule before checking its signature")
{
    auto keys = fresh_keys();
    CapsuleEngine engine;
    DecryptionVerifier verifier;

    auto sealed = engine.create_capsule("still locked", "2035-01-01", keys, created);
    REQUIRE(sealed.has_value());

    Capsule c = *sealed;
    c.signature[10] ^= 0x01;

    auto plain = verifier.decrypt(c, keys, before_unlock);
    REQUIRE(!plain.has_value());
    CHECK(plain.error().code == errc::time_locked);
    REQUIRE(plain.error().unlock_date.has_value());
    CHECK(datetime::format_date(*plain.error().unlock_date) == "2035-01-01");
}
