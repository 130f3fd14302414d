#include "capsule/key_store.hpp"
#include "crypto/digest.hpp"
#include "crypto/utils.hpp"
#include "fundamentals/encoding.hpp"
#include "fundamentals/json_utils.hpp"
#include "logger.hpp"

#include <boost/json.hpp>
#include <format>
#include <fstream>
#include <span>
#include <sstream>
#include <string_view>
#include <system_error>

namespace fs = std::filesystem;
namespace json = boost::json;

namespace capsule
{

namespace {

fs::path with_suffix(const fs::path& path, std::string_view suffix)
{
    auto out = path;
    out += suffix;
    return out;
}

// Writes the artifact to "<path>.tmp" with owner-only permissions. Nothing is
// renamed here; see commit_artifacts.
Result<void> stage_artifact(const fs::path& path, std::string_view algorithm,
                            std::span<const uint8_t> public_key, std::span<const uint8_t> secret_key)
{
    auto secret_b64 = encoding::to_base64(secret_key);
    json::object obj{
        {"algorithm", std::string(algorithm)},
        {"public_key", encoding::to_base64(public_key)},
        {"secret_key", secret_b64},
    };
    auto text = json::serialize(obj);
    crypto::secure_clear(secret_b64);

    auto tmp = with_suffix(path, ".tmp");
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out.is_open())
        {
            crypto::secure_clear(text);
            return fail(errc::storage, std::format("cannot open {} for writing", tmp.string()));
        }
        out.write(text.data(), static_cast<std::streamsize>(text.size()));
        out.close();
        crypto::secure_clear(text);
        if (!out)
        {
            std::error_code ec;
            fs::remove(tmp, ec);
            return fail(errc::storage, std::format("failed writing {}", tmp.string()));
        }
    }

    std::error_code ec;
    fs::permissions(tmp, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace, ec);
    if (ec)
    {
        LOG_WARN("Could not restrict permissions on {}: {}", tmp.string(), ec.message());
    }
    return {};
}

/**
 * Moves both staged artifacts into place. The previous KEM artifact is parked
 * as "<kem>.bak" until the signing artifact has landed, so a failure on either
 * rename leaves the old pair on disk.
 */
Result<void> commit_artifacts(const fs::path& kem_path, const fs::path& sig_path)
{
    const auto kem_tmp = with_suffix(kem_path, ".tmp");
    const auto sig_tmp = with_suffix(sig_path, ".tmp");
    const auto kem_bak = with_suffix(kem_path, ".bak");

    std::error_code ec;
    auto discard_staged = [&] {
        std::error_code ignored;
        fs::remove(kem_tmp, ignored);
        fs::remove(sig_tmp, ignored);
    };

    const bool had_kem = fs::exists(kem_path, ec);
    if (had_kem)
    {
        fs::rename(kem_path, kem_bak, ec);
        if (ec)
        {
            discard_staged();
            return fail(errc::storage, std::format("cannot back up {}: {}", kem_path.string(), ec.message()));
        }
    }

    auto restore_kem = [&] {
        std::error_code rb;
        if (had_kem)
        {
            fs::rename(kem_bak, kem_path, rb);
        }
        else
        {
            fs::remove(kem_path, rb);
        }
        if (rb)
        {
            LOG_ERROR("Could not restore {}: {}", kem_path.string(), rb.message());
        }
    };

    fs::rename(kem_tmp, kem_path, ec);
    if (ec)
    {
        auto why = ec.message();
        restore_kem();
        discard_staged();
        return fail(errc::storage, std::format("cannot replace {}: {}", kem_path.string(), why));
    }

    fs::rename(sig_tmp, sig_path, ec);
    if (ec)
    {
        auto why = ec.message();
        restore_kem();
        discard_staged();
        return fail(errc::storage, std::format("cannot replace {}: {}", sig_path.string(), why));
    }

    if (had_kem)
    {
        fs::remove(kem_bak, ec);
        if (ec)
        {
            LOG_WARN("Could not remove {}: {}", kem_bak.string(), ec.message());
        }
    }
    return {};
}

// Parsed artifact with base64 decoded; sizes are checked by the caller.
template<class Pair>
Result<Pair> read_artifact(const fs::path& path, std::string_view algorithm)
{
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open())
    {
        return fail(errc::keys_not_found, std::format("cannot open {}", path.string()));
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    auto text = buffer.str();

    auto corrupt = [&](std::string_view why) {
        crypto::secure_clear(text);
        return fail(errc::key_corruption, std::format("{}: {}", path.filename().string(), why));
    };

    auto obj = json_utils::parse_object(text);
    if (!obj)
    {
        return corrupt(obj.error());
    }

    auto alg = json_utils::extract_str(*obj, "algorithm");
    auto pk = json_utils::extract_str(*obj, "public_key");
    auto sk = json_utils::extract_str(*obj, "secret_key");
    if (!alg || !pk || !sk)
    {
        if (sk)
        {
            crypto::secure_clear(*sk);
        }
        return corrupt(!alg ? alg.error() : !pk ? pk.error() : sk.error());
    }
    if (*alg != algorithm)
    {
        crypto::secure_clear(*sk);
        return corrupt(std::format("expected {} key material, found {}", algorithm, *alg));
    }

    auto pk_bytes = encoding::from_base64(*pk);
    auto sk_bytes = encoding::from_base64(*sk);
    crypto::secure_clear(*sk);
    if (!pk_bytes || !sk_bytes)
    {
        if (sk_bytes)
        {
            crypto::secure_clear(*sk_bytes);
        }
        return corrupt("key field is not valid base64");
    }

    crypto::secure_clear(text);
    return Pair{std::move(*pk_bytes), std::move(*sk_bytes)};
}

} // namespace

KeyStore::KeyStore(fs::path dir)
    : dir(std::move(dir))
{
}

Result<KeyPair> KeyStore::generate_keys()
{
    auto kem_kp = kem.generate_keypair();
    if (!kem_kp)
    {
        return fail(errc::key_generation, std::format("{} key generation failed", crypto::MlKem768::algorithm));
    }
    auto sig_kp = dsa.generate_keypair();
    if (!sig_kp)
    {
        crypto::secure_clear(kem_kp->secret_key);
        return fail(errc::key_generation, std::format("{} key generation failed", crypto::MlDsa65::algorithm));
    }

    KeyPair keys{std::move(*kem_kp), std::move(*sig_kp)};

    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec)
    {
        keys.wipe();
        return fail(errc::storage, std::format("cannot create key directory {}: {}", dir.string(), ec.message()));
    }

    if (auto res = stage_artifact(kem_path(), crypto::MlKem768::algorithm, keys.kem.public_key, keys.kem.secret_key);
        !res)
    {
        keys.wipe();
        return std::unexpected(res.error());
    }
    if (auto res = stage_artifact(sig_path(), crypto::MlDsa65::algorithm, keys.sig.public_key, keys.sig.secret_key);
        !res)
    {
        keys.wipe();
        fs::remove(with_suffix(kem_path(), ".tmp"), ec);
        return std::unexpected(res.error());
    }
    if (auto res = commit_artifacts(kem_path(), sig_path()); !res)
    {
        keys.wipe();
        LOG_ERROR("Key generation rolled back: {}", res.error().what());
        return std::unexpected(res.error());
    }

    LOG_INFO("Generated key pair {} in {}", fingerprint(keys), dir.string());
    return keys;
}

Result<KeyPair> KeyStore::load_keys() const
{
    if (!has_keys())
    {
        return fail(errc::keys_not_found, std::format("no key pair in {}", dir.string()));
    }

    auto kem_kp = read_artifact<crypto::MlKem768::keypair_t>(kem_path(), crypto::MlKem768::algorithm);
    if (!kem_kp)
    {
        LOG_ERROR("Loading keys failed: {}", kem_kp.error().what());
        return std::unexpected(kem_kp.error());
    }

    auto sig_kp = read_artifact<crypto::MlDsa65::keypair_t>(sig_path(), crypto::MlDsa65::algorithm);
    if (!sig_kp)
    {
        crypto::secure_clear(kem_kp->secret_key);
        LOG_ERROR("Loading keys failed: {}", sig_kp.error().what());
        return std::unexpected(sig_kp.error());
    }

    KeyPair keys{std::move(*kem_kp), std::move(*sig_kp)};
    if (!crypto::MlKem768::valid_keypair(keys.kem) || !crypto::MlDsa65::valid_keypair(keys.sig))
    {
        keys.wipe();
        auto err = Error{errc::key_corruption, "key size mismatch", std::nullopt};
        LOG_ERROR("Loading keys failed: {}", err.what());
        return std::unexpected(err);
    }

    LOG_DEBUG("Loaded key pair {}", fingerprint(keys));
    return keys;
}

bool KeyStore::has_keys() const
{
    std::error_code ec;
    return fs::is_regular_file(kem_path(), ec) && fs::is_regular_file(sig_path(), ec);
}

std::string KeyStore::fingerprint(const KeyPair& keys)
{
    auto digest = crypto::sha256({keys.kem.public_key, keys.sig.public_key});
    if (!digest)
    {
        return "unknown";
    }
    return encoding::to_hex(std::span<const uint8_t>(*digest).first(8));
}

} // namespace capsule
