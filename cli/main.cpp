#include "capsule/engine.hpp"
#include "capsule/key_store.hpp"
#include "capsule/service.hpp"
#include "store/capsule_store.hpp"
#include "config.hpp"
#include "logger.hpp"

#include <print>
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <charconv>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace {

constexpr std::string_view default_config = "qcapsule.json";

struct Args
{
    std::optional<std::string> config_path;
    std::optional<std::string> data_dir;
    std::vector<std::string> rest;
};

void print_usage(const char* prog)
{
    std::println("Usage: {} [--config <file>] [--data-dir <dir>] <command> [args]", prog);
    std::println("Commands:");
    std::println("  keygen                        Generate ML-KEM-768 and ML-DSA-65 keys");
    std::println("  create <message> <YYYY-MM-DD> Seal a message until the given date");
    std::println("  list                          List capsules and their lock status");
    std::println("  decrypt <n>                   Open capsule n once its date has arrived");
    std::println("  verify <n>                    Check the signature of capsule n");
}

std::optional<Args> parse_args(int argc, char** argv)
{
    Args args;
    for (int i = 1; i < argc; ++i)
    {
        std::string_view arg = argv[i];
        if (arg == "--config" || arg == "--data-dir")
        {
            if (i + 1 >= argc)
            {
                std::println(stderr, "{} requires a value", arg);
                return std::nullopt;
            }
            (arg == "--config" ? args.config_path : args.data_dir) = argv[++i];
        }
        else
        {
            args.rest.emplace_back(arg);
        }
    }
    return args;
}

// 1-based capsule number from the command line, converted to a 0-based index.
std::optional<size_t> parse_number(std::string_view text)
{
    size_t n = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), n);
    if (ec != std::errc{} || ptr != text.data() + text.size() || n == 0)
    {
        return std::nullopt;
    }
    return n - 1;
}

void report(const capsule::Error& err)
{
    using capsule::errc;
    switch (err.code)
    {
        case errc::time_locked:
            std::println(stderr, "Capsule locked until {}",
                         err.unlock_date ? datetime::format_date(*err.unlock_date) : std::string("(unknown)"));
            break;
        case errc::signature_invalid:
            std::println(stderr, "Signature verification failed! Capsule may be tampered.");
            break;
        case errc::keys_not_found:
            std::println(stderr, "No keys found. Run 'keygen' first. ({})", err.detail);
            break;
        case errc::index_out_of_range:
            std::println(stderr, "No such capsule: {}", err.detail);
            break;
        case errc::tag_mismatch:
            std::println(stderr, "Decryption failed: ciphertext or metadata was modified");
            break;
        default:
            std::println(stderr, "{}", err.what());
            break;
    }
}

std::optional<capsule::CapsuleStore> open_store(const Config& config)
{
    fs::path db_path = config.storage().resolved_capsule_db();
    if (db_path.has_parent_path())
    {
        std::error_code ec;
        fs::create_directories(db_path.parent_path(), ec);
        if (ec)
        {
            std::println(stderr, "Failed to create {}: {}", db_path.parent_path().string(), ec.message());
            return std::nullopt;
        }
    }
    auto store = capsule::CapsuleStore::open(db_path.string());
    if (!store)
    {
        report(store.error());
        return std::nullopt;
    }
    return std::move(*store);
}

int cmd_keygen(capsule::CapsuleService& svc, const capsule::KeyStore& keys)
{
    if (auto res = svc.generate_keys(); !res)
    {
        report(res.error());
        return 1;
    }
    std::println("Keys generated in {}", keys.directory().string());
    std::println("  KEM:       {}", keys.kem_path().string());
    std::println("  Signature: {}", keys.sig_path().string());
    return 0;
}

int cmd_create(capsule::CapsuleService& svc, std::string_view message, std::string_view date)
{
    auto res = svc.create_capsule(message, date, datetime::now());
    if (!res)
    {
        report(res.error());
        return 1;
    }
    std::println("Capsule #{} created", res->index + 1);
    std::println("  Created:  {}", datetime::format_timestamp(res->created_at));
    std::println("  Unlocks:  {}", datetime::format_date(res->unlock_date));
    if (res->status == capsule::LockStatus::unlockable)
    {
        std::println("  Note: unlock date has already passed; capsule can be opened now");
    }
    return 0;
}

int cmd_list(const capsule::CapsuleService& svc)
{
    auto res = svc.list_capsules(datetime::now());
    if (!res)
    {
        report(res.error());
        return 1;
    }
    if (res->empty())
    {
        std::println("No capsules found");
        return 0;
    }

    std::println("{:<6} {:<22} {:<12} {}", "#", "Created", "Unlocks", "Status");
    std::println("{}", std::string(50, '-'));
    for (const auto& s : *res)
    {
        std::println("{:<6} {:<22} {:<12} {}", s.index + 1,
                     datetime::format_timestamp(s.created_at),
                     datetime::format_date(s.unlock_date),
                     capsule::to_string(s.status));
    }
    return 0;
}

int cmd_decrypt(const capsule::CapsuleService& svc, size_t index)
{
    auto res = svc.decrypt_capsule(index, datetime::now());
    if (!res)
    {
        report(res.error());
        return 1;
    }
    std::println("Capsule #{} (created {}, unlocked {})", index + 1,
                 datetime::format_timestamp(res->created_at),
                 datetime::format_date(res->unlock_date));
    std::println("{}", res->plaintext);
    return 0;
}

int cmd_verify(const capsule::CapsuleService& svc, size_t index)
{
    auto res = svc.verify_capsule(index, datetime::now());
    if (!res)
    {
        report(res.error());
        return 1;
    }
    std::println("Capsule #{}: {}", index + 1, res->reason);
    std::println("  Created:  {}", datetime::format_timestamp(res->created_at));
    std::println("  Unlocks:  {} ({})", datetime::format_date(res->unlock_date), capsule::to_string(res->status));
    return res->verified ? 0 : 1;
}

int run(const Args& args, const Config& config, const char* prog)
{
    const auto& cmd = args.rest.front();
    const auto argc = args.rest.size();

    size_t index = 0;
    if ((cmd == "decrypt" || cmd == "verify") && argc == 2)
    {
        auto n = parse_number(args.rest[1]);
        if (!n)
        {
            std::println(stderr, "Capsule number must be a positive integer, got '{}'", args.rest[1]);
            return 1;
        }
        index = *n;
    }
    else if (cmd == "create" && argc == 3)
    {
        // Reject bad input before any file is created.
        capsule::CapsuleEngine probe(config.capsule().max_message_bytes);
        if (auto ok = probe.validate(args.rest[1], args.rest[2]); !ok)
        {
            report(ok.error());
            return 1;
        }
    }
    else if (!((cmd == "keygen" || cmd == "list") && argc == 1))
    {
        print_usage(prog);
        return 1;
    }

    auto store = open_store(config);
    if (!store)
    {
        return 1;
    }
    capsule::KeyStore keys(config.storage().resolved_keys_dir());
    capsule::CapsuleService svc(keys, *store, config.capsule().max_message_bytes);

    if (cmd == "keygen")
    {
        return cmd_keygen(svc, keys);
    }
    else if (cmd == "create")
    {
        return cmd_create(svc, args.rest[1], args.rest[2]);
    }
    else if (cmd == "list")
    {
        return cmd_list(svc);
    }
    else if (cmd == "decrypt")
    {
        return cmd_decrypt(svc, index);
    }
    return cmd_verify(svc, index);
}

} // namespace

int main(int argc, char** argv)
{
    auto args = parse_args(argc, argv);
    if (!args || args->rest.empty())
    {
        print_usage(argv[0]);
        return 1;
    }

    Config config;
    if (args->config_path)
    {
        auto loaded = Config::load(*args->config_path, args->data_dir);
        if (!loaded)
        {
            std::println(stderr, "Failed to load config: {}", loaded.error());
            return 1;
        }
        config = std::move(*loaded);
    }
    else
    {
        config = Config::load_or_defaults(std::string(default_config), args->data_dir);
    }

    const auto& log_cfg = config.logging();
    if (auto result = Logger::init(log_cfg.level, log_cfg.file, log_cfg.max_size_mb, log_cfg.enable_console);
        !result)
    {
        std::println(stderr, "Failed to initialize logger: {}", result.error());
        return 1;
    }

    int rc = 1;
    try
    {
        rc = run(*args, config, argv[0]);
    }
    catch (const std::exception& e)
    {
        LOG_ERROR("Fatal: {}", e.what());
        std::println(stderr, "Fatal: {}", e.what());
    }
    Logger::shutdown();
    return rc;
}
