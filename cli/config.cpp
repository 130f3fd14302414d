#include "config.hpp"

#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <format>
#include <print>
#include <system_error>

namespace {

template<std::unsigned_integral Ty>
std::expected<Ty, std::string> get_uint(const json::object& obj, std::string_view key,
                                        Ty min_val, Ty max_val, Ty default_val)
{
    auto it = obj.find(key);
    if (it == obj.end())
    {
        return default_val;
    }
    if (!it->value().is_int64() && !it->value().is_uint64())
    {
        return std::unexpected(std::format("'{}' must be an integer", key));
    }
    if (it->value().is_int64() && it->value().as_int64() < 0)
    {
        return std::unexpected(std::format("'{}' must be between {} and {}", key, min_val, max_val));
    }
    auto val = it->value().to_number<uint64_t>();
    if (val < static_cast<uint64_t>(min_val) || val > static_cast<uint64_t>(max_val))
    {
        return std::unexpected(std::format("'{}' must be between {} and {}",
                                           key, min_val, max_val));
    }
    return static_cast<Ty>(val);
}

std::expected<std::string, std::string> get_string(const json::object& obj, std::string_view key, std::string_view default_val)
{
    auto it = obj.find(key);
    if (it == obj.end())
    {
        return std::string(default_val);
    }
    if (!it->value().is_string())
    {
        return std::unexpected(std::format("'{}' must be a string", key));
    }
    return std::string(it->value().as_string());
}

bool get_bool(const json::object& obj, std::string_view key, bool default_val)
{
    auto it = obj.find(key);
    if (it == obj.end() || !it->value().is_bool())
    {
        return default_val;
    }
    return it->value().as_bool();
}

const json::object* section(const json::object& root, std::string_view name)
{
    auto it = root.find(name);
    if (it == root.end() || !it->value().is_object())
    {
        return nullptr;
    }
    return std::addressof(it->value().as_object());
}

} // namespace

std::string Config::StorageCfg::resolved_keys_dir() const
{
    if (!keys_dir.empty())
    {
        return keys_dir;
    }
    return (std::filesystem::path(data_dir) / "keys").string();
}

std::string Config::StorageCfg::resolved_capsule_db() const
{
    if (!capsule_db.empty())
    {
        return capsule_db;
    }
    return (std::filesystem::path(data_dir) / "capsules.db").string();
}

std::expected<Config, std::string> Config::load(const std::string& filepath, std::optional<std::string> cli_data_dir)
{
    std::ifstream file(filepath);
    if (!file.is_open())
    {
        return std::unexpected(std::format("Failed to open config file: {}", filepath));
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    json::value jv;
    try
    {
        jv = json::parse(buffer.str());
    }
    catch (const std::exception& e)
    {
        return std::unexpected(std::format("JSON parse error: {}", e.what()));
    }
    auto result = parse(jv);
    if (result && cli_data_dir.has_value())
    {
        result->store.data_dir = *cli_data_dir;
    }
    return result;
}

Config Config::load_defaults(std::optional<std::string> cli_data_dir)
{
    Config cfg{};
    if (cli_data_dir.has_value())
    {
        cfg.store.data_dir = *cli_data_dir;
    }
    return cfg;
}

Config Config::load_or_defaults(const std::string& filepath, std::optional<std::string> cli_data_dir)
{
    std::error_code ec;
    if (!std::filesystem::exists(filepath, ec))
    {
        return load_defaults(cli_data_dir);
    }
    auto result = load(filepath, cli_data_dir);
    if (result)
    {
        return *result;
    }
    std::println(stderr, "Ignoring {}: {}", filepath, result.error());
    return load_defaults(cli_data_dir);
}

std::expected<Config, std::string> Config::parse(const json::value& jv)
{
    if (!jv.is_object())
    {
        return std::unexpected("Config root must be a JSON object");
    }
    const auto& root = jv.as_object();
    Config config;

    if (const auto* st = section(root, "storage"))
    {
        auto data_dir = get_string(*st, "data_dir", "data");
        auto keys_dir = get_string(*st, "keys_dir", "");
        auto capsule_db = get_string(*st, "capsule_db", "");
        if (!data_dir)
        {
            return std::unexpected(data_dir.error());
        }
        if (!keys_dir)
        {
            return std::unexpected(keys_dir.error());
        }
        if (!capsule_db)
        {
            return std::unexpected(capsule_db.error());
        }
        if (data_dir->empty())
        {
            return std::unexpected("'data_dir' must not be empty");
        }
        config.store.data_dir = std::move(*data_dir);
        config.store.keys_dir = std::move(*keys_dir);
        config.store.capsule_db = std::move(*capsule_db);
    }

    if (const auto* cap = section(root, "capsule"))
    {
        if (auto max_msg = get_uint<size_t>(*cap, "max_message_bytes", 1, 64 * 1024 * 1024, 1024 * 1024); max_msg)
        {
            config.cap.max_message_bytes = *max_msg;
        }
        else
        {
            return std::unexpected(max_msg.error());
        }
    }

    if (const auto* log = section(root, "logging"))
    {
        auto level = get_string(*log, "level", "info");
        auto file = get_string(*log, "file", "");
        if (!level)
        {
            return std::unexpected(level.error());
        }
        if (!file)
        {
            return std::unexpected(file.error());
        }
        config.log.level = std::move(*level);
        config.log.file = std::move(*file);
        if (auto max_size = get_uint<size_t>(*log, "max_size_mb", 1, 10000, 100); max_size)
        {
            config.log.max_size_mb = *max_size;
        }
        else
        {
            return std::unexpected(max_size.error());
        }
        config.log.enable_console = get_bool(*log, "enable_console", true);
    }
    return config;
}
