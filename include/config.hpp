#pragma once

#include <boost/json.hpp>
#include <string>
#include <expected>
#include <optional>
#include <cstdint>

namespace json = boost::json;

/**
 * Application configuration loaded from JSON file.
 * Load-once at startup, immutable thereafter.
 */
class Config
{
public:
    struct StorageCfg
    {
        std::string data_dir = "data";
        std::string keys_dir = "";
        std::string capsule_db = "";

        // Empty overrides fall back to locations under data_dir.
        [[nodiscard]] std::string resolved_keys_dir() const;
        [[nodiscard]] std::string resolved_capsule_db() const;
    };

    struct CapsuleCfg
    {
        size_t max_message_bytes = 1024 * 1024;
    };

    struct LoggingCfg
    {
        std::string level = "info";
        std::string file = "";
        size_t max_size_mb = 100;
        bool enable_console = true;
    };

    [[nodiscard]] static std::expected<Config, std::string> load(const std::string& filepath, std::optional<std::string> cli_data_dir = std::nullopt);
    [[nodiscard]] static Config load_defaults(std::optional<std::string> cli_data_dir = std::nullopt);
    // Defaults when the file is absent; a present but invalid file is reported on stderr and ignored.
    [[nodiscard]] static Config load_or_defaults(const std::string& filepath, std::optional<std::string> cli_data_dir = std::nullopt);

    [[nodiscard]] const StorageCfg& storage() const { return store; }
    [[nodiscard]] const CapsuleCfg& capsule() const { return cap; }
    [[nodiscard]] const LoggingCfg& logging() const { return log; }

private:
    StorageCfg store;
    CapsuleCfg cap;
    LoggingCfg log;

    [[nodiscard]] static std::expected<Config, std::string> parse(const json::value& jv);
};
