#pragma once
#include <boost/json.hpp>
#include <string>
#include <string_view>
#include <expected>
#include <format>
#include <utility>

namespace json_utils
{

inline std::expected<boost::json::object, std::string> parse_object(std::string_view text)
{
    boost::system::error_code ec;
    auto jv = boost::json::parse(text, ec);
    if (ec)
    {
        return std::unexpected(std::format("JSON parse error: {}", ec.message()));
    }
    if (!jv.is_object())
    {
        return std::unexpected(std::string("JSON root must be an object"));
    }
    return std::move(jv.as_object());
}

inline std::expected<std::string, std::string> extract_str(const boost::json::object& obj, std::string_view key)
{
    auto it = obj.find(key);
    if (it == obj.end())
    {
        return std::unexpected(std::format("\"{}\" field required", key));
    }
    if (!it->value().is_string())
    {
        return std::unexpected(std::format("\"{}\" must be a string", key));
    }

    return static_cast<std::string>(it->value().as_string());
}

} // namespace json_utils
