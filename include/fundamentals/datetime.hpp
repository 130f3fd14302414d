#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace datetime
{

using date_t = std::chrono::year_month_day;
using timestamp_t = std::chrono::sys_seconds;

// Strict "YYYY-MM-DD", year 0001..9999, must name a real calendar day.
[[nodiscard]] std::optional<date_t> parse_date(std::string_view text);

// Strict "YYYY-MM-DDTHH:MM:SSZ" (UTC).
[[nodiscard]] std::optional<timestamp_t> parse_timestamp(std::string_view text);

[[nodiscard]] std::string format_date(date_t date);
[[nodiscard]] std::string format_timestamp(timestamp_t ts);

[[nodiscard]] timestamp_t now();
[[nodiscard]] timestamp_t start_of(date_t date);

inline constexpr size_t date_len = 10;
inline constexpr size_t timestamp_len = 20;

} // namespace datetime
