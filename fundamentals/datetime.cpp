#include "fundamentals/datetime.hpp"

#include <charconv>
#include <format>

namespace datetime
{

namespace {

template<std::unsigned_integral Ty>
std::optional<Ty> fixed_digits(std::string_view text, size_t pos, size_t width)
{
    if (pos + width > text.size())
    {
        return std::nullopt;
    }
    auto field = text.substr(pos, width);
    for (char ch : field)
    {
        if (ch < '0' || ch > '9')
        {
            return std::nullopt;
        }
    }
    Ty val = 0;
    auto [ptr, ec] = std::from_chars(field.data(), field.data() + field.size(), val);
    if (ec != std::errc{} || ptr != field.data() + field.size())
    {
        return std::nullopt;
    }
    return val;
}

std::optional<date_t> parse_date_prefix(std::string_view text)
{
    if (text.size() < date_len || text[4] != '-' || text[7] != '-')
    {
        return std::nullopt;
    }
    auto y = fixed_digits<unsigned>(text, 0, 4);
    auto m = fixed_digits<unsigned>(text, 5, 2);
    auto d = fixed_digits<unsigned>(text, 8, 2);
    if (!y || !m || !d || *y == 0)
    {
        return std::nullopt;
    }

    date_t date{std::chrono::year(static_cast<int>(*y)), std::chrono::month(*m), std::chrono::day(*d)};
    if (!date.ok())
    {
        return std::nullopt;
    }
    return date;
}

} // namespace

std::optional<date_t> parse_date(std::string_view text)
{
    if (text.size() != date_len)
    {
        return std::nullopt;
    }
    return parse_date_prefix(text);
}

std::optional<timestamp_t> parse_timestamp(std::string_view text)
{
    if (text.size() != timestamp_len || text[10] != 'T' ||
        text[13] != ':' || text[16] != ':' || text[19] != 'Z')
    {
        return std::nullopt;
    }
    auto date = parse_date_prefix(text);
    auto hh = fixed_digits<unsigned>(text, 11, 2);
    auto mm = fixed_digits<unsigned>(text, 14, 2);
    auto ss = fixed_digits<unsigned>(text, 17, 2);
    if (!date || !hh || !mm || !ss || *hh > 23 || *mm > 59 || *ss > 59)
    {
        return std::nullopt;
    }

    return start_of(*date) + std::chrono::hours(*hh) + std::chrono::minutes(*mm) + std::chrono::seconds(*ss);
}

std::string format_date(date_t date)
{
    return std::format("{:04}-{:02}-{:02}",
                       static_cast<int>(date.year()),
                       static_cast<unsigned>(date.month()),
                       static_cast<unsigned>(date.day()));
}

std::string format_timestamp(timestamp_t ts)
{
    auto day = std::chrono::floor<std::chrono::days>(ts);
    std::chrono::hh_mm_ss hms(ts - day);
    return std::format("{}T{:02}:{:02}:{:02}Z",
                       format_date(date_t(day)),
                       hms.hours().count(),
                       hms.minutes().count(),
                       hms.seconds().count());
}

timestamp_t now()
{
    return std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
}

timestamp_t start_of(date_t date)
{
    return std::chrono::sys_days(date);
}

} // namespace datetime
