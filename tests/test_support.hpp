#pragma once

#include "fundamentals/datetime.hpp"

#include <chrono>
#include <filesystem>
#include <random>
#include <string>
#include <string_view>
#include <system_error>

namespace test_support
{

// Unique directory under the system temp dir, removed on scope exit.
class TempDir
{
public:
    explicit TempDir(std::string_view tag)
    {
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() /
                (std::string("qcapsule_") + std::string(tag) + "_" + std::to_string(rd()));
        std::filesystem::create_directories(path_);
    }

    ~TempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }
    [[nodiscard]] std::filesystem::path operator/(std::string_view name) const { return path_ / name; }

private:
    std::filesystem::path path_;
};

inline datetime::timestamp_t at(int y, unsigned m, unsigned d, int hh = 0, int mm = 0, int ss = 0)
{
    using namespace std::chrono;
    return datetime::start_of(year_month_day{year(y), month(m), day(d)}) + hours(hh) + minutes(mm) + seconds(ss);
}

} // namespace test_support
