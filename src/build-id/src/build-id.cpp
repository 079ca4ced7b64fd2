#include "runmap/build-id/build-id.h"

#include <array>
#include <chrono>
#include <iomanip>
#include <sstream>

namespace runmap::build_id {

namespace {

constexpr std::size_t MAX_FIELD_DIGITS = 4;
constexpr std::array<char, 5> SEPARATORS = {'-', '-', '_', '-', '-'};

bool
is_digit(char c)
{
    return c >= '0' && c <= '9';
}

// Reads 1..MAX_FIELD_DIGITS digits starting at pos
bool
read_field(std::string_view text, std::size_t& pos, int& value)
{
    std::size_t start = pos;
    value = 0;
    while (pos < text.size() && pos - start < MAX_FIELD_DIGITS &&
           is_digit(text[pos]))
    {
        value = value * 10 + (text[pos] - '0');
        ++pos;
    }
    return pos > start;
}

}  // namespace

std::optional<std::int64_t>
parse(std::string_view id)
{
    // year, month, day, hour, minute, second
    std::array<int, 6> fields{};
    std::size_t pos = 0;

    for (std::size_t i = 0; i < fields.size(); ++i)
    {
        if (i > 0)
        {
            if (pos >= id.size() || id[pos] != SEPARATORS[i - 1])
                return std::nullopt;
            ++pos;
        }
        if (!read_field(id, pos, fields[i]))
            return std::nullopt;
    }

    if (pos != id.size())
        return std::nullopt;

    using namespace std::chrono;

    // Roll month and day over the calendar instead of rejecting them
    year_month_day first{year{fields[0]}, January, day{1}};
    first += months{fields[1] - 1};
    sys_days date = sys_days{first} + days{fields[2] - 1};

    auto instant =
        date + hours{fields[3]} + minutes{fields[4]} + seconds{fields[5]};
    return static_cast<std::int64_t>(
        duration_cast<seconds>(instant.time_since_epoch()).count());
}

std::string
format(std::int64_t epoch_seconds)
{
    using namespace std::chrono;

    sys_seconds instant{seconds{epoch_seconds}};
    sys_days date = floor<days>(instant);
    year_month_day ymd{date};
    hh_mm_ss<seconds> time{instant - date};

    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(4) << static_cast<int>(ymd.year())
        << '-' << std::setw(2) << static_cast<unsigned>(ymd.month()) << '-'
        << std::setw(2) << static_cast<unsigned>(ymd.day()) << '_'
        << std::setw(2) << time.hours().count() << '-' << std::setw(2)
        << time.minutes().count() << '-' << std::setw(2)
        << time.seconds().count();
    return oss.str();
}

bool
is_canonical(std::string_view id)
{
    auto parsed = parse(id);
    return parsed && format(*parsed) == id;
}

}  // namespace runmap::build_id
