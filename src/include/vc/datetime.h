#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace vc {

struct Date {
    int32_t year = 1970;
    uint8_t month = 1;
    uint8_t day = 1;

    bool operator==(const Date& rhs) const noexcept {
        return year == rhs.year && month == rhs.month && day == rhs.day;
    }
    bool operator!=(const Date& rhs) const noexcept { return not(*this == rhs); }
    bool operator<(const Date& rhs) const noexcept {
        if (year != rhs.year) return year < rhs.year;
        if (month != rhs.month) return month < rhs.month;
        return day < rhs.day;
    }

    // YYYY-MM-DD
    std::string iso() const;
};

struct Time {
    uint8_t hour = 0;
    uint8_t minute = 0;
    uint8_t second = 0;
    uint32_t microsecond = 0;
    // UTC offset in seconds; empty for a naive time
    std::optional<int32_t> tz_offset;

    bool is_midnight() const noexcept { return hour == 0 && minute == 0 && second == 0 && microsecond == 0; }

    bool operator==(const Time& rhs) const noexcept {
        return hour == rhs.hour && minute == rhs.minute && second == rhs.second &&
               microsecond == rhs.microsecond && tz_offset == rhs.tz_offset;
    }
    bool operator!=(const Time& rhs) const noexcept { return not(*this == rhs); }
    bool operator<(const Time& rhs) const noexcept;

    // HH:MM:SS[.ffffff][Z|+HH:MM]
    std::string iso() const;
};

struct DateTime {
    Date date;
    Time time;

    bool operator==(const DateTime& rhs) const noexcept { return date == rhs.date && time == rhs.time; }
    bool operator!=(const DateTime& rhs) const noexcept { return not(*this == rhs); }
    bool operator<(const DateTime& rhs) const noexcept {
        if (date != rhs.date) return date < rhs.date;
        return time < rhs.time;
    }

    std::string iso() const;
};

inline DateTime make_datetime(int32_t year, int month, int day, int hour = 0, int minute = 0, int second = 0,
                              uint32_t microsecond = 0) {
    DateTime dt;
    dt.date = Date{year, static_cast<uint8_t>(month), static_cast<uint8_t>(day)};
    dt.time.hour = static_cast<uint8_t>(hour);
    dt.time.minute = static_cast<uint8_t>(minute);
    dt.time.second = static_cast<uint8_t>(second);
    dt.time.microsecond = microsecond;
    return dt;
}

bool is_leap_year(int32_t year) noexcept;
int days_in_month(int32_t year, int month) noexcept;

// Outcome of a temporal parse: either a value or a short reason used as the
// `error` context of date_parsing / datetime_parsing.
template <typename T>
struct ParseOutcome {
    std::optional<T> value;
    std::string error;

    explicit operator bool() const noexcept { return value.has_value(); }
};

// Parse exactly `YYYY-MM-DD`.
ParseOutcome<Date> parse_date(const std::string& text);

// Parse an ISO-8601 date-time.
//
// strict grammar:
//   date 'T' HH ':' MM ':' SS ( '.' [0-9]{1,6} )? ( 'Z' | [+-] HH ':' MM )?
// lax grammar:
//   date ( [Tt ] HH ':' MM ( ':' SS ( [.,] [0-9]+ )? )? ( [Zz] | [+-] HH ( ':'? MM )? )? )?
//
// Fractional seconds are scaled to microseconds by truncation.
ParseOutcome<DateTime> parse_datetime(const std::string& text, bool strict);

}  // namespace vc
