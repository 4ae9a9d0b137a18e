#include <vc/datetime.h>
#include <cstdio>
#include <cstdlib>
#include <sstream>
#include <iomanip>

namespace vc {

bool is_leap_year(int32_t year) noexcept { return (year % 4 == 0 && year % 100 != 0) || (year % 400 == 0); }

int days_in_month(int32_t year, int month) noexcept {
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) return 0;
    if (month == 2 && is_leap_year(year)) return 29;
    return days[month - 1];
}

std::string Date::iso() const {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", static_cast<int>(year), static_cast<unsigned>(month),
                  static_cast<unsigned>(day));
    return buf;
}

bool Time::operator<(const Time& rhs) const noexcept {
    if (hour != rhs.hour) return hour < rhs.hour;
    if (minute != rhs.minute) return minute < rhs.minute;
    if (second != rhs.second) return second < rhs.second;
    if (microsecond != rhs.microsecond) return microsecond < rhs.microsecond;
    return tz_offset < rhs.tz_offset;
}

std::string Time::iso() const {
    std::ostringstream ss;
    ss << std::setfill('0') << std::setw(2) << unsigned(hour) << ':' << std::setw(2) << unsigned(minute) << ':'
       << std::setw(2) << unsigned(second);
    if (microsecond != 0) ss << '.' << std::setw(6) << microsecond;
    if (tz_offset.has_value()) {
        int32_t off = *tz_offset;
        if (off == 0) {
            ss << 'Z';
        } else {
            ss << (off < 0 ? '-' : '+');
            off = std::abs(off);
            ss << std::setw(2) << off / 3600 << ':' << std::setw(2) << (off % 3600) / 60;
        }
    }
    return ss.str();
}

std::string DateTime::iso() const { return date.iso() + "T" + time.iso(); }

namespace {
    struct Cursor {
        const std::string& s;
        size_t i = 0;

        explicit Cursor(const std::string& str) : s(str) {}

        char peek() const { return i < s.size() ? s[i] : '\0'; }
        bool at_end() const { return i >= s.size(); }
        size_t remaining() const { return i < s.size() ? s.size() - i : 0; }

        static bool is_digit(char c) { return c >= '0' && c <= '9'; }

        // read exactly `width` digits
        bool digits(int width, int& out) {
            if (remaining() < static_cast<size_t>(width)) return false;
            int v = 0;
            for (int k = 0; k < width; ++k) {
                char c = s[i + k];
                if (not is_digit(c)) return false;
                v = v * 10 + (c - '0');
            }
            i += width;
            out = v;
            return true;
        }
    };

    // Shared date part of both grammars. Leaves the cursor after the day.
    bool read_date(Cursor& c, Date& out, std::string& error) {
        if (c.remaining() < 10) {
            error = "input is too short";
            return false;
        }
        int year = 0, month = 0, day = 0;
        if (not c.digits(4, year)) {
            error = "invalid character in year";
            return false;
        }
        if (c.peek() != '-') {
            error = "invalid date separator, expected `-`";
            return false;
        }
        ++c.i;
        if (not c.digits(2, month)) {
            error = "invalid character in month";
            return false;
        }
        if (c.peek() != '-') {
            error = "invalid date separator, expected `-`";
            return false;
        }
        ++c.i;
        if (not c.digits(2, day)) {
            error = "invalid character in day";
            return false;
        }
        if (month < 1 || month > 12) {
            error = "month value is outside expected range of 1-12";
            return false;
        }
        if (day < 1 || day > days_in_month(year, month)) {
            error = "day value is outside expected range";
            return false;
        }
        out = Date{year, static_cast<uint8_t>(month), static_cast<uint8_t>(day)};
        return true;
    }

    bool read_offset(Cursor& c, bool strict, Time& t, std::string& error) {
        char sign = c.peek();
        if (sign == 'Z' || (not strict && sign == 'z')) {
            ++c.i;
            t.tz_offset = 0;
            return true;
        }
        if (sign != '+' && sign != '-') {
            error = "invalid timezone sign";
            return false;
        }
        ++c.i;
        int hh = 0, mm = 0;
        if (not c.digits(2, hh)) {
            error = "invalid timezone hour";
            return false;
        }
        if (c.peek() == ':') {
            ++c.i;
            if (not c.digits(2, mm)) {
                error = "invalid timezone minute";
                return false;
            }
        } else if (strict) {
            error = "invalid time separator, expected `:`";
            return false;
        } else if (not c.at_end()) {
            if (not c.digits(2, mm)) {
                error = "invalid timezone minute";
                return false;
            }
        }
        if (hh > 23) {
            error = "timezone offset must be less than 24 hours";
            return false;
        }
        if (mm > 59) {
            error = "timezone offset minute is outside expected range of 0-59";
            return false;
        }
        int32_t off = hh * 3600 + mm * 60;
        t.tz_offset = sign == '-' ? -off : off;
        return true;
    }

    bool read_time(Cursor& c, bool strict, Time& t, std::string& error) {
        int hh = 0, mm = 0, ss = 0;
        if (not c.digits(2, hh)) {
            error = c.remaining() < 2 ? "input is too short" : "invalid character in hour";
            return false;
        }
        if (c.peek() != ':') {
            error = "invalid time separator, expected `:`";
            return false;
        }
        ++c.i;
        if (not c.digits(2, mm)) {
            error = c.remaining() < 2 ? "input is too short" : "invalid character in minute";
            return false;
        }
        if (c.peek() == ':') {
            ++c.i;
            if (not c.digits(2, ss)) {
                error = c.remaining() < 2 ? "input is too short" : "invalid character in second";
                return false;
            }
            char sep = c.peek();
            if (sep == '.' || (not strict && sep == ',')) {
                ++c.i;
                uint32_t micro = 0;
                int count = 0;
                while (Cursor::is_digit(c.peek())) {
                    if (count < 6) micro = micro * 10 + static_cast<uint32_t>(c.peek() - '0');
                    ++count;
                    ++c.i;
                }
                if (count == 0) {
                    error = "second fraction is missing digits";
                    return false;
                }
                if (strict && count > 6) {
                    error = "second fraction value is more than 6 digits long";
                    return false;
                }
                for (int k = count; k < 6; ++k) micro *= 10;
                t.microsecond = micro;
            }
        } else if (strict) {
            error = c.at_end() ? "input is too short" : "invalid time separator, expected `:`";
            return false;
        }
        if (hh > 23) {
            error = "hour value is outside expected range of 0-23";
            return false;
        }
        if (mm > 59) {
            error = "minute value is outside expected range of 0-59";
            return false;
        }
        if (ss > 59) {
            error = "second value is outside expected range of 0-59";
            return false;
        }
        t.hour = static_cast<uint8_t>(hh);
        t.minute = static_cast<uint8_t>(mm);
        t.second = static_cast<uint8_t>(ss);
        if (not c.at_end()) return read_offset(c, strict, t, error);
        return true;
    }
}  // namespace

ParseOutcome<Date> parse_date(const std::string& text) {
    ParseOutcome<Date> out;
    Cursor c(text);
    Date d;
    if (not read_date(c, d, out.error)) return out;
    if (not c.at_end()) {
        out.error = "unexpected extra characters at the end of the input";
        return out;
    }
    out.value = d;
    return out;
}

ParseOutcome<DateTime> parse_datetime(const std::string& text, bool strict) {
    ParseOutcome<DateTime> out;
    Cursor c(text);
    DateTime dt;
    if (not read_date(c, dt.date, out.error)) return out;
    if (c.at_end()) {
        if (strict) {
            out.error = "input is too short";
            return out;
        }
        out.value = dt;
        return out;
    }
    char sep = c.peek();
    bool sep_ok = strict ? sep == 'T' : (sep == 'T' || sep == 't' || sep == ' ');
    if (not sep_ok) {
        out.error = strict ? "invalid datetime separator, expected `T`"
                           : "invalid datetime separator, expected `T`, `t` or space";
        return out;
    }
    ++c.i;
    if (not read_time(c, strict, dt.time, out.error)) return out;
    if (not c.at_end()) {
        out.error = "unexpected extra characters at the end of the input";
        return out;
    }
    out.value = dt;
    return out;
}

}  // namespace vc
