#include <vc/coerce.h>
#include <cctype>
#include <charconv>
#include <cmath>
#include <limits>

namespace vc {

static std::string to_lower_ascii(const std::string& s) {
    std::string out = s;
    for (char& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

static bool is_digit(char c) { return c >= '0' && c <= '9'; }

std::optional<bool> parse_bool_literal(const std::string& text) {
    const std::string t = to_lower_ascii(text);
    if (t == "true" || t == "t" || t == "yes" || t == "y" || t == "on" || t == "1") return true;
    if (t == "false" || t == "f" || t == "no" || t == "n" || t == "off" || t == "0") return false;
    return std::nullopt;
}

std::optional<int64_t> parse_int_literal(const std::string& text, bool allow_zero_fraction) {
    size_t start = 0;
    bool negative = false;
    if (!text.empty() && (text[0] == '+' || text[0] == '-')) {
        negative = text[0] == '-';
        start = 1;
    }
    size_t end = start;
    while (end < text.size() && is_digit(text[end])) ++end;
    if (end == start) return std::nullopt;
    if (end != text.size()) {
        if (!allow_zero_fraction || text[end] != '.') return std::nullopt;
        for (size_t k = end + 1; k < text.size(); ++k)
            if (text[k] != '0') return std::nullopt;
    }
    // from_chars takes the minus sign but not a plus sign
    std::string digits = (negative ? "-" : "") + text.substr(start, end - start);
    int64_t v = 0;
    auto res = std::from_chars(digits.data(), digits.data() + digits.size(), v);
    if (res.ec != std::errc() || res.ptr != digits.data() + digits.size()) return std::nullopt;
    return v;
}

std::optional<double> parse_float_literal(const std::string& text) {
    size_t i = 0;
    bool negative = false;
    if (i < text.size() && (text[i] == '+' || text[i] == '-')) {
        negative = text[i] == '-';
        ++i;
    }
    const std::string word = to_lower_ascii(text.substr(i));
    if (word == "inf" || word == "infinity")
        return negative ? -std::numeric_limits<double>::infinity() : std::numeric_limits<double>::infinity();
    if (word == "nan") return std::numeric_limits<double>::quiet_NaN();

    const size_t number_start = i;
    // decimal exponent of the first significant digit, used to tell overflow
    // from underflow when from_chars reports the value out of range
    long magnitude = 0;
    bool significant = false;
    size_t int_digits = 0, frac_digits = 0;
    while (i < text.size() && is_digit(text[i])) {
        if (significant || text[i] != '0') {
            significant = true;
            ++magnitude;
        }
        ++i;
        ++int_digits;
    }
    if (i < text.size() && text[i] == '.') {
        ++i;
        while (i < text.size() && is_digit(text[i])) {
            if (!significant) {
                if (text[i] != '0') significant = true;
                else --magnitude;
            }
            ++i;
            ++frac_digits;
        }
    }
    if (int_digits == 0 && frac_digits == 0) return std::nullopt;
    if (i < text.size() && (text[i] == 'e' || text[i] == 'E')) {
        ++i;
        bool exp_negative = false;
        if (i < text.size() && (text[i] == '+' || text[i] == '-')) {
            exp_negative = text[i] == '-';
            ++i;
        }
        size_t exp_digits = 0;
        long exponent = 0;
        while (i < text.size() && is_digit(text[i])) {
            if (exponent < 100000) exponent = exponent * 10 + (text[i] - '0');
            ++i;
            ++exp_digits;
        }
        if (exp_digits == 0) return std::nullopt;
        magnitude += exp_negative ? -exponent : exponent;
    }
    if (i != text.size()) return std::nullopt;

    // from_chars is locale-independent and takes no leading '+'. It rounds
    // correctly: "1.10" and "1.1" give the same double.
    double v = 0.0;
    const char* first = text.data() + number_start;
    const char* last = text.data() + text.size();
    auto res = std::from_chars(first, last, v);
    if (res.ec == std::errc::result_out_of_range) {
        // too small to represent: the nearest double is zero
        if (significant && magnitude <= 0) return negative ? -0.0 : 0.0;
        return std::nullopt;
    }
    if (res.ec != std::errc() || res.ptr != last) return std::nullopt;
    return negative ? -v : v;
}

std::optional<bool> coerce_bool(const Input& input, ValidationState& state) {
    switch (input.kind()) {
        case Input::Kind::Bool:
            return input.asBool();
        case Input::Kind::Int:
            if (state.strict()) break;
            if (input.asInt() == 0) return false;
            if (input.asInt() == 1) return true;
            state.fail(ErrorKind::BoolParsing, input);
            return std::nullopt;
        case Input::Kind::Text:
        case Input::Kind::Bytes: {
            // strict mode only takes a native bool
            if (state.strict()) break;
            auto text = canonical_text(input);
            if (!text) break;
            if (auto b = parse_bool_literal(*text)) return b;
            state.fail(ErrorKind::BoolParsing, input);
            return std::nullopt;
        }
        default:
            break;
    }
    state.fail(ErrorKind::StringType, input);
    return std::nullopt;
}

std::optional<int64_t> coerce_int(const Input& input, ValidationState& state) {
    switch (input.kind()) {
        case Input::Kind::Int:
            return input.asInt();
        case Input::Kind::Bool:
            if (state.strict()) break;
            return int64_t(input.asBool() ? 1 : 0);
        case Input::Kind::Float: {
            if (state.strict()) break;
            double x = input.asDouble();
            if (!std::isfinite(x)) {
                state.fail(ErrorKind::FiniteNumber, input);
                return std::nullopt;
            }
            if (std::trunc(x) != x) {
                state.fail(ErrorKind::IntFromFloat, input);
                return std::nullopt;
            }
            // 2^63 is exactly representable; anything at or beyond it does not fit
            if (x < -9223372036854775808.0 || x >= 9223372036854775808.0) {
                state.fail(ErrorKind::IntParsing, input);
                return std::nullopt;
            }
            return static_cast<int64_t>(x);
        }
        default: {
            auto text = canonical_text(input);
            if (!text) break;
            if (auto v = parse_int_literal(*text, !state.strict())) return v;
            state.fail(ErrorKind::IntParsing, input);
            return std::nullopt;
        }
    }
    state.fail(ErrorKind::StringType, input);
    return std::nullopt;
}

std::optional<double> coerce_float(const Input& input, bool allow_inf_nan, ValidationState& state) {
    std::optional<double> out;
    switch (input.kind()) {
        case Input::Kind::Float:
            out = input.asDouble();
            break;
        case Input::Kind::Int:
            out = static_cast<double>(input.asInt());
            break;
        case Input::Kind::Bool:
            if (state.strict()) {
                state.fail(ErrorKind::StringType, input);
                return std::nullopt;
            }
            out = input.asBool() ? 1.0 : 0.0;
            break;
        default: {
            auto text = canonical_text(input);
            if (!text) {
                state.fail(ErrorKind::StringType, input);
                return std::nullopt;
            }
            out = parse_float_literal(*text);
            if (!out) {
                state.fail(ErrorKind::FloatParsing, input);
                return std::nullopt;
            }
            break;
        }
    }
    if (!allow_inf_nan && !std::isfinite(*out)) {
        state.fail(ErrorKind::FiniteNumber, input);
        return std::nullopt;
    }
    return out;
}

// Lax narrowing of a datetime to a date: only exact midnight is lossless. The
// UTC offset, if any, belongs to that midnight and is dropped.
static std::optional<Date> date_from_datetime(const DateTime& dt, const Input& input, ValidationState& state) {
    if (dt.time.is_midnight()) return dt.date;
    state.fail(ErrorKind::DateFromDatetimeInexact, input);
    return std::nullopt;
}

std::optional<Date> coerce_date(const Input& input, ValidationState& state) {
    if (input.is_date()) return input.asDate();
    if (input.is_datetime() && !state.strict()) return date_from_datetime(input.asDateTime(), input, state);

    auto text = canonical_text(input);
    if (!text) {
        state.fail(ErrorKind::StringType, input);
        return std::nullopt;
    }
    auto parsed = parse_date(*text);
    if (parsed) return parsed.value;

    // strict mode never tries the datetime path
    if (!state.strict()) {
        auto dt = parse_datetime(*text, false);
        if (dt) return date_from_datetime(*dt.value, input, state);
    }
    state.fail(ErrorKind::DateParsing, input, {{"error", parsed.error}});
    return std::nullopt;
}

std::optional<DateTime> coerce_datetime(const Input& input, ValidationState& state) {
    if (input.is_datetime()) return input.asDateTime();
    if (input.is_date() && !state.strict()) {
        DateTime dt;
        dt.date = input.asDate();
        return dt;
    }
    auto text = canonical_text(input);
    if (!text) {
        state.fail(ErrorKind::StringType, input);
        return std::nullopt;
    }
    auto parsed = parse_datetime(*text, state.strict());
    if (parsed) return parsed.value;
    state.fail(ErrorKind::DatetimeParsing, input, {{"error", parsed.error}});
    return std::nullopt;
}

}  // namespace vc
