#include <vc/errors.h>
#include <sstream>

namespace vc {

namespace {
    struct KindInfo {
        ErrorKind kind;
        const char* name;
        const char* message;
    };

    const KindInfo kKinds[] = {
        {ErrorKind::StringType, "string_type", "Input should be a valid string"},
        {ErrorKind::BoolParsing, "bool_parsing", "Input should be a valid boolean, unable to interpret input"},
        {ErrorKind::IntParsing, "int_parsing", "Input should be a valid integer, unable to parse string as an integer"},
        {ErrorKind::IntFromFloat, "int_from_float", "Input should be a valid integer, got a number with a fractional part"},
        {ErrorKind::FloatParsing, "float_parsing", "Input should be a valid number, unable to parse string as a number"},
        {ErrorKind::FiniteNumber, "finite_number", "Input should be a finite number"},
        {ErrorKind::DateParsing, "date_parsing", "Input should be a valid date in the format YYYY-MM-DD, {error}"},
        {ErrorKind::DateFromDatetimeInexact, "date_from_datetime_inexact",
         "Datetimes provided to dates should have zero time - e.g. be exact dates"},
        {ErrorKind::DatetimeParsing, "datetime_parsing", "Input should be a valid datetime, {error}"},
        {ErrorKind::DictType, "dict_type", "Input should be a valid dictionary"},
        {ErrorKind::TooShort, "too_short",
         "Dictionary should have at least {min_length} items after validation, not {actual_length}"},
        {ErrorKind::TooLong, "too_long",
         "Dictionary should have at most {max_length} items after validation, not {actual_length}"},
        {ErrorKind::JsonInvalid, "json_invalid", "Invalid JSON: {error}"},
    };

    const KindInfo& info(ErrorKind kind) {
        for (auto const& k : kKinds)
            if (k.kind == kind) return k;
        throw std::logic_error("Not a valid error kind");
    }

    std::string context_to_string(const ContextValue& v) {
        if (auto s = std::get_if<std::string>(&v)) return *s;
        return std::to_string(std::get<int64_t>(v));
    }

    bool is_utf8_continuation(char c) { return (static_cast<unsigned char>(c) & 0xC0) == 0x80; }

    // Shorten long reprs in the middle so both ends stay visible. Cuts land on
    // UTF-8 lead bytes so no code point is split.
    std::string truncate_middle(const std::string& s, size_t maxlen = 50) {
        if (s.size() <= maxlen) return s;
        size_t head = maxlen / 2;
        size_t tail_start = s.size() - (maxlen - head - 1);
        while (head > 0 && is_utf8_continuation(s[head])) --head;
        while (tail_start < s.size() && is_utf8_continuation(s[tail_start])) ++tail_start;
        return s.substr(0, head) + "..." + s.substr(tail_start);
    }
}  // namespace

std::string error_kind_name(ErrorKind kind) { return info(kind).name; }

std::optional<ErrorKind> error_kind_from_name(const std::string& name) {
    for (auto const& k : kKinds)
        if (name == k.name) return k.kind;
    return std::nullopt;
}

std::string render_message(ErrorKind kind, const ErrorContext& context) {
    std::string msg = info(kind).message;
    for (auto const& p : context) {
        const std::string placeholder = "{" + p.first + "}";
        size_t pos = msg.find(placeholder);
        if (pos != std::string::npos) msg.replace(pos, placeholder.size(), context_to_string(p.second));
    }
    return msg;
}

ValidationError make_error(ErrorKind kind, const Input& input, Location location, ErrorContext context) {
    ValidationError e;
    e.kind = kind;
    e.location = std::move(location);
    e.message = render_message(kind, context);
    e.input = input;
    e.context = std::move(context);
    return e;
}

std::string ValidationError::loc_string() const {
    std::string out;
    for (size_t k = 0; k < location.size(); ++k) {
        if (k) out.push_back('.');
        if (auto s = std::get_if<std::string>(&location[k]))
            out += *s;
        else
            out += std::to_string(std::get<int64_t>(location[k]));
    }
    return out;
}

std::string ValidationError::to_json(const std::optional<std::string>& url_base) const {
    std::ostringstream ss;
    ss << "{\"kind\":" << escape_json_string(type()) << ",\"loc\":[";
    for (size_t k = 0; k < location.size(); ++k) {
        if (k) ss << ',';
        if (auto s = std::get_if<std::string>(&location[k]))
            ss << escape_json_string(*s);
        else
            ss << std::get<int64_t>(location[k]);
    }
    ss << "],\"msg\":" << escape_json_string(message) << ",\"input\":" << input.dump();
    if (!context.empty()) {
        ss << ",\"ctx\":{";
        for (size_t k = 0; k < context.size(); ++k) {
            if (k) ss << ',';
            ss << escape_json_string(context[k].first) << ':';
            if (auto s = std::get_if<std::string>(&context[k].second))
                ss << escape_json_string(*s);
            else
                ss << std::get<int64_t>(context[k].second);
        }
        ss << '}';
    }
    if (url_base.has_value()) ss << ",\"url\":" << escape_json_string(*url_base + type());
    ss << '}';
    return ss.str();
}

std::string format_report(const std::string& title, const std::vector<ValidationError>& errors, bool hide_input) {
    std::ostringstream ss;
    ss << errors.size() << " validation error" << (errors.size() == 1 ? "" : "s") << " for " << title;
    for (auto const& e : errors) {
        ss << "\n";
        if (!e.location.empty()) ss << e.loc_string() << "\n";
        ss << "  " << e.message << " [type=" << e.type();
        if (!hide_input) ss << ", input_value=" << truncate_middle(e.input.repr()) << ", input_type=" << e.input.typeString();
        ss << "]";
    }
    return ss.str();
}

ValidationFailure::ValidationFailure(std::string title, std::vector<ValidationError> errors, bool hide_input)
    : std::runtime_error(format_report(title, errors, hide_input)),
      m_title(std::move(title)),
      m_errors(std::move(errors)) {}

std::string ValidationFailure::errors_json(const std::optional<std::string>& url_base) const {
    std::string out = "[";
    for (size_t k = 0; k < m_errors.size(); ++k) {
        if (k) out += ",";
        out += m_errors[k].to_json(url_base);
    }
    return out + "]";
}

}  // namespace vc
