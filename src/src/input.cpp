#include <vc/input.h>
#include <cstdio>
#include <sstream>
#include <stdexcept>

namespace vc {

bool Input::asBool() const {
    if (my_kind != Kind::Bool) throw std::runtime_error("not a bool");
    return m_bool;
}

int64_t Input::asInt() const {
    if (my_kind != Kind::Int) throw std::runtime_error("not an int");
    return m_int;
}

double Input::asDouble() const {
    if (my_kind != Kind::Float) throw std::runtime_error("not a float");
    return m_double;
}

const std::string& Input::asString() const {
    if (my_kind != Kind::Text && my_kind != Kind::Bytes) throw std::runtime_error("not text or bytes");
    return m_string;
}

const vc::Date& Input::asDate() const {
    if (my_kind != Kind::Date) throw std::runtime_error("not a date");
    return m_date;
}

const vc::DateTime& Input::asDateTime() const {
    if (my_kind != Kind::DateTime) throw std::runtime_error("not a datetime");
    return m_datetime;
}

const std::vector<Input>& Input::asList() const {
    if (my_kind != Kind::List) throw std::runtime_error("not a list");
    return m_list;
}

const Input::Items& Input::items() const {
    if (my_kind != Kind::Mapping) throw std::runtime_error("not a mapping");
    return m_items;
}

int Input::size() const noexcept {
    switch (my_kind) {
        case Kind::List:
            return static_cast<int>(m_list.size());
        case Kind::Mapping:
            return static_cast<int>(m_items.size());
        case Kind::Text:
        case Kind::Bytes:
            return static_cast<int>(m_string.size());
        default:
            return 0;
    }
}

std::string Input::typeString() const {
    switch (my_kind) {
        case Kind::Null:
            return "null";
        case Kind::Bool:
            return "bool";
        case Kind::Int:
            return "int";
        case Kind::Float:
            return "float";
        case Kind::Text:
            return "text";
        case Kind::Bytes:
            return "bytes";
        case Kind::Date:
            return "date";
        case Kind::DateTime:
            return "datetime";
        case Kind::List:
            return "list";
        case Kind::Mapping:
            return "mapping";
    }
    throw std::logic_error("Not a valid input kind");
}

// Single-quoted rendering; `escape_high` also escapes bytes >= 0x80.
static std::string quote_single(const std::string& s, bool escape_high = false) {
    std::string out;
    out.reserve(s.size() + 2);
    out.push_back('\'');
    for (unsigned char c : s) {
        switch (c) {
            case '\'':
                out += "\\'";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                if (c < 0x20 || (escape_high && c >= 0x80)) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\x%02x", c);
                    out += buf;
                } else {
                    out.push_back(static_cast<char>(c));
                }
        }
    }
    out.push_back('\'');
    return out;
}

static std::string format_double(double x) {
    std::ostringstream ss;
    ss.precision(17);
    ss << x;
    std::string s = ss.str();
    // keep floats visibly distinct from ints
    if (s.find_first_of(".eEn") == std::string::npos) s += ".0";
    return s;
}

std::string Input::repr() const {
    switch (my_kind) {
        case Kind::Null:
            return "null";
        case Kind::Bool:
            return m_bool ? "true" : "false";
        case Kind::Int:
            return std::to_string(m_int);
        case Kind::Float:
            return format_double(m_double);
        case Kind::Text:
            return quote_single(m_string);
        case Kind::Bytes:
            return "b" + quote_single(m_string, true);
        case Kind::Date:
            return m_date.iso();
        case Kind::DateTime:
            return m_datetime.iso();
        case Kind::List: {
            std::string out = "[";
            for (size_t k = 0; k < m_list.size(); ++k) {
                if (k) out += ", ";
                out += m_list[k].repr();
            }
            return out + "]";
        }
        case Kind::Mapping: {
            std::string out = "{";
            for (size_t k = 0; k < m_items.size(); ++k) {
                if (k) out += ", ";
                out += m_items[k].first.repr() + ": " + m_items[k].second.repr();
            }
            return out + "}";
        }
    }
    return std::string();
}

std::string escape_json_string(const std::string& s) {
    std::string result;
    result.reserve(s.size() + 2);
    result.push_back('"');
    for (char c : s) {
        switch (c) {
            case '"':
                result += "\\\"";
                break;
            case '\\':
                result += "\\\\";
                break;
            case '\n':
                result += "\\n";
                break;
            case '\r':
                result += "\\r";
                break;
            case '\t':
                result += "\\t";
                break;
            case '\b':
                result += "\\b";
                break;
            case '\f':
                result += "\\f";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    result += buf;
                } else {
                    result.push_back(c);
                }
                break;
        }
    }
    result.push_back('"');
    return result;
}

std::string Input::dump() const {
    switch (my_kind) {
        case Kind::Null:
            return "null";
        case Kind::Bool:
            return m_bool ? "true" : "false";
        case Kind::Int:
            return std::to_string(m_int);
        case Kind::Float: {
            // JSON has no inf/nan literals
            if (m_double != m_double || m_double - m_double != 0.0) return escape_json_string(format_double(m_double));
            return format_double(m_double);
        }
        case Kind::Text:
            return escape_json_string(m_string);
        case Kind::Bytes: {
            if (is_valid_utf8(m_string)) return escape_json_string(m_string);
            std::string latin;
            for (unsigned char c : m_string) {
                if (c < 0x80) {
                    latin.push_back(static_cast<char>(c));
                } else {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\x%02x", c);
                    latin += buf;
                }
            }
            return escape_json_string(latin);
        }
        case Kind::Date:
            return escape_json_string(m_date.iso());
        case Kind::DateTime:
            return escape_json_string(m_datetime.iso());
        case Kind::List: {
            std::ostringstream ss;
            ss << '[';
            for (size_t k = 0; k < m_list.size(); ++k) {
                if (k) ss << ',';
                ss << m_list[k].dump();
            }
            ss << ']';
            return ss.str();
        }
        case Kind::Mapping: {
            // JSON object keys must be strings
            std::ostringstream ss;
            ss << '{';
            for (size_t k = 0; k < m_items.size(); ++k) {
                if (k) ss << ',';
                const Input& key = m_items[k].first;
                if (key.is_text() || key.is_bytes())
                    ss << key.dump();
                else
                    ss << escape_json_string(key.repr());
                ss << ':' << m_items[k].second.dump();
            }
            ss << '}';
            return ss.str();
        }
    }
    return std::string();
}

bool Input::operator==(const Input& rhs) const {
    if (my_kind != rhs.my_kind) return false;
    switch (my_kind) {
        case Kind::Null:
            return true;
        case Kind::Bool:
            return m_bool == rhs.m_bool;
        case Kind::Int:
            return m_int == rhs.m_int;
        case Kind::Float:
            return m_double == rhs.m_double;
        case Kind::Text:
        case Kind::Bytes:
            return m_string == rhs.m_string;
        case Kind::Date:
            return m_date == rhs.m_date;
        case Kind::DateTime:
            return m_datetime == rhs.m_datetime;
        case Kind::List:
            return m_list == rhs.m_list;
        case Kind::Mapping:
            return m_items == rhs.m_items;
    }
    return false;
}

bool is_valid_utf8(const std::string& raw) noexcept {
    size_t i = 0;
    const size_t n = raw.size();
    while (i < n) {
        unsigned char c = static_cast<unsigned char>(raw[i]);
        size_t len = 0;
        uint32_t cp = 0;
        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            len = 2;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4;
            cp = c & 0x07;
        } else {
            return false;
        }
        if (i + len > n) return false;
        for (size_t k = 1; k < len; ++k) {
            unsigned char cc = static_cast<unsigned char>(raw[i + k]);
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        // reject overlong forms, surrogates and out-of-range code points
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) return false;
        if (cp >= 0xD800 && cp <= 0xDFFF) return false;
        if (cp > 0x10FFFF) return false;
        i += len;
    }
    return true;
}

std::optional<std::string> canonical_text(const Input& input) {
    switch (input.kind()) {
        case Input::Kind::Text:
            return input.asString();
        case Input::Kind::Bytes:
            if (is_valid_utf8(input.asString())) return input.asString();
            return std::nullopt;
        default:
            return std::nullopt;
    }
}

std::ostream& operator<<(std::ostream& os, const Input& in) {
    os << in.repr();
    return os;
}

}  // namespace vc
