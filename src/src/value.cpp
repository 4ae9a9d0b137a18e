#include <vc/value.h>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace vc {

bool Value::asBool() const {
    if (my_kind != Kind::Bool) throw std::runtime_error("not a bool");
    return m_bool;
}

int64_t Value::asInt() const {
    if (my_kind != Kind::Int) throw std::runtime_error("not an int");
    return m_int;
}

double Value::asDouble() const {
    if (my_kind != Kind::Float) throw std::runtime_error("not a float");
    return m_double;
}

const vc::Date& Value::asDate() const {
    if (my_kind != Kind::Date) throw std::runtime_error("not a date");
    return m_date;
}

const vc::DateTime& Value::asDateTime() const {
    if (my_kind != Kind::DateTime) throw std::runtime_error("not a datetime");
    return m_datetime;
}

const Value::Dict& Value::asDict() const {
    if (my_kind != Kind::Dict) throw std::runtime_error("not a dict");
    return m_dict;
}

std::string Value::typeString() const {
    switch (my_kind) {
        case Kind::Bool:
            return "bool";
        case Kind::Int:
            return "int";
        case Kind::Float:
            return "float";
        case Kind::Date:
            return "date";
        case Kind::DateTime:
            return "datetime";
        case Kind::Dict:
            return "dict";
    }
    throw std::logic_error("Not a valid value kind");
}

std::string Value::to_string() const {
    switch (my_kind) {
        case Kind::Bool:
            return m_bool ? "true" : "false";
        case Kind::Int:
            return std::to_string(m_int);
        case Kind::Float: {
            std::ostringstream ss;
            ss.precision(17);
            ss << m_double;
            return ss.str();
        }
        case Kind::Date:
            return m_date.iso();
        case Kind::DateTime:
            return m_datetime.iso();
        case Kind::Dict: {
            std::string out = "{";
            bool first = true;
            for (auto const& p : m_dict) {
                if (!first) out += ", ";
                first = false;
                out += p.first.to_string() + ": " + p.second.to_string();
            }
            return out + "}";
        }
    }
    return std::string();
}

Input Value::to_input() const {
    switch (my_kind) {
        case Kind::Bool:
            return Input(m_bool);
        case Kind::Int:
            return Input(m_int);
        case Kind::Float:
            return Input(m_double);
        case Kind::Date:
            return Input(m_date);
        case Kind::DateTime:
            return Input(m_datetime);
        case Kind::Dict: {
            Input::Items items;
            items.reserve(m_dict.size());
            for (auto const& p : m_dict) items.emplace_back(p.first.to_input(), p.second.to_input());
            return Input::mapping(std::move(items));
        }
    }
    throw std::logic_error("Not a valid value kind");
}

bool Value::operator==(const Value& rhs) const {
    if (my_kind != rhs.my_kind) return false;
    switch (my_kind) {
        case Kind::Bool:
            return m_bool == rhs.m_bool;
        case Kind::Int:
            return m_int == rhs.m_int;
        case Kind::Float:
            return m_double == rhs.m_double;
        case Kind::Date:
            return m_date == rhs.m_date;
        case Kind::DateTime:
            return m_datetime == rhs.m_datetime;
        case Kind::Dict:
            return m_dict == rhs.m_dict;
    }
    return false;
}

bool Value::operator<(const Value& rhs) const {
    if (my_kind != rhs.my_kind) return my_kind < rhs.my_kind;
    switch (my_kind) {
        case Kind::Bool:
            return m_bool < rhs.m_bool;
        case Kind::Int:
            return m_int < rhs.m_int;
        case Kind::Float: {
            // NaN sorts after every number and is equivalent to itself
            bool a_nan = std::isnan(m_double);
            bool b_nan = std::isnan(rhs.m_double);
            if (a_nan || b_nan) return !a_nan && b_nan;
            return m_double < rhs.m_double;
        }
        case Kind::Date:
            return m_date < rhs.m_date;
        case Kind::DateTime:
            return m_datetime < rhs.m_datetime;
        case Kind::Dict:
            return m_dict < rhs.m_dict;
    }
    return false;
}

std::ostream& operator<<(std::ostream& os, const Value& v) {
    os << v.to_string();
    return os;
}

}  // namespace vc
