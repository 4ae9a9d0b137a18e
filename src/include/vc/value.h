#pragma once

#include <cstdint>
#include <map>
#include <ostream>
#include <string>
#include <vc/datetime.h>
#include <vc/input.h>

namespace vc {

// Typed Output: the result of a successful coercion.
class Value {
  public:
    enum class Kind { Bool, Int, Float, Date, DateTime, Dict };

    using Dict = std::map<Value, Value>;

  private:
    Kind my_kind = Kind::Bool;
    bool m_bool = false;
    int64_t m_int = 0;
    double m_double = 0.0;
    vc::Date m_date;
    vc::DateTime m_datetime;
    Dict m_dict;

  public:
    Value() = default;
    Value(bool b) : my_kind(Kind::Bool), m_bool(b) {}
    Value(int64_t n) : my_kind(Kind::Int), m_int(n) {}
    Value(int n) : Value(int64_t(n)) {}
    Value(double x) : my_kind(Kind::Float), m_double(x) {}
    Value(const vc::Date& d) : my_kind(Kind::Date), m_date(d) {}
    Value(const vc::DateTime& dt) : my_kind(Kind::DateTime), m_datetime(dt) {}
    Value(Dict d) : my_kind(Kind::Dict), m_dict(std::move(d)) {}

    Kind kind() const noexcept { return my_kind; }

    bool is_bool() const noexcept { return my_kind == Kind::Bool; }
    bool is_int() const noexcept { return my_kind == Kind::Int; }
    bool is_double() const noexcept { return my_kind == Kind::Float; }
    bool is_date() const noexcept { return my_kind == Kind::Date; }
    bool is_datetime() const noexcept { return my_kind == Kind::DateTime; }
    bool is_dict() const noexcept { return my_kind == Kind::Dict; }

    bool asBool() const;
    int64_t asInt() const;
    double asDouble() const;
    const vc::Date& asDate() const;
    const vc::DateTime& asDateTime() const;
    const Dict& asDict() const;

    std::string typeString() const;

    std::string to_string() const;

    // The equivalent boundary value. Feeding it back through the schema that
    // produced this Value yields an equal Value.
    Input to_input() const;

    bool operator==(const Value& rhs) const;
    bool operator!=(const Value& rhs) const { return not(*this == rhs); }
    // Total order: kind first, then payload. Used to key the output mapping.
    bool operator<(const Value& rhs) const;
};

std::ostream& operator<<(std::ostream& os, const Value& v);

}  // namespace vc
