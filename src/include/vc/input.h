#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>
#include <vc/datetime.h>

namespace vc {

// A value as it arrives at the validator boundary. Text, Bytes and Mapping are
// the shapes callers marshal data into; the native scalar kinds let already
// typed data (or parsed JSON) pass through the same coercers.
class Input {
  public:
    enum class Kind { Null, Bool, Int, Float, Text, Bytes, Date, DateTime, List, Mapping };

    using Items = std::vector<std::pair<Input, Input> >;

  private:
    Kind my_kind = Kind::Null;
    bool m_bool = false;
    int64_t m_int = 0;
    double m_double = 0.0;
    std::string m_string;
    vc::Date m_date;
    vc::DateTime m_datetime;
    std::vector<Input> m_list;
    Items m_items;

  public:
    Input() = default;
    Input(bool b) : my_kind(Kind::Bool), m_bool(b) {}
    Input(int64_t n) : my_kind(Kind::Int), m_int(n) {}
    Input(int n) : Input(int64_t(n)) {}
    Input(double x) : my_kind(Kind::Float), m_double(x) {}
    Input(const std::string& s) : my_kind(Kind::Text), m_string(s) {}
    Input(std::string&& s) : my_kind(Kind::Text), m_string(std::move(s)) {}
    Input(const char* s) : Input(std::string(s)) {}
    Input(const vc::Date& d) : my_kind(Kind::Date), m_date(d) {}
    Input(const vc::DateTime& dt) : my_kind(Kind::DateTime), m_datetime(dt) {}

    static Input null() { return Input(); }

    static Input bytes(std::string raw) {
        Input in;
        in.my_kind = Kind::Bytes;
        in.m_string = std::move(raw);
        return in;
    }

    static Input list(std::vector<Input> values) {
        Input in;
        in.my_kind = Kind::List;
        in.m_list = std::move(values);
        return in;
    }

    // Keys and values keep the caller's pairing and order.
    static Input mapping(Items items) {
        Input in;
        in.my_kind = Kind::Mapping;
        in.m_items = std::move(items);
        return in;
    }

    Kind kind() const noexcept { return my_kind; }

    bool is_null() const noexcept { return my_kind == Kind::Null; }
    bool is_bool() const noexcept { return my_kind == Kind::Bool; }
    bool is_int() const noexcept { return my_kind == Kind::Int; }
    bool is_double() const noexcept { return my_kind == Kind::Float; }
    bool is_text() const noexcept { return my_kind == Kind::Text; }
    bool is_bytes() const noexcept { return my_kind == Kind::Bytes; }
    bool is_date() const noexcept { return my_kind == Kind::Date; }
    bool is_datetime() const noexcept { return my_kind == Kind::DateTime; }
    bool is_list() const noexcept { return my_kind == Kind::List; }
    bool is_mapping() const noexcept { return my_kind == Kind::Mapping; }

    bool asBool() const;
    int64_t asInt() const;
    double asDouble() const;
    // raw contents of a Text or Bytes input
    const std::string& asString() const;
    const vc::Date& asDate() const;
    const vc::DateTime& asDateTime() const;
    const std::vector<Input>& asList() const;
    const Items& items() const;

    int size() const noexcept;

    // short type name used in error reports: text, bytes, int, ...
    std::string typeString() const;

    // human-readable rendering used for input_value in error reports
    std::string repr() const;

    // JSON rendering used for the machine-readable error shape
    std::string dump() const;

    bool operator==(const Input& rhs) const;
    bool operator!=(const Input& rhs) const { return not(*this == rhs); }
};

// True when `raw` is a well-formed UTF-8 sequence.
bool is_valid_utf8(const std::string& raw) noexcept;

// Canonical Input Representation: the decoded text of a Text or (UTF-8) Bytes
// input, or nothing for any other shape.
std::optional<std::string> canonical_text(const Input& input);

std::string escape_json_string(const std::string& s);

std::ostream& operator<<(std::ostream& os, const Input& in);

}  // namespace vc
