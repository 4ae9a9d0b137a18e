#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace vc {

// Coercion policy for one top-level validation call.
enum class Strictness { Strict, Lax };

inline Strictness strictness_from_bool(bool strict) noexcept {
    return strict ? Strictness::Strict : Strictness::Lax;
}

// Immutable description of an expected type. A closed set of variants; the
// engine dispatches on `kind()` with a single switch.
class Schema {
  public:
    enum class Kind { Bool, Int, Float, Date, Datetime, Dict };

  private:
    Kind my_kind = Kind::Bool;
    bool m_allow_inf_nan = true;
    std::optional<size_t> m_min_length;
    std::optional<size_t> m_max_length;
    std::unique_ptr<Schema> m_keys;
    std::unique_ptr<Schema> m_values;

    explicit Schema(Kind k) : my_kind(k) {}

  public:
    // Deep copy: a Dict exclusively owns its key and value schemas.
    Schema(const Schema& other);
    Schema& operator=(const Schema& other);
    Schema(Schema&&) noexcept = default;
    Schema& operator=(Schema&&) noexcept = default;
    ~Schema() = default;

    static Schema boolean() { return Schema(Kind::Bool); }
    static Schema integer() { return Schema(Kind::Int); }
    static Schema floating(bool allow_inf_nan = true) {
        Schema s(Kind::Float);
        s.m_allow_inf_nan = allow_inf_nan;
        return s;
    }
    static Schema date() { return Schema(Kind::Date); }
    static Schema datetime() { return Schema(Kind::Datetime); }
    // Throws std::invalid_argument if min_length > max_length.
    static Schema dict(Schema keys, Schema values, std::optional<size_t> min_length = std::nullopt,
                       std::optional<size_t> max_length = std::nullopt);

    Kind kind() const noexcept { return my_kind; }

    bool allowInfNan() const noexcept { return m_allow_inf_nan; }
    const std::optional<size_t>& minLength() const noexcept { return m_min_length; }
    const std::optional<size_t>& maxLength() const noexcept { return m_max_length; }

    // key / value schemas of a Dict; throws std::logic_error for other kinds
    const Schema& keys() const;
    const Schema& values() const;

    // bool, int, float, date, datetime, dict[<key>,<value>]
    std::string name() const;
};

// Shorthands mirroring the usual schema-builder vocabulary.
inline Schema bool_schema() { return Schema::boolean(); }
inline Schema int_schema() { return Schema::integer(); }
inline Schema float_schema(bool allow_inf_nan = true) { return Schema::floating(allow_inf_nan); }
inline Schema date_schema() { return Schema::date(); }
inline Schema datetime_schema() { return Schema::datetime(); }
inline Schema dict_schema(Schema keys, Schema values, std::optional<size_t> min_length = std::nullopt,
                          std::optional<size_t> max_length = std::nullopt) {
    return Schema::dict(std::move(keys), std::move(values), min_length, max_length);
}

}  // namespace vc
