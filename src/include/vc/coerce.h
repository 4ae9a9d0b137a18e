#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <vc/datetime.h>
#include <vc/errors.h>
#include <vc/input.h>
#include <vc/schema.h>
#include <vc/value.h>

namespace vc {

// Per-call state threaded through every coercion: the fixed strictness, the
// path from the top-level input to the value being coerced, and the errors
// accumulated so far.
class ValidationState {
  public:
    explicit ValidationState(Strictness strictness) : m_strictness(strictness) {}

    Strictness strictness() const noexcept { return m_strictness; }
    bool strict() const noexcept { return m_strictness == Strictness::Strict; }

    const Location& location() const noexcept { return m_path; }
    void push(LocItem item) { m_path.push_back(std::move(item)); }
    void pop() {
        if (!m_path.empty()) m_path.pop_back();
    }

    // Record a failure of `input` at the current location.
    void fail(ErrorKind kind, const Input& input, ErrorContext context = {});

    const std::vector<ValidationError>& errors() const noexcept { return m_errors; }
    size_t error_count() const noexcept { return m_errors.size(); }
    std::vector<ValidationError> take_errors() { return std::move(m_errors); }

  private:
    const Strictness m_strictness;
    Location m_path;
    std::vector<ValidationError> m_errors;
};

// Extends the current location for the lifetime of the guard.
class LocationGuard {
  public:
    LocationGuard(ValidationState& state, LocItem item) : m_state(state) { m_state.push(std::move(item)); }
    ~LocationGuard() { m_state.pop(); }
    LocationGuard(const LocationGuard&) = delete;
    LocationGuard& operator=(const LocationGuard&) = delete;

  private:
    ValidationState& m_state;
};

// Dispatch on the schema variant. Returns the typed value, or nothing after
// recording at least one error in `state`.
std::optional<Value> coerce(const Schema& schema, const Input& input, ValidationState& state);

std::optional<bool> coerce_bool(const Input& input, ValidationState& state);
std::optional<int64_t> coerce_int(const Input& input, ValidationState& state);
std::optional<double> coerce_float(const Input& input, bool allow_inf_nan, ValidationState& state);
std::optional<Date> coerce_date(const Input& input, ValidationState& state);
std::optional<DateTime> coerce_datetime(const Input& input, ValidationState& state);
std::optional<Value::Dict> coerce_dict(const Schema& schema, const Input& input, ValidationState& state);

// Literal tables and grammars shared by the scalar coercers.

// true: true t yes y on 1 / false: false f no n off 0 (ASCII case-insensitive)
std::optional<bool> parse_bool_literal(const std::string& text);
// [+-]?[0-9]+ fitting in int64; with `allow_zero_fraction` also [+-]?[0-9]+\.0*
std::optional<int64_t> parse_int_literal(const std::string& text, bool allow_zero_fraction);
// [+-]?([0-9]+(\.[0-9]*)?|\.[0-9]+)([eE][+-]?[0-9]+)? or [+-]?(inf|infinity|nan)
std::optional<double> parse_float_literal(const std::string& text);

// Path segment naming a mapping entry by its original (pre-coercion) key.
LocItem loc_item_for_key(const Input& key);

}  // namespace vc
