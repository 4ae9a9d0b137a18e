#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include <vc/input.h>
#include <vc/value.h>

namespace vc {

// Closed set of machine-readable failure kinds.
enum class ErrorKind {
    StringType,               // wrong shape at the scalar boundary
    BoolParsing,
    IntParsing,
    IntFromFloat,
    FloatParsing,
    FiniteNumber,
    DateParsing,
    DateFromDatetimeInexact,  // a valid datetime that is not an exact date
    DatetimeParsing,
    DictType,                 // container given something that is not a mapping
    TooShort,
    TooLong,
    JsonInvalid
};

// string_type, int_parsing, ...
std::string error_kind_name(ErrorKind kind);
// inverse of error_kind_name
std::optional<ErrorKind> error_kind_from_name(const std::string& name);

// One path segment: a mapping key (text) or an integer key / index.
using LocItem = std::variant<std::string, int64_t>;
using Location = std::vector<LocItem>;

// Named parameters used to render an error message, in insertion order.
using ContextValue = std::variant<std::string, int64_t>;
using ErrorContext = std::vector<std::pair<std::string, ContextValue> >;

struct ValidationError {
    ErrorKind kind = ErrorKind::StringType;
    Location location;
    std::string message;
    Input input;
    ErrorContext context;

    std::string type() const { return error_kind_name(kind); }

    // Location rendered as `a.[key]`, `1.2`; empty at the top level.
    std::string loc_string() const;

    // {"kind":..,"loc":[..],"msg":..,"input":..,"ctx":{..},"url":..}
    // `url` is emitted only when `url_base` is given.
    std::string to_json(const std::optional<std::string>& url_base = std::nullopt) const;
};

// Human message for `kind`, with `{name}` placeholders filled from `context`.
std::string render_message(ErrorKind kind, const ErrorContext& context);

// Build a ValidationError with its message already rendered.
ValidationError make_error(ErrorKind kind, const Input& input, Location location = {}, ErrorContext context = {});

// Outcome of one validation call: a value, or every error found.
struct ValidationResult {
    std::optional<Value> value;
    std::vector<ValidationError> errors;

    bool is_valid() const noexcept { return errors.empty() && value.has_value(); }
    size_t error_count() const noexcept { return errors.size(); }
};

// Thrown by the throwing entry points (Validator::validate_string and
// Validator::validate_json). what() is a multi-line report:
//
//   2 validation errors for dict[int,date]
//   x.[key]
//     Input should be a valid integer, ... [type=int_parsing, input_value='x', input_type=text]
class ValidationFailure : public std::runtime_error {
  public:
    ValidationFailure(std::string title, std::vector<ValidationError> errors, bool hide_input = false);

    const std::string& title() const noexcept { return m_title; }
    const std::vector<ValidationError>& errors() const noexcept { return m_errors; }
    size_t error_count() const noexcept { return m_errors.size(); }

    // JSON array of every error's external shape
    std::string errors_json(const std::optional<std::string>& url_base = std::nullopt) const;

  private:
    std::string m_title;
    std::vector<ValidationError> m_errors;
};

// The text used by ValidationFailure::what().
std::string format_report(const std::string& title, const std::vector<ValidationError>& errors,
                          bool hide_input = false);

}  // namespace vc
