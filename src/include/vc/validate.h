#pragma once

#include <optional>
#include <string>
#include <vc/errors.h>
#include <vc/input.h>
#include <vc/schema.h>
#include <vc/value.h>

namespace vc {

// Coerce `input` to the type described by `schema`. Returns the typed value
// or every error found; one strictness applies to the whole call.
ValidationResult validate(const Schema& schema, const Input& input, Strictness strictness);

struct ValidatorConfig {
    // Title used in ValidationFailure reports; defaults to the schema name.
    std::optional<std::string> title;
    // When set, each error's JSON shape carries "url": url_base + type.
    std::optional<std::string> url_base;
    // Leave input_value/input_type out of ValidationFailure reports.
    bool hide_input = false;
};

// A schema bound to its reporting configuration. Read-only after
// construction, so one instance can serve concurrent calls.
class Validator {
  public:
    explicit Validator(Schema schema, ValidatorConfig config = {});

    const Schema& schema() const noexcept { return m_schema; }
    const ValidatorConfig& config() const noexcept { return m_config; }
    std::string title() const;

    ValidationResult validate(const Input& input, Strictness strictness = Strictness::Lax) const;

    // Throws ValidationFailure listing every error.
    Value validate_string(const Input& input, bool strict = false) const;

    // Parse `json` and validate the document. Malformed JSON throws
    // ValidationFailure with a single json_invalid error.
    Value validate_json(const std::string& json, bool strict = false) const;

    // JSON array of the errors in `failure`, honoring url_base.
    std::string errors_json(const ValidationFailure& failure) const;

  private:
    Schema m_schema;
    ValidatorConfig m_config;
};

}  // namespace vc
