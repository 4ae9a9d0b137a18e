#include <vc/validate.h>
#include <vc/coerce.h>
#include <vc/debug.h>
#include <vc/json.h>
#include <stdexcept>

namespace vc {

// Keep only the first line of a parser message (the caret snippet follows).
static std::string first_line(const std::string& msg) {
    size_t nl = msg.find('\n');
    if (nl == std::string::npos) return msg;
    return msg.substr(0, nl);
}

ValidationResult validate(const Schema& schema, const Input& input, Strictness strictness) {
    if (debug_enabled()) {
        std::cerr << "validate debug: schema=" << schema.name() << " input=" << input.repr()
                  << " strict=" << (strictness == Strictness::Strict ? "true" : "false") << "\n";
    }
    ValidationState state(strictness);
    ValidationResult result;
    auto value = coerce(schema, input, state);
    result.errors = state.take_errors();
    // partial success is still a failure
    if (result.errors.empty()) result.value = std::move(value);
    if (debug_enabled()) std::cerr << "validate debug: " << result.errors.size() << " error(s)\n";
    return result;
}

Validator::Validator(Schema schema, ValidatorConfig config) : m_schema(std::move(schema)), m_config(std::move(config)) {}

std::string Validator::title() const { return m_config.title.value_or(m_schema.name()); }

ValidationResult Validator::validate(const Input& input, Strictness strictness) const {
    return vc::validate(m_schema, input, strictness);
}

Value Validator::validate_string(const Input& input, bool strict) const {
    ValidationResult result = validate(input, strictness_from_bool(strict));
    if (!result.is_valid()) throw ValidationFailure(title(), std::move(result.errors), m_config.hide_input);
    return std::move(*result.value);
}

Value Validator::validate_json(const std::string& json, bool strict) const {
    Input document;
    try {
        document = parse_json(json);
    } catch (const std::runtime_error& e) {
        std::vector<ValidationError> errors;
        errors.push_back(make_error(ErrorKind::JsonInvalid, Input(json), {}, {{"error", first_line(e.what())}}));
        throw ValidationFailure(title(), std::move(errors), m_config.hide_input);
    }
    return validate_string(document, strict);
}

std::string Validator::errors_json(const ValidationFailure& failure) const {
    return failure.errors_json(m_config.url_base);
}

}  // namespace vc
