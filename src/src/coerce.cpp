#include <vc/coerce.h>
#include <vc/debug.h>

namespace vc {

void ValidationState::fail(ErrorKind kind, const Input& input, ErrorContext context) {
    if (debug_enabled()) {
        std::cerr << "coerce fail: kind=" << error_kind_name(kind) << " input=" << input.repr() << " loc_depth="
                  << m_path.size() << "\n";
    }
    m_errors.push_back(make_error(kind, input, m_path, std::move(context)));
}

LocItem loc_item_for_key(const Input& key) {
    switch (key.kind()) {
        case Input::Kind::Text:
            return key.asString();
        case Input::Kind::Int:
            return key.asInt();
        case Input::Kind::Bytes:
            if (is_valid_utf8(key.asString())) return key.asString();
            return key.repr();
        default:
            return key.repr();
    }
}

std::optional<Value> coerce(const Schema& schema, const Input& input, ValidationState& state) {
    if (debug_enabled()) {
        std::cerr << "coerce enter: schema=" << schema.name() << " input=" << input.repr()
                  << " strict=" << (state.strict() ? "true" : "false") << "\n";
    }
    switch (schema.kind()) {
        case Schema::Kind::Bool:
            if (auto b = coerce_bool(input, state)) return Value(*b);
            return std::nullopt;
        case Schema::Kind::Int:
            if (auto n = coerce_int(input, state)) return Value(*n);
            return std::nullopt;
        case Schema::Kind::Float:
            if (auto x = coerce_float(input, schema.allowInfNan(), state)) return Value(*x);
            return std::nullopt;
        case Schema::Kind::Date:
            if (auto d = coerce_date(input, state)) return Value(*d);
            return std::nullopt;
        case Schema::Kind::Datetime:
            if (auto dt = coerce_datetime(input, state)) return Value(*dt);
            return std::nullopt;
        case Schema::Kind::Dict:
            if (auto m = coerce_dict(schema, input, state)) return Value(std::move(*m));
            return std::nullopt;
    }
    throw std::logic_error("Not a valid schema kind");
}

}  // namespace vc
