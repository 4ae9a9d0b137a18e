#include <vc/coerce.h>
#include <vc/debug.h>

namespace vc {

std::optional<Value::Dict> coerce_dict(const Schema& schema, const Input& input, ValidationState& state) {
    if (!input.is_mapping()) {
        // one error for the container, nothing per key
        state.fail(ErrorKind::DictType, input);
        return std::nullopt;
    }
    const Schema& key_schema = schema.keys();
    const Schema& value_schema = schema.values();

    Value::Dict output;
    const size_t errors_before = state.error_count();

    for (auto const& entry : input.items()) {
        const Input& key = entry.first;
        const Input& value = entry.second;
        LocationGuard entry_loc(state, loc_item_for_key(key));

        std::optional<Value> out_key;
        {
            LocationGuard key_marker(state, LocItem(std::string("[key]")));
            out_key = coerce(key_schema, key, state);
        }
        // the value is checked even when the key failed so one pass reports both
        std::optional<Value> out_value = coerce(value_schema, value, state);

        if (out_key && out_value) {
            auto it = output.find(*out_key);
            if (it != output.end()) {
                // distinct input keys coerced to the same output key: last write wins
                if (debug_enabled())
                    std::cerr << "coerce_dict: key " << key.repr() << " overwrites output key " << out_key->to_string()
                              << "\n";
                it->second = std::move(*out_value);
            } else {
                output.emplace(std::move(*out_key), std::move(*out_value));
            }
        }
    }

    if (state.error_count() != errors_before) return std::nullopt;

    const int64_t actual = static_cast<int64_t>(output.size());
    if (schema.minLength() && output.size() < *schema.minLength()) {
        state.fail(ErrorKind::TooShort, input,
                   {{"field_type", std::string("Dictionary")},
                    {"min_length", static_cast<int64_t>(*schema.minLength())},
                    {"actual_length", actual}});
        return std::nullopt;
    }
    if (schema.maxLength() && output.size() > *schema.maxLength()) {
        state.fail(ErrorKind::TooLong, input,
                   {{"field_type", std::string("Dictionary")},
                    {"max_length", static_cast<int64_t>(*schema.maxLength())},
                    {"actual_length", actual}});
        return std::nullopt;
    }
    return output;
}

}  // namespace vc
