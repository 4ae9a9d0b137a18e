#include <vc/schema.h>
#include <stdexcept>

namespace vc {

Schema::Schema(const Schema& other)
    : my_kind(other.my_kind),
      m_allow_inf_nan(other.m_allow_inf_nan),
      m_min_length(other.m_min_length),
      m_max_length(other.m_max_length) {
    if (other.m_keys) m_keys = std::make_unique<Schema>(*other.m_keys);
    if (other.m_values) m_values = std::make_unique<Schema>(*other.m_values);
}

Schema& Schema::operator=(const Schema& other) {
    if (this == &other) return *this;
    // copy first so assigning from one of our own sub-schemas is safe
    Schema tmp(other);
    *this = std::move(tmp);
    return *this;
}

Schema Schema::dict(Schema keys, Schema values, std::optional<size_t> min_length, std::optional<size_t> max_length) {
    if (min_length && max_length && *min_length > *max_length)
        throw std::invalid_argument("dict schema: min_length " + std::to_string(*min_length) +
                                    " is greater than max_length " + std::to_string(*max_length));
    Schema s(Kind::Dict);
    s.m_keys = std::make_unique<Schema>(std::move(keys));
    s.m_values = std::make_unique<Schema>(std::move(values));
    s.m_min_length = min_length;
    s.m_max_length = max_length;
    return s;
}

const Schema& Schema::keys() const {
    if (my_kind != Kind::Dict || !m_keys) throw std::logic_error("Not a dict schema");
    return *m_keys;
}

const Schema& Schema::values() const {
    if (my_kind != Kind::Dict || !m_values) throw std::logic_error("Not a dict schema");
    return *m_values;
}

std::string Schema::name() const {
    switch (my_kind) {
        case Kind::Bool:
            return "bool";
        case Kind::Int:
            return "int";
        case Kind::Float:
            return "float";
        case Kind::Date:
            return "date";
        case Kind::Datetime:
            return "datetime";
        case Kind::Dict:
            return "dict[" + keys().name() + "," + values().name() + "]";
    }
    throw std::logic_error("Not a valid schema kind");
}

}  // namespace vc
