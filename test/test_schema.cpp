#include <catch2/catch_all.hpp>
#include <vc/validate.h>

using namespace vc;

TEST_CASE("schema names", "[schema]") {
    REQUIRE(bool_schema().name() == "bool");
    REQUIRE(float_schema().name() == "float");
    REQUIRE(datetime_schema().name() == "datetime");
    REQUIRE(dict_schema(int_schema(), dict_schema(date_schema(), bool_schema())).name() ==
            "dict[int,dict[date,bool]]");
}

TEST_CASE("dict schema construction", "[schema]") {
    auto s = dict_schema(int_schema(), date_schema(), 1, 4);
    REQUIRE(s.kind() == Schema::Kind::Dict);
    REQUIRE(s.keys().kind() == Schema::Kind::Int);
    REQUIRE(s.values().kind() == Schema::Kind::Date);
    REQUIRE(s.minLength() == std::optional<size_t>(1));
    REQUIRE(s.maxLength() == std::optional<size_t>(4));

    REQUIRE_NOTHROW(dict_schema(int_schema(), int_schema(), 2, 2));
    REQUIRE_THROWS_AS(dict_schema(int_schema(), int_schema(), 3, 2), std::invalid_argument);
    REQUIRE_THROWS_AS(int_schema().keys(), std::logic_error);

    REQUIRE(float_schema().allowInfNan());
    REQUIRE_FALSE(float_schema(false).allowInfNan());
}

TEST_CASE("schemas copy deeply", "[schema]") {
    Schema original = dict_schema(int_schema(), dict_schema(int_schema(), bool_schema()), std::nullopt, 5);
    Schema copy = original;
    REQUIRE(copy.name() == original.name());
    REQUIRE(&copy.values() != &original.values());

    // reassigning from a nested schema of itself
    copy = copy.values();
    REQUIRE(copy.name() == "dict[int,bool]");
    REQUIRE_FALSE(copy.maxLength().has_value());
    REQUIRE(original.name() == "dict[int,dict[int,bool]]");
}

TEST_CASE("validated output is a fixed point", "[schema][validate]") {
    struct Case {
        Schema schema;
        Input input;
    };
    const std::vector<Case> cases = {
        {bool_schema(), Input("yes")},
        {int_schema(), Input("12.0")},
        {float_schema(), Input("1.10")},
        {date_schema(), Input("2017-01-01T00:00")},
        {datetime_schema(), Input("2017-01-01 12:13:14.5+01:00")},
        {dict_schema(int_schema(), date_schema()), Input::mapping({{"1", "2017-01-01"}, {"02", "2017-01-02"}})},
    };

    for (auto const& c : cases) {
        INFO("schema: " << c.schema.name() << " input: " << c.input);
        auto first = validate(c.schema, c.input, Strictness::Lax);
        REQUIRE(first.is_valid());
        for (auto s : {Strictness::Lax, Strictness::Strict}) {
            auto again = validate(c.schema, first.value->to_input(), s);
            REQUIRE(again.is_valid());
            REQUIRE(*again.value == *first.value);
        }
    }
}

TEST_CASE("one validator serves many calls", "[schema][validate]") {
    Validator v(dict_schema(int_schema(), float_schema()));
    for (int k = 0; k < 50; ++k) {
        auto input = Input::mapping({{std::to_string(k), std::to_string(k) + ".5"}});
        auto r = v.validate(input, k % 2 ? Strictness::Strict : Strictness::Lax);
        REQUIRE(r.is_valid());
        REQUIRE(r.value->asDict().at(Value(int64_t(k))) == Value(k + 0.5));
    }
}
