#include <catch2/catch_all.hpp>
#include <vc/validate.h>

using namespace vc;

namespace {

// Run one lax or strict call and return the single error kind, or "" on success.
std::string error_type(const Schema& schema, const Input& input, bool strict) {
    auto result = validate(schema, input, strictness_from_bool(strict));
    if (result.is_valid()) return "";
    REQUIRE(result.errors.size() == 1);
    return result.errors[0].type();
}

}  // namespace

TEST_CASE("validate_string: bool", "[validate][string]") {
    Validator v(bool_schema());

    REQUIRE(v.validate_string(Input("true")) == Value(true));
    REQUIRE(v.validate_string(Input("false")) == Value(false));
    // strict mode only takes a native bool
    REQUIRE(v.validate_string(Input(true), true) == Value(true));
    REQUIRE_THROWS_AS(v.validate_string(Input("true"), true), ValidationFailure);
}

TEST_CASE("validate_string: scalar table", "[validate][string]") {
    SECTION("int") {
        REQUIRE(validate(int_schema(), "1", Strictness::Lax).value == Value(int64_t(1)));
        REQUIRE(validate(int_schema(), "1", Strictness::Strict).value == Value(int64_t(1)));
        REQUIRE(error_type(int_schema(), "xxx", true) == "int_parsing");
    }

    SECTION("float keeps numeric value across trailing zeros") {
        for (bool strict : {false, true}) {
            auto a = validate(float_schema(), "1.1", strictness_from_bool(strict));
            auto b = validate(float_schema(), "1.10", strictness_from_bool(strict));
            REQUIRE(a.is_valid());
            REQUIRE(b.is_valid());
            REQUIRE(a.value->asDouble() == 1.1);
            REQUIRE(*a.value == *b.value);
        }
    }

    SECTION("date") {
        Value expected(Date{2017, 1, 1});
        REQUIRE(validate(date_schema(), "2017-01-01", Strictness::Lax).value == expected);
        REQUIRE(validate(date_schema(), "2017-01-01", Strictness::Strict).value == expected);
    }

    SECTION("datetime with milliseconds") {
        Value expected(make_datetime(2017, 1, 1, 12, 13, 14, 567000));
        REQUIRE(validate(datetime_schema(), "2017-01-01T12:13:14.567", Strictness::Lax).value == expected);
        REQUIRE(validate(datetime_schema(), "2017-01-01T12:13:14.567", Strictness::Strict).value == expected);
    }

    SECTION("date from a datetime with a time component") {
        REQUIRE(error_type(date_schema(), "2017-01-01T12:13:14.567", false) == "date_from_datetime_inexact");
        REQUIRE(error_type(date_schema(), "2017-01-01T12:13:14.567", true) == "date_parsing");
    }

    SECTION("date from a datetime at midnight") {
        REQUIRE(validate(date_schema(), "2017-01-01T00:00:00", Strictness::Lax).value == Value(Date{2017, 1, 1}));
        REQUIRE(error_type(date_schema(), "2017-01-01T00:00:00", true) == "date_parsing");
    }
}

TEST_CASE("validate_string: dict of int to date", "[validate][string][dict]") {
    Validator v(dict_schema(int_schema(), date_schema()));

    Value out = v.validate_string(Input::mapping({{"1", "2017-01-01"}, {"2", "2017-01-02"}}));

    Value::Dict expected;
    expected.emplace(Value(int64_t(1)), Value(Date{2017, 1, 1}));
    expected.emplace(Value(int64_t(2)), Value(Date{2017, 1, 2}));
    REQUIRE(out == Value(expected));
}

TEST_CASE("validate_string: failure report names the error type", "[validate][string]") {
    Validator v(int_schema());
    try {
        v.validate_string(Input("xxx"), true);
        FAIL("expected validate_string to throw");
    } catch (const ValidationFailure& e) {
        std::string msg = e.what();
        REQUIRE(msg.find("1 validation error for int") == 0);
        REQUIRE(msg.find("type=int_parsing") != std::string::npos);
        REQUIRE(msg.find("input_value='xxx'") != std::string::npos);
        REQUIRE(msg.find("input_type=text") != std::string::npos);
    }
}
