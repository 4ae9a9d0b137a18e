#include <catch2/catch_all.hpp>
#include <vc/validate.h>
#include <vc/coerce.h>

using namespace vc;

TEST_CASE("bool: every lax literal", "[validate][bool]") {
    const std::vector<std::pair<std::string, bool> > literals = {
        {"true", true},  {"True", true},   {"TRUE", true}, {"t", true},    {"T", true},    {"yes", true},
        {"YES", true},   {"y", true},      {"on", true},   {"On", true},   {"1", true},    {"false", false},
        {"False", false}, {"FALSE", false}, {"f", false},  {"F", false},   {"no", false},  {"No", false},
        {"n", false},    {"off", false},   {"OFF", false}, {"0", false},
    };

    for (auto const& lit : literals) {
        INFO("literal: " << lit.first);
        auto lax = validate(bool_schema(), Input(lit.first), Strictness::Lax);
        REQUIRE(lax.is_valid());
        REQUIRE(lax.value->asBool() == lit.second);

        auto strict = validate(bool_schema(), Input(lit.first), Strictness::Strict);
        REQUIRE_FALSE(strict.is_valid());
        REQUIRE(strict.errors.size() == 1);
        REQUIRE(strict.errors[0].kind == ErrorKind::StringType);
    }
}

TEST_CASE("bool: rejected near-misses", "[validate][bool]") {
    for (const char* text : {"", " true", "true ", "tru", "2", "-1", "yess", "nope", "1.0", "none"}) {
        INFO("literal: '" << text << "'");
        auto r = validate(bool_schema(), Input(text), Strictness::Lax);
        REQUIRE_FALSE(r.is_valid());
        REQUIRE(r.errors[0].kind == ErrorKind::BoolParsing);
        REQUIRE(r.errors[0].input == Input(text));
    }
}

TEST_CASE("bool: bytes input", "[validate][bool]") {
    REQUIRE(validate(bool_schema(), Input::bytes("yes"), Strictness::Lax).value == Value(true));

    auto strict = validate(bool_schema(), Input::bytes("yes"), Strictness::Strict);
    REQUIRE(strict.errors.size() == 1);
    REQUIRE(strict.errors[0].type() == "string_type");

    // not decodable as UTF-8
    auto bad = validate(bool_schema(), Input::bytes(std::string("\xff\xfe", 2)), Strictness::Lax);
    REQUIRE(bad.errors.size() == 1);
    REQUIRE(bad.errors[0].type() == "string_type");
}

TEST_CASE("bool: native and numeric input", "[validate][bool]") {
    for (auto s : {Strictness::Lax, Strictness::Strict}) {
        REQUIRE(validate(bool_schema(), Input(true), s).value == Value(true));
        REQUIRE(validate(bool_schema(), Input(false), s).value == Value(false));
    }

    REQUIRE(validate(bool_schema(), Input(1), Strictness::Lax).value == Value(true));
    REQUIRE(validate(bool_schema(), Input(0), Strictness::Lax).value == Value(false));
    REQUIRE(validate(bool_schema(), Input(2), Strictness::Lax).errors[0].type() == "bool_parsing");
    REQUIRE(validate(bool_schema(), Input(1), Strictness::Strict).errors[0].type() == "string_type");
}

TEST_CASE("bool: wrong shapes", "[validate][bool]") {
    auto mapping = Input::mapping({{"a", "b"}});
    for (auto s : {Strictness::Lax, Strictness::Strict}) {
        REQUIRE(validate(bool_schema(), mapping, s).errors[0].type() == "string_type");
        REQUIRE(validate(bool_schema(), Input::null(), s).errors[0].type() == "string_type");
        REQUIRE(validate(bool_schema(), Input(1.0), s).errors[0].type() == "string_type");
    }
}

TEST_CASE("parse_bool_literal table", "[bool][unit]") {
    REQUIRE(parse_bool_literal("Y") == std::optional<bool>(true));
    REQUIRE(parse_bool_literal("oFf") == std::optional<bool>(false));
    REQUIRE_FALSE(parse_bool_literal("enabled").has_value());
}
