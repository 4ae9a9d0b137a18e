#include <catch2/catch_all.hpp>
#include <vc/validate.h>

using namespace vc;

TEST_CASE("dict: all entries valid", "[validate][dict]") {
    auto schema = dict_schema(int_schema(), date_schema());
    auto input = Input::mapping({{"1", "2017-01-01"}, {"2", "2017-01-02"}});

    for (auto s : {Strictness::Lax, Strictness::Strict}) {
        auto r = validate(schema, input, s);
        REQUIRE(r.is_valid());
        const auto& out = r.value->asDict();
        REQUIRE(out.size() == 2);
        REQUIRE(out.at(Value(int64_t(1))) == Value(Date{2017, 1, 1}));
        REQUIRE(out.at(Value(int64_t(2))) == Value(Date{2017, 1, 2}));
    }

    REQUIRE(validate(schema, Input::mapping({}), Strictness::Strict).value == Value(Value::Dict()));
}

TEST_CASE("dict: every failing key and value is reported", "[validate][dict][multi-error]") {
    auto schema = dict_schema(int_schema(), date_schema());
    auto input = Input::mapping({{"a", "2017-01-01"}, {"2", "nope"}, {"x", "bad"}, {"4", "2017-01-04"}});

    auto r = validate(schema, input, Strictness::Lax);
    REQUIRE_FALSE(r.is_valid());
    REQUIRE_FALSE(r.value.has_value());
    REQUIRE(r.error_count() == 4);

    REQUIRE(r.errors[0].type() == "int_parsing");
    REQUIRE(r.errors[0].loc_string() == "a.[key]");
    REQUIRE(r.errors[0].input == Input("a"));

    REQUIRE(r.errors[1].type() == "date_parsing");
    REQUIRE(r.errors[1].loc_string() == "2");
    REQUIRE(r.errors[1].input == Input("nope"));

    // a bad key does not hide a bad value in the same entry
    REQUIRE(r.errors[2].loc_string() == "x.[key]");
    REQUIRE(r.errors[3].type() == "date_parsing");
    REQUIRE(r.errors[3].loc_string() == "x");
}

TEST_CASE("dict: key and value locations", "[validate][dict]") {
    auto r = validate(dict_schema(bool_schema(), int_schema()), Input::mapping({{Input(7), Input("q")}}),
                      Strictness::Lax);
    REQUIRE(r.error_count() == 2);

    Location key_loc{LocItem(int64_t(7)), LocItem(std::string("[key]"))};
    Location value_loc{LocItem(int64_t(7))};
    REQUIRE(r.errors[0].location == key_loc);
    REQUIRE(r.errors[0].type() == "bool_parsing");
    REQUIRE(r.errors[1].location == value_loc);
    REQUIRE(r.errors[1].type() == "int_parsing");
    REQUIRE(r.errors[0].loc_string() == "7.[key]");
}

TEST_CASE("dict: non-mapping input", "[validate][dict]") {
    auto schema = dict_schema(int_schema(), int_schema());
    for (auto s : {Strictness::Lax, Strictness::Strict}) {
        for (const Input& in : {Input("{}"), Input(3), Input::list({Input(1)}), Input::null()}) {
            auto r = validate(schema, in, s);
            REQUIRE(r.error_count() == 1);
            REQUIRE(r.errors[0].type() == "dict_type");
            REQUIRE(r.errors[0].location.empty());
            REQUIRE(r.errors[0].message == "Input should be a valid dictionary");
        }
    }
}

TEST_CASE("dict: strictness reaches nested coercions", "[validate][dict]") {
    auto schema = dict_schema(int_schema(), bool_schema());
    auto input = Input::mapping({{"1", "true"}});

    REQUIRE(validate(schema, input, Strictness::Lax).is_valid());

    auto strict = validate(schema, input, Strictness::Strict);
    REQUIRE(strict.error_count() == 1);
    REQUIRE(strict.errors[0].type() == "string_type");
    REQUIRE(strict.errors[0].loc_string() == "1");
}

TEST_CASE("dict: colliding output keys keep the last value", "[validate][dict]") {
    auto r = validate(dict_schema(int_schema(), int_schema()), Input::mapping({{"1", "10"}, {"01", "20"}, {"+1", "30"}}),
                      Strictness::Lax);
    REQUIRE(r.is_valid());
    const auto& out = r.value->asDict();
    REQUIRE(out.size() == 1);
    REQUIRE(out.at(Value(int64_t(1))) == Value(int64_t(30)));
}

TEST_CASE("dict: length bounds apply to the output", "[validate][dict]") {
    auto schema = dict_schema(int_schema(), int_schema(), 2, 3);

    REQUIRE(validate(schema, Input::mapping({{"1", 1}, {"2", 2}}), Strictness::Lax).is_valid());

    SECTION("too short") {
        auto r = validate(schema, Input::mapping({{"1", 1}}), Strictness::Lax);
        REQUIRE(r.error_count() == 1);
        REQUIRE(r.errors[0].type() == "too_short");
        REQUIRE(r.errors[0].location.empty());
        REQUIRE(r.errors[0].message == "Dictionary should have at least 2 items after validation, not 1");
    }

    SECTION("duplicates collapse before counting") {
        auto r = validate(schema, Input::mapping({{"1", 1}, {"01", 1}}), Strictness::Lax);
        REQUIRE(r.error_count() == 1);
        REQUIRE(r.errors[0].type() == "too_short");
    }

    SECTION("too long") {
        auto r = validate(schema, Input::mapping({{"1", 1}, {"2", 2}, {"3", 3}, {"4", 4}}), Strictness::Lax);
        REQUIRE(r.error_count() == 1);
        REQUIRE(r.errors[0].type() == "too_long");
        REQUIRE(r.errors[0].message == "Dictionary should have at most 3 items after validation, not 4");
    }

    SECTION("entry errors suppress the length check") {
        auto r = validate(schema, Input::mapping({{"x", 1}}), Strictness::Lax);
        REQUIRE(r.error_count() == 1);
        REQUIRE(r.errors[0].type() == "int_parsing");
    }
}

TEST_CASE("dict: nested dictionaries extend the location", "[validate][dict]") {
    auto schema = dict_schema(int_schema(), dict_schema(int_schema(), bool_schema()));

    auto input = Input::mapping({
        {"1", Input::mapping({{"2", "maybe"}, {"3", "yes"}})},
        {"4", "not a dict"},
        {"5", Input::mapping({{"z", "no"}})},
    });
    auto r = validate(schema, input, Strictness::Lax);
    REQUIRE(r.error_count() == 3);
    REQUIRE(r.errors[0].type() == "bool_parsing");
    REQUIRE(r.errors[0].loc_string() == "1.2");
    REQUIRE(r.errors[1].type() == "dict_type");
    REQUIRE(r.errors[1].loc_string() == "4");
    REQUIRE(r.errors[2].type() == "int_parsing");
    REQUIRE(r.errors[2].loc_string() == "5.z.[key]");
}

TEST_CASE("dict: input is not modified", "[validate][dict]") {
    auto input = Input::mapping({{"1", "2017-01-01"}, {"b", "x"}});
    const Input before = input;
    (void)validate(dict_schema(int_schema(), date_schema()), input, Strictness::Lax);
    REQUIRE(input == before);
}

TEST_CASE("dict: bytes keys", "[validate][dict]") {
    auto r = validate(dict_schema(int_schema(), int_schema()),
                      Input::mapping({{Input::bytes("k"), 1}, {Input::bytes(std::string("\xff", 1)), 2}}),
                      Strictness::Lax);
    REQUIRE(r.error_count() == 2);
    REQUIRE(r.errors[0].loc_string() == "k.[key]");
    REQUIRE(r.errors[1].type() == "string_type");
    REQUIRE(r.errors[1].loc_string() == "b'\\xff'.[key]");
}
