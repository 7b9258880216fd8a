#include <treediff/encodings/yaml.h>

#include <cmath>

#include <treediff/utilities/testing.h>
#include <treediff/utilities/text.h>

using namespace treediff;

// Test that a YAML string can be translated to its expected dynamic form.
// (But don't test the inverse.)
static void
test_one_way_yaml_encoding(string const& yaml, dynamic const& expected_value)
{
    CAPTURE(yaml);

    // Parse it and check that it matches.
    auto converted_value = parse_yaml_value(yaml);
    REQUIRE(converted_value == expected_value);
}

// Test that a YAML string can be translated to and from its expected dynamic
// form.
static void
test_yaml_encoding(string const& yaml, dynamic const& expected_value)
{
    CAPTURE(yaml);

    // Parse it and check that it matches.
    auto converted_value = parse_yaml_value(yaml);
    REQUIRE(converted_value == expected_value);

    // Convert it back to YAML and check that that matches the original (modulo
    // whitespace).
    auto converted_yaml = value_to_yaml(converted_value);
    REQUIRE(strip_whitespace(converted_yaml) == strip_whitespace(yaml));
}

TEST_CASE("basic YAML encoding", "[encodings][yaml]")
{
    // Try some basic types.
    test_yaml_encoding(
        R"(
            false
        )",
        false);
    test_yaml_encoding(
        R"(
            true
        )",
        true);
    test_yaml_encoding(
        R"(
            "true"
        )",
        "true");
    test_yaml_encoding(
        R"(
            1
        )",
        1);
    test_yaml_encoding(
        R"(
            -1
        )",
        -1);
    test_yaml_encoding(
        R"(
            1.25
        )",
        1.25);
    test_yaml_encoding(
        R"(
            "1.25"
        )",
        "1.25");
    test_yaml_encoding(
        R"(
            "null"
        )",
        "null");
    test_one_way_yaml_encoding(
        R"(
            0x10
        )",
        16);
    test_one_way_yaml_encoding(
        R"(
            0o10
        )",
        8);
    test_one_way_yaml_encoding(
        R"(
            "hi"
        )",
        "hi");
    test_one_way_yaml_encoding(
        R"(
            ~
        )",
        nil);

    // Try some arrays.
    test_yaml_encoding(
        R"(
            - 1
            - 2
            - 3
        )",
        dynamic{1, 2, 3});
    test_yaml_encoding(
        R"(
            []
        )",
        dynamic_array());

    // Try a map.
    test_yaml_encoding(
        R"(
            happy: true
            n: 4.125
        )",
        dynamic{{"happy", true}, {"n", 4.125}});

    // Try some ptimes.
    test_yaml_encoding(
        R"(
            "2017-04-26T01:02:03.000Z"
        )",
        make_test_time(2017, 4, 26, 1, 2, 3));
    test_yaml_encoding(
        R"(
            "2017-05-26T13:02:03.456Z"
        )",
        make_test_time(2017, 5, 26, 13, 2, 3, 456));

    // Try some thing that look like a ptime at first and check that they're
    // just treated as strings.
    test_one_way_yaml_encoding(
        R"(
            "2017-05-26T13:13:03.456ZABC"
        )",
        "2017-05-26T13:13:03.456ZABC");
    test_one_way_yaml_encoding(
        R"(
            "2017-05-26T13:XX:03.456Z"
        )",
        "2017-05-26T13:XX:03.456Z");
    test_one_way_yaml_encoding(
        R"(
            "2017-05-26T42:00:03.456Z"
        )",
        "2017-05-26T42:00:03.456Z");
    test_one_way_yaml_encoding(
        R"(
            "2017-05-26T13:02:03.45Z"
        )",
        "2017-05-26T13:02:03.45Z");

    // Unquoted, it's just a string.
    test_one_way_yaml_encoding(
        R"(
            2017-05-26T13:02:03.456Z
        )",
        "2017-05-26T13:02:03.456Z");
}

TEST_CASE("YAML special numbers", "[encodings][yaml]")
{
    auto nan = parse_yaml_value(".nan");
    REQUIRE(nan.type() == value_type::NUMBER);
    REQUIRE(std::isnan(cast<double>(nan)));

    REQUIRE(parse_yaml_value("-.inf") == dynamic(-HUGE_VAL));
}

TEST_CASE("YAML encoding of patterns", "[encodings][yaml]")
{
    REQUIRE(value_to_yaml(make_pattern("a+", "i")) == "\"/a+/i\"");
}

TEST_CASE("diagnostic YAML encoding", "[encodings][yaml]")
{
    REQUIRE(
        strip_whitespace(value_to_diagnostic_yaml(dynamic{{"a", 1}}))
        == "a:1");

    dynamic_array large(100);
    auto large_yaml = value_to_diagnostic_yaml(dynamic_map{{"a", large}});
    REQUIRE(large_yaml.find("<array - size: 100>") != string::npos);
}

TEST_CASE("cyclic YAML values", "[encodings][yaml]")
{
    dynamic v = dynamic_map();
    cast<dynamic_map>(v)["n"] = 1;
    cast<dynamic_map>(v)["self"] = v;

    REQUIRE_THROWS_AS(value_to_yaml(v), cyclic_value);
    REQUIRE(value_to_diagnostic_yaml(v).find("<cycle>") != string::npos);
    // Streaming uses the diagnostic form.
    REQUIRE(lexical_cast<string>(v).find("<cycle>") != string::npos);

    cast<dynamic_map>(v).erase("self");
}

static void
test_malformed_yaml(string const& malformed_yaml)
{
    CAPTURE(malformed_yaml);

    try
    {
        parse_yaml_value(malformed_yaml);
        FAIL("no exception thrown");
    }
    catch (parsing_error& e)
    {
        REQUIRE(get_required_error_info<expected_format_info>(e) == "YAML");
        REQUIRE(get_required_error_info<parsed_text_info>(e) == malformed_yaml);
        REQUIRE(!get_required_error_info<parsing_error_info>(e).empty());
    }
}

TEST_CASE("malformed YAML", "[encodings][yaml]")
{
    test_malformed_yaml(
        R"(
            ]asdf
        )");
    test_malformed_yaml(
        R"(
            asdf: [123
        )");
}
