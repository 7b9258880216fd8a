#include <treediff/config.h>

#include <treediff/encodings/json.h>
#include <treediff/utilities/testing.h>
#include <treediff/utilities/text.h>

using namespace treediff;

TEST_CASE("tool config reading", "[config]")
{
    auto config = read_tool_config(parse_json_value(
        R"(
            {
                "log_level": "debug",
                "log_file": "treediff.log",
                "indent": 2,
                "unused": true
            }
        )"));
    REQUIRE(config.log_level == some(string("debug")));
    REQUIRE(config.log_file == some(string("treediff.log")));
    REQUIRE(config.indent == some(integer(2)));
    REQUIRE(get_indent(config) == 2);

    auto logging = get_logging_config(config);
    REQUIRE(logging.level == some(string("debug")));
    REQUIRE(logging.file == some(string("treediff.log")));
}

TEST_CASE("default tool config", "[config]")
{
    auto config = read_tool_config(dynamic(dynamic_map()));
    REQUIRE(!config.log_level);
    REQUIRE(!config.log_file);
    REQUIRE(!config.indent);
    REQUIRE(get_indent(config) == 4);

    config.indent = integer(-1);
    REQUIRE(get_indent(config) == -1);
}

TEST_CASE("invalid tool config", "[config]")
{
    REQUIRE_THROWS_AS(
        read_tool_config(dynamic{{"indent", 1.5}}), parsing_error);
    REQUIRE_THROWS_AS(
        read_tool_config(dynamic{{"indent", 1000}}), parsing_error);
    REQUIRE_THROWS_AS(read_tool_config(dynamic{1, 2}), type_mismatch);

    try
    {
        read_tool_config(dynamic{{"log_level", 3}});
        FAIL("no exception thrown");
    }
    catch (type_mismatch& e)
    {
        REQUIRE(
            get_required_error_info<dynamic_value_path_info>(e)
            == std::list<dynamic>({dynamic("log_level")}));
    }
}
