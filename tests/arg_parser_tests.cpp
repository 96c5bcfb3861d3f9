#include "test_common.hpp"

TEST_CASE("ArgParser basic parsing") {
    const char* argv[] = {"prog", "--foo", "--opt", "42", "pos", "--unknown"};
    ArgParser parser(6, const_cast<char**>(argv), {"--foo", "--bar", "--opt"});
    REQUIRE(parser.has_flag("--foo"));
    REQUIRE(parser.get_option("--opt") == "42");
    REQUIRE(parser.positional().size() == 1);
    REQUIRE(parser.positional()[0] == "pos");
    REQUIRE(parser.unknown_flags().size() == 1);
    REQUIRE(parser.unknown_flags()[0] == "--unknown");
}

TEST_CASE("ArgParser option with equals") {
    const char* argv[] = {"prog", "--opt=val"};
    ArgParser parser(2, const_cast<char**>(argv), {"--opt"});
    REQUIRE(parser.has_flag("--opt"));
    REQUIRE(parser.get_option("--opt") == "val");
}

TEST_CASE("ArgParser short options") {
    const char* argv[] = {"prog", "-h", "-p", "9000", "-o=/srv/index"};
    ArgParser parser(5, const_cast<char**>(argv), {"--help", "--port", "--path"},
                     {{'h', "--help"}, {'p', "--port"}, {'o', "--path"}});
    REQUIRE(parser.has_flag("--help"));
    REQUIRE(parser.get_option("--port") == "9000");
    REQUIRE(parser.get_option("--path") == "/srv/index");
}

TEST_CASE("ArgParser flag followed by flag takes no value") {
    const char* argv[] = {"prog", "--json-log", "--port", "80"};
    ArgParser parser(4, const_cast<char**>(argv), {"--json-log", "--port"});
    REQUIRE(parser.has_flag("--json-log"));
    REQUIRE(parser.get_option("--json-log").empty());
    REQUIRE(parser.get_option("--port") == "80");
}

TEST_CASE("ArgParser unknown short flag stays positional") {
    const char* argv[] = {"prog", "-x"};
    ArgParser parser(2, const_cast<char**>(argv), {"--bar"}, {{'a', "--bar"}});
    REQUIRE(parser.unknown_flags().empty());
    REQUIRE(parser.positional().size() == 1);
    REQUIRE(parser.positional()[0] == "-x");
}

TEST_CASE("ArgParser accepts everything without known flags") {
    const char* argv[] = {"prog", "--anything", "1"};
    ArgParser parser(3, const_cast<char**>(argv));
    REQUIRE(parser.has_flag("--anything"));
    REQUIRE(parser.unknown_flags().empty());
    REQUIRE(parser.options().at("--anything") == "1");
}
