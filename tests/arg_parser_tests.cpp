#include "test_common.hpp"
#include "options.hpp"

#include <stdexcept>

TEST_CASE("ArgParser basic parsing") {
    const char* argv[] = {"prog", "--foo", "--opt", "42", "pos", "--unknown"};
    ArgParser parser(6, const_cast<char**>(argv), {"--opt"}, {"--foo"});
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

TEST_CASE("ArgParser switches never take a value") {
    const char* argv[] = {"prog", "--help", "deploy"};
    ArgParser parser(3, const_cast<char**>(argv), {}, {"--help"});
    REQUIRE(parser.has_flag("--help"));
    REQUIRE(parser.get_option("--help").empty());
    REQUIRE(parser.positional() == std::vector<std::string>{"deploy"});
}

TEST_CASE("ArgParser short options") {
    const char* argv[] = {"prog", "-h", "-c42", "-r", "/srv"};
    ArgParser parser(5, const_cast<char**>(argv), {"--config", "--root"}, {"--help"},
                     {{'h', "--help"}, {'c', "--config"}, {'r', "--root"}});
    REQUIRE(parser.has_flag("--help"));
    REQUIRE(parser.get_option("--config") == "42");
    REQUIRE(parser.get_option("--root") == "/srv");
}

TEST_CASE("ArgParser double dash ends option parsing") {
    const char* argv[] = {"prog", "--", "--not-a-flag"};
    ArgParser parser(3, const_cast<char**>(argv), {"--opt"});
    REQUIRE(parser.unknown_flags().empty());
    REQUIRE(parser.positional() == std::vector<std::string>{"--not-a-flag"});
}

TEST_CASE("parse_options reads command and arguments") {
    const char* argv[] = {"multideploy", "--root", "/srv/sites", "deploy", "site",
                          "origin/feature/x"};
    Options opts = parse_options(6, const_cast<char**>(argv));
    REQUIRE(opts.root == "/srv/sites");
    REQUIRE(opts.command == "deploy");
    REQUIRE(opts.args == std::vector<std::string>{"site", "origin/feature/x"});
}

TEST_CASE("parse_options validates commands") {
    const char* unknown[] = {"multideploy", "explode"};
    REQUIRE_THROWS_AS(parse_options(2, const_cast<char**>(unknown)), std::runtime_error);

    const char* missing[] = {"multideploy", "status"};
    REQUIRE_THROWS_AS(parse_options(2, const_cast<char**>(missing)), std::runtime_error);

    const char* no_key[] = {"multideploy", "provision-ssh", "site", "git@host:a/b.git"};
    REQUIRE_THROWS_AS(parse_options(4, const_cast<char**>(no_key)), std::runtime_error);

    const char* bad_flag[] = {"multideploy", "--bogus", "list"};
    REQUIRE_THROWS_AS(parse_options(3, const_cast<char**>(bad_flag)), std::runtime_error);

    const char* help[] = {"multideploy", "-h"};
    REQUIRE(parse_options(2, const_cast<char**>(help)).show_help);
}
