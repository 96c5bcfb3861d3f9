#include "test_common.hpp"

using indexmirror::test_support::Argv;

TEST_CASE("parse_options defaults") {
    Argv args{"indexmirror", "--git-url", "https://example.com/index.git", "--path",
              "/srv/index"};
    Options opts = parse_options(args.argc(), args.argv());
    REQUIRE(opts.repo.git_url == "https://example.com/index.git");
    REQUIRE(opts.repo.path == fs::path("/srv/index"));
    REQUIRE(opts.repo.branch.empty());
    REQUIRE(opts.repo.interval == std::chrono::seconds(3600));
    REQUIRE(opts.web.address == "0.0.0.0");
    REQUIRE(opts.web.port == 8080);
    REQUIRE(opts.web.listing);
    REQUIRE(opts.logging.log_level == LogLevel::INFO);
    REQUIRE_FALSE(opts.single_run);
    REQUIRE_NOTHROW(validate_options(opts));
}

TEST_CASE("parse_options short flags and durations") {
    Argv args{"indexmirror", "-u=file:///tmp/up", "-o", "/tmp/mirror", "-i", "5m",
              "-p", "9000",  "-a",                "127.0.0.1", "--no-listing", "--single-run"};
    Options opts = parse_options(args.argc(), args.argv());
    REQUIRE(opts.repo.git_url == "file:///tmp/up");
    REQUIRE(opts.repo.interval == std::chrono::minutes(5));
    REQUIRE(opts.web.port == 9000);
    REQUIRE(opts.web.address == "127.0.0.1");
    REQUIRE_FALSE(opts.web.listing);
    REQUIRE(opts.single_run);
}

TEST_CASE("parse_options rejects invalid values") {
    {
        Argv args{"indexmirror", "--port", "70000"};
        REQUIRE_THROWS_AS(parse_options(args.argc(), args.argv()), std::runtime_error);
    }
    {
        Argv args{"indexmirror", "--interval", "0"};
        REQUIRE_THROWS_AS(parse_options(args.argc(), args.argv()), std::runtime_error);
    }
    {
        Argv args{"indexmirror", "--log-level", "LOUD"};
        REQUIRE_THROWS_AS(parse_options(args.argc(), args.argv()), std::runtime_error);
    }
    {
        Argv args{"indexmirror", "--bogus"};
        REQUIRE_THROWS_AS(parse_options(args.argc(), args.argv()), std::runtime_error);
    }
    {
        Argv args{"indexmirror", "stray"};
        REQUIRE_THROWS_AS(parse_options(args.argc(), args.argv()), std::runtime_error);
    }
    {
        Argv args{"indexmirror", "--json-log=maybe"};
        REQUIRE_THROWS_AS(parse_options(args.argc(), args.argv()), std::runtime_error);
    }
}

TEST_CASE("validate_options requires url and path") {
    Options opts;
    REQUIRE_THROWS_AS(validate_options(opts), std::runtime_error);
    opts.repo.git_url = "https://example.com/index.git";
    REQUIRE_THROWS_AS(validate_options(opts), std::runtime_error);
    opts.repo.path = "/srv/index";
    REQUIRE_NOTHROW(validate_options(opts));
}

TEST_CASE("help and version skip value parsing") {
    Argv help{"indexmirror", "-h", "--port", "not-a-port"};
    Options opts = parse_options(help.argc(), help.argv());
    REQUIRE(opts.show_help);

    Argv version{"indexmirror", "--version"};
    opts = parse_options(version.argc(), version.argv());
    REQUIRE(opts.print_version);
}

TEST_CASE("command line overrides the config file") {
    fs::path dir = indexmirror::test_support::scratch_dir("options_cfg");
    fs::path cfg = dir / "mirror.yaml";
    indexmirror::test_support::write_file(cfg, "repo:\n"
                                               "  git_url: https://example.com/a.git\n"
                                               "  path: /srv/a\n"
                                               "  update_interval: 120\n"
                                               "web:\n"
                                               "  port: 8000\n"
                                               "log_level: DEBUG\n");
    Argv args{"indexmirror", "--config-yaml", cfg.string(), "--port", "8001"};
    Options opts = parse_options(args.argc(), args.argv());
    REQUIRE(opts.config_file == cfg);
    REQUIRE(opts.repo.git_url == "https://example.com/a.git");
    REQUIRE(opts.repo.path == fs::path("/srv/a"));
    REQUIRE(opts.repo.interval == std::chrono::seconds(120));
    REQUIRE(opts.web.port == 8001);
    REQUIRE(opts.logging.log_level == LogLevel::DEBUG);
    FS_REMOVE_ALL(dir);
}

TEST_CASE("missing config file is an error") {
    Argv args{"indexmirror", "--config-json", "/nonexistent/indexmirror.json"};
    REQUIRE_THROWS_AS(parse_options(args.argc(), args.argv()), std::runtime_error);
}
