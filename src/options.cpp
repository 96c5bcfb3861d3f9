#include <filesystem>
#include <map>
#include <set>
#include <stdexcept>
#include <string>

#include "arg_parser.hpp"
#include "options.hpp"
#include "parse_utils.hpp"

namespace fs = std::filesystem;

std::optional<std::string> OptionSource::value(const std::string& flag) const {
    if (parser_.has_flag(flag))
        return parser_.get_option(flag);
    auto it = cfg_.find(flag);
    if (it != cfg_.end())
        return it->second;
    return std::nullopt;
}

bool OptionSource::flag(const std::string& flag, bool def) const {
    auto v = value(flag);
    if (!v)
        return def;
    bool ok = false;
    bool b = parse_bool(*v, ok);
    if (!ok)
        throw std::runtime_error("Invalid value for " + flag);
    return b;
}

Options parse_options(int argc, char* argv[]) {
    std::map<std::string, std::string> cfg_opts;
    fs::path config_file;
    load_config_files(argc, argv, cfg_opts, config_file);

    const std::set<std::string> known{"--config-yaml",
                                      "--config-json",
                                      "--git-url",
                                      "--path",
                                      "--branch",
                                      "--interval",
                                      "--address",
                                      "--port",
                                      "--workers",
                                      "--request-timeout",
                                      "--no-listing",
                                      "--git-timeout",
                                      "--proxy",
                                      "--ssh-public-key",
                                      "--ssh-private-key",
                                      "--credential-file",
                                      "--log-file",
                                      "--log-level",
                                      "--max-log-size",
                                      "--max-log-files",
                                      "--json-log",
                                      "--compress-logs",
                                      "--syslog",
                                      "--single-run",
                                      "--help",
                                      "--version"};
    const std::map<char, std::string> short_opts{
        {'y', "--config-yaml"}, {'j', "--config-json"}, {'u', "--git-url"},
        {'o', "--path"},        {'i', "--interval"},    {'a', "--address"},
        {'p', "--port"},        {'w', "--workers"},     {'l', "--log-file"},
        {'L', "--log-level"},   {'h', "--help"},        {'V', "--version"}};
    ArgParser parser(argc, argv, known, short_opts);

    if (!parser.unknown_flags().empty())
        throw std::runtime_error("Unknown option: " + parser.unknown_flags().front());
    if (!parser.positional().empty())
        throw std::runtime_error("Unexpected argument: " + parser.positional().front());

    Options opts;
    opts.config_file = config_file;
    opts.show_help = parser.has_flag("--help");
    opts.print_version = parser.has_flag("--version");
    if (opts.show_help || opts.print_version)
        return opts;

    OptionSource src(parser, cfg_opts);
    parse_repo_options(opts, src);
    parse_web_options(opts, src);
    parse_logging_options(opts, src);
    opts.single_run = src.flag("--single-run");
    return opts;
}

void validate_options(const Options& opts) {
    if (opts.repo.git_url.empty())
        throw std::runtime_error("Missing required option --git-url");
    if (opts.repo.path.empty())
        throw std::runtime_error("Missing required option --path");
}
