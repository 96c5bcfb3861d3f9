// options/config.cpp
//
// Locate and load the YAML/JSON configuration file.

#include <filesystem>
#include <map>
#include <set>
#include <stdexcept>
#include <string>

#include "arg_parser.hpp"
#include "config_utils.hpp"
#include "options.hpp"

namespace fs = std::filesystem;

static void load_one(const fs::path& cfg, bool json,
                     std::map<std::string, std::string>& cfg_opts) {
    std::string err;
    bool ok = json ? load_json_config(cfg.string(), cfg_opts, err)
                   : load_yaml_config(cfg.string(), cfg_opts, err);
    if (!ok)
        throw std::runtime_error("Failed to load config " + cfg.string() + ": " + err);
}

void load_config_files(int argc, char* argv[], std::map<std::string, std::string>& cfg_opts,
                       fs::path& config_file) {
    const std::set<std::string> pre_known{"--config-yaml", "--config-json"};
    const std::map<char, std::string> pre_short{{'y', "--config-yaml"}, {'j', "--config-json"}};
    ArgParser pre_parser(argc, argv, pre_known, pre_short);
    for (const char* flag : {"--config-yaml", "--config-json"}) {
        if (!pre_parser.has_flag(flag))
            continue;
        std::string cfg = pre_parser.get_option(flag);
        if (cfg.empty())
            throw std::runtime_error(std::string(flag) + " requires a file");
        load_one(cfg, std::string(flag) == "--config-json", cfg_opts);
        config_file = cfg;
    }
    if (!config_file.empty())
        return;

    for (const char* name : {"indexmirror.yaml", "indexmirror.json"}) {
        fs::path candidate = fs::current_path() / name;
        std::error_code ec;
        if (fs::is_regular_file(candidate, ec)) {
            load_one(candidate, candidate.extension() == ".json", cfg_opts);
            config_file = candidate;
            return;
        }
    }
}
