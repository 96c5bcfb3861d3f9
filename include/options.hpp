#ifndef OPTIONS_HPP
#define OPTIONS_HPP
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include "arg_parser.hpp"
#include "logger.hpp"

struct LoggingOptions {
    LogLevel log_level = LogLevel::INFO;
    std::string log_file;
    size_t max_log_size = 0;
    size_t max_log_files = 3;
    bool json_log = false;
    bool compress_logs = false;
    bool use_syslog = false;
};

/// Upstream repository and local copy.
struct RepoSettings {
    std::string git_url;
    std::filesystem::path path;
    std::string branch; ///< Empty follows the remote's default branch
    std::chrono::seconds interval{3600};
};

struct WebOptions {
    std::string address = "0.0.0.0";
    uint16_t port = 8080;
    size_t workers = 8;
    std::chrono::seconds request_timeout{30};
    bool listing = true;
};

/// Transport settings handed to libgit2.
struct GitTransportOptions {
    std::filesystem::path ssh_public_key;
    std::filesystem::path ssh_private_key;
    std::filesystem::path credential_file;
    std::string proxy_url;
    std::chrono::seconds timeout{0};
};

struct Options {
    RepoSettings repo;
    WebOptions web;
    GitTransportOptions git;
    LoggingOptions logging;
    std::filesystem::path config_file;
    bool single_run = false;
    bool show_help = false;
    bool print_version = false;
};

/**
 * @brief Resolves option values from the command line first and the loaded
 * configuration file second.
 */
class OptionSource {
  public:
    OptionSource(const ArgParser& parser, const std::map<std::string, std::string>& cfg)
        : parser_(parser), cfg_(cfg) {}

    /** @return Raw value of @p flag, or `std::nullopt` when set nowhere. */
    std::optional<std::string> value(const std::string& flag) const;

    /**
     * @brief Resolve a boolean switch.
     *
     * A bare command line flag means `true`; otherwise the value is parsed
     * with parse_bool(). Throws `std::runtime_error` on an invalid value.
     */
    bool flag(const std::string& flag, bool def = false) const;

  private:
    const ArgParser& parser_;
    const std::map<std::string, std::string>& cfg_;
};

/**
 * @brief Parse command line arguments into an Options structure.
 *
 * Loads the configuration file first (explicit `--config-yaml` /
 * `--config-json`, else `indexmirror.yaml` / `indexmirror.json` in the
 * working directory) and lets command line flags override it.
 *
 * @throws std::runtime_error on unknown flags or invalid values.
 */
Options parse_options(int argc, char* argv[]);

/**
 * @brief Check that everything needed to run a mirror is present.
 *
 * @throws std::runtime_error naming the first missing option.
 */
void validate_options(const Options& opts);

// Helpers implemented in src/options/*.cpp
void load_config_files(int argc, char* argv[], std::map<std::string, std::string>& cfg_opts,
                       std::filesystem::path& config_file);
void parse_repo_options(Options& opts, const OptionSource& src);
void parse_web_options(Options& opts, const OptionSource& src);
void parse_logging_options(Options& opts, const OptionSource& src);

#endif // OPTIONS_HPP
