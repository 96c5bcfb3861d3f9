#ifndef CONFIG_UTILS_HPP
#define CONFIG_UTILS_HPP
#include <map>
#include <string>

/**
 * @brief Load configuration options from a YAML file.
 *
 * Top-level scalars become `--key` entries. Mappings are treated as
 * sections (for example `repo:` and `web:`) and their scalar members are
 * flattened into the same map. Keys are normalized by normalize_config_key().
 *
 * @param path  Filesystem path to the YAML configuration file.
 * @param opts  Map receiving option values keyed by `--name`.
 * @param error Receives a human-readable message on failure.
 * @return `true` if the file was loaded successfully.
 */
bool load_yaml_config(const std::string& path, std::map<std::string, std::string>& opts,
                      std::string& error);

/**
 * @brief Load configuration options from a JSON file.
 *
 * Same flattening rules as load_yaml_config().
 *
 * @param path  Filesystem path to the JSON configuration file.
 * @param opts  Map receiving option values keyed by `--name`.
 * @param error Receives a human-readable message on failure.
 * @return `true` if the file was loaded successfully.
 */
bool load_json_config(const std::string& path, std::map<std::string, std::string>& opts,
                      std::string& error);

/**
 * @brief Map a config key to its command line flag.
 *
 * Underscores become dashes and a leading `--` is added, so `git_url`
 * yields `--git-url`. `update_interval` is accepted as an alias of
 * `--interval`.
 */
std::string normalize_config_key(const std::string& key);

#endif // CONFIG_UTILS_HPP
