#ifndef ARG_PARSER_HPP
#define ARG_PARSER_HPP
#include <map>
#include <set>
#include <string>
#include <vector>

/**
 * @brief Simple command line argument parser.
 *
 * Recognizes long options (`--flag`, `--opt value`, `--opt=value`) and
 * single-letter aliases (`-p 8080`, `-p=8080`) mapped to their long form.
 * When a set of known flags is supplied, anything else is collected in
 * unknown_flags() so the caller can report it.
 */
class ArgParser {
    std::set<std::string> flags_;                ///< Flags present on the command line
    std::map<std::string, std::string> options_; ///< Option values keyed by flag
    std::vector<std::string> positional_;        ///< Positional arguments in order
    std::vector<std::string> unknown_flags_;     ///< Flags not present in known_flags
    std::set<std::string> known_flags_;          ///< List of accepted flags
    std::map<char, std::string> short_map_;      ///< Mapping of short to long flags

    bool accept(const std::string& key) {
        if (known_flags_.empty() || known_flags_.count(key))
            return true;
        unknown_flags_.push_back(key);
        return false;
    }

    void store(const std::string& key, const std::string* value) {
        if (!accept(key))
            return;
        flags_.insert(key);
        if (value)
            options_[key] = *value;
    }

  public:
    /**
     * @param argc Argument count from `main`.
     * @param argv Argument vector from `main`.
     * @param known_flags Accepted long flags. Empty accepts everything.
     * @param short_map Mapping from single letters to long flags.
     */
    ArgParser(int argc, char* argv[], const std::set<std::string>& known_flags = {},
              const std::map<char, std::string>& short_map = {})
        : known_flags_(known_flags), short_map_(short_map) {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            std::string key;
            if (arg.rfind("--", 0) == 0) {
                key = arg;
            } else if (arg.size() >= 2 && arg[0] == '-' && short_map_.count(arg[1]) &&
                       (arg.size() == 2 || arg[2] == '=')) {
                key = short_map_.at(arg[1]) + arg.substr(2);
            } else {
                positional_.push_back(arg);
                continue;
            }
            size_t eq = key.find('=');
            if (eq != std::string::npos) {
                std::string val = key.substr(eq + 1);
                store(key.substr(0, eq), &val);
            } else if (i + 1 < argc && argv[i + 1][0] != '-') {
                std::string val = argv[++i];
                store(key, &val);
            } else {
                store(key, nullptr);
            }
        }
    }

    /** @return `true` if @p flag (including `--`) was given. */
    bool has_flag(const std::string& flag) const { return flags_.count(flag) > 0; }

    /** @return Value of @p opt or an empty string when missing. */
    std::string get_option(const std::string& opt) const {
        auto it = options_.find(opt);
        if (it != options_.end())
            return it->second;
        return "";
    }

    const std::map<std::string, std::string>& options() const { return options_; }
    const std::vector<std::string>& positional() const { return positional_; }
    const std::vector<std::string>& unknown_flags() const { return unknown_flags_; }
};

#endif // ARG_PARSER_HPP
