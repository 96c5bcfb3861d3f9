#include "help_text.hpp"
#include <algorithm>
#include <cstring>
#include <iomanip>
#include <map>
#include <string>
#include <vector>

struct OptionInfo {
    const char* long_flag;
    const char* short_flag;
    const char* arg;
    const char* desc;
    const char* category;
};

static std::string flag_column(const OptionInfo& o) {
    std::string flag = "  ";
    if (std::strlen(o.short_flag))
        flag += std::string(o.short_flag) + ", ";
    else
        flag += "    ";
    flag += o.long_flag;
    if (std::strlen(o.arg))
        flag += " " + std::string(o.arg);
    return flag;
}

void print_help(const char* prog, std::ostream& os) {
    static const std::vector<OptionInfo> opts = {
        {"--git-url", "-u", "<url>", "Upstream index repository (required)", "Mirror"},
        {"--path", "-o", "<dir>", "Local directory for the mirror (required)", "Mirror"},
        {"--branch", "", "<name>", "Branch to follow (default: remote HEAD)", "Mirror"},
        {"--interval", "-i", "<N[s|m|h|d|w]>", "Time between syncs, start to start (default 1h)",
         "Mirror"},
        {"--single-run", "", "", "Sync once and exit without serving", "Mirror"},
        {"--address", "-a", "<ip>", "Listen address (default 0.0.0.0)", "HTTP"},
        {"--port", "-p", "<n>", "Listen port (default 8080)", "HTTP"},
        {"--workers", "-w", "<n>", "Request worker threads (default 8)", "HTTP"},
        {"--request-timeout", "", "<N[s|m]>", "Per-connection I/O timeout (default 30s)", "HTTP"},
        {"--no-listing", "", "", "Answer 404 instead of listing directories", "HTTP"},
        {"--git-timeout", "", "<N[s|m]>", "Network timeout for git operations", "Git"},
        {"--proxy", "", "<url>", "Proxy for git network traffic", "Git"},
        {"--ssh-public-key", "", "<file>", "SSH public key for authentication", "Git"},
        {"--ssh-private-key", "", "<file>", "SSH private key for authentication", "Git"},
        {"--credential-file", "", "<file>", "File with username and password lines", "Git"},
        {"--config-yaml", "-y", "<file>", "Load options from YAML file", "Config"},
        {"--config-json", "-j", "<file>", "Load options from JSON file", "Config"},
        {"--log-file", "-l", "<path>", "Write logs to this file instead of stderr", "Logging"},
        {"--log-level", "-L", "<level>", "DEBUG, INFO, WARNING or ERROR", "Logging"},
        {"--max-log-size", "", "<bytes>", "Rotate --log-file when over this size", "Logging"},
        {"--max-log-files", "", "<n>", "Rotated log files to keep (default 3)", "Logging"},
        {"--json-log", "", "", "Write log lines as JSON", "Logging"},
        {"--compress-logs", "", "", "Gzip rotated log files", "Logging"},
        {"--syslog", "", "", "Also log to syslog", "Logging"},
        {"--version", "-V", "", "Print program version and exit", "Other"},
        {"--help", "-h", "", "Show this message", "Other"}};

    std::map<std::string, std::vector<const OptionInfo*>> groups;
    size_t width = 0;
    for (const auto& o : opts) {
        groups[o.category].push_back(&o);
        width = std::max(width, flag_column(o).size());
    }

    os << "indexmirror - Package index mirror\n";
    os << "Keeps a local copy of a git-hosted package index up to date and serves it over "
          "HTTP.\n";
    os << "Options can also be read from YAML or JSON files.\n\n";
    os << "Usage: " << prog << " --git-url <url> --path <dir> [options]\n\n";
    const std::vector<std::string> order{"Mirror", "HTTP", "Git", "Config", "Logging", "Other"};
    for (const auto& cat : order) {
        if (!groups.count(cat))
            continue;
        os << cat << ":\n";
        for (const auto* o : groups[cat])
            os << std::left << std::setw(static_cast<int>(width) + 2) << flag_column(*o)
               << o->desc << "\n";
        os << "\n";
    }
}
