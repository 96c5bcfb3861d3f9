// options/repo.cpp
//
// Upstream repository, local path, sync interval and git transport.

#include <stdexcept>
#include <string>

#include "options.hpp"
#include "parse_utils.hpp"

void parse_repo_options(Options& opts, const OptionSource& src) {
    bool ok = false;
    if (auto v = src.value("--git-url"))
        opts.repo.git_url = *v;
    if (auto v = src.value("--path"))
        opts.repo.path = *v;
    if (auto v = src.value("--branch"))
        opts.repo.branch = *v;
    if (auto v = src.value("--interval")) {
        auto dur = parse_duration(*v, ok);
        if (!ok || dur.count() < 1)
            throw std::runtime_error("Invalid value for --interval");
        opts.repo.interval = dur;
    }

    if (auto v = src.value("--git-timeout")) {
        auto dur = parse_duration(*v, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --git-timeout");
        opts.git.timeout = dur;
    }
    if (auto v = src.value("--proxy"))
        opts.git.proxy_url = *v;
    if (auto v = src.value("--ssh-public-key"))
        opts.git.ssh_public_key = *v;
    if (auto v = src.value("--ssh-private-key"))
        opts.git.ssh_private_key = *v;
    if (auto v = src.value("--credential-file"))
        opts.git.credential_file = *v;
}
