#include <utility>
#include "errors.hpp"
#include "logger.hpp"
#include "vcs.hpp"

namespace mirror {

static const char* const REMOTE_NAME = "origin";

static std::string describe(const std::string& action, const std::string& error,
                            bool auth_failed) {
    std::string msg = action + ": " + (error.empty() ? "unknown error" : error);
    if (auth_failed)
        msg += " (authentication failed)";
    return msg;
}

LibGit2Vcs::LibGit2Vcs(git::TransportOptions transport, std::string branch)
    : transport_(std::move(transport)), branch_(std::move(branch)) {}

std::string LibGit2Vcs::branch_for(const fs::path& dir) const {
    if (!branch_.empty())
        return branch_;
    std::string err;
    auto current = git::get_current_branch(dir, &err);
    if (!current)
        throw VcsError(describe("cannot determine branch of " + dir.string(), err, false));
    return *current;
}

bool LibGit2Vcs::has_repository(const fs::path& dir) { return git::is_git_repo(dir); }

void LibGit2Vcs::clone(const std::string& url, const fs::path& dir) {
    std::string err;
    bool auth_failed = false;
    if (!git::clone_bare(dir, url, &transport_, &auth_failed, &err))
        throw VcsError(describe("clone of " + url + " failed", err, auth_failed));
    // A clone leaves HEAD on the remote's default branch.
    if (!branch_.empty()) {
        std::string rev = fetch(dir);
        advance_head(dir, rev);
    }
}

std::string LibGit2Vcs::fetch(const fs::path& dir) {
    const std::string branch = branch_for(dir);
    std::string err;
    bool auth_failed = false;
    auto rev = git::fetch_remote(dir, REMOTE_NAME, branch, &transport_, &auth_failed, &err);
    if (!rev)
        throw VcsError(describe("fetch of " + branch + " failed", err, auth_failed));
    log_debug("Fetched upstream", {{"branch", branch}, {"revision", *rev}});
    return *rev;
}

std::string LibGit2Vcs::head_revision(const fs::path& dir) {
    std::string err;
    auto rev = git::get_local_hash(dir, &err);
    if (!rev)
        throw VcsError(describe("cannot read HEAD of " + dir.string(), err, false));
    return *rev;
}

void LibGit2Vcs::export_revision(const fs::path& dir, const std::string& revision,
                                 const fs::path& dest, const fs::path& base_dir,
                                 const std::string& base_revision) {
    std::string err;
    if (!git::export_tree(dir, revision, dest, base_dir, base_revision, &err))
        throw VcsError(describe("export of " + revision + " failed", err, false));
}

void LibGit2Vcs::advance_head(const fs::path& dir, const std::string& revision) {
    const std::string branch = branch_for(dir);
    std::string err;
    if (!git::set_branch_target(dir, branch, revision, &err))
        throw VcsError(describe("cannot move " + branch + " to " + revision, err, false));
}

} // namespace mirror
