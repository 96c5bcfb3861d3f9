#ifndef GIT_UTILS_HPP
#define GIT_UTILS_HPP

#include <git2.h>
#include <filesystem>
#include <optional>
#include <string>

namespace git {
namespace fs = std::filesystem;

/**
 * @brief RAII helper managing global libgit2 initialization.
 *
 * libgit2 reference-counts init/shutdown, so nesting guards is safe.
 */
struct GitInitGuard {
    GitInitGuard();  ///< Calls `git_libgit2_init()`
    ~GitInitGuard(); ///< Calls `git_libgit2_shutdown()`
};

/**
 * @brief Configure the libgit2 server connect/timeout for network operations.
 *
 * A value of `0` leaves the library default in place.
 */
void set_libgit_timeout(unsigned int seconds);

// RAII wrappers for libgit2 resources
template <typename T, void (*Free)(T*)> struct GitHandle {
    T* h;
    explicit GitHandle(T* h_ = nullptr) : h(h_) {}
    ~GitHandle() {
        if (h)
            Free(h);
    }
    GitHandle(const GitHandle&) = delete;
    GitHandle& operator=(const GitHandle&) = delete;
    T* get() const { return h; }
};

using repo_ptr = GitHandle<git_repository, git_repository_free>;
using remote_ptr = GitHandle<git_remote, git_remote_free>;
using reference_ptr = GitHandle<git_reference, git_reference_free>;
using commit_ptr = GitHandle<git_commit, git_commit_free>;
using tree_ptr = GitHandle<git_tree, git_tree_free>;
using tree_entry_ptr = GitHandle<git_tree_entry, git_tree_entry_free>;
using blob_ptr = GitHandle<git_blob, git_blob_free>;

/**
 * @brief Authentication and proxy settings for clone and fetch.
 *
 * Credentials are tried in this order: explicit SSH key, SSH agent,
 * `~/.ssh/id_rsa`, username/password from @ref credential_file, then the
 * `GIT_USERNAME`/`GIT_PASSWORD` environment variables, then the default
 * credential helper.
 */
struct TransportOptions {
    fs::path ssh_public_key;
    fs::path ssh_private_key;
    fs::path credential_file; ///< Username on line one, password on line two
    std::string proxy_url;    ///< Empty lets libgit2 auto-detect
};

// The utility functions below assume libgit2 is already initialized.

/**
 * @brief Determine whether the given path is a Git repository.
 *
 * Works for both bare repositories and working trees; parent directories
 * are not searched.
 */
bool is_git_repo(const fs::path& p);

/**
 * @brief Get the commit hash pointed to by `HEAD`.
 *
 * @param repo  Path to a Git repository.
 * @param error Optional output string receiving a libgit2 error message.
 * @return 40 character hexadecimal commit hash or `std::nullopt` on error.
 */
std::optional<std::string> get_local_hash(const fs::path& repo, std::string* error = nullptr);

/**
 * @brief Retrieve the branch `HEAD` refers to.
 *
 * @param repo  Path to a Git repository.
 * @param error Optional output string receiving a libgit2 error message.
 * @return Branch name or `std::nullopt` if it cannot be determined.
 */
std::optional<std::string> get_current_branch(const fs::path& repo, std::string* error = nullptr);

/**
 * @brief Clone @p url into @p dest as a bare repository.
 *
 * @param dest        Destination directory; must not contain a repository.
 * @param url         Remote repository URL.
 * @param transport   Optional credentials and proxy settings.
 * @param auth_failed Optional output flag set when authentication fails.
 * @param error       Optional output string receiving a libgit2 error message.
 * @return `true` on success.
 */
bool clone_bare(const fs::path& dest, const std::string& url,
                const TransportOptions* transport = nullptr, bool* auth_failed = nullptr,
                std::string* error = nullptr);

/**
 * @brief Fetch @p branch from @p remote and return the fetched commit hash.
 *
 * The branch is fetched into `refs/remotes/<remote>/<branch>`; local
 * branches and `HEAD` are left untouched.
 *
 * @return Commit hash of the remote branch or `std::nullopt` on failure.
 */
std::optional<std::string> fetch_remote(const fs::path& repo, const std::string& remote,
                                        const std::string& branch,
                                        const TransportOptions* transport = nullptr,
                                        bool* auth_failed = nullptr,
                                        std::string* error = nullptr);

/**
 * @brief Write the tree of commit @p revision into the directory @p dest.
 *
 * Regular and executable files are written and directories created;
 * symbolic links and submodules are skipped. When @p base_dir holds an
 * export of @p base_revision, files whose blob is unchanged are hard-linked
 * from it instead of being rewritten.
 *
 * @return `true` on success. @p dest may be partially populated on failure.
 */
bool export_tree(const fs::path& repo, const std::string& revision, const fs::path& dest,
                 const fs::path& base_dir = {}, const std::string& base_revision = {},
                 std::string* error = nullptr);

/**
 * @brief Point `refs/heads/<branch>` at @p revision and make it `HEAD`.
 *
 * The branch is created if needed.
 */
bool set_branch_target(const fs::path& repo, const std::string& branch,
                       const std::string& revision, std::string* error = nullptr);

} // namespace git

#endif // GIT_UTILS_HPP
