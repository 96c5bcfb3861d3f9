#ifndef VCS_HPP
#define VCS_HPP

#include <filesystem>
#include <string>
#include "git_utils.hpp"

namespace mirror {
namespace fs = std::filesystem;

/**
 * @brief Version-control operations the mirror relies on.
 *
 * Every method throws VcsError on failure. Implementations need not be
 * thread-safe; RepositoryMirror serializes all calls.
 */
class Vcs {
  public:
    virtual ~Vcs() = default;

    /** @return `true` when @p dir already holds a repository. */
    virtual bool has_repository(const fs::path& dir) = 0;

    /** Create a new local copy of @p url in @p dir. */
    virtual void clone(const std::string& url, const fs::path& dir) = 0;

    /**
     * @brief Download upstream changes without touching the published state.
     * @return Revision of the upstream branch after the fetch.
     */
    virtual std::string fetch(const fs::path& dir) = 0;

    /** @return Revision currently recorded as the local head. */
    virtual std::string head_revision(const fs::path& dir) = 0;

    /**
     * @brief Materialize the tree of @p revision into @p dest.
     *
     * @p base_dir, when not empty, is a complete export of @p base_revision
     * the implementation may share unchanged files with.
     */
    virtual void export_revision(const fs::path& dir, const std::string& revision,
                                 const fs::path& dest, const fs::path& base_dir,
                                 const std::string& base_revision) = 0;

    /** Record @p revision as the new local head. */
    virtual void advance_head(const fs::path& dir, const std::string& revision) = 0;
};

/**
 * @brief Vcs backed by libgit2 and a bare repository.
 *
 * Requires libgit2 to be initialized (see git::GitInitGuard).
 */
class LibGit2Vcs : public Vcs {
  public:
    /**
     * @param transport Credentials and proxy used for clone and fetch.
     * @param branch    Upstream branch to follow; empty follows the
     *                  remote's default branch.
     */
    explicit LibGit2Vcs(git::TransportOptions transport = {}, std::string branch = {});

    bool has_repository(const fs::path& dir) override;
    void clone(const std::string& url, const fs::path& dir) override;
    std::string fetch(const fs::path& dir) override;
    std::string head_revision(const fs::path& dir) override;
    void export_revision(const fs::path& dir, const std::string& revision, const fs::path& dest,
                         const fs::path& base_dir, const std::string& base_revision) override;
    void advance_head(const fs::path& dir, const std::string& revision) override;

  private:
    std::string branch_for(const fs::path& dir) const;

    git::TransportOptions transport_;
    std::string branch_;
};

} // namespace mirror

#endif // VCS_HPP
