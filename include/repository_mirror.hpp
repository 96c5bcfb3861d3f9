#ifndef REPOSITORY_MIRROR_HPP
#define REPOSITORY_MIRROR_HPP

#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "vcs.hpp"

namespace mirror {
namespace fs = std::filesystem;

/// One fully exported, immutable tree.
struct Snapshot {
    fs::path root;
    std::string revision;
};

/**
 * @brief The published view of the mirror.
 *
 * Never modified after publication; each refresh publishes a new one.
 */
struct MirrorState {
    std::shared_ptr<const Snapshot> snapshot;
    std::chrono::system_clock::time_point last_synced_at; ///< Last successful sync
    std::optional<std::string> last_error;                ///< Set by a failed refresh
};

enum class RefreshOutcome { Updated, UpToDate, Failed, Busy, NotInitialized };

const char* refresh_outcome_name(RefreshOutcome outcome);

/**
 * @brief Owns the local copy of the upstream repository.
 *
 * Layout under the local path:
 *  - `repo.git/` bare repository used for fetching
 *  - `snapshots/<revision>/` published trees
 *  - `snapshots/.staging-<revision>/` exports in progress
 *
 * Readers call current() and keep the returned pointer for as long as they
 * use files under its root. A retired snapshot directory is deleted only
 * once its last reader has let go.
 */
class RepositoryMirror {
  public:
    explicit RepositoryMirror(Vcs& vcs);
    RepositoryMirror(const RepositoryMirror&) = delete;
    RepositoryMirror& operator=(const RepositoryMirror&) = delete;

    /**
     * @brief Clone when needed and publish the local head.
     *
     * Calling it again with the same path is a no-op.
     *
     * @throws AcquisitionError if the remote cannot be cloned or the path
     *         cannot be written.
     */
    void ensure_initialized(const std::string& git_url, const fs::path& local_path);

    /**
     * @brief Fetch upstream and publish the new revision, if any.
     *
     * Never throws. On failure the previous snapshot stays current and the
     * error is recorded in MirrorState::last_error. Returns
     * RefreshOutcome::Busy without doing anything when another refresh is
     * in flight.
     */
    RefreshOutcome refresh();

    /** @return Current state, or `nullptr` before initialization. */
    std::shared_ptr<const MirrorState> current() const;

    /** @return Root of the current snapshot, empty before initialization. */
    fs::path current_root() const;

    const fs::path& local_path() const { return local_path_; }
    fs::path repository_dir() const { return local_path_ / "repo.git"; }
    fs::path snapshots_dir() const { return local_path_ / "snapshots"; }

  private:
    void update_to_upstream(const MirrorState& cur, RefreshOutcome& outcome);
    std::shared_ptr<const Snapshot> materialize(const std::string& revision,
                                                const std::shared_ptr<const Snapshot>& base);
    fs::path snapshot_dir_for(const std::string& revision) const;
    void publish(std::shared_ptr<const Snapshot> snapshot,
                 std::chrono::system_clock::time_point synced_at,
                 std::optional<std::string> error);
    void remove_stale(const std::string& keep);
    void prune_retired();

    Vcs& vcs_;
    fs::path local_path_;
    std::shared_ptr<const MirrorState> state_; ///< Accessed only through atomic_load/store
    std::mutex refresh_mtx_;                   ///< Serializes writers
    std::vector<std::pair<std::weak_ptr<const Snapshot>, fs::path>> retired_;
};

} // namespace mirror

#endif // REPOSITORY_MIRROR_HPP
