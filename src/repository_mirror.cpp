#include "repository_mirror.hpp"
#include <atomic>
#include <system_error>
#include "errors.hpp"
#include "logger.hpp"

namespace mirror {

using sys_clock = std::chrono::system_clock;

const char* refresh_outcome_name(RefreshOutcome outcome) {
    switch (outcome) {
    case RefreshOutcome::Updated:
        return "updated";
    case RefreshOutcome::UpToDate:
        return "up-to-date";
    case RefreshOutcome::Failed:
        return "failed";
    case RefreshOutcome::Busy:
        return "busy";
    case RefreshOutcome::NotInitialized:
        return "not-initialized";
    }
    return "unknown";
}

RepositoryMirror::RepositoryMirror(Vcs& vcs) : vcs_(vcs) {}

std::shared_ptr<const MirrorState> RepositoryMirror::current() const {
    return std::atomic_load(&state_);
}

fs::path RepositoryMirror::current_root() const {
    auto s = current();
    if (!s || !s->snapshot)
        return {};
    return s->snapshot->root;
}

void RepositoryMirror::publish(std::shared_ptr<const Snapshot> snapshot,
                               sys_clock::time_point synced_at, std::optional<std::string> error) {
    auto next = std::make_shared<const MirrorState>(
        MirrorState{std::move(snapshot), synced_at, std::move(error)});
    std::atomic_store(&state_, std::move(next));
}

fs::path RepositoryMirror::snapshot_dir_for(const std::string& revision) const {
    const fs::path dir = snapshots_dir();
    fs::path target = dir / revision;
    // A retired copy of the same revision may still be in use.
    for (int n = 1; fs::exists(target); ++n)
        target = dir / (revision + "-" + std::to_string(n));
    return target;
}

std::shared_ptr<const Snapshot>
RepositoryMirror::materialize(const std::string& revision,
                              const std::shared_ptr<const Snapshot>& base) {
    const fs::path staging = snapshots_dir() / (".staging-" + revision);
    std::error_code ec;
    fs::remove_all(staging, ec);
    try {
        if (base)
            vcs_.export_revision(repository_dir(), revision, staging, base->root,
                                 base->revision);
        else
            vcs_.export_revision(repository_dir(), revision, staging, {}, {});
        const fs::path target = snapshot_dir_for(revision);
        fs::rename(staging, target);
        return std::make_shared<const Snapshot>(Snapshot{target, revision});
    } catch (const std::exception&) {
        fs::remove_all(staging, ec);
        throw;
    }
}

void RepositoryMirror::remove_stale(const std::string& keep) {
    std::error_code ec;
    size_t removed = 0;
    for (const auto& entry : fs::directory_iterator(snapshots_dir(), ec)) {
        if (entry.path().filename() == keep && entry.is_directory(ec))
            continue;
        std::error_code rm_ec;
        fs::remove_all(entry.path(), rm_ec);
        if (rm_ec)
            log_warning("Cannot remove stale snapshot",
                        {{"path", entry.path().string()}, {"error", rm_ec.message()}});
        else
            ++removed;
    }
    if (removed > 0)
        log_info("Removed stale snapshots", {{"count", std::to_string(removed)}});
}

void RepositoryMirror::prune_retired() {
    for (auto it = retired_.begin(); it != retired_.end();) {
        if (!it->first.expired()) {
            ++it;
            continue;
        }
        std::error_code ec;
        fs::remove_all(it->second, ec);
        if (ec) {
            log_warning("Cannot remove retired snapshot",
                        {{"path", it->second.string()}, {"error", ec.message()}});
            ++it;
            continue;
        }
        log_debug("Removed retired snapshot", {{"path", it->second.string()}});
        it = retired_.erase(it);
    }
}

void RepositoryMirror::ensure_initialized(const std::string& git_url,
                                          const fs::path& local_path) {
    std::lock_guard<std::mutex> lk(refresh_mtx_);
    std::error_code ec;
    fs::path abs = fs::absolute(local_path, ec);
    if (ec)
        throw AcquisitionError("Invalid local path " + local_path.string() + ": " + ec.message());
    abs = abs.lexically_normal();
    if (current()) {
        if (abs == local_path_)
            return;
        throw AcquisitionError("Mirror already initialized at " + local_path_.string());
    }
    local_path_ = abs;

    try {
        fs::create_directories(snapshots_dir());
        const fs::path repo = repository_dir();
        if (!vcs_.has_repository(repo)) {
            if (fs::exists(repo))
                fs::remove_all(repo); // leftover of an interrupted clone
            log_info("Cloning upstream", {{"url", git_url}, {"path", repo.string()}});
            vcs_.clone(git_url, repo);
        }
        const std::string revision = vcs_.head_revision(repo);
        remove_stale(revision);

        std::shared_ptr<const Snapshot> snap;
        const fs::path existing = snapshots_dir() / revision;
        if (fs::is_directory(existing)) {
            snap = std::make_shared<const Snapshot>(Snapshot{existing, revision});
            log_debug("Reusing snapshot", {{"path", existing.string()}});
        } else {
            snap = materialize(revision, nullptr);
        }
        publish(std::move(snap), sys_clock::now(), std::nullopt);
        log_info("Mirror ready", {{"revision", revision}, {"root", current_root().string()}});
    } catch (const VcsError& e) {
        local_path_.clear();
        throw AcquisitionError(std::string("Cannot acquire repository: ") + e.what());
    } catch (const fs::filesystem_error& e) {
        local_path_.clear();
        throw AcquisitionError(std::string("Cannot prepare local path: ") + e.what());
    }
}

void RepositoryMirror::update_to_upstream(const MirrorState& cur, RefreshOutcome& outcome) {
    const fs::path repo = repository_dir();
    try {
        const std::string revision = vcs_.fetch(repo);
        if (revision == cur.snapshot->revision) {
            publish(cur.snapshot, sys_clock::now(), std::nullopt);
            outcome = RefreshOutcome::UpToDate;
            return;
        }
        auto snap = materialize(revision, cur.snapshot);
        try {
            vcs_.advance_head(repo, revision);
        } catch (const VcsError&) {
            std::error_code ec;
            fs::remove_all(snap->root, ec);
            throw;
        }
        publish(snap, sys_clock::now(), std::nullopt);
        retired_.emplace_back(cur.snapshot, cur.snapshot->root);
        log_info("Mirror updated", {{"from", cur.snapshot->revision}, {"to", revision}});
        outcome = RefreshOutcome::Updated;
    } catch (const VcsError& e) {
        throw RefreshError(e.what());
    } catch (const fs::filesystem_error& e) {
        throw RefreshError(e.what());
    }
}

RefreshOutcome RepositoryMirror::refresh() {
    std::unique_lock<std::mutex> lk(refresh_mtx_, std::try_to_lock);
    if (!lk.owns_lock())
        return RefreshOutcome::Busy;
    auto cur = current();
    if (!cur)
        return RefreshOutcome::NotInitialized;

    prune_retired();
    RefreshOutcome outcome = RefreshOutcome::Failed;
    try {
        update_to_upstream(*cur, outcome);
    } catch (const RefreshError& e) {
        log_error("Refresh failed",
                  {{"error", e.what()}, {"revision", cur->snapshot->revision}});
        publish(cur->snapshot, cur->last_synced_at, std::string(e.what()));
        outcome = RefreshOutcome::Failed;
    }
    cur.reset();
    prune_retired();
    return outcome;
}

} // namespace mirror
