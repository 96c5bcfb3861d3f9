#include "test_common.hpp"
#include <condition_variable>
#include "repository_mirror.hpp"

using indexmirror::test_support::read_file;
using indexmirror::test_support::scratch_dir;
using indexmirror::test_support::write_file;
using mirror::RefreshOutcome;
using mirror::RepositoryMirror;

namespace {

/// In-memory Vcs: each revision is a fixed set of files.
class FakeVcs : public mirror::Vcs {
  public:
    std::map<std::string, std::map<std::string, std::string>> trees{
        {"r1", {{"config.json", "{\"dl\":\"v1\"}"}, {"cr/at/crate", "crate v1"}}},
        {"r2", {{"config.json", "{\"dl\":\"v2\"}"}, {"cr/at/crate", "crate v2"}}},
        {"r3", {{"config.json", "{\"dl\":\"v3\"}"}, {"cr/at/crate", "crate v3"}}}};

    void set_upstream(const std::string& rev) {
        std::lock_guard<std::mutex> lk(mtx_);
        upstream_ = rev;
    }
    void fail_fetch(bool fail) { fail_fetch_ = fail; }
    void fail_clone(bool fail) { fail_clone_ = fail; }
    void fail_export(bool fail) { fail_export_ = fail; }
    int clones() const { return clones_.load(); }

    /// Make the next export wait until release_export() is called.
    void hold_export() {
        std::lock_guard<std::mutex> lk(mtx_);
        hold_ = true;
        in_export_ = false;
    }
    void wait_until_exporting() {
        std::unique_lock<std::mutex> lk(mtx_);
        cv_.wait(lk, [this] { return in_export_; });
    }
    void release_export() {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            hold_ = false;
        }
        cv_.notify_all();
    }

    bool has_repository(const fs::path& dir) override { return fs::exists(dir / "HEAD"); }

    void clone(const std::string& url, const fs::path& dir) override {
        if (fail_clone_)
            throw mirror::VcsError("cannot reach " + url);
        ++clones_;
        std::lock_guard<std::mutex> lk(mtx_);
        write_file(dir / "HEAD", upstream_);
        head_ = upstream_;
    }

    std::string fetch(const fs::path&) override {
        if (fail_fetch_)
            throw mirror::VcsError("connection refused");
        std::lock_guard<std::mutex> lk(mtx_);
        return upstream_;
    }

    std::string head_revision(const fs::path&) override {
        std::lock_guard<std::mutex> lk(mtx_);
        return head_;
    }

    void export_revision(const fs::path&, const std::string& revision, const fs::path& dest,
                         const fs::path&, const std::string&) override {
        {
            std::unique_lock<std::mutex> lk(mtx_);
            in_export_ = true;
            cv_.notify_all();
            cv_.wait(lk, [this] { return !hold_; });
        }
        fs::create_directories(dest);
        for (const auto& [name, content] : trees.at(revision))
            write_file(dest / name, content);
        if (fail_export_)
            throw mirror::VcsError("disk full");
    }

    void advance_head(const fs::path&, const std::string& revision) override {
        std::lock_guard<std::mutex> lk(mtx_);
        head_ = revision;
    }

  private:
    std::mutex mtx_;
    std::condition_variable cv_;
    std::string upstream_ = "r1";
    std::string head_;
    bool hold_ = false;
    bool in_export_ = false;
    std::atomic<bool> fail_fetch_{false};
    std::atomic<bool> fail_clone_{false};
    std::atomic<bool> fail_export_{false};
    std::atomic<int> clones_{0};
};

bool has_staging(const fs::path& snapshots) {
    for (const auto& e : fs::directory_iterator(snapshots))
        if (e.path().filename().string().rfind(".staging-", 0) == 0)
            return true;
    return false;
}

} // namespace

TEST_CASE("ensure_initialized clones and publishes the head") {
    fs::path dir = scratch_dir("mirror_init");
    FakeVcs vcs;
    RepositoryMirror m(vcs);
    REQUIRE(m.current() == nullptr);
    REQUIRE(m.current_root().empty());

    m.ensure_initialized("https://example.com/index.git", dir);
    auto state = m.current();
    REQUIRE(state);
    REQUIRE(state->snapshot->revision == "r1");
    REQUIRE_FALSE(state->last_error);
    REQUIRE(m.current_root() == m.snapshots_dir() / "r1");
    REQUIRE(read_file(m.current_root() / "config.json") == "{\"dl\":\"v1\"}");
    REQUIRE(read_file(m.current_root() / "cr/at/crate") == "crate v1");
    REQUIRE(vcs.clones() == 1);

    // Same path again is a no-op, another path is refused.
    m.ensure_initialized("https://example.com/index.git", dir);
    REQUIRE(vcs.clones() == 1);
    REQUIRE(m.current() == state);
    REQUIRE_THROWS_AS(m.ensure_initialized("https://example.com/index.git", dir / "other"),
                      mirror::AcquisitionError);
    FS_REMOVE_ALL(dir);
}

TEST_CASE("ensure_initialized reports an unreachable remote") {
    fs::path dir = scratch_dir("mirror_unreachable");
    FakeVcs vcs;
    vcs.fail_clone(true);
    RepositoryMirror m(vcs);
    REQUIRE_THROWS_AS(m.ensure_initialized("https://invalid.example/index.git", dir),
                      mirror::AcquisitionError);
    REQUIRE(m.current() == nullptr);
    REQUIRE(m.refresh() == RefreshOutcome::NotInitialized);
    FS_REMOVE_ALL(dir);
}

TEST_CASE("refresh before initialization does nothing") {
    FakeVcs vcs;
    RepositoryMirror m(vcs);
    REQUIRE(m.refresh() == RefreshOutcome::NotInitialized);
    REQUIRE(m.current() == nullptr);
}

TEST_CASE("refresh with an unchanged upstream keeps the snapshot") {
    fs::path dir = scratch_dir("mirror_uptodate");
    FakeVcs vcs;
    RepositoryMirror m(vcs);
    m.ensure_initialized("u", dir);
    auto before = m.current();

    REQUIRE(m.refresh() == RefreshOutcome::UpToDate);
    auto after = m.current();
    REQUIRE(after->snapshot == before->snapshot);
    REQUIRE(after->last_synced_at >= before->last_synced_at);
    REQUIRE_FALSE(after->last_error);
    FS_REMOVE_ALL(dir);
}

TEST_CASE("refresh publishes a new revision and removes the old tree") {
    fs::path dir = scratch_dir("mirror_update");
    FakeVcs vcs;
    RepositoryMirror m(vcs);
    m.ensure_initialized("u", dir);
    const fs::path old_root = m.current_root();

    vcs.set_upstream("r2");
    REQUIRE(m.refresh() == RefreshOutcome::Updated);
    REQUIRE(m.current()->snapshot->revision == "r2");
    REQUIRE(m.current_root() == m.snapshots_dir() / "r2");
    REQUIRE(read_file(m.current_root() / "config.json") == "{\"dl\":\"v2\"}");
    REQUIRE(vcs.head_revision(m.repository_dir()) == "r2");
    REQUIRE_FALSE(fs::exists(old_root));
    REQUIRE_FALSE(has_staging(m.snapshots_dir()));
    FS_REMOVE_ALL(dir);
}

TEST_CASE("a held snapshot outlives its replacement") {
    fs::path dir = scratch_dir("mirror_held");
    FakeVcs vcs;
    RepositoryMirror m(vcs);
    m.ensure_initialized("u", dir);
    auto held = m.current();
    const fs::path old_root = held->snapshot->root;

    vcs.set_upstream("r2");
    REQUIRE(m.refresh() == RefreshOutcome::Updated);
    REQUIRE(fs::exists(old_root));
    REQUIRE(read_file(old_root / "cr/at/crate") == "crate v1");

    held.reset();
    REQUIRE(m.refresh() == RefreshOutcome::UpToDate);
    REQUIRE_FALSE(fs::exists(old_root));
    FS_REMOVE_ALL(dir);
}

TEST_CASE("a failed fetch keeps serving the previous revision") {
    fs::path dir = scratch_dir("mirror_fetch_fail");
    FakeVcs vcs;
    RepositoryMirror m(vcs);
    m.ensure_initialized("u", dir);
    auto before = m.current();

    vcs.set_upstream("r2");
    vcs.fail_fetch(true);
    REQUIRE(m.refresh() == RefreshOutcome::Failed);
    auto failed = m.current();
    REQUIRE(failed->snapshot == before->snapshot);
    REQUIRE(failed->last_synced_at == before->last_synced_at);
    REQUIRE(failed->last_error);
    REQUIRE(failed->last_error->find("connection refused") != std::string::npos);
    REQUIRE(read_file(m.current_root() / "config.json") == "{\"dl\":\"v1\"}");

    vcs.fail_fetch(false);
    REQUIRE(m.refresh() == RefreshOutcome::Updated);
    REQUIRE(m.current()->snapshot->revision == "r2");
    REQUIRE_FALSE(m.current()->last_error);
    FS_REMOVE_ALL(dir);
}

TEST_CASE("a failed export leaves no partial tree behind") {
    fs::path dir = scratch_dir("mirror_export_fail");
    FakeVcs vcs;
    RepositoryMirror m(vcs);
    m.ensure_initialized("u", dir);

    vcs.set_upstream("r2");
    vcs.fail_export(true);
    REQUIRE(m.refresh() == RefreshOutcome::Failed);
    REQUIRE(m.current()->snapshot->revision == "r1");
    REQUIRE(vcs.head_revision(m.repository_dir()) == "r1");
    REQUIRE_FALSE(fs::exists(m.snapshots_dir() / "r2"));
    REQUIRE_FALSE(has_staging(m.snapshots_dir()));
    FS_REMOVE_ALL(dir);
}

TEST_CASE("a concurrent refresh reports Busy") {
    fs::path dir = scratch_dir("mirror_busy");
    FakeVcs vcs;
    RepositoryMirror m(vcs);
    m.ensure_initialized("u", dir);

    vcs.set_upstream("r2");
    vcs.hold_export();
    RefreshOutcome first = RefreshOutcome::Failed;
    std::thread worker([&] { first = m.refresh(); });
    vcs.wait_until_exporting();

    REQUIRE(m.refresh() == RefreshOutcome::Busy);
    // Readers still see the old tree while the export is paused.
    REQUIRE(m.current()->snapshot->revision == "r1");
    REQUIRE(read_file(m.current_root() / "config.json") == "{\"dl\":\"v1\"}");

    vcs.release_export();
    worker.join();
    REQUIRE(first == RefreshOutcome::Updated);
    REQUIRE(m.current()->snapshot->revision == "r2");
    FS_REMOVE_ALL(dir);
}

TEST_CASE("readers never see a mix of two revisions") {
    fs::path dir = scratch_dir("mirror_readers");
    FakeVcs vcs;
    RepositoryMirror m(vcs);
    m.ensure_initialized("u", dir);

    std::atomic<bool> done{false};
    std::atomic<int> mismatches{0};
    std::atomic<int> reads{0};
    std::vector<std::thread> readers;
    for (int i = 0; i < 4; ++i) {
        readers.emplace_back([&] {
            while (!done) {
                auto state = m.current();
                const fs::path root = state->snapshot->root;
                const std::string cfg = read_file(root / "config.json");
                const std::string crate = read_file(root / "cr/at/crate");
                if (cfg.size() < 4) {
                    ++mismatches;
                    continue;
                }
                const std::string v = cfg.substr(cfg.size() - 4, 2);
                if (crate != "crate " + v)
                    ++mismatches;
                ++reads;
            }
        });
    }
    for (const char* rev : {"r2", "r3", "r1", "r2", "r3"}) {
        vcs.set_upstream(rev);
        REQUIRE(m.refresh() == RefreshOutcome::Updated);
    }
    done = true;
    for (auto& t : readers)
        t.join();
    REQUIRE(reads.load() > 0);
    REQUIRE(mismatches.load() == 0);
    FS_REMOVE_ALL(dir);
}

TEST_CASE("restart reuses the existing clone and clears leftovers") {
    fs::path dir = scratch_dir("mirror_restart");
    FakeVcs vcs;
    {
        RepositoryMirror m(vcs);
        m.ensure_initialized("u", dir);
    }
    write_file(dir / "snapshots" / ".staging-r9" / "partial", "x");
    write_file(dir / "snapshots" / "r0" / "config.json", "old");

    RepositoryMirror again(vcs);
    again.ensure_initialized("u", dir);
    REQUIRE(vcs.clones() == 1);
    REQUIRE(again.current()->snapshot->revision == "r1");
    REQUIRE(read_file(again.current_root() / "config.json") == "{\"dl\":\"v1\"}");
    REQUIRE_FALSE(fs::exists(dir / "snapshots" / ".staging-r9"));
    REQUIRE_FALSE(fs::exists(dir / "snapshots" / "r0"));
    FS_REMOVE_ALL(dir);
}

TEST_CASE("refresh_outcome_name") {
    REQUIRE(std::string(mirror::refresh_outcome_name(RefreshOutcome::Updated)) == "updated");
    REQUIRE(std::string(mirror::refresh_outcome_name(RefreshOutcome::Busy)) == "busy");
}
