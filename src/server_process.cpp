#include "server_process.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <thread>
#include "errors.hpp"
#include "http_server.hpp"
#include "index_file_server.hpp"
#include "lockfile.hpp"
#include "logger.hpp"
#include "repository_mirror.hpp"
#include "sync_scheduler.hpp"
#include "time_utils.hpp"
#include "vcs.hpp"
#include "version.hpp"

namespace cli {

static std::atomic<bool> g_running{false};

static void handle_signal(int) { g_running.store(false); }

void setup_logging(const LoggingOptions& opts) {
    set_json_logging(opts.json_log);
    set_log_compression(opts.compress_logs);
    init_logger(opts.log_file, opts.log_level, opts.max_log_size, opts.max_log_files);
    if (opts.use_syslog)
        init_syslog();
}

git::TransportOptions make_transport(const GitTransportOptions& opts) {
    git::TransportOptions t;
    t.ssh_public_key = opts.ssh_public_key;
    t.ssh_private_key = opts.ssh_private_key;
    t.credential_file = opts.credential_file;
    t.proxy_url = opts.proxy_url;
    return t;
}

static int serve(const Options& opts) {
    if (opts.git.timeout.count() > 0)
        git::set_libgit_timeout(static_cast<unsigned int>(opts.git.timeout.count()));

    LockFile lock(opts.repo.path);
    if (!lock.acquired()) {
        log_error("Cannot lock local path", {{"error", lock.error()}});
        return 1;
    }

    mirror::LibGit2Vcs vcs(make_transport(opts.git), opts.repo.branch);
    mirror::RepositoryMirror repo(vcs);
    try {
        repo.ensure_initialized(opts.repo.git_url, opts.repo.path);
    } catch (const mirror::AcquisitionError& e) {
        log_error("Initial acquisition failed", {{"error", e.what()}});
        return 1;
    }

    if (opts.single_run) {
        const mirror::RefreshOutcome outcome = repo.refresh();
        log_info("Single run finished", {{"outcome", mirror::refresh_outcome_name(outcome)}});
        return outcome == mirror::RefreshOutcome::Failed ? 1 : 0;
    }

    mirror::IndexFileServer files(repo, opts.web.listing);
    httpd::HttpServer server(opts.web.address, opts.web.port, files, opts.web.workers,
                             opts.web.request_timeout);
    if (!server.start())
        return 1;
    mirror::SyncScheduler scheduler(repo, opts.repo.interval);

    g_running.store(true);
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);
    scheduler.start();
    while (g_running.load())
        std::this_thread::sleep_for(std::chrono::milliseconds(200));

    log_info("Shutting down");
    scheduler.stop();
    server.stop();
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    return 0;
}

int run_server(const Options& opts) {
    setup_logging(opts.logging);
    log_info("Starting indexmirror", {{"version", INDEXMIRROR_VERSION},
                                      {"url", opts.repo.git_url},
                                      {"path", opts.repo.path.string()},
                                      {"interval", format_duration_short(opts.repo.interval)}});
    if (!opts.config_file.empty())
        log_info("Loaded configuration", {{"file", opts.config_file.string()}});
    const int rc = serve(opts);
    log_info("Exiting", {{"code", std::to_string(rc)}});
    shutdown_logger();
    return rc;
}

} // namespace cli
