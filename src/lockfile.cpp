#include "lockfile.hpp"
#include <signal.h>
#include <unistd.h>
#include <cerrno>
#include <fstream>
#include <system_error>

namespace {

bool process_running(int pid) {
    if (pid <= 0)
        return false;
    return kill(pid, 0) == 0 || errno != ESRCH;
}

} // namespace

LockFile::LockFile(const std::filesystem::path& dir) : lock_dir_(dir / ".indexmirror-lock") {
    namespace fs = std::filesystem;
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (fs::exists(lock_dir_, ec)) {
        std::ifstream f(lock_dir_ / "pid");
        int pid = 0;
        if (f)
            f >> pid;
        if (pid != 0 && process_running(pid)) {
            err_ = "Another instance is already running (PID " + std::to_string(pid) + ")";
            return;
        }
        // Left behind by a process that no longer exists.
        fs::remove_all(lock_dir_, ec);
    }
    if (!fs::create_directory(lock_dir_, ec)) {
        err_ = "Failed to create lock directory " + lock_dir_.string();
        if (ec)
            err_ += ": " + ec.message();
        return;
    }
    std::ofstream out(lock_dir_ / "pid");
    out << static_cast<int>(getpid());
    if (!out) {
        err_ = "Failed to write " + (lock_dir_ / "pid").string();
        fs::remove_all(lock_dir_, ec);
        return;
    }
    locked_ = true;
}

LockFile::~LockFile() {
    if (locked_) {
        std::error_code ec;
        std::filesystem::remove_all(lock_dir_, ec);
    }
}

bool LockFile::acquired() const { return locked_; }
const std::string& LockFile::error() const { return err_; }
