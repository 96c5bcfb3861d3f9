#ifndef LOCKFILE_HPP
#define LOCKFILE_HPP
#include <filesystem>
#include <string>

/** RAII class that creates a lock directory inside the mirror's local
 *  path to prevent two instances from managing the same copy. */
class LockFile {
  public:
    explicit LockFile(const std::filesystem::path& dir);
    ~LockFile();
    LockFile(const LockFile&) = delete;
    LockFile& operator=(const LockFile&) = delete;

    bool acquired() const;
    const std::string& error() const;
    const std::filesystem::path& path() const { return lock_dir_; }

  private:
    std::filesystem::path lock_dir_;
    bool locked_ = false;
    std::string err_;
};

#endif // LOCKFILE_HPP
