#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

namespace mirror {

/**
 * @brief Base class for every failure raised by the mirror core.
 */
class MirrorError : public std::runtime_error {
  public:
    explicit MirrorError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief The initial local copy could not be established.
 *
 * Raised by RepositoryMirror::ensure_initialized when the remote is
 * unreachable or the local path cannot be written. Fatal at startup.
 */
class AcquisitionError : public MirrorError {
  public:
    using MirrorError::MirrorError;
};

/**
 * @brief A periodic refresh failed.
 *
 * Never escapes RepositoryMirror::refresh; the message is recorded in the
 * current MirrorState and the scheduler retries on its next tick.
 */
class RefreshError : public MirrorError {
  public:
    using MirrorError::MirrorError;
};

/** @brief Failure reported by a Vcs implementation. */
class VcsError : public MirrorError {
  public:
    using MirrorError::MirrorError;
};

/** @brief The client sent a malformed or escaping path (HTTP 400). */
class RequestPathError : public MirrorError {
  public:
    using MirrorError::MirrorError;
};

/** @brief The requested path does not exist in the snapshot (HTTP 404). */
class NotFoundError : public MirrorError {
  public:
    using MirrorError::MirrorError;
};

/** @brief Local I/O failure while serving a present file (HTTP 500). */
class ReadError : public MirrorError {
  public:
    using MirrorError::MirrorError;
};

} // namespace mirror

#endif // ERRORS_HPP
