#ifndef SERVER_PROCESS_HPP
#define SERVER_PROCESS_HPP
#include "git_utils.hpp"
#include "options.hpp"

namespace cli {

/** Start the logger and optional syslog sink described by @p opts. */
void setup_logging(const LoggingOptions& opts);

/** Translate the command line git settings into libgit2 transport options. */
git::TransportOptions make_transport(const GitTransportOptions& opts);

/**
 * @brief Run the mirror until SIGINT/SIGTERM, or once with `--single-run`.
 *
 * Expects libgit2 to be initialized and @p opts to be validated.
 *
 * @return Process exit code: 0 on clean shutdown, 1 on startup failure or a
 *         failed single run.
 */
int run_server(const Options& opts);

} // namespace cli

#endif // SERVER_PROCESS_HPP
