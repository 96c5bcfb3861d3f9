#ifndef HTTP_SERVER_HPP
#define HTTP_SERVER_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "bounded_queue.hpp"
#include "index_file_server.hpp"

namespace httpd {

/// Largest accepted request head (request line plus headers).
constexpr size_t MAX_REQUEST_HEAD = 64 * 1024;

/**
 * @brief Minimal HTTP/1.1 front end for IndexFileServer.
 *
 * One thread accepts connections and hands them to a fixed pool of workers
 * through a bounded queue. Every connection carries a single request and is
 * closed after the response.
 */
class HttpServer {
  public:
    /**
     * @param bind_addr IPv4 address to listen on.
     * @param port      TCP port; `0` picks a free one (see port()).
     * @param files     Request handler.
     * @param workers   Number of request worker threads.
     * @param request_timeout Limit for receiving the whole request head, and
     *                        the send timeout for the response.
     */
    HttpServer(std::string bind_addr, uint16_t port, const mirror::IndexFileServer& files,
               size_t workers = 8,
               std::chrono::seconds request_timeout = std::chrono::seconds(30));
    ~HttpServer();
    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /**
     * @brief Bind, listen and spawn the threads.
     * @return `false` if the socket could not be set up; the reason is logged.
     */
    bool start();

    /// Stop accepting, finish queued requests and join all threads.
    void stop();

    bool running() const { return running_.load(); }

    /// Port actually bound, valid after a successful start().
    uint16_t port() const { return bound_port_; }

  private:
    void accept_loop();
    void worker_loop();
    void handle_connection(int fd);

    std::string bind_addr_;
    uint16_t port_;
    uint16_t bound_port_ = 0;
    const mirror::IndexFileServer& files_;
    size_t worker_count_;
    std::chrono::seconds request_timeout_;

    int listen_fd_ = -1;
    std::atomic<bool> running_{false};
    std::mutex lifecycle_mu_;
    std::unique_ptr<BoundedQueue<int>> connections_;
    std::thread accept_thread_;
    std::vector<std::thread> workers_;
};

/// Standard reason phrase for @p status.
const char* reason_phrase(int status);

} // namespace httpd

#endif // HTTP_SERVER_HPP
