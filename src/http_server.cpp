#include "http_server.hpp"
#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <sstream>
#include <strings.h>
#include "logger.hpp"
#include "time_utils.hpp"
#include "version.hpp"

namespace httpd {

const char* reason_phrase(int status) {
    switch (status) {
    case 200:
        return "OK";
    case 304:
        return "Not Modified";
    case 400:
        return "Bad Request";
    case 404:
        return "Not Found";
    case 405:
        return "Method Not Allowed";
    case 500:
        return "Internal Server Error";
    case 503:
        return "Service Unavailable";
    default:
        return "Unknown";
    }
}

HttpServer::HttpServer(std::string bind_addr, uint16_t port,
                       const mirror::IndexFileServer& files, size_t workers,
                       std::chrono::seconds request_timeout)
    : bind_addr_(std::move(bind_addr)), port_(port), files_(files),
      worker_count_(workers == 0 ? 1 : workers), request_timeout_(request_timeout) {}

HttpServer::~HttpServer() { stop(); }

bool HttpServer::start() {
    std::lock_guard<std::mutex> lk(lifecycle_mu_);
    if (running_)
        return true;

    sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port_);
    if (inet_pton(AF_INET, bind_addr_.c_str(), &addr.sin_addr) != 1) {
        log_error("Invalid listen address", {{"address", bind_addr_}});
        return false;
    }

    listen_fd_ = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (listen_fd_ < 0) {
        log_error("socket() failed", {{"error", std::strerror(errno)}});
        return false;
    }
    int opt = 1;
    setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));
    if (bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0 ||
        listen(listen_fd_, 128) < 0) {
        log_error("Cannot listen",
                  {{"address", bind_addr_},
                   {"port", std::to_string(port_)},
                   {"error", std::strerror(errno)}});
        close(listen_fd_);
        listen_fd_ = -1;
        return false;
    }
    socklen_t len = sizeof(addr);
    if (getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len) == 0)
        bound_port_ = ntohs(addr.sin_port);
    else
        bound_port_ = port_;

    connections_ = std::make_unique<BoundedQueue<int>>(worker_count_ * 16);
    running_ = true;
    for (size_t i = 0; i < worker_count_; ++i)
        workers_.emplace_back(&HttpServer::worker_loop, this);
    accept_thread_ = std::thread(&HttpServer::accept_loop, this);
    log_info("HTTP server listening", {{"address", bind_addr_},
                                       {"port", std::to_string(bound_port_)},
                                       {"workers", std::to_string(worker_count_)}});
    return true;
}

void HttpServer::stop() {
    std::lock_guard<std::mutex> lk(lifecycle_mu_);
    if (!running_)
        return;
    running_ = false;
    // Wakes the blocked accept() call.
    shutdown(listen_fd_, SHUT_RDWR);
    if (accept_thread_.joinable())
        accept_thread_.join();
    close(listen_fd_);
    listen_fd_ = -1;
    connections_->close();
    for (auto& t : workers_)
        if (t.joinable())
            t.join();
    workers_.clear();
    connections_.reset();
    log_info("HTTP server stopped");
}

void HttpServer::accept_loop() {
    while (running_) {
        sockaddr_in client;
        socklen_t clen = sizeof(client);
        int fd = accept4(listen_fd_, reinterpret_cast<sockaddr*>(&client), &clen, SOCK_CLOEXEC);
        if (!running_) {
            if (fd >= 0)
                close(fd);
            break;
        }
        if (fd < 0) {
            if (errno != EINTR && errno != ECONNABORTED)
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
            continue;
        }
        timeval tv{};
        tv.tv_sec = static_cast<time_t>(request_timeout_.count());
        setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
        if (!connections_->push(fd))
            close(fd);
    }
}

void HttpServer::worker_loop() {
    int fd = -1;
    while (connections_->pop(fd))
        handle_connection(fd);
}

enum class ReadResult { Complete, TooLarge, TimedOut, Failed };

// Read until the end of the request head or until @p deadline passes.
static ReadResult read_request_head(int fd, std::string& out,
                                    std::chrono::steady_clock::time_point deadline) {
    char buf[4096];
    while (true) {
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (left.count() <= 0)
            return ReadResult::TimedOut;
        pollfd pfd{fd, POLLIN, 0};
        int ready = poll(&pfd, 1, static_cast<int>(left.count()));
        if (ready < 0 && errno == EINTR)
            continue;
        if (ready < 0)
            return ReadResult::Failed;
        if (ready == 0)
            return ReadResult::TimedOut;
        ssize_t r = recv(fd, buf, sizeof(buf), 0);
        if (r < 0 && errno == EINTR)
            continue;
        if (r <= 0)
            return ReadResult::Failed;
        out.append(buf, static_cast<size_t>(r));
        if (out.find("\r\n\r\n") != std::string::npos)
            return ReadResult::Complete;
        if (out.size() > MAX_REQUEST_HEAD)
            return ReadResult::TooLarge;
    }
}

static bool send_all(int fd, const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR)
            continue;
        if (n <= 0)
            return false;
        sent += static_cast<size_t>(n);
    }
    return true;
}

// Read and drop what the client is still sending so close() does not
// reset the connection before the response arrives.
static void drain_input(int fd) {
    shutdown(fd, SHUT_WR);
    char buf[4096];
    size_t total = 0;
    while (total < 4 * MAX_REQUEST_HEAD) {
        ssize_t r = recv(fd, buf, sizeof(buf), 0);
        if (r < 0 && errno == EINTR)
            continue;
        if (r <= 0)
            break;
        total += static_cast<size_t>(r);
    }
}

static std::string serialize(const mirror::IndexResponse& res) {
    std::ostringstream os;
    os << "HTTP/1.1 " << res.status << " " << reason_phrase(res.status) << "\r\n";
    for (const auto& [name, value] : res.headers)
        os << name << ": " << value << "\r\n";
    os << "Date: " << http_date(std::chrono::system_clock::now()) << "\r\n"
       << "Server: " << INDEXMIRROR_SERVER_TOKEN << "\r\n"
       << "Connection: close\r\n\r\n";
    if (res.status != 304)
        os << res.body;
    return os.str();
}

static mirror::IndexResponse plain_response(int status) {
    mirror::IndexResponse res;
    res.status = status;
    res.body = std::to_string(status) + " " + reason_phrase(status) + "\n";
    res.headers["Content-Type"] = "text/plain; charset=utf-8";
    res.headers["Content-Length"] = std::to_string(res.body.size());
    return res;
}

void HttpServer::handle_connection(int fd) {
    const auto started = std::chrono::steady_clock::now();
    std::string head;
    std::string method;
    std::string target;
    mirror::IndexResponse res;

    ReadResult rr = read_request_head(fd, head, started + request_timeout_);
    if (rr == ReadResult::TimedOut)
        log_debug("Request head timed out", {{"bytes", std::to_string(head.size())}});
    if (rr == ReadResult::Failed || rr == ReadResult::TimedOut) {
        close(fd);
        return;
    }
    if (rr == ReadResult::TooLarge) {
        res = plain_response(400);
    } else {
        std::istringstream rs(head);
        std::string line;
        std::getline(rs, line);
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        std::istringstream rl(line);
        std::string proto;
        std::string extra;
        rl >> method >> target >> proto;
        mirror::IndexRequest req;
        bool valid = !method.empty() && !target.empty() && proto.rfind("HTTP/1.", 0) == 0 &&
                     !(rl >> extra) && target[0] == '/';
        while (valid && std::getline(rs, line)) {
            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            if (line.empty())
                break;
            size_t colon = line.find(':');
            if (colon == std::string::npos) {
                valid = false;
                break;
            }
            std::string name = line.substr(0, colon);
            std::string value = line.substr(colon + 1);
            value.erase(0, value.find_first_not_of(" \t"));
            if (strcasecmp(name.c_str(), "If-None-Match") == 0)
                req.if_none_match = value;
        }
        if (!valid) {
            res = plain_response(400);
        } else if (method != "GET") {
            res = plain_response(405);
            res.headers["Allow"] = "GET";
        } else {
            req.path = target;
            try {
                res = files_.handle(req);
            } catch (const std::exception& e) {
                log_error("Request handler failed", {{"path", target}, {"error", e.what()}});
                res = plain_response(500);
            }
        }
    }

    const std::string wire = serialize(res);
    if (!send_all(fd, wire))
        log_debug("Client went away", {{"path", target}, {"error", std::strerror(errno)}});
    else if (rr == ReadResult::TooLarge)
        drain_input(fd);
    close(fd);
    const auto took = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    log_debug("request", {{"method", method},
                          {"path", target},
                          {"status", std::to_string(res.status)},
                          {"bytes", std::to_string(res.status == 304 ? 0 : res.body.size())},
                          {"ms", std::to_string(took.count())}});
}

} // namespace httpd
