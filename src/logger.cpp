#include "logger.hpp"
#include <zlib.h>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>
#include "time_utils.hpp"
#ifdef __linux__
#include <syslog.h>
#endif

namespace fs = std::filesystem;

static std::ofstream g_log_ofs;
static std::string g_log_path; // NOLINT(runtime/string)
static std::atomic<LogLevel> g_min_level{LogLevel::INFO};
static std::atomic<size_t> g_max_size{0};
static std::atomic<size_t> g_max_files{1};
static std::atomic<bool> g_json_log{false};
static std::atomic<bool> g_compress_logs{false};
#ifdef __linux__
static std::atomic<bool> g_syslog{false};
#endif

struct LogMessage {
    LogLevel level;
    std::string ts;
    std::string msg;
    std::map<std::string, std::string> fields;
};

static std::queue<LogMessage> g_log_queue;
static std::mutex g_queue_mtx;
static std::condition_variable g_queue_cv;
static std::condition_variable g_drained_cv;
static size_t g_in_flight = 0;
static std::atomic<bool> g_running{false};
static std::thread g_log_thread;
static std::mutex g_init_mtx;

static void log_worker();

static void stop_log_thread() {
    {
        std::lock_guard<std::mutex> qlk(g_queue_mtx);
        g_running.store(false);
    }
    g_queue_cv.notify_all();
    if (g_log_thread.joinable())
        g_log_thread.join();
}

void init_logger(const std::string& path, LogLevel level, size_t max_size, size_t max_files) {
    std::lock_guard<std::mutex> lk(g_init_mtx);
    std::string prev_path = g_log_path;
    stop_log_thread();
    if (g_log_ofs.is_open()) {
        g_log_ofs.flush();
        g_log_ofs.close();
    }
    g_log_ofs.clear();
    g_max_size.store(max_size);
    g_max_files.store(max_files);
    std::string target = path;
    if (!target.empty()) {
        g_log_ofs.open(target, std::ios::app);
        if (!g_log_ofs.is_open()) {
            std::cerr << "Failed to open log file: " << path << std::endl;
            target = prev_path;
            if (!target.empty())
                g_log_ofs.open(target, std::ios::app);
        }
    }
    g_log_path = target;
    g_min_level.store(level);
    g_running.store(true);
    g_log_thread = std::thread(log_worker);
}

#ifdef __linux__
void init_syslog(int facility) {
    std::lock_guard<std::mutex> lk(g_init_mtx);
    g_syslog.store(true);
    openlog("indexmirror", LOG_PID | LOG_CONS, facility == 0 ? LOG_DAEMON : facility);
}
#else
void init_syslog(int) {}
#endif

void set_json_logging(bool enable) { g_json_log.store(enable); }

void set_log_compression(bool enable) { g_compress_logs.store(enable); }

bool logger_initialized() { return g_running.load(); }

void flush_logger() {
    std::unique_lock<std::mutex> lk(g_queue_mtx);
    g_drained_cv.wait_for(lk, std::chrono::seconds(5),
                          [] { return (g_log_queue.empty() && g_in_flight == 0) || !g_running; });
}

bool parse_log_level(const std::string& name, LogLevel& out) {
    std::string up = name;
    std::transform(up.begin(), up.end(), up.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (up == "DEBUG")
        out = LogLevel::DEBUG;
    else if (up == "INFO")
        out = LogLevel::INFO;
    else if (up == "WARNING" || up == "WARN")
        out = LogLevel::WARNING;
    else if (up == "ERROR" || up == "ERR")
        out = LogLevel::ERR;
    else
        return false;
    return true;
}

const char* log_level_name(LogLevel level) {
    switch (level) {
    case LogLevel::DEBUG:
        return "DEBUG";
    case LogLevel::INFO:
        return "INFO";
    case LogLevel::WARNING:
        return "WARNING";
    case LogLevel::ERR:
        return "ERROR";
    }
    return "INFO";
}

static bool gzip_file(const std::string& src, const std::string& dst) {
    std::ifstream in(src, std::ios::binary);
    gzFile out = gzopen(dst.c_str(), "wb");
    if (!in.is_open() || out == nullptr) {
        if (out)
            gzclose(out);
        return false;
    }
    char buf[8192];
    bool ok = true;
    while (in) {
        in.read(buf, sizeof(buf));
        std::streamsize n = in.gcount();
        if (n > 0 && gzwrite(out, buf, static_cast<unsigned int>(n)) == 0) {
            ok = false;
            break;
        }
    }
    return gzclose(out) == Z_OK && ok;
}

static std::string json_escape(const std::string& in) {
    std::string out;
    out.reserve(in.size());
    for (char c : in) {
        switch (c) {
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            out += c;
            break;
        }
    }
    return out;
}

static std::string format_entry(const LogMessage& m) {
    const char* label = log_level_name(m.level);
    std::string line;
    if (g_json_log.load()) {
        line = "{\"timestamp\":\"" + json_escape(m.ts) + "\",\"level\":\"" + label +
               "\",\"msg\":\"" + json_escape(m.msg) + "\"";
        for (const auto& [k, v] : m.fields)
            line += ",\"" + json_escape(k) + "\":\"" + json_escape(v) + "\"";
        line += "}";
    } else {
        line = "[" + m.ts + "] [" + label + "] " + m.msg;
        for (const auto& [k, v] : m.fields)
            line += " " + k + "=" + v;
    }
    return line;
}

// Shift name.N -> name.N+1, dropping the oldest, then move the active file
// to name.1 (gzipped when compression is on).
static void rotate_files() {
    std::error_code ec;
    const size_t keep = g_max_files.load();
    const bool gz = g_compress_logs.load();
    const std::string suffix = gz ? ".gz" : "";
    for (size_t i = keep; i > 0; --i) {
        fs::path src = g_log_path + "." + std::to_string(i) + suffix;
        if (i == keep)
            fs::remove(src, ec);
        else
            fs::rename(src, g_log_path + "." + std::to_string(i + 1) + suffix, ec);
    }
    fs::path first = g_log_path + ".1";
    fs::rename(g_log_path, first, ec);
    if (gz) {
        fs::path packed = first;
        packed += ".gz";
        if (gzip_file(first.string(), packed.string()))
            fs::remove(first, ec);
    }
}

static void write_log_entry(const LogMessage& m) {
    if (m.level < g_min_level.load())
        return;
    std::string line = format_entry(m);
    if (!g_log_ofs.is_open()) {
        std::cerr << line << '\n';
    } else {
        g_log_ofs << line << '\n';
        if (g_max_size.load() > 0) {
            g_log_ofs.flush();
            std::error_code ec;
            auto size = fs::file_size(g_log_path, ec);
            if (!ec && size > g_max_size.load()) {
                g_log_ofs.close();
                if (g_max_files.load() > 0)
                    rotate_files();
                g_log_ofs.open(g_log_path, std::ios::trunc);
            }
        }
    }
#ifdef __linux__
    if (g_syslog.load()) {
        int pri = LOG_INFO;
        switch (m.level) {
        case LogLevel::DEBUG:
            pri = LOG_DEBUG;
            break;
        case LogLevel::INFO:
            pri = LOG_INFO;
            break;
        case LogLevel::WARNING:
            pri = LOG_WARNING;
            break;
        case LogLevel::ERR:
            pri = LOG_ERR;
            break;
        }
        syslog(pri, "%s", line.c_str());
    }
#endif
}

static void enqueue(LogLevel level, const std::string& msg,
                    const std::map<std::string, std::string>& fields) {
    if (level < g_min_level.load() || !g_running.load())
        return;
    {
        std::lock_guard<std::mutex> lk(g_queue_mtx);
        g_log_queue.push(LogMessage{level, timestamp(), msg, fields});
    }
    g_queue_cv.notify_one();
}

void log_event(LogLevel level, const std::string& message) { enqueue(level, message, {}); }

void log_event(LogLevel level, const std::string& message,
               const std::map<std::string, std::string>& fields) {
    enqueue(level, message, fields);
}

void log_debug(const std::string& msg) { enqueue(LogLevel::DEBUG, msg, {}); }
void log_debug(const std::string& msg, const std::map<std::string, std::string>& fields) {
    enqueue(LogLevel::DEBUG, msg, fields);
}
void log_info(const std::string& msg) { enqueue(LogLevel::INFO, msg, {}); }
void log_info(const std::string& msg, const std::map<std::string, std::string>& fields) {
    enqueue(LogLevel::INFO, msg, fields);
}
void log_warning(const std::string& msg) { enqueue(LogLevel::WARNING, msg, {}); }
void log_warning(const std::string& msg, const std::map<std::string, std::string>& fields) {
    enqueue(LogLevel::WARNING, msg, fields);
}
void log_error(const std::string& msg) { enqueue(LogLevel::ERR, msg, {}); }
void log_error(const std::string& msg, const std::map<std::string, std::string>& fields) {
    enqueue(LogLevel::ERR, msg, fields);
}

static void log_worker() {
    std::vector<LogMessage> batch;
    batch.reserve(16);
    while (true) {
        std::unique_lock<std::mutex> lk(g_queue_mtx);
        g_queue_cv.wait(lk, [] { return !g_log_queue.empty() || !g_running.load(); });
        if (!g_running.load() && g_log_queue.empty())
            break;
        while (!g_log_queue.empty() && batch.size() < 16) {
            batch.push_back(std::move(g_log_queue.front()));
            g_log_queue.pop();
        }
        g_in_flight = batch.size();
        lk.unlock();
        for (const LogMessage& m : batch)
            write_log_entry(m);
        batch.clear();
        if (g_log_ofs.is_open())
            g_log_ofs.flush();
        lk.lock();
        g_in_flight = 0;
        if (g_log_queue.empty())
            g_drained_cv.notify_all();
    }
    if (g_log_ofs.is_open())
        g_log_ofs.flush();
    g_drained_cv.notify_all();
}

void shutdown_logger() {
    std::lock_guard<std::mutex> lk(g_init_mtx);
    stop_log_thread();
    if (g_log_ofs.is_open()) {
        g_log_ofs.flush();
        g_log_ofs.close();
    }
    g_log_path.clear();
#ifdef __linux__
    if (g_syslog.load()) {
        closelog();
        g_syslog.store(false);
    }
#endif
    std::lock_guard<std::mutex> qlk(g_queue_mtx);
    std::queue<LogMessage>().swap(g_log_queue);
}
