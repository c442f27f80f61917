#include "logger.hpp"
#include <zlib.h>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <condition_variable>
#include <deque>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>
#include "time_utils.hpp"
#ifdef __linux__
#include <syslog.h>
#endif

namespace fs = std::filesystem;

namespace {

struct LogMessage {
    LogLevel level;
    std::string msg;
    LogFields fields;
};

const char* level_label(LogLevel level) {
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

#ifdef __linux__
int syslog_priority(LogLevel level) {
    switch (level) {
    case LogLevel::DEBUG:
        return LOG_DEBUG;
    case LogLevel::WARNING:
        return LOG_WARNING;
    case LogLevel::ERR:
        return LOG_ERR;
    case LogLevel::INFO:
        break;
    }
    return LOG_INFO;
}
#endif

bool gzip_file(const fs::path& src, const fs::path& dst) {
    std::ifstream in(src, std::ios::binary);
    if (!in.is_open())
        return false;
    gzFile out = gzopen(dst.c_str(), "wb");
    if (out == nullptr)
        return false;
    char buf[8192];
    bool ok = true;
    while (ok && in) {
        in.read(buf, sizeof(buf));
        std::streamsize n = in.gcount();
        if (n > 0)
            ok = gzwrite(out, buf, static_cast<unsigned int>(n)) == n;
    }
    return gzclose(out) == Z_OK && ok;
}

/**
 * Destination file plus its rotation settings. Only the writer thread touches
 * the stream once the thread is running; `init_logger` and `shutdown_logger`
 * stop the thread before reopening or closing it.
 */
struct Sink {
    std::ofstream out;
    std::string path;
    size_t max_size = 0;
    size_t max_files = 1;
    std::atomic<LogLevel> min_level{LogLevel::INFO};
    std::atomic<bool> json{false};
    std::atomic<bool> compress{false};
    std::atomic<bool> syslog{false};

    bool open(const std::string& target) {
        std::error_code ec;
        fs::path parent = fs::path(target).parent_path();
        if (!parent.empty())
            fs::create_directories(parent, ec);
        out.clear();
        out.open(target, std::ios::app);
        if (!out.is_open())
            return false;
        path = target;
        return true;
    }

    void close() {
        if (out.is_open()) {
            out.flush();
            out.close();
        }
    }

    fs::path rotated(size_t n) const {
        std::string name = path + "." + std::to_string(n);
        if (compress.load())
            name += ".gz";
        return name;
    }

    /** `log.N` becomes `log.N+1`; the oldest is dropped and a fresh file opened. */
    void rotate() {
        std::error_code ec;
        out.close();
        if (max_files > 0) {
            fs::remove(rotated(max_files), ec);
            for (size_t i = max_files - 1; i > 0; --i)
                fs::rename(rotated(i), rotated(i + 1), ec);
            fs::path first = path + ".1";
            fs::rename(path, first, ec);
            if (compress.load() && gzip_file(first, rotated(1)))
                fs::remove(first, ec);
        }
        out.open(path, std::ios::trunc);
    }

    std::string format(const LogMessage& m) const {
        std::string ts = timestamp();
        if (json.load()) {
            nlohmann::json j;
            j["timestamp"] = ts;
            j["level"] = level_label(m.level);
            j["msg"] = m.msg;
            for (const auto& [k, v] : m.fields)
                j[k] = v;
            return j.dump();
        }
        std::string line = "[" + ts + "] [" + level_label(m.level) + "] " + m.msg;
        for (const auto& [k, v] : m.fields)
            line += " " + k + "=" + v;
        return line;
    }

    void write(const LogMessage& m) {
        if (!out.is_open() || m.level < min_level.load())
            return;
        std::string line = format(m);
        out << line << '\n';
        if (max_size > 0) {
            out.flush();
            std::error_code ec;
            auto size = fs::file_size(path, ec);
            if (!ec && size > max_size)
                rotate();
        }
#ifdef __linux__
        if (syslog.load())
            ::syslog(syslog_priority(m.level), "%s", line.c_str());
#endif
    }
};

/** Hand-off between logging threads and the single writer thread. */
struct Queue {
    std::mutex mtx;
    std::condition_variable pending_cv;
    std::condition_variable drained_cv;
    std::deque<LogMessage> items;
    size_t in_flight = 0;
    bool running = false;
};

Sink g_sink;
Queue g_queue;
std::thread g_writer;
std::mutex g_init_mtx; ///< Serializes init/shutdown/syslog setup.

void writer_loop() {
    std::vector<LogMessage> batch;
    std::unique_lock<std::mutex> lk(g_queue.mtx);
    while (true) {
        g_queue.pending_cv.wait(lk, [] { return !g_queue.items.empty() || !g_queue.running; });
        if (g_queue.items.empty())
            break;
        while (!g_queue.items.empty() && batch.size() < 16) {
            batch.push_back(std::move(g_queue.items.front()));
            g_queue.items.pop_front();
        }
        g_queue.in_flight = batch.size();
        lk.unlock();
        for (const auto& m : batch)
            g_sink.write(m);
        g_sink.out.flush();
        batch.clear();
        lk.lock();
        g_queue.in_flight = 0;
        g_queue.drained_cv.notify_all();
    }
    g_queue.drained_cv.notify_all();
}

/** Ask the writer to drain what is queued and wait for it to exit. */
void stop_writer() {
    {
        std::lock_guard<std::mutex> lk(g_queue.mtx);
        g_queue.running = false;
    }
    g_queue.pending_cv.notify_all();
    if (g_writer.joinable())
        g_writer.join();
}

void enqueue(LogLevel level, const std::string& msg, LogFields fields) {
    if (level < g_sink.min_level.load())
        return;
    {
        std::lock_guard<std::mutex> lk(g_queue.mtx);
        if (!g_queue.running)
            return;
        g_queue.items.push_back(LogMessage{level, msg, std::move(fields)});
    }
    g_queue.pending_cv.notify_one();
}

} // namespace

void init_logger(const std::string& path, LogLevel level, size_t max_size, size_t max_files) {
    std::lock_guard<std::mutex> lk(g_init_mtx);
    stop_writer();
    std::string previous = g_sink.path;
    g_sink.close();
    g_sink.max_size = max_size;
    g_sink.max_files = max_files;
    g_sink.min_level.store(level);
    if (!g_sink.open(path)) {
        std::cerr << "Failed to open log file: " << path << std::endl;
        if (!previous.empty())
            g_sink.open(previous);
    }
    {
        std::lock_guard<std::mutex> qlk(g_queue.mtx);
        g_queue.running = true;
    }
    g_writer = std::thread(writer_loop);
}

bool parse_log_level(const std::string& name, LogLevel& level) {
    std::string n = name;
    std::transform(n.begin(), n.end(), n.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (n == "debug")
        level = LogLevel::DEBUG;
    else if (n == "info")
        level = LogLevel::INFO;
    else if (n == "warning" || n == "warn")
        level = LogLevel::WARNING;
    else if (n == "error" || n == "err")
        level = LogLevel::ERR;
    else
        return false;
    return true;
}

#ifdef __linux__
void init_syslog(int facility) {
    std::lock_guard<std::mutex> lk(g_init_mtx);
    openlog("specflow", LOG_PID | LOG_CONS, facility == 0 ? LOG_USER : facility);
    g_sink.syslog.store(true);
}
#else
void init_syslog(int) {}
#endif

void set_json_logging(bool enable) { g_sink.json.store(enable); }

void set_log_compression(bool enable) { g_sink.compress.store(enable); }

bool logger_initialized() {
    std::lock_guard<std::mutex> lk(g_init_mtx);
    return g_sink.out.is_open();
}

void flush_logger() {
    std::unique_lock<std::mutex> lk(g_queue.mtx);
    g_queue.drained_cv.wait(lk, [] {
        return (g_queue.items.empty() && g_queue.in_flight == 0) || !g_queue.running;
    });
}

void log_event(LogLevel level, const std::string& message) { enqueue(level, message, {}); }

void log_event(LogLevel level, const std::string& message, const std::string& data) {
    enqueue(level, message, data.empty() ? LogFields{} : LogFields{{"data", data}});
}

void log_event(LogLevel level, const std::string& message, const LogFields& fields) {
    enqueue(level, message, fields);
}

void log_debug(const std::string& msg) { log_event(LogLevel::DEBUG, msg); }
void log_debug(const std::string& msg, const std::string& data) {
    log_event(LogLevel::DEBUG, msg, data);
}
void log_debug(const std::string& msg, const LogFields& fields) {
    log_event(LogLevel::DEBUG, msg, fields);
}

void log_info(const std::string& msg) { log_event(LogLevel::INFO, msg); }
void log_info(const std::string& msg, const std::string& data) {
    log_event(LogLevel::INFO, msg, data);
}
void log_info(const std::string& msg, const LogFields& fields) {
    log_event(LogLevel::INFO, msg, fields);
}

void log_warning(const std::string& msg) { log_event(LogLevel::WARNING, msg); }
void log_warning(const std::string& msg, const std::string& data) {
    log_event(LogLevel::WARNING, msg, data);
}
void log_warning(const std::string& msg, const LogFields& fields) {
    log_event(LogLevel::WARNING, msg, fields);
}

void log_error(const std::string& msg) { log_event(LogLevel::ERR, msg); }
void log_error(const std::string& msg, const std::string& data) {
    log_event(LogLevel::ERR, msg, data);
}
void log_error(const std::string& msg, const LogFields& fields) {
    log_event(LogLevel::ERR, msg, fields);
}

void shutdown_logger() {
    std::lock_guard<std::mutex> lk(g_init_mtx);
    stop_writer();
    g_sink.close();
#ifdef __linux__
    if (g_sink.syslog.exchange(false))
        closelog();
#endif
    std::lock_guard<std::mutex> qlk(g_queue.mtx);
    g_queue.items.clear();
}
