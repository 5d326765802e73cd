#include "logger.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>
#include "time_utils.hpp"
#ifdef __linux__
#include <syslog.h>
#endif

static std::ofstream g_log_ofs;
static std::string g_log_path; // NOLINT(runtime/string)
static std::atomic<LogLevel> g_min_level{LogLevel::INFO};
static std::atomic<size_t> g_max_size{0};
static std::atomic<size_t> g_max_files{1};
static std::atomic<bool> g_json_log{false};
#ifdef __linux__
static std::atomic<bool> g_syslog{false};
#endif

struct LogMessage {
    LogLevel level;
    std::string msg;
    std::map<std::string, std::string> fields;
};

static std::queue<std::unique_ptr<LogMessage>> g_log_queue;
static std::mutex g_queue_mtx;
static std::condition_variable g_queue_cv;
static std::condition_variable g_drained_cv;
static std::atomic<bool> g_running{false};
static size_t g_pending = 0; // queued or being written, guarded by g_queue_mtx
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
    g_log_ofs.open(target, std::ios::app);
    if (!g_log_ofs.is_open()) {
        std::cerr << "Failed to open log file: " << path << std::endl;
        target = prev_path;
        if (!target.empty())
            g_log_ofs.open(target, std::ios::app);
    }
    g_log_path = target;
    g_min_level.store(level);
    if (!g_log_ofs.is_open())
        return;
    g_running.store(true);
    g_log_thread = std::thread(log_worker);
}

#ifdef __linux__
void init_syslog(int facility) {
    std::lock_guard<std::mutex> lk(g_init_mtx);
    g_syslog.store(true);
    openlog("multideploy", LOG_PID | LOG_CONS, facility == 0 ? LOG_USER : facility);
}
#else
void init_syslog(int) {}
#endif

bool parse_log_level(const std::string& name, LogLevel& level) {
    std::string up = name;
    std::transform(up.begin(), up.end(), up.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (up == "DEBUG")
        level = LogLevel::DEBUG;
    else if (up == "INFO")
        level = LogLevel::INFO;
    else if (up == "WARNING" || up == "WARN")
        level = LogLevel::WARNING;
    else if (up == "ERROR" || up == "ERR")
        level = LogLevel::ERR;
    else
        return false;
    return true;
}

void set_json_logging(bool enable) { g_json_log.store(enable); }

bool logger_initialized() { return g_running.load(); }

void flush_logger() {
    std::unique_lock<std::mutex> lk(g_queue_mtx);
    g_drained_cv.wait_for(lk, std::chrono::seconds(5),
                          [] { return g_pending == 0 || !g_running.load(); });
}

static const char* level_label(LogLevel level) {
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

static void rotate_files() {
    namespace fs = std::filesystem;
    std::error_code ec;
    g_log_ofs.close();
    size_t keep = g_max_files.load();
    if (keep > 0) {
        for (size_t i = keep; i > 0; --i) {
            fs::path src = g_log_path + "." + std::to_string(i);
            if (i == keep)
                fs::remove(src, ec);
            else
                fs::rename(src, g_log_path + "." + std::to_string(i + 1), ec);
        }
        fs::rename(g_log_path, g_log_path + ".1", ec);
    }
    g_log_ofs.open(g_log_path, std::ios::trunc);
}

/**
 * @brief Format one entry and write it to the file sink (and syslog).
 *
 * Runs on the writer thread only.
 */
static void write_log_entry(const LogMessage& m) {
    if (!g_log_ofs.is_open())
        return;
    const char* label = level_label(m.level);
    std::string line;
    std::string ts = timestamp();
    if (g_json_log.load()) {
        line = "{\"timestamp\":\"" + json_escape(ts) + "\",\"level\":\"" + label +
               "\",\"msg\":\"" + json_escape(m.msg) + "\"";
        for (const auto& [k, v] : m.fields)
            line += ",\"" + json_escape(k) + "\":\"" + json_escape(v) + "\"";
        line += "}";
    } else {
        line = "[" + ts + "] [" + label + "] " + m.msg;
        for (const auto& [k, v] : m.fields)
            line += " " + k + "=" + v;
    }
    g_log_ofs << line << '\n';
    if (g_max_size.load() > 0) {
        g_log_ofs.flush();
        std::error_code ec;
        auto size = std::filesystem::file_size(g_log_path, ec);
        if (!ec && size > g_max_size.load())
            rotate_files();
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
                    std::map<std::string, std::string> fields) {
    if (level < g_min_level.load() || !g_running.load())
        return;
    {
        std::lock_guard<std::mutex> lk(g_queue_mtx);
        g_log_queue.push(std::make_unique<LogMessage>(LogMessage{level, msg, std::move(fields)}));
        ++g_pending;
    }
    g_queue_cv.notify_one();
}

static std::map<std::string, std::string> data_field(const std::string& data) {
    if (data.empty())
        return {};
    return {{"data", data}};
}

void log_debug(const std::string& msg) { enqueue(LogLevel::DEBUG, msg, {}); }
void log_debug(const std::string& msg, const std::string& data) {
    enqueue(LogLevel::DEBUG, msg, data_field(data));
}
void log_debug(const std::string& msg, const std::map<std::string, std::string>& fields) {
    enqueue(LogLevel::DEBUG, msg, fields);
}

void log_info(const std::string& msg) { enqueue(LogLevel::INFO, msg, {}); }
void log_info(const std::string& msg, const std::string& data) {
    enqueue(LogLevel::INFO, msg, data_field(data));
}
void log_info(const std::string& msg, const std::map<std::string, std::string>& fields) {
    enqueue(LogLevel::INFO, msg, fields);
}

void log_warning(const std::string& msg) { enqueue(LogLevel::WARNING, msg, {}); }
void log_warning(const std::string& msg, const std::string& data) {
    enqueue(LogLevel::WARNING, msg, data_field(data));
}
void log_warning(const std::string& msg, const std::map<std::string, std::string>& fields) {
    enqueue(LogLevel::WARNING, msg, fields);
}

void log_error(const std::string& msg) { enqueue(LogLevel::ERR, msg, {}); }
void log_error(const std::string& msg, const std::string& data) {
    enqueue(LogLevel::ERR, msg, data_field(data));
}
void log_error(const std::string& msg, const std::map<std::string, std::string>& fields) {
    enqueue(LogLevel::ERR, msg, fields);
}

static void log_worker() {
    std::vector<std::unique_ptr<LogMessage>> batch;
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
        lk.unlock();
        for (const auto& m : batch)
            write_log_entry(*m);
        g_log_ofs.flush();
        lk.lock();
        g_pending -= batch.size();
        batch.clear();
        if (g_pending == 0)
            g_drained_cv.notify_all();
    }
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
#ifdef __linux__
    if (g_syslog.load()) {
        closelog();
        g_syslog.store(false);
    }
#endif
    std::lock_guard<std::mutex> qlk(g_queue_mtx);
    while (!g_log_queue.empty())
        g_log_queue.pop();
    g_pending = 0;
}
