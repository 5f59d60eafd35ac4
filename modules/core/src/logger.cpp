#include "logger.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <condition_variable>
#include <deque>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>

namespace {

std::atomic<LogLevel> g_level(LogLevel::INFO);

// Output side: tag and sink, guarded by one mutex so lines never interleave.
struct LogOutput {
    std::mutex mutex;
    std::string tag = "proxlink";
    std::function<void(const std::string&)> sink;

    void write(const std::string& line) {
        std::lock_guard<std::mutex> lock(mutex);
        if (sink) {
            sink(line);
        } else {
            std::cerr << line << '\n';
        }
    }
};

// Async side: pending lines and the thread that drains them.
struct LogWriter {
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<std::string> pending;
    std::thread worker;
    bool stopping = false;
    std::atomic<bool> enabled{false};
};

LogOutput& output() {
    static LogOutput instance;
    return instance;
}

LogWriter& writer() {
    static LogWriter instance;
    return instance;
}

char level_letter(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return 'D';
        case LogLevel::INFO: return 'I';
        case LogLevel::WARNING: return 'W';
        case LogLevel::ERROR: return 'E';
        default: return '-';
    }
}

void drain_loop() {
    LogWriter& w = writer();
    std::unique_lock<std::mutex> lock(w.mutex);
    for (;;) {
        w.cv.wait(lock, [&w] { return w.stopping || !w.pending.empty(); });
        while (!w.pending.empty()) {
            std::string line = std::move(w.pending.front());
            w.pending.pop_front();
            lock.unlock();
            output().write(line);
            lock.lock();
        }
        if (w.stopping) return;
    }
}

} // namespace

/**
 * @brief Sets the tag printed in brackets at the start of every line.
 */
void setNodeTag(const std::string& tag) {
    std::lock_guard<std::mutex> lock(output().mutex);
    output().tag = tag;
}

/**
 * @brief Routes formatted lines to a callback instead of stdout.
 *
 * Passing an empty function restores stdout output.
 */
void setLogCallback(std::function<void(const std::string&)> callback) {
    std::lock_guard<std::mutex> lock(output().mutex);
    output().sink = std::move(callback);
}

void set_log_level(LogLevel level) {
    g_level.store(level);
}

LogLevel get_log_level() {
    return g_level.load();
}

/**
 * @brief Maps a config string such as "warn" to a level; unknown names give INFO.
 */
LogLevel parse_log_level(const std::string& level) {
    std::string lower = level;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warn" || lower == "warning") return LogLevel::WARNING;
    if (lower == "error") return LogLevel::ERROR;
    if (lower == "none") return LogLevel::NONE;
    return LogLevel::INFO;
}

const char* log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "debug";
        case LogLevel::INFO: return "info";
        case LogLevel::WARNING: return "warning";
        case LogLevel::ERROR: return "error";
        case LogLevel::NONE: return "none";
        default: return "info";
    }
}

/**
 * @brief Starts the drain thread. Lines are queued and written off the caller's thread.
 */
void enable_async_logging() {
    LogWriter& w = writer();
    std::lock_guard<std::mutex> lock(w.mutex);
    if (w.enabled) return;
    w.stopping = false;
    w.worker = std::thread(drain_loop);
    w.enabled = true;
}

/**
 * @brief Stops the drain thread after the queued lines are written.
 */
void disable_async_logging() {
    LogWriter& w = writer();
    {
        std::lock_guard<std::mutex> lock(w.mutex);
        if (!w.enabled) return;
        w.enabled = false;
        w.stopping = true;
    }
    w.cv.notify_all();
    if (w.worker.joinable()) {
        w.worker.join();
    }
}

bool is_async_logging_enabled() {
    return writer().enabled.load();
}

/**
 * @brief Formats one line as "[tag] L message" and hands it to the sink or the queue.
 * @param level Level of the line; the letter after the tag is derived from it.
 * @param message Text already filtered by the LOG_* macros.
 */
void log_line(LogLevel level, const std::string& message) {
    std::string tag;
    {
        std::lock_guard<std::mutex> lock(output().mutex);
        tag = output().tag;
    }
    std::string line = "[" + tag + "] " + level_letter(level) + " " + message;

    LogWriter& w = writer();
    {
        std::lock_guard<std::mutex> lock(w.mutex);
        if (w.enabled) {
            w.pending.push_back(std::move(line));
            w.cv.notify_one();
            return;
        }
    }
    output().write(line);
}
