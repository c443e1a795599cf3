#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace minerhub {

class DebugLogger {
public:
    static void set_enabled(bool enabled) { enabled_ = enabled; }
    static bool is_enabled() { return enabled_; }

    template<typename... Args>
    static void log(Args&&... args) {
        if (enabled_) {
            std::cerr << "[DEBUG] ";
            ((std::cerr << args), ...);
            std::cerr << std::endl;
        }
    }

private:
    static std::atomic<bool> enabled_;
};

enum class LogLevel {
    Info,
    Warning,
    Error
};

// Where a line came from: the miner's own streams or the controller itself
enum class LogStream {
    Stdout,
    Stderr,
    Controller
};

struct LogLine {
    std::string slot_id;     // empty for application-wide messages
    LogStream stream = LogStream::Controller;
    LogLevel level = LogLevel::Info;
    std::string text;
    std::chrono::system_clock::time_point timestamp;
};

LogLine make_log_line(const std::string& slot_id, LogLevel level, const std::string& text,
                      LogStream stream = LogStream::Controller);

const char* to_string(LogLevel level);
std::string format_timestamp(const std::chrono::system_clock::time_point& tp);

// "[2024-05-01 13:00:00] INFO - gminer: message"
std::string format_log_line(const LogLine& line);

// Pure consumer of log lines. Implementations must be callable from any thread.
class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void write(const LogLine& line) = 0;
};

class ConsoleLogSink : public LogSink {
public:
    void write(const LogLine& line) override;

private:
    std::mutex mutex_;
};

class FileLogSink : public LogSink {
public:
    explicit FileLogSink(const std::string& path);
    ~FileLogSink() override;

    bool is_open() const { return log_file_.is_open(); }
    void write(const LogLine& line) override;

private:
    std::mutex mutex_;
    std::ofstream log_file_;
};

class FanoutLogSink : public LogSink {
public:
    void add(std::shared_ptr<LogSink> sink);
    void write(const LogLine& line) override;

private:
    std::vector<std::shared_ptr<LogSink>> sinks_;
};

// Decouples producers from a slow sink. write() never blocks on the inner
// sink: lines go into a bounded buffer and when it is full the oldest line
// is dropped. The drop count is reported once delivery catches up.
class AsyncLogSink : public LogSink {
public:
    AsyncLogSink(std::shared_ptr<LogSink> inner, size_t capacity);
    ~AsyncLogSink() override;

    void write(const LogLine& line) override;

    // Blocks until everything buffered so far has been delivered
    void flush();
    void stop();

    uint64_t dropped_total() const { return dropped_total_; }

private:
    void delivery_loop();

    std::shared_ptr<LogSink> inner_;
    size_t capacity_;
    std::deque<LogLine> buffer_;
    uint64_t dropped_pending_ = 0;
    std::atomic<uint64_t> dropped_total_{0};
    bool delivering_ = false;
    bool stopping_ = false;
    bool finished_ = false;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable drained_cv_;
    std::thread worker_;
};

} // namespace minerhub
