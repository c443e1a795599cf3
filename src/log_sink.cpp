#include "minerhub/log_sink.hpp"
#include <iomanip>
#include <sstream>
#include <ctime>

namespace minerhub {

std::atomic<bool> DebugLogger::enabled_{false};

LogLine make_log_line(const std::string& slot_id, LogLevel level, const std::string& text,
                      LogStream stream) {
    LogLine line;
    line.slot_id = slot_id;
    line.stream = stream;
    line.level = level;
    line.text = text;
    line.timestamp = std::chrono::system_clock::now();
    return line;
}

const char* to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Error:   return "ERROR";
        default:                return "INFO";
    }
}

std::string format_timestamp(const std::chrono::system_clock::time_point& tp) {
    auto time_t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm;
    localtime_r(&time_t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

std::string format_log_line(const LogLine& line) {
    std::ostringstream oss;
    oss << "[" << format_timestamp(line.timestamp) << "] " << to_string(line.level) << " - ";
    if (line.slot_id.empty()) {
        oss << "minerhub";
    } else {
        oss << line.slot_id;
    }
    if (line.stream == LogStream::Stderr) {
        oss << " (stderr)";
    }
    oss << ": " << line.text;
    return oss.str();
}

void ConsoleLogSink::write(const LogLine& line) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& out = line.level == LogLevel::Info ? std::cout : std::cerr;
    out << format_log_line(line) << "\n";
    out.flush();
}

FileLogSink::FileLogSink(const std::string& path) {
    log_file_.open(path, std::ios::app);
    if (!log_file_.is_open()) {
        std::cerr << "Warning: Failed to open log file: " << path << "\n";
    }
}

FileLogSink::~FileLogSink() {
    if (log_file_.is_open()) {
        log_file_.close();
    }
}

void FileLogSink::write(const LogLine& line) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!log_file_.is_open()) {
        return;
    }
    log_file_ << format_log_line(line) << "\n";
    log_file_.flush();
}

void FanoutLogSink::add(std::shared_ptr<LogSink> sink) {
    sinks_.push_back(std::move(sink));
}

void FanoutLogSink::write(const LogLine& line) {
    for (const auto& sink : sinks_) {
        sink->write(line);
    }
}

AsyncLogSink::AsyncLogSink(std::shared_ptr<LogSink> inner, size_t capacity)
    : inner_(std::move(inner))
    , capacity_(capacity == 0 ? 1 : capacity)
{
    worker_ = std::thread(&AsyncLogSink::delivery_loop, this);
}

AsyncLogSink::~AsyncLogSink() {
    stop();
}

void AsyncLogSink::write(const LogLine& line) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return;
        }
        if (buffer_.size() >= capacity_) {
            buffer_.pop_front();
            ++dropped_pending_;
            ++dropped_total_;
        }
        buffer_.push_back(line);
    }
    cv_.notify_one();
}

void AsyncLogSink::flush() {
    std::unique_lock<std::mutex> lock(mutex_);
    drained_cv_.wait(lock, [this] { return (buffer_.empty() && !delivering_) || finished_; });
}

void AsyncLogSink::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return;
        }
        stopping_ = true;
    }
    cv_.notify_one();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void AsyncLogSink::delivery_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        cv_.wait(lock, [this] { return stopping_ || !buffer_.empty(); });
        if (buffer_.empty()) {
            // stopping and fully drained
            finished_ = true;
            drained_cv_.notify_all();
            return;
        }

        std::deque<LogLine> batch;
        batch.swap(buffer_);
        uint64_t dropped = dropped_pending_;
        dropped_pending_ = 0;
        delivering_ = true;
        lock.unlock();

        if (dropped > 0) {
            inner_->write(make_log_line("", LogLevel::Warning,
                std::to_string(dropped) + " log lines dropped (output faster than log delivery)"));
        }
        for (const auto& line : batch) {
            inner_->write(line);
        }

        lock.lock();
        delivering_ = false;
        if (buffer_.empty()) {
            drained_cv_.notify_all();
        }
    }
}

} // namespace minerhub
