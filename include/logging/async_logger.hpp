#pragma once

#include "../util/time_utils.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <functional>
#include <string>
#include <thread>

namespace pipeview {
namespace logging {

/**
 * Log Level
 */
enum class LogLevel : uint8_t { Trace = 0, Debug = 1, Info = 2, Warn = 3, Error = 4, Fatal = 5 };

inline const char* level_to_string(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return "TRACE";
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO ";
    case LogLevel::Warn:
        return "WARN ";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Fatal:
        return "FATAL";
    default:
        return "?????";
    }
}

// Returns false for an unknown name and leaves `out` untouched
inline bool parse_level(const std::string& name, LogLevel& out) {
    if (name == "trace") out = LogLevel::Trace;
    else if (name == "debug") out = LogLevel::Debug;
    else if (name == "info") out = LogLevel::Info;
    else if (name == "warn") out = LogLevel::Warn;
    else if (name == "error") out = LogLevel::Error;
    else if (name == "fatal") out = LogLevel::Fatal;
    else return false;
    return true;
}

// Category constants for the pager
namespace LogCategory {
constexpr uint8_t System = 0;
constexpr uint8_t Stream = 1;
constexpr uint8_t Keyboard = 2;
constexpr uint8_t Signal = 3;
constexpr uint8_t Render = 4;
} // namespace LogCategory

inline const char* category_to_string(uint8_t category) {
    switch (category) {
    case LogCategory::System:
        return "system";
    case LogCategory::Stream:
        return "stream";
    case LogCategory::Keyboard:
        return "keyboard";
    case LogCategory::Signal:
        return "signal";
    case LogCategory::Render:
        return "render";
    default:
        return "other";
    }
}

/**
 * Log Entry - Fixed size, four cache lines
 */
struct alignas(64) LogEntry {
    uint64_t timestamp_ns; // 8 bytes, wall clock
    LogLevel level;        // 1 byte
    uint8_t category;      // 1 byte
    uint16_t reserved;     // 2 bytes padding
    uint32_t thread_id;    // 4 bytes
    char message[240];     // 240 bytes (null-terminated)
    // Total: 256 bytes

    void set_message(const char* msg) {
        size_t len = std::strlen(msg);
        if (len >= sizeof(message))
            len = sizeof(message) - 1;
        std::memcpy(message, msg, len);
        message[len] = '\0';
    }
};
static_assert(sizeof(LogEntry) == 256, "LogEntry must be 256 bytes");

/**
 * Ring buffer with many producers and one consumer.
 *
 * Producers serialize on a spin flag (the critical section is one copy);
 * the consumer side stays lock-free.
 */
template <size_t Capacity = 4096> // 4K entries = 1MB buffer
class alignas(64) LogRingBuffer {
public:
    static_assert((Capacity & (Capacity - 1)) == 0, "Capacity must be power of 2");

    LogRingBuffer() : head_(0), tail_(0) { std::memset(buffer_.data(), 0, sizeof(buffer_)); }

    /**
     * Try to push a log entry (any thread)
     * Returns true if successful, false if buffer is full.
     */
    bool try_push(const LogEntry& entry) {
        while (push_lock_.test_and_set(std::memory_order_acquire)) {
            // spin
        }

        size_t head = head_.load(std::memory_order_relaxed);
        size_t next_head = (head + 1) & (Capacity - 1);

        bool pushed = false;
        if (next_head != tail_.load(std::memory_order_acquire)) {
            buffer_[head] = entry;
            head_.store(next_head, std::memory_order_release);
            pushed = true;
        }

        push_lock_.clear(std::memory_order_release);
        return pushed;
    }

    /**
     * Try to pop a log entry (consumer side)
     * Returns true if entry was available, false if empty.
     */
    bool try_pop(LogEntry& entry) {
        size_t tail = tail_.load(std::memory_order_relaxed);

        if (tail == head_.load(std::memory_order_acquire)) {
            return false;
        }

        entry = buffer_[tail];
        tail_.store((tail + 1) & (Capacity - 1), std::memory_order_release);
        return true;
    }

    size_t size() const {
        size_t head = head_.load(std::memory_order_acquire);
        size_t tail = tail_.load(std::memory_order_acquire);
        return (head - tail + Capacity) & (Capacity - 1);
    }

    bool empty() const { return head_.load(std::memory_order_acquire) == tail_.load(std::memory_order_acquire); }

private:
    alignas(64) std::atomic<size_t> head_;
    alignas(64) std::atomic<size_t> tail_;
    std::atomic_flag push_lock_ = ATOMIC_FLAG_INIT;
    alignas(64) std::array<LogEntry, Capacity> buffer_;
};

/**
 * Async Logger
 *
 * log() formats into a fixed entry and pushes it; a background thread does
 * the file I/O so producers never block on the disk.
 *
 * Usage:
 *   AsyncLogger logger;
 *   logger.set_output_callback(make_file_sink(fp));
 *   logger.start();
 *   PV_LOG_INFO(&logger, LogCategory::Stream, "read %zu lines", n);
 *   logger.stop();
 */
class AsyncLogger {
public:
    using OutputCallback = std::function<void(const LogEntry&)>;

    AsyncLogger() : running_(false), min_level_(LogLevel::Info), dropped_count_(0), total_logged_(0) {}

    ~AsyncLogger() { stop(); }

    // Non-copyable
    AsyncLogger(const AsyncLogger&) = delete;
    AsyncLogger& operator=(const AsyncLogger&) = delete;

    /**
     * Start the background consumer thread
     */
    void start() {
        if (running_.exchange(true))
            return; // Already running

        consumer_thread_ = std::thread([this]() { consume_loop(); });
    }

    /**
     * Stop the logger and flush remaining entries
     */
    void stop() {
        if (!running_.exchange(false))
            return; // Already stopped

        if (consumer_thread_.joinable()) {
            consumer_thread_.join();
        }

        LogEntry entry;
        while (buffer_.try_pop(entry)) {
            output_entry(entry);
        }
    }

    void log(LogLevel level, uint8_t category, const char* message) {
        if (level < min_level_.load(std::memory_order_relaxed))
            return;

        LogEntry entry;
        entry.timestamp_ns = util::wall_clock_ns();
        entry.level = level;
        entry.category = category;
        entry.reserved = 0;
        entry.thread_id = get_thread_id();
        entry.set_message(message);

        if (!buffer_.try_push(entry)) {
            dropped_count_.fetch_add(1, std::memory_order_relaxed);
        } else {
            total_logged_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    /**
     * Log with printf-style formatting
     */
    template <typename... Args>
    void logf(LogLevel level, uint8_t category, const char* fmt, Args... args) {
        if (level < min_level_.load(std::memory_order_relaxed))
            return;

        char buffer[sizeof(LogEntry::message)];
        std::snprintf(buffer, sizeof(buffer), fmt, args...);
        log(level, category, buffer);
    }

    void set_min_level(LogLevel level) { min_level_.store(level, std::memory_order_relaxed); }
    LogLevel min_level() const { return min_level_.load(std::memory_order_relaxed); }
    void set_output_callback(OutputCallback cb) { output_callback_ = std::move(cb); }

    // Statistics
    uint64_t dropped_count() const { return dropped_count_.load(); }
    uint64_t total_logged() const { return total_logged_.load(); }
    bool running() const { return running_.load(); }

private:
    LogRingBuffer<4096> buffer_;
    std::atomic<bool> running_;
    std::thread consumer_thread_;
    std::atomic<LogLevel> min_level_;
    OutputCallback output_callback_;

    std::atomic<uint64_t> dropped_count_;
    std::atomic<uint64_t> total_logged_;

    void consume_loop() {
        LogEntry entry;
        while (running_.load(std::memory_order_relaxed)) {
            while (buffer_.try_pop(entry)) {
                output_entry(entry);
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }
    }

    void output_entry(const LogEntry& entry) {
        if (output_callback_) {
            output_callback_(entry);
        } else {
            auto ts_ms = entry.timestamp_ns / 1000000;
            std::fprintf(stderr, "[%lu.%03lu] [%s] [%s] %s\n", static_cast<unsigned long>(ts_ms / 1000),
                         static_cast<unsigned long>(ts_ms % 1000), level_to_string(entry.level),
                         category_to_string(entry.category), entry.message);
        }
    }

    static uint32_t get_thread_id() {
        static thread_local uint32_t id = 0;
        if (id == 0) {
            std::hash<std::thread::id> hasher;
            id = static_cast<uint32_t>(hasher(std::this_thread::get_id()));
        }
        return id;
    }
};

/**
 * Format an entry as "YYYY-mm-dd HH:MM:SS.mmm [LEVEL] [category] (tid) message".
 */
inline std::string format_entry(const LogEntry& entry) {
    std::time_t secs = static_cast<std::time_t>(entry.timestamp_ns / 1000000000ULL);
    unsigned ms = static_cast<unsigned>((entry.timestamp_ns / 1000000ULL) % 1000);

    std::tm local{};
    localtime_r(&secs, &local);

    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &local);

    char line[sizeof(LogEntry::message) + 96];
    std::snprintf(line, sizeof(line), "%s.%03u [%s] [%s] (%08x) %s", stamp, ms, level_to_string(entry.level),
                  category_to_string(entry.category), entry.thread_id, entry.message);
    return line;
}

/**
 * Output callback writing formatted lines to `out`. The caller keeps `out` open
 * until the logger is stopped.
 */
inline AsyncLogger::OutputCallback make_file_sink(std::FILE* out) {
    return [out](const LogEntry& entry) {
        std::string line = format_entry(entry);
        std::fputs(line.c_str(), out);
        std::fputc('\n', out);
        std::fflush(out);
    };
}

// Convenience macros; `logger` is an AsyncLogger* and may be null (logging off)
#define PV_LOGF(logger, level, cat, fmt, ...)                                                                          \
    do {                                                                                                               \
        if (logger)                                                                                                    \
            (logger)->logf(level, cat, fmt, ##__VA_ARGS__);                                                            \
    } while (0)

#define PV_LOG_DEBUG(logger, cat, fmt, ...) PV_LOGF(logger, ::pipeview::logging::LogLevel::Debug, cat, fmt, ##__VA_ARGS__)
#define PV_LOG_INFO(logger, cat, fmt, ...) PV_LOGF(logger, ::pipeview::logging::LogLevel::Info, cat, fmt, ##__VA_ARGS__)
#define PV_LOG_WARN(logger, cat, fmt, ...) PV_LOGF(logger, ::pipeview::logging::LogLevel::Warn, cat, fmt, ##__VA_ARGS__)
#define PV_LOG_ERROR(logger, cat, fmt, ...) PV_LOGF(logger, ::pipeview::logging::LogLevel::Error, cat, fmt, ##__VA_ARGS__)

} // namespace logging
} // namespace pipeview
