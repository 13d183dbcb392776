// src/log.cpp
// ============================================================================
// Leveled, categorized logging.
// Synchronous writes go straight to stdout/stderr under one mutex. Async mode
// hands entries to a background writer through a bounded queue so that hot
// append paths never wait on the terminal.
// ============================================================================
#include "log.h"
#include <mutex>
#include <iostream>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <string>
#include <deque>
#include <vector>
#include <thread>
#include <condition_variable>
#include <sstream>
#include <cstring>
#include <algorithm>
#include <cctype>

namespace cchain {

// ============================================================================
// Configuration
// ============================================================================
static std::atomic<LogLevel> g_log_level{LogLevel::INFO};
static std::atomic<uint32_t> g_log_categories{static_cast<uint32_t>(LogCategory::ALL)};
static std::atomic<bool> g_timestamps_enabled{true};
static std::atomic<bool> g_async_mode{false};

// ============================================================================
// Synchronous logging
// ============================================================================
static std::mutex g_log_mutex;

static thread_local char g_timestamp_buf[32];
static thread_local int64_t g_last_timestamp_sec = 0;

static inline const char* format_timestamp_fast() {
    using namespace std::chrono;
    const auto now = system_clock::now();
    const auto now_sec = duration_cast<seconds>(now.time_since_epoch()).count();

    // Only reformat if second changed
    if (now_sec != g_last_timestamp_sec) {
        g_last_timestamp_sec = now_sec;
        const std::time_t tt = static_cast<std::time_t>(now_sec);
        std::tm tm{};
#if defined(_WIN32)
        gmtime_s(&tm, &tt);
#else
        gmtime_r(&tt, &tm);
#endif
        std::snprintf(g_timestamp_buf, sizeof(g_timestamp_buf),
                      "%04d-%02d-%02dT%02d:%02d:%02dZ",
                      tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                      tm.tm_hour, tm.tm_min, tm.tm_sec);
    }
    return g_timestamp_buf;
}

static inline bool is_error_level(const char* level) {
    return std::strcmp(level, "ERROR") == 0 || std::strcmp(level, "FATAL") == 0;
}

static void write_line_fast(const char* level, const std::string& msg) noexcept {
    std::lock_guard<std::mutex> lk(g_log_mutex);
    try {
        std::ostream& os = is_error_level(level) ? std::cerr : std::cout;
        if (g_timestamps_enabled.load(std::memory_order_relaxed)) {
            os << "[" << level << "][" << format_timestamp_fast() << "] " << msg << '\n';
        } else {
            os << "[" << level << "] " << msg << '\n';
        }
    } catch (const std::exception&) {
        // Logging must never take down an append
    }
}

// ============================================================================
// Async logging
// ============================================================================
struct AsyncLogEntry {
    int64_t timestamp_ms;
    char level[8];
    std::string message;
};

static std::mutex g_async_mutex;
static std::condition_variable g_async_cv;
static std::deque<AsyncLogEntry> g_async_queue;
static std::atomic<bool> g_async_running{false};
static std::thread g_async_thread;
static constexpr size_t ASYNC_QUEUE_MAX = 10000;
static constexpr size_t ASYNC_BATCH_SIZE = 100;

static void emit_entry(std::ostream& os, const AsyncLogEntry& entry) {
    if (g_timestamps_enabled.load(std::memory_order_relaxed)) {
        const std::time_t tt = static_cast<std::time_t>(entry.timestamp_ms / 1000);
        std::tm tm{};
#if defined(_WIN32)
        gmtime_s(&tm, &tt);
#else
        gmtime_r(&tt, &tm);
#endif
        os << "[" << entry.level << "]["
           << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ")
           << "] " << entry.message << '\n';
    } else {
        os << "[" << entry.level << "] " << entry.message << '\n';
    }
}

static void async_logger_thread() {
    std::vector<AsyncLogEntry> local_batch;
    local_batch.reserve(ASYNC_BATCH_SIZE);

    while (g_async_running.load(std::memory_order_relaxed)) {
        {
            std::unique_lock<std::mutex> lk(g_async_mutex);
            g_async_cv.wait_for(lk, std::chrono::milliseconds(50), []() {
                return !g_async_queue.empty() || !g_async_running.load(std::memory_order_relaxed);
            });

            size_t count = std::min(g_async_queue.size(), ASYNC_BATCH_SIZE);
            for (size_t i = 0; i < count; ++i) {
                local_batch.push_back(std::move(g_async_queue.front()));
                g_async_queue.pop_front();
            }
        }

        if (!local_batch.empty()) {
            std::lock_guard<std::mutex> lk(g_log_mutex);
            for (const auto& entry : local_batch) {
                emit_entry(is_error_level(entry.level) ? std::cerr : std::cout, entry);
            }
            std::cout.flush();
            local_batch.clear();
        }
    }

    // Drain remaining messages on shutdown
    std::lock_guard<std::mutex> qlk(g_async_mutex);
    std::lock_guard<std::mutex> lk(g_log_mutex);
    for (const auto& entry : g_async_queue) {
        emit_entry(is_error_level(entry.level) ? std::cerr : std::cout, entry);
    }
    g_async_queue.clear();
    std::cout.flush();
}

static void write_line_async(const char* level, const std::string& msg) noexcept {
    try {
        AsyncLogEntry entry;
        entry.timestamp_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
        std::strncpy(entry.level, level, sizeof(entry.level) - 1);
        entry.level[sizeof(entry.level) - 1] = '\0';
        entry.message = msg;

        std::lock_guard<std::mutex> lk(g_async_mutex);
        if (g_async_queue.size() < ASYNC_QUEUE_MAX) {
            g_async_queue.push_back(std::move(entry));
            g_async_cv.notify_one();
        }
        // Queue full: drop rather than block the caller
    } catch (const std::exception&) {
    }
}

// ============================================================================
// Rate limiting for high-frequency log sources
// ============================================================================
struct RateLimitState {
    std::atomic<int64_t> last_log_ms{0};
    std::atomic<uint64_t> suppressed_count{0};
};

static constexpr size_t RATE_LIMIT_BUCKETS = 256;
static RateLimitState g_rate_limits[RATE_LIMIT_BUCKETS];
static constexpr int64_t RATE_LIMIT_INTERVAL_MS = 1000;

static inline size_t hash_source(const char* file, int line) {
    size_t h = 0;
    while (*file) h = h * 31 + static_cast<unsigned char>(*file++);
    h ^= static_cast<size_t>(line);
    return h % RATE_LIMIT_BUCKETS;
}

bool log_rate_limited(const char* file, int line) {
    size_t bucket = hash_source(file, line);
    auto& state = g_rate_limits[bucket];

    int64_t now = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
    int64_t last = state.last_log_ms.load(std::memory_order_relaxed);

    if (now - last < RATE_LIMIT_INTERVAL_MS) {
        state.suppressed_count.fetch_add(1, std::memory_order_relaxed);
        return true;
    }

    if (state.last_log_ms.compare_exchange_weak(last, now, std::memory_order_relaxed)) {
        uint64_t suppressed = state.suppressed_count.exchange(0, std::memory_order_relaxed);
        if (suppressed > 0) {
            write_line_fast("INFO", "(suppressed " + std::to_string(suppressed) + " similar messages)");
        }
        return false;
    }
    return true; // Lost the race
}

// ============================================================================
// Public API
// ============================================================================

static inline void write_line(const char* level, const std::string& msg) noexcept {
    if (g_async_mode.load(std::memory_order_relaxed) &&
        g_async_running.load(std::memory_order_relaxed)) {
        write_line_async(level, msg);
    } else {
        write_line_fast(level, msg);
    }
}

static inline bool enabled(LogLevel lvl, LogCategory cat) {
    return g_log_level.load(std::memory_order_relaxed) <= lvl &&
           (g_log_categories.load(std::memory_order_relaxed) & static_cast<uint32_t>(cat));
}

static inline bool enabled(LogLevel lvl) {
    return g_log_level.load(std::memory_order_relaxed) <= lvl;
}

void log_info(const std::string& m)  { if (enabled(LogLevel::INFO)) write_line("INFO", m); }
void log_warn(const std::string& m)  { if (enabled(LogLevel::WARN)) write_line("WARN", m); }
void log_error(const std::string& m) { if (enabled(LogLevel::ERR))  write_line("ERROR", m); }

void log_trace(LogCategory cat, const std::string& s) { if (enabled(LogLevel::TRACE, cat)) write_line("TRACE", s); }
void log_debug(LogCategory cat, const std::string& s) { if (enabled(LogLevel::DEBUG, cat)) write_line("DEBUG", s); }
void log_info(LogCategory cat, const std::string& s)  { if (enabled(LogLevel::INFO, cat))  write_line("INFO", s); }
void log_warn(LogCategory cat, const std::string& s)  { if (enabled(LogLevel::WARN, cat))  write_line("WARN", s); }
void log_error(LogCategory cat, const std::string& s) { if (enabled(LogLevel::ERR, cat))   write_line("ERROR", s); }
void log_fatal(LogCategory cat, const std::string& s) { if (enabled(LogLevel::FATAL, cat)) write_line("FATAL", s); }

void log_set_level(LogLevel level) {
    g_log_level.store(level, std::memory_order_relaxed);
}

void log_set_categories(uint32_t categories) {
    g_log_categories.store(categories, std::memory_order_relaxed);
}

void log_enable_timestamps(bool enable) {
    g_timestamps_enabled.store(enable, std::memory_order_relaxed);
}

LogLevel log_get_level() {
    return g_log_level.load(std::memory_order_relaxed);
}

uint32_t log_get_categories() {
    return g_log_categories.load(std::memory_order_relaxed);
}

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool log_level_from_string(const std::string& s, LogLevel& out) {
    const std::string v = lower(s);
    if (v == "trace") out = LogLevel::TRACE;
    else if (v == "debug") out = LogLevel::DEBUG;
    else if (v == "info") out = LogLevel::INFO;
    else if (v == "warn" || v == "warning") out = LogLevel::WARN;
    else if (v == "error" || v == "err") out = LogLevel::ERR;
    else if (v == "fatal") out = LogLevel::FATAL;
    else if (v == "none" || v == "off") out = LogLevel::NONE;
    else return false;
    return true;
}

bool log_category_from_string(const std::string& s, LogCategory& out) {
    const std::string v = lower(s);
    if (v == "general") out = LogCategory::GENERAL;
    else if (v == "canon") out = LogCategory::CANON;
    else if (v == "mmr") out = LogCategory::MMR;
    else if (v == "chain") out = LogCategory::CHAIN;
    else if (v == "fork") out = LogCategory::FORK;
    else if (v == "anchor") out = LogCategory::ANCHOR;
    else if (v == "config") out = LogCategory::CONFIG;
    else if (v == "registry") out = LogCategory::REGISTRY;
    else if (v == "all") out = LogCategory::ALL;
    else return false;
    return true;
}

void log_flush() {
    std::lock_guard<std::mutex> lk(g_log_mutex);
    std::cout.flush();
    std::cerr.flush();
}

static void start_async_writer() {
    if (!g_async_running.exchange(true, std::memory_order_relaxed)) {
        g_async_thread = std::thread(async_logger_thread);
    }
}

static void stop_async_writer() {
    if (g_async_running.exchange(false, std::memory_order_relaxed)) {
        g_async_cv.notify_all();
        if (g_async_thread.joinable()) {
            g_async_thread.join();
        }
    }
}

void log_init(LogLevel level, uint32_t categories) {
    g_log_level.store(level, std::memory_order_relaxed);
    g_log_categories.store(categories, std::memory_order_relaxed);

    if (g_async_mode.load(std::memory_order_relaxed)) {
        start_async_writer();
    }
}

void log_shutdown() {
    stop_async_writer();
    log_flush();
}

void log_set_async(bool enable) {
    bool was_async = g_async_mode.exchange(enable, std::memory_order_relaxed);
    if (enable && !was_async) {
        start_async_writer();
    } else if (!enable && was_async) {
        stop_async_writer();
    }
}

}  // namespace cchain
