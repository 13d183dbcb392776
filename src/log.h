// =============================================================================
// CORRIDOR CHAIN LOGGING
// =============================================================================

#pragma once
#include <string>
#include <cstdint>
#include <atomic>
#include <mutex>
#include <sstream>

namespace cchain {

// Log levels
// Note: Using ERR instead of ERROR to avoid conflict with Windows ERROR macro
enum class LogLevel : int {
    TRACE = 0,    // Extremely verbose
    DEBUG = 1,    // Debug information
    INFO = 2,     // General information
    WARN = 3,     // Warnings (integrity rejections land here)
    ERR = 4,      // Errors (named ERR to avoid Windows macro conflict)
    FATAL = 5,    // Fatal errors
    NONE = 6      // Disable all logging
};

// Log categories for filtering
enum class LogCategory : uint32_t {
    GENERAL    = 0x0001,
    CANON      = 0x0002,
    MMR        = 0x0004,
    CHAIN      = 0x0008,
    FORK       = 0x0010,
    ANCHOR     = 0x0020,
    CONFIG     = 0x0040,
    REGISTRY   = 0x0080,
    ALL        = 0xFFFF
};

// Configuration
void log_set_level(LogLevel level);
void log_set_categories(uint32_t categories);
void log_enable_timestamps(bool enable);

// Get current configuration
LogLevel log_get_level();
uint32_t log_get_categories();

// Parse "trace", "debug", "info", "warn", "error", "fatal", "none".
bool log_level_from_string(const std::string& s, LogLevel& out);
// Parse a single category name ("chain", "mmr", ..., "all").
bool log_category_from_string(const std::string& s, LogCategory& out);

// Uncategorized logging
void log_info(const std::string& s);
void log_warn(const std::string& s);
void log_error(const std::string& s);

// Logging with categories
void log_trace(LogCategory cat, const std::string& s);
void log_debug(LogCategory cat, const std::string& s);
void log_info(LogCategory cat, const std::string& s);
void log_warn(LogCategory cat, const std::string& s);
void log_error(LogCategory cat, const std::string& s);
void log_fatal(LogCategory cat, const std::string& s);

// Conditional logging (avoids string construction if level is disabled)
#define CCHAIN_LOG_TRACE(cat, msg) do { \
    if (cchain::log_get_level() <= cchain::LogLevel::TRACE && \
        (cchain::log_get_categories() & static_cast<uint32_t>(cat))) { \
        cchain::log_trace(cat, msg); \
    } \
} while(0)

#define CCHAIN_LOG_DEBUG(cat, msg) do { \
    if (cchain::log_get_level() <= cchain::LogLevel::DEBUG && \
        (cchain::log_get_categories() & static_cast<uint32_t>(cat))) { \
        cchain::log_debug(cat, msg); \
    } \
} while(0)

#define CCHAIN_LOG_INFO(cat, msg) do { \
    if (cchain::log_get_level() <= cchain::LogLevel::INFO && \
        (cchain::log_get_categories() & static_cast<uint32_t>(cat))) { \
        cchain::log_info(cat, msg); \
    } \
} while(0)

#define CCHAIN_LOG_WARN(cat, msg) do { \
    if (cchain::log_get_level() <= cchain::LogLevel::WARN && \
        (cchain::log_get_categories() & static_cast<uint32_t>(cat))) { \
        cchain::log_warn(cat, msg); \
    } \
} while(0)

#define CCHAIN_LOG_ERROR(cat, msg) do { \
    if (cchain::log_get_level() <= cchain::LogLevel::ERR && \
        (cchain::log_get_categories() & static_cast<uint32_t>(cat))) { \
        cchain::log_error(cat, msg); \
    } \
} while(0)

// Flush all buffered logs
void log_flush();

// Initialization
void log_init(LogLevel level = LogLevel::INFO,
              uint32_t categories = static_cast<uint32_t>(LogCategory::ALL));

// Shutdown logging (stop the async writer and flush)
void log_shutdown();

// Enable/disable async logging mode (for high-throughput appenders)
void log_set_async(bool enable);

// Rate limiting helper - returns true if this log call should be suppressed
bool log_rate_limited(const char* file, int line);

// Rate-limited logging macro - only logs once per second from same source location
#define CCHAIN_LOG_RATE_LIMITED(level, cat, msg) do { \
    if (!cchain::log_rate_limited(__FILE__, __LINE__)) { \
        cchain::log_##level(cat, msg); \
    } \
} while(0)

}  // namespace cchain
