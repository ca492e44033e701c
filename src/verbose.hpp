#pragma once

/**
 * Diagnostic logging for quarry.
 *
 * Category-tagged, timestamped lines on stderr. Debug traffic (HTTP calls,
 * pipeline stages, store writes) is printed only with -v/--verbose;
 * warnings about skipped sources and degraded runs are always printed.
 */

#include <string>
#include <iostream>
#include <iomanip>
#include <chrono>
#include <sstream>
#include <mutex>
#include <ctime>

namespace quarry {

/**
 * Global verbose mode flag.
 */
inline bool g_verbose = false;

// Serializes lines written from ingestion and server threads.
inline std::mutex g_log_mutex;

inline void set_verbose(bool enabled) {
    g_verbose = enabled;
}

inline bool is_verbose() {
    return g_verbose;
}

/**
 * Get current wall-clock time as HH:MM:SS.mmm.
 */
inline std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_now;
    localtime_r(&time_t_now, &tm_now);

    std::ostringstream oss;
    oss << std::put_time(&tm_now, "%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

// Writes one formatted line; color is the ANSI code for the category tag.
inline void write_log_line(const char* color, const std::string& tag, const std::string& message) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::cerr << "\033[90m[" << timestamp() << "] " << color << "[" << tag << "]\033[0m "
              << message << std::endl;
}

/**
 * Log a verbose message with timestamp and category.
 */
inline void verbose_log(const std::string& category, const std::string& message) {
    if (!g_verbose) return;
    write_log_line("\033[36m", category, message);
}

/**
 * Log outgoing data (requests).
 */
inline void verbose_out(const std::string& category, const std::string& message) {
    if (!g_verbose) return;
    write_log_line("\033[33m", category + " >>>", message);
}

/**
 * Log incoming data (responses).
 */
inline void verbose_in(const std::string& category, const std::string& message) {
    if (!g_verbose) return;
    write_log_line("\033[32m", category + " <<<", message);
}

/**
 * Log error details (verbose mode only).
 */
inline void verbose_err(const std::string& category, const std::string& message) {
    if (!g_verbose) return;
    write_log_line("\033[31m", category + " ERR", message);
}

/**
 * Log a warning regardless of verbose mode.
 */
inline void warn_log(const std::string& category, const std::string& message) {
    write_log_line("\033[33m", category + " WARN", message);
}

/**
 * Truncate long content for display.
 */
inline std::string truncate(const std::string& s, size_t max_len = 200) {
    if (s.length() <= max_len) return s;
    return s.substr(0, max_len) + "... (" + std::to_string(s.length()) + " bytes total)";
}

} // namespace quarry
