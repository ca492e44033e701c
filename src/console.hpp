#pragma once

#include "decision_policy.hpp"
#include "question_index.hpp"
#include "registry.hpp"
#include <string>
#include <iostream>

namespace quarry {

// ========== ANSI Escape Codes ==========

// ANSI escape codes for terminal colors.
namespace ansi {
    constexpr const char* RESET = "\033[0m";
    constexpr const char* BOLD = "\033[1m";
    constexpr const char* DIM = "\033[2m";
    constexpr const char* RED = "\033[31m";
    constexpr const char* GREEN = "\033[32m";
    constexpr const char* YELLOW = "\033[33m";
    constexpr const char* BLUE = "\033[34m";
    constexpr const char* MAGENTA = "\033[35m";
    constexpr const char* CYAN = "\033[36m";
}

/**
 * Terminal output helper with color support.
 *
 * Provides styled output methods that automatically handle ANSI color codes
 * based on terminal capabilities. Falls back to plain text when colors are
 * not supported (TERM=dumb, NO_COLOR set, or stdout is not a TTY).
 */
class Console {
public:
    // Creates a Console instance and detects color support.
    Console();

    // ========== Basic Output ==========

    // Prints text without a trailing newline.
    void print(const std::string& text) const;

    // Prints text followed by a newline.
    void println(const std::string& text = "") const;

    // ========== Colored Output ==========

    // Prints error message in red on stderr.
    void print_error(const std::string& text) const;

    // Prints warning message in yellow.
    void print_warning(const std::string& text) const;

    // Prints success message in green with a checkmark prefix.
    void print_success(const std::string& text) const;

    // Prints informational message in cyan.
    void print_info(const std::string& text) const;

    // Prints header text in bold cyan.
    void print_header(const std::string& text) const;

    // Prints text with a specific ANSI color code.
    void print_colored(const std::string& text, const char* color) const;

    // ========== Domain Output ==========

    // Prints "  key: value" with the key dimmed.
    void print_field(const std::string& key, const std::string& value) const;

    // Prints the action in bold, colored by kind, followed by the reason.
    void print_decision(const Decision& decision) const;

    // Prints a numbered match with its score and primary source.
    void print_match(size_t rank, const Match& match) const;

    // Prints one status line for a registry entry.
    void print_entry(const RegistryEntry& entry) const;

    // ========== Status Messages ==========

    // Displays a status message (for progress indication).
    void start_status(const std::string& message) const;

    // Clears the current status line.
    void clear_status() const;

    // Flushes stdout.
    void flush() const;

private:
    bool colors_enabled_;  // True if terminal supports ANSI colors.

    // Detects and enables color support based on terminal capabilities.
    void enable_colors();
};

} // namespace quarry
