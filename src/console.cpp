#include "console.hpp"
#include "report.hpp"
#include <cstdio>
#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <unistd.h>

namespace quarry {

Console::Console() : colors_enabled_(true) {
    enable_colors();
}

void Console::enable_colors() {
    const char* term = std::getenv("TERM");
    if (!term || std::string(term) == "dumb") {
        colors_enabled_ = false;
    }
    if (std::getenv("NO_COLOR")) {
        colors_enabled_ = false;
    }
    // Piped output stays free of escape codes
    if (!isatty(fileno(stdout))) {
        colors_enabled_ = false;
    }
}

void Console::print(const std::string& text) const {
    std::cout << text;
}

void Console::println(const std::string& text) const {
    std::cout << text << std::endl;
}

void Console::print_error(const std::string& text) const {
    if (colors_enabled_) {
        std::cerr << ansi::RED << text << ansi::RESET << std::endl;
    } else {
        std::cerr << text << std::endl;
    }
}

void Console::print_warning(const std::string& text) const {
    if (colors_enabled_) {
        std::cout << ansi::YELLOW << text << ansi::RESET << std::endl;
    } else {
        std::cout << text << std::endl;
    }
}

void Console::print_success(const std::string& text) const {
    if (colors_enabled_) {
        std::cout << ansi::GREEN << "✓" << ansi::RESET << " " << text << std::endl;
    } else {
        std::cout << "* " << text << std::endl;
    }
}

void Console::print_info(const std::string& text) const {
    if (colors_enabled_) {
        std::cout << ansi::CYAN << text << ansi::RESET << std::endl;
    } else {
        std::cout << text << std::endl;
    }
}

void Console::print_header(const std::string& text) const {
    if (colors_enabled_) {
        std::cout << ansi::BOLD << ansi::CYAN << text << ansi::RESET << std::endl;
    } else {
        std::cout << text << std::endl;
    }
}

void Console::print_colored(const std::string& text, const char* color) const {
    if (colors_enabled_) {
        std::cout << color << text << ansi::RESET;
    } else {
        std::cout << text;
    }
}

// ========== Domain Output ==========

void Console::print_field(const std::string& key, const std::string& value) const {
    std::cout << "  ";
    print_colored(key + ":", ansi::DIM);
    std::cout << " " << value << std::endl;
}

void Console::print_decision(const Decision& decision) const {
    const char* color = ansi::GREEN;
    if (decision.action == Action::Ingest) {
        color = ansi::MAGENTA;
    } else if (decision.action == Action::IncrementalIngest) {
        color = ansi::YELLOW;
    }

    if (colors_enabled_) {
        std::cout << ansi::BOLD << color << to_string(decision.action) << ansi::RESET;
    } else {
        std::cout << to_string(decision.action);
    }
    std::cout << "  " << decision.reason << std::endl;
}

void Console::print_match(size_t rank, const Match& match) const {
    std::ostringstream score;
    score << std::fixed << std::setprecision(3) << match.score;

    std::cout << std::setw(3) << rank << ". ";
    print_colored("[" + score.str() + "]", ansi::GREEN);
    std::cout << " " << match.record.text << std::endl;

    const SourceRef& source = match.record.primary_source();
    std::string where = to_string(source.type) + " | " +
                        (source.title.empty() ? source.url : source.title);
    if (source.media_timestamp) {
        where += " @ " + format_timestamp(*source.media_timestamp);
    }
    std::cout << "       ";
    print_colored(where, ansi::DIM);
    std::cout << std::endl;

    if (match.record.sources.size() > 1) {
        std::cout << "       ";
        print_colored("asked in " + std::to_string(match.record.sources.size()) + " sources", ansi::DIM);
        std::cout << std::endl;
    }
}

void Console::print_entry(const RegistryEntry& entry) const {
    const char* color = ansi::GREEN;
    if (entry.status == SubjectStatus::Empty) {
        color = ansi::RED;
    } else if (entry.status == SubjectStatus::Degraded) {
        color = ansi::YELLOW;
    }

    print_colored(entry.display_name, ansi::BOLD);
    std::cout << " (" << entry.subject_id << ") ";
    print_colored(to_string(entry.status), color);
    std::cout << std::endl;
    print_field("questions", std::to_string(entry.question_count));
    print_field("sources", std::to_string(entry.source_counts.video) + " video, " +
                std::to_string(entry.source_counts.audio) + " audio, " +
                std::to_string(entry.source_counts.article) + " article");
    print_field("last indexed", format_utc(entry.last_indexed_at));
}

// ========== Status Messages ==========

void Console::start_status(const std::string& message) const {
    if (colors_enabled_) {
        // Return to start of line, print message, clear to end of line
        std::cout << "\r" << ansi::YELLOW << message << ansi::RESET << "\033[K" << std::flush;
    } else {
        std::cout << message << std::endl;
    }
}

void Console::clear_status() const {
    if (colors_enabled_) {
        std::cout << "\r\033[K" << std::flush;
    }
}

void Console::flush() const {
    std::cout << std::flush;
}

} // namespace quarry
