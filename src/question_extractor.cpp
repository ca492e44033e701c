#include "question_extractor.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <regex>
#include <sstream>

namespace quarry {

static bool is_terminator(char c) {
    return c == '.' || c == '!' || c == '?';
}

static bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(" \t\n\r");
    return s.substr(start, end - start + 1);
}

// Collapses runs of whitespace into single spaces.
static std::string collapse_whitespace(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    bool last_was_space = false;
    for (char c : s) {
        if (is_space(c)) {
            if (!last_was_space && !out.empty()) {
                out += ' ';
            }
            last_was_space = true;
        } else {
            out += c;
            last_was_space = false;
        }
    }
    return trim(out);
}

std::vector<std::string> split_sentences(const std::string& text) {
    std::vector<std::string> sentences;
    std::string current;

    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (is_space(c) && i > 0 && is_terminator(text[i - 1])) {
            std::string sentence = trim(current);
            if (!sentence.empty()) {
                sentences.push_back(sentence);
            }
            current.clear();
            continue;
        }
        current += c;
    }

    std::string last = trim(current);
    if (!last.empty()) {
        sentences.push_back(last);
    }
    return sentences;
}

std::vector<std::string> split_tokens(const std::string& sentence) {
    std::vector<std::string> tokens;
    std::istringstream stream(sentence);
    std::string token;
    while (stream >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

// Lower-cases a token and strips surrounding punctuation ("What," -> "what").
static std::string normalize_token(const std::string& token) {
    size_t start = 0;
    size_t end = token.size();
    while (start < end && std::ispunct(static_cast<unsigned char>(token[start]))) {
        ++start;
    }
    while (end > start && std::ispunct(static_cast<unsigned char>(token[end - 1]))) {
        --end;
    }

    std::string out = token.substr(start, end - start);
    std::transform(out.begin(), out.end(), out.begin(), ::tolower);
    return out;
}

QuestionExtractor::QuestionExtractor(ExtractionLimits limits) : limits_(limits) {}

bool QuestionExtractor::is_candidate(const std::string& sentence) const {
    std::vector<std::string> tokens = split_tokens(sentence);
    if (tokens.size() < limits_.min_tokens || tokens.size() > limits_.max_tokens) {
        return false;
    }
    if (tokens.empty()) {
        return false;
    }

    if (sentence.back() == '?') {
        return true;
    }
    return INTERROGATIVE_WORDS.count(normalize_token(tokens.front())) > 0;
}

std::vector<std::string> QuestionExtractor::extract(const std::string& text) const {
    std::vector<std::string> candidates;
    for (const auto& sentence : split_sentences(text)) {
        if (is_candidate(sentence)) {
            candidates.push_back(sentence);
        }
    }
    return candidates;
}

std::vector<std::string> QuestionExtractor::extract_qa(const std::string& text) const {
    static const std::regex qa_line(
        R"(^\s*\*{0,2}\s*(?:q|question|interviewer)\s*:\s*\*{0,2}\s*(.+)$)",
        std::regex::icase);

    std::vector<std::string> questions;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        std::smatch match;
        if (!std::regex_match(line, match, qa_line)) {
            continue;
        }

        std::string question = collapse_whitespace(match[1].str());
        if (split_tokens(question).size() < QA_MIN_TOKENS) {
            continue;
        }
        while (!question.empty() && std::strchr(".!:;,", question.back()) != nullptr) {
            question.pop_back();
        }
        if (question.empty()) {
            continue;
        }
        if (question.back() != '?') {
            question += '?';
        }
        questions.push_back(question);
    }
    return questions;
}

} // namespace quarry
