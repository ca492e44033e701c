#include "http_fetcher.hpp"
#include "../errors.hpp"
#include "../question_extractor.hpp"
#include "../verbose.hpp"
#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace quarry::providers {

namespace {

// Pages with less text than this are error pages or paywalls.
constexpr size_t MIN_ARTICLE_CHARS = 100;

constexpr const char* USER_AGENT =
    "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 (KHTML, like Gecko) "
    "Chrome/120.0.0.0 Safari/537.36";

// Context shared with the CURL callbacks.
struct FetchContext {
    std::string body;
    CancelCallback cancel_check;
    bool cancelled = false;
};

// CURL write callback for collecting response data into a string.
size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<FetchContext*>(userdata);
    ctx->body.append(ptr, size * nmemb);
    return size * nmemb;
}

// CURL progress callback for cancellation support.
// Returns non-zero to abort the transfer.
int progress_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<FetchContext*>(userdata);
    if (ctx->cancel_check && ctx->cancel_check()) {
        ctx->cancelled = true;
        return 1;
    }
    return 0;
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), ::tolower);
    return s;
}

bool is_block_tag(const std::string& name) {
    static const char* blocks[] = {
        "p", "br", "div", "li", "tr", "h1", "h2", "h3", "h4", "h5", "h6",
        "blockquote", "section", "article", "header", "footer", "dt", "dd"
    };
    for (const char* block : blocks) {
        if (name == block) {
            return true;
        }
    }
    return false;
}

std::string decode_entities(const std::string& s) {
    static const std::pair<const char*, const char*> entities[] = {
        {"&amp;", "&"}, {"&lt;", "<"}, {"&gt;", ">"}, {"&quot;", "\""},
        {"&#39;", "'"}, {"&apos;", "'"}, {"&nbsp;", " "}, {"&rsquo;", "'"},
        {"&lsquo;", "'"}, {"&rdquo;", "\""}, {"&ldquo;", "\""}, {"&mdash;", "-"},
        {"&ndash;", "-"}, {"&hellip;", "..."}
    };

    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '&') {
            bool replaced = false;
            for (const auto& [entity, text] : entities) {
                size_t len = std::char_traits<char>::length(entity);
                if (s.compare(i, len, entity) == 0) {
                    out += text;
                    i += len - 1;
                    replaced = true;
                    break;
                }
            }
            if (replaced) {
                continue;
            }
        }
        out += s[i];
    }
    return out;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

std::string html_to_text(const std::string& html) {
    std::string text;
    text.reserve(html.size());
    std::string lowered = lower(html);

    size_t i = 0;
    while (i < html.size()) {
        if (html[i] != '<') {
            text += html[i++];
            continue;
        }

        size_t close = html.find('>', i);
        if (close == std::string::npos) {
            text += html.substr(i);
            break;
        }

        std::string tag = lowered.substr(i + 1, close - i - 1);
        bool closing = !tag.empty() && tag[0] == '/';
        size_t name_start = closing ? 1 : 0;
        size_t name_end = tag.find_first_of(" \t\r\n/", name_start);
        std::string name = tag.substr(name_start, name_end == std::string::npos ? std::string::npos
                                                                                : name_end - name_start);

        if (!closing && (name == "script" || name == "style" || name == "head")) {
            // Skip everything up to the matching end tag
            size_t end = lowered.find("</" + name, close);
            i = end == std::string::npos ? html.size() : html.find('>', end);
            i = i == std::string::npos ? html.size() : i + 1;
            continue;
        }

        if (is_block_tag(name)) {
            text += '\n';
        }
        i = close + 1;
    }

    // Collapse whitespace within lines and drop blank lines
    std::istringstream stream(decode_entities(text));
    std::string line;
    std::string out;
    while (std::getline(stream, line)) {
        std::string cleaned;
        bool space = false;
        for (char c : line) {
            if (std::isspace(static_cast<unsigned char>(c))) {
                space = true;
            } else {
                if (space && !cleaned.empty()) {
                    cleaned += ' ';
                }
                cleaned += c;
                space = false;
            }
        }
        if (!cleaned.empty()) {
            out += cleaned + "\n";
        }
    }
    return out;
}

HttpFetcher::HttpFetcher(int max_attempts) : max_attempts_(std::max(1, max_attempts)) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

HttpFetcher::~HttpFetcher() {
    curl_global_cleanup();
}

std::string HttpFetcher::http_get(const std::string& url, const FetchOptions& options) {
    verbose_out("CURL", "GET " + url);

    CURL* curl = curl_easy_init();
    if (!curl) {
        verbose_err("CURL", "Failed to initialize CURL");
        throw std::runtime_error("Failed to initialize CURL");
    }

    FetchContext ctx;
    ctx.cancel_check = options.cancel_check;

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Accept: text/html,application/xhtml+xml,text/plain;q=0.9,*/*;q=0.8");
    headers = curl_slist_append(headers, "Accept-Language: en-US,en;q=0.5");

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, USER_AGENT);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    if (options.timeout_seconds > 0) {
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(options.timeout_seconds));
    }

    if (is_verbose()) {
        curl_easy_setopt(curl, CURLOPT_VERBOSE, 1L);
    }

    CURLcode res = curl_easy_perform(curl);

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (ctx.cancelled) {
        throw SourceUnavailableError("Fetch of " + url + " was cancelled");
    }
    if (res != CURLE_OK) {
        verbose_err("CURL", std::string("GET failed: ") + curl_easy_strerror(res));
        throw std::runtime_error(std::string("HTTP GET failed: ") + curl_easy_strerror(res));
    }

    verbose_in("CURL", "HTTP " + std::to_string(http_code) + " - " + std::to_string(ctx.body.size()) + " bytes");

    if (http_code >= 400) {
        throw std::runtime_error("HTTP " + std::to_string(http_code));
    }
    return ctx.body;
}

std::string HttpFetcher::fetch(const std::string& url, const FetchOptions& options) {
    std::string body;

    if (starts_with(url, "file://")) {
        std::string path = url.substr(7);
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open()) {
            throw SourceUnavailableError("Cannot open " + path);
        }
        std::ostringstream ss;
        ss << file.rdbuf();
        body = ss.str();
    } else {
        std::string last_error;
        for (int attempt = 1; attempt <= max_attempts_; ++attempt) {
            try {
                body = http_get(url, options);
                last_error.clear();
                break;
            } catch (const SourceUnavailableError&) {
                throw;
            } catch (const std::runtime_error& e) {
                last_error = e.what();
                verbose_err("FETCH", "Attempt " + std::to_string(attempt) + " for " + url +
                            " failed: " + last_error);
                if (attempt < max_attempts_) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(500 * attempt));
                }
            }
        }
        if (!last_error.empty()) {
            throw SourceUnavailableError("Cannot fetch " + url + ": " + last_error);
        }
    }

    std::string text = html_to_text(body);
    if (trim(text).size() < MIN_ARTICLE_CHARS) {
        throw SourceUnavailableError("Page " + url + " has too little text to be an article");
    }
    return text;
}

} // namespace quarry::providers
