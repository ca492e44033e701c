#pragma once

/**
 * Article fetcher over HTTP(S) using libcurl.
 *
 * Downloads a page with a browser-like User-Agent, retries transient
 * failures, and reduces HTML to readable text with one paragraph per
 * line. file:// URLs are read from disk so saved articles can be indexed
 * offline.
 */

#include "provider.hpp"

namespace quarry::providers {

class HttpFetcher : public IFetcher {
public:
    explicit HttpFetcher(int max_attempts = 3);
    ~HttpFetcher() override;

    HttpFetcher(const HttpFetcher&) = delete;
    HttpFetcher& operator=(const HttpFetcher&) = delete;

    /**
     * Returns the text of the page at url. Throws SourceUnavailableError on
     * transport or HTTP errors, cancellation, or a page with too little
     * text to be an article.
     */
    std::string fetch(const std::string& url, const FetchOptions& options) override;

private:
    // One GET attempt; returns the body or throws std::runtime_error.
    std::string http_get(const std::string& url, const FetchOptions& options);

    int max_attempts_;
};

/**
 * Reduces an HTML document to plain text. Script, style and head content
 * is dropped, block-level tags become line breaks, common entities are
 * decoded, and blank lines are collapsed. Text without tags is returned
 * with only whitespace cleanup.
 */
std::string html_to_text(const std::string& html);

} // namespace quarry::providers
