#include "openai_client.hpp"
#include "verbose.hpp"
#include <curl/curl.h>
#include <stdexcept>

namespace quarry {

using json = nlohmann::json;

// CURL write callback for collecting response data into a string.
static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* response = static_cast<std::string*>(userdata);
    response->append(ptr, size * nmemb);
    return size * nmemb;
}

// Extracts the API's error message from a failed response body, if present.
static std::string api_error_message(const std::string& body) {
    try {
        json j = json::parse(body);
        if (j.contains("error") && j["error"].is_object()) {
            return j["error"].value("message", body);
        }
    } catch (const json::exception&) {
        // Not JSON; fall through to the raw body
    }
    return truncate(body, 300);
}

OpenAIClient::OpenAIClient(const std::string& api_key, const std::string& base_url, int timeout_seconds)
    : api_key_(api_key),
      base_url_(base_url),
      timeout_seconds_(timeout_seconds) {
    while (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

OpenAIClient::~OpenAIClient() {
    curl_global_cleanup();
}

json OpenAIClient::http_post_json(const std::string& url, const json& body) {
    std::string body_str = body.dump();
    verbose_out("CURL", "POST " + url);
    verbose_out("CURL", "Body: " + truncate(body_str, 500));

    CURL* curl = curl_easy_init();
    if (!curl) {
        verbose_err("CURL", "Failed to initialize CURL");
        throw std::runtime_error("Failed to initialize CURL");
    }

    std::string response;

    struct curl_slist* headers = nullptr;
    std::string auth_header = "Authorization: Bearer " + api_key_;
    headers = curl_slist_append(headers, auth_header.c_str());
    headers = curl_slist_append(headers, "Content-Type: application/json");

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body_str.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(timeout_seconds_));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    if (is_verbose()) {
        curl_easy_setopt(curl, CURLOPT_VERBOSE, 1L);
    }

    CURLcode res = curl_easy_perform(curl);

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        verbose_err("CURL", std::string("POST failed: ") + curl_easy_strerror(res));
        throw std::runtime_error(std::string("HTTP POST failed: ") + curl_easy_strerror(res));
    }

    verbose_in("CURL", "HTTP " + std::to_string(http_code) + " - " + truncate(response, 500));

    if (http_code >= 400) {
        throw std::runtime_error("HTTP " + std::to_string(http_code) + " from " + url + ": " +
                                 api_error_message(response));
    }

    try {
        return json::parse(response);
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Invalid JSON response from ") + url + ": " + e.what());
    }
}

// ========== Embeddings API ==========

std::vector<std::vector<float>> OpenAIClient::create_embeddings(const std::string& model,
                                                                const std::vector<std::string>& texts,
                                                                size_t dimensions) {
    json body = {
        {"model", model},
        {"input", texts}
    };
    if (dimensions > 0) {
        body["dimensions"] = dimensions;
    }

    json j = http_post_json(base_url_ + "/embeddings", body);
    if (!j.contains("data") || !j["data"].is_array()) {
        throw std::runtime_error("Embeddings response has no 'data' array");
    }

    std::vector<std::vector<float>> vectors(texts.size());
    for (const auto& item : j["data"]) {
        size_t index = item.value("index", size_t(0));
        if (index >= vectors.size() || !item.contains("embedding")) {
            throw std::runtime_error("Embeddings response item is malformed");
        }
        vectors[index] = item["embedding"].get<std::vector<float>>();
    }

    for (const auto& v : vectors) {
        if (v.empty()) {
            throw std::runtime_error("Embeddings response is missing a vector");
        }
    }
    return vectors;
}

// ========== Chat Completions API ==========

ChatCompletion OpenAIClient::chat_completion(const std::string& model,
                                             const std::string& system_prompt,
                                             const std::string& user_prompt) {
    json body = {
        {"model", model},
        {"messages", json::array({
            {{"role", "system"}, {"content", system_prompt}},
            {{"role", "user"}, {"content", user_prompt}}
        })},
        {"temperature", 0}
    };

    json j = http_post_json(base_url_ + "/chat/completions", body);
    if (!j.contains("choices") || !j["choices"].is_array() || j["choices"].empty()) {
        throw std::runtime_error("Chat completion response has no choices");
    }

    json message = j["choices"][0].value("message", json::object());
    ChatCompletion completion;
    if (message.contains("content") && message["content"].is_string()) {
        completion.content = message["content"].get<std::string>();
    }

    if (j.contains("usage") && j["usage"].is_object()) {
        completion.usage.input_tokens = j["usage"].value("prompt_tokens", 0);
        completion.usage.output_tokens = j["usage"].value("completion_tokens", 0);
    }
    return completion;
}

} // namespace quarry
