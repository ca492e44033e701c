#pragma once

/**
 * HTTP server exposing the quarry engine as a JSON API.
 *
 * Routes:
 *   GET  /health                 liveness and embedder info
 *   GET  /api/subjects           registry entries
 *   GET  /api/subjects/<name>    one entry plus index counters
 *   POST /api/decide             {"subject", "force"}
 *   POST /api/retrieve           {"subject", "question", "k", "threshold"}
 *   POST /api/ask                {"subject", "question", "k", "threshold", "force"}
 */

#include <functional>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

namespace httplib {
class Server;
}

namespace quarry {

class Engine;

/**
 * Blocking HTTP server bound to one Engine.
 */
class HttpServer {
public:
    explicit HttpServer(Engine& engine);
    ~HttpServer();

    // Starts the server on the given address and port.
    // This call blocks until the server is stopped.
    // Returns true if the server ran and stopped cleanly, false if it failed to bind.
    bool start(const std::string& address, int port);

    // Stops a running server from another thread or a signal handler.
    void stop();

    // Sets a callback to be called when the server starts.
    void on_start(std::function<void(const std::string&, int)> callback);

    // ========== Request Handlers ==========
    // Each takes a parsed request body and returns the response body. They
    // throw std::invalid_argument for a bad request.

    nlohmann::json handle_health() const;
    nlohmann::json handle_subjects() const;
    nlohmann::json handle_subject(const std::string& subject) const;
    nlohmann::json handle_decide(const nlohmann::json& body);
    nlohmann::json handle_retrieve(const nlohmann::json& body);
    nlohmann::json handle_ask(const nlohmann::json& body);

private:
    Engine& engine_;
    std::unique_ptr<httplib::Server> server_;
    std::function<void(const std::string&, int)> on_start_callback_;
};

} // namespace quarry
