#include "http_server.hpp"
#include "engine.hpp"
#include "errors.hpp"
#include "verbose.hpp"
#include <httplib.h>
#include <stdexcept>

using json = nlohmann::json;

namespace quarry {

// ========== JSON Views ==========

static json decision_to_json(const Decision& decision) {
    return {
        {"action", to_string(decision.action)},
        {"reason", decision.reason}
    };
}

static json match_to_json(const Match& match) {
    json j = record_to_json(match.record);
    j["score"] = match.score;
    return j;
}

static json ingestion_to_json(const IngestionReport& report) {
    return {
        {"mode", to_string(report.mode)},
        {"questions_added", report.questions_added},
        {"sources_ingested", {
            {"video", report.sources_ingested.video},
            {"audio", report.sources_ingested.audio},
            {"article", report.sources_ingested.article}
        }},
        {"questions_by_type", {
            {"video", report.questions_by_type.video},
            {"audio", report.questions_by_type.audio},
            {"article", report.questions_by_type.article}
        }},
        {"unavailable_sources", report.unavailable_sources},
        {"degraded", report.degraded}
    };
}

static std::string required_string(const json& body, const char* key) {
    if (!body.is_object() || !body.contains(key) || !body[key].is_string() ||
        body[key].get<std::string>().empty()) {
        throw std::invalid_argument(std::string("'") + key + "' is required");
    }
    return body[key].get<std::string>();
}

static std::optional<size_t> optional_k(const json& body) {
    if (!body.contains("k")) {
        return std::nullopt;
    }
    if (!body["k"].is_number_integer() || body["k"].get<int64_t>() < 0) {
        throw std::invalid_argument("'k' must be a non-negative integer");
    }
    return body["k"].get<size_t>();
}

static std::optional<float> optional_threshold(const json& body) {
    if (!body.contains("threshold")) {
        return std::nullopt;
    }
    if (!body["threshold"].is_number()) {
        throw std::invalid_argument("'threshold' must be a number");
    }
    return body["threshold"].get<float>();
}

// ========== Handlers ==========

HttpServer::HttpServer(Engine& engine) : engine_(engine) {}

HttpServer::~HttpServer() = default;

json HttpServer::handle_health() const {
    return {
        {"status", "ok"},
        {"embedder", engine_.embedder().model()},
        {"dimension", engine_.embedder().dimension()},
        {"subjects", engine_.status().size()}
    };
}

json HttpServer::handle_subjects() const {
    json subjects = json::array();
    for (const auto& entry : engine_.status()) {
        subjects.push_back(entry_to_json(entry));
    }
    return {
        {"subjects", subjects},
        {"corrupt", engine_.corrupt_subjects()}
    };
}

json HttpServer::handle_subject(const std::string& subject) const {
    IndexStats stats = engine_.stats(subject);
    json j = {
        {"subject_id", stats.subject_id},
        {"records", stats.record_count},
        {"next_id", stats.next_id},
        {"corrupt", stats.corrupt}
    };
    for (const auto& entry : engine_.status()) {
        if (entry.subject_id == stats.subject_id) {
            j["registry"] = entry_to_json(entry);
        }
    }
    return j;
}

json HttpServer::handle_decide(const json& body) {
    std::string subject = required_string(body, "subject");
    bool force = body.value("force", false);
    return decision_to_json(engine_.decide(subject, force));
}

json HttpServer::handle_retrieve(const json& body) {
    std::string subject = required_string(body, "subject");
    std::string question = required_string(body, "question");

    auto matches = engine_.retrieve(subject, question,
                                    optional_k(body).value_or(engine_.settings().top_k),
                                    optional_threshold(body).value_or(engine_.settings().similarity_threshold));
    json out = json::array();
    for (const auto& match : matches) {
        out.push_back(match_to_json(match));
    }
    return {{"matches", out}};
}

json HttpServer::handle_ask(const json& body) {
    std::string subject = required_string(body, "subject");
    std::string question = required_string(body, "question");
    bool force = body.value("force", false);

    AskResult result = engine_.ask(subject, question, force, optional_k(body), optional_threshold(body));

    json matches = json::array();
    for (const auto& match : result.matches) {
        matches.push_back(match_to_json(match));
    }

    json j = {
        {"decision", decision_to_json(result.decision)},
        {"matches", matches}
    };
    if (result.ingestion) {
        j["ingestion"] = ingestion_to_json(*result.ingestion);
    }
    return j;
}

// ========== Server Loop ==========

// Runs a handler and maps exceptions to HTTP status codes.
static void respond(httplib::Response& res, const std::function<json()>& handler) {
    try {
        res.set_content(handler().dump(), "application/json");
    } catch (const json::exception& e) {
        res.status = 400;
        res.set_content(json{{"error", std::string("Invalid JSON: ") + e.what()}}.dump(), "application/json");
    } catch (const std::invalid_argument& e) {
        res.status = 400;
        res.set_content(json{{"error", e.what()}}.dump(), "application/json");
    } catch (const QueryEmbeddingError& e) {
        res.status = 422;
        res.set_content(json{{"error", e.what()}}.dump(), "application/json");
    } catch (const IndexCorruptError& e) {
        res.status = 409;
        res.set_content(json{{"error", e.what()}, {"subject", e.subject()}}.dump(), "application/json");
    } catch (const RegistryCorruptError& e) {
        res.status = 409;
        res.set_content(json{{"error", e.what()}, {"subject", e.subject()}}.dump(), "application/json");
    } catch (const std::exception& e) {
        verbose_err("HTTP", e.what());
        res.status = 500;
        res.set_content(json{{"error", e.what()}}.dump(), "application/json");
    }
}

bool HttpServer::start(const std::string& address, int port) {
    server_ = std::make_unique<httplib::Server>();
    httplib::Server& svr = *server_;

    svr.set_logger([](const httplib::Request& req, const httplib::Response& res) {
        verbose_log("HTTP", req.method + " " + req.path + " -> " + std::to_string(res.status));
    });

    svr.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        respond(res, [this] { return handle_health(); });
    });

    svr.Get("/api/subjects", [this](const httplib::Request&, httplib::Response& res) {
        respond(res, [this] { return handle_subjects(); });
    });

    svr.Get(R"(/api/subjects/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
        std::string subject = req.matches[1];
        respond(res, [this, &subject] { return handle_subject(subject); });
    });

    svr.Post("/api/decide", [this](const httplib::Request& req, httplib::Response& res) {
        respond(res, [this, &req] { return handle_decide(json::parse(req.body)); });
    });

    svr.Post("/api/retrieve", [this](const httplib::Request& req, httplib::Response& res) {
        respond(res, [this, &req] { return handle_retrieve(json::parse(req.body)); });
    });

    svr.Post("/api/ask", [this](const httplib::Request& req, httplib::Response& res) {
        respond(res, [this, &req] { return handle_ask(json::parse(req.body)); });
    });

    if (!svr.bind_to_port(address, port)) {
        return false;
    }

    // Call the on_start callback before blocking
    if (on_start_callback_) {
        on_start_callback_(address, port);
    }

    // This blocks until stop() is called
    return svr.listen_after_bind();
}

void HttpServer::stop() {
    if (server_) {
        server_->stop();
    }
}

void HttpServer::on_start(std::function<void(const std::string&, int)> callback) {
    on_start_callback_ = std::move(callback);
}

} // namespace quarry
