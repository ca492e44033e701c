#include "config.hpp"
#include "console.hpp"
#include "engine.hpp"
#include "errors.hpp"
#include "extraction_pipeline.hpp"
#include "http_server.hpp"
#include "report.hpp"
#include "settings.hpp"
#include "usage_tracker.hpp"
#include "verbose.hpp"
#include "providers/factory.hpp"

#include <CLI/CLI.hpp>
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>

using namespace quarry;

// ========== Signal Handling ==========

static std::atomic<bool> g_cancel{false};   // Set by Ctrl+C; checked between source fetches.
static HttpServer* g_server = nullptr;      // Running server, stopped by Ctrl+C.

// Handles SIGINT (Ctrl+C): the first press cancels, the second exits.
void signal_handler(int) {
    if (g_server) {
        g_server->stop();
        return;
    }
    if (g_cancel.exchange(true)) {
        std::_Exit(130);
    }
}

// ========== Helpers ==========

// Joins positional words into one question.
static std::string join_words(const std::vector<std::string>& words) {
    std::string out;
    for (const auto& word : words) {
        if (!out.empty()) {
            out += ' ';
        }
        out += word;
    }
    return out;
}

// Parses "type=url" into a source. Throws ConfigError if malformed.
static Source parse_source_arg(const std::string& arg) {
    size_t eq = arg.find('=');
    if (eq == std::string::npos || eq == 0 || eq + 1 == arg.size()) {
        throw ConfigError("Source '" + arg + "' must look like type=url (video, audio or article)");
    }
    auto type = parse_source_type(arg.substr(0, eq));
    if (!type) {
        throw ConfigError("Unknown source type '" + arg.substr(0, eq) + "'");
    }
    return make_source(*type, arg.substr(eq + 1));
}

static Settings load_or_default_settings(const std::string& path) {
    auto loaded = load_settings(path);
    if (!loaded) {
        verbose_log("CONFIG", "No settings at " + path + ", using defaults");
        return Settings{};
    }
    verbose_log("CONFIG", "Loaded settings from " + path);
    return *loaded;
}

static std::unique_ptr<Engine> make_engine(const Settings& settings, UsageTracker& usage) {
    return std::make_unique<Engine>(settings, providers::ProviderFactory::create(settings, usage));
}

static void print_ingestion(const Console& console, const IngestionReport& report) {
    console.print_success("Ingested " + std::to_string(report.sources_ingested.total()) + " source(s), " +
                          std::to_string(report.questions_added) + " new question(s) (" +
                          to_string(report.mode) + ")");
    console.print_field("questions by type",
                        std::to_string(report.questions_by_type.video) + " video, " +
                        std::to_string(report.questions_by_type.audio) + " audio, " +
                        std::to_string(report.questions_by_type.article) + " article");
    if (report.merged > 0) {
        console.print_field("merged duplicates", std::to_string(report.merged));
    }
    if (report.known_sources_skipped > 0) {
        console.print_field("already indexed", std::to_string(report.known_sources_skipped) + " source(s)");
    }
    for (const auto& url : report.unavailable_sources) {
        console.print_warning("  unavailable: " + url);
    }
    if (report.embedding_failures + report.write_failures > 0) {
        console.print_warning("  " + std::to_string(report.embedding_failures + report.write_failures) +
                              " question(s) could not be stored");
    }
    if (report.degraded) {
        console.print_warning("  refinement failed for some batches; heuristic questions kept");
    }
}

static void print_matches(const Console& console, const std::vector<Match>& matches) {
    if (matches.empty()) {
        console.print_warning("No stored question is similar enough.");
        return;
    }
    for (size_t i = 0; i < matches.size(); ++i) {
        console.print_match(i + 1, matches[i]);
    }
}

// ========== Commands ==========

static int cmd_init(const Console& console, const std::string& path, bool overwrite) {
    if (!overwrite && load_settings(path)) {
        console.print_warning(path + " already exists (use --force to overwrite)");
        return 1;
    }
    Settings settings;
    settings.subjects["Example Person"] = {
        make_source(SourceType::Article, "https://example.com/interview", "Example interview"),
        make_source(SourceType::Video, "transcripts/example-talk.json", "Example talk")
    };
    save_settings(settings, path);
    console.print_success("Wrote " + path);
    return 0;
}

static int cmd_ask_batch(const Console& console, Engine& engine, const std::string& file,
                         bool force, std::optional<size_t> k, std::optional<float> threshold) {
    std::ifstream in(file);
    if (!in.is_open()) {
        throw ConfigError("Cannot open batch file " + file);
    }

    std::string line;
    int failures = 0;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        line = trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        size_t bar = line.find('|');
        if (bar == std::string::npos) {
            console.print_error(file + ":" + std::to_string(line_no) + ": expected 'subject|question'");
            ++failures;
            continue;
        }

        std::string subject = trim(line.substr(0, bar));
        std::string question = trim(line.substr(bar + 1));
        console.println();
        console.print_header(subject + ": " + question);
        try {
            AskResult result = engine.ask(subject, question, force, k, threshold);
            console.print_decision(result.decision);
            if (result.ingestion) {
                print_ingestion(console, *result.ingestion);
            }
            print_matches(console, result.matches);
        } catch (const QuarryError& e) {
            console.print_error("Error: " + std::string(e.what()));
            ++failures;
        }
    }
    return failures == 0 ? 0 : 1;
}

static int cmd_extract(const Console& console, const Settings& settings, UsageTracker& usage,
                       const std::string& path, const std::string& type_name) {
    auto type = parse_source_type(type_name);
    if (!type) {
        throw ConfigError("Unknown source type '" + type_name + "'");
    }

    providers::Collaborators collaborators = providers::ProviderFactory::create(settings, usage);
    SourceReader reader(*collaborators.fetcher, *collaborators.transcriber);
    Source source = make_source(*type, path);
    if (*type == SourceType::Article && path.find("://") == std::string::npos) {
        source = make_source(*type, "file://" + path, path);
    }

    providers::FetchOptions options;
    options.timeout_seconds = settings.source_timeout_seconds;
    SourceText text = reader.read(source, options);

    ExtractionOptions extraction;
    extraction.limits.min_tokens = settings.min_tokens;
    extraction.limits.max_tokens = settings.max_tokens;
    extraction.batch_size = settings.refine_batch_size;
    ExtractionPipeline pipeline(extraction, collaborators.refiner.get());
    ExtractionResult result = pipeline.run(text);

    for (const auto& question : result.questions) {
        if (question.source.media_timestamp) {
            console.print_colored("[" + format_timestamp(*question.source.media_timestamp) + "] ", ansi::DIM);
        }
        console.println(question.text);
    }
    console.println();
    console.print_info(std::to_string(result.questions.size()) + " question(s), " +
                       std::to_string(result.stage1_count) + " heuristic candidate(s)" +
                       (result.heuristics_only() ? ", refinement degraded" : ""));
    return 0;
}

// ========== Main ==========

int main(int argc, char* argv[]) {
    CLI::App app{"quarry: index the questions interviewers have already asked"};
    app.footer("\nExamples:\n"
               "  quarry init                                      Write a starter .quarry.json\n"
               "  quarry ask \"Jane Doe\" What got you into film?    Decide, ingest if needed, search\n"
               "  quarry ingest \"Jane Doe\" --source article=https://example.com/qa\n"
               "  quarry status                                    List indexed subjects\n"
               "  quarry serve -p 8000                             Start the JSON API\n");
    app.require_subcommand(1);

    std::string config_path = SETTINGS_FILE;
    app.add_option("-c,--config", config_path, "Settings file (default: .quarry.json)");

    bool verbose = false;
    app.add_flag("-v,--verbose", verbose, "Log HTTP traffic and pipeline stages to stderr");

    // init
    auto* init_cmd = app.add_subcommand("init", "Write a settings file with defaults");
    bool init_force = false;
    init_cmd->add_flag("--force", init_force, "Overwrite an existing settings file");

    // decide
    auto* decide_cmd = app.add_subcommand("decide", "Show whether a subject needs ingestion");
    std::string decide_subject;
    bool decide_force = false;
    decide_cmd->add_option("subject", decide_subject, "Subject name")->required();
    decide_cmd->add_flag("-f,--force", decide_force, "Treat as a forced re-ingest");

    // ingest
    auto* ingest_cmd = app.add_subcommand("ingest", "Ingest sources for a subject");
    std::string ingest_subject;
    bool ingest_incremental = false;
    std::vector<std::string> ingest_sources;
    ingest_cmd->add_option("subject", ingest_subject, "Subject name")->required();
    ingest_cmd->add_flag("-i,--incremental", ingest_incremental, "Skip sources already ingested");
    ingest_cmd->add_option("-s,--source", ingest_sources,
                           "Source as type=url (video, audio, article); overrides configured sources");

    // ask
    auto* ask_cmd = app.add_subcommand("ask", "Decide, ingest if needed, then find similar questions");
    std::string ask_subject;
    std::vector<std::string> ask_words;
    bool ask_force = false;
    size_t ask_k = 0;
    float ask_threshold = -2.0f;
    std::string ask_batch;
    ask_cmd->add_option("subject", ask_subject, "Subject name");
    ask_cmd->add_option("question", ask_words, "Question text");
    ask_cmd->add_flag("-f,--force", ask_force, "Force a full ingest first");
    ask_cmd->add_option("-k,--top-k", ask_k, "Maximum number of matches");
    ask_cmd->add_option("-t,--threshold", ask_threshold, "Minimum similarity score")
        ->check(CLI::Range(-1.0, 2.0));
    ask_cmd->add_option("--batch", ask_batch, "File of 'subject|question' lines");

    // retrieve
    auto* retrieve_cmd = app.add_subcommand("retrieve", "Search stored questions without ingesting");
    std::string retrieve_subject;
    std::vector<std::string> retrieve_words;
    size_t retrieve_k = 0;
    float retrieve_threshold = -2.0f;
    retrieve_cmd->add_option("subject", retrieve_subject, "Subject name")->required();
    retrieve_cmd->add_option("question", retrieve_words, "Question text")->required();
    retrieve_cmd->add_option("-k,--top-k", retrieve_k, "Maximum number of matches");
    retrieve_cmd->add_option("-t,--threshold", retrieve_threshold, "Minimum similarity score")
        ->check(CLI::Range(-1.0, 2.0));

    // status
    auto* status_cmd = app.add_subcommand("status", "List indexed subjects");
    std::string status_subject;
    status_cmd->add_option("subject", status_subject, "Show index counters for one subject");

    // reset
    auto* reset_cmd = app.add_subcommand("reset", "Delete a subject's questions and registry entry");
    std::string reset_subject;
    reset_cmd->add_option("subject", reset_subject, "Subject name")->required();

    // extract
    auto* extract_cmd = app.add_subcommand("extract", "Print the questions found in one file or URL");
    std::string extract_path;
    std::string extract_type = "article";
    extract_cmd->add_option("source", extract_path, "File path, transcript or URL")->required();
    extract_cmd->add_option("--type", extract_type, "video, audio or article (default: article)");

    // export
    auto* export_cmd = app.add_subcommand("export", "Write a markdown report of a subject's questions");
    std::string export_subject;
    std::string export_output;
    export_cmd->add_option("subject", export_subject, "Subject name")->required();
    export_cmd->add_option("-o,--output", export_output, "Output file (default: stdout)");

    // serve
    auto* serve_cmd = app.add_subcommand("serve", "Run the JSON API server");
    int server_port = 8000;
    std::string server_address = "127.0.0.1";
    serve_cmd->add_option("-p,--port", server_port, "Port (default: 8000)")
        ->check(CLI::Range(1, 65535));
    serve_cmd->add_option("--address", server_address, "Bind address (default: 127.0.0.1)");

    CLI11_PARSE(app, argc, argv);

    set_verbose(verbose);
    Console console;
    std::signal(SIGINT, signal_handler);

    UsageTracker usage;
    int rc = 0;

    try {
        if (init_cmd->parsed()) {
            return cmd_init(console, config_path, init_force);
        }

        Settings settings = load_or_default_settings(config_path);

        if (extract_cmd->parsed()) {
            rc = cmd_extract(console, settings, usage, extract_path, extract_type);
        } else {
            std::unique_ptr<Engine> engine = make_engine(settings, usage);

            if (decide_cmd->parsed()) {
                console.print_decision(engine->decide(decide_subject, decide_force));

            } else if (ingest_cmd->parsed()) {
                IngestMode mode = ingest_incremental ? IngestMode::Incremental : IngestMode::Full;
                IngestionReport report;
                console.start_status("Ingesting " + ingest_subject + "...");
                if (ingest_sources.empty()) {
                    const std::vector<Source>* configured = find_subject_sources(settings, ingest_subject);
                    if (!configured) {
                        console.clear_status();
                        throw ConfigError("No sources configured for '" + ingest_subject +
                                          "'; pass --source or add them to " + config_path);
                    }
                    report = engine->ingest(ingest_subject, *configured, mode, Engine::unix_now(),
                                            [] { return g_cancel.load(); });
                } else {
                    std::vector<Source> sources;
                    for (const auto& arg : ingest_sources) {
                        sources.push_back(parse_source_arg(arg));
                    }
                    report = engine->ingest(ingest_subject, sources, mode, Engine::unix_now(),
                                            [] { return g_cancel.load(); });
                }
                console.clear_status();
                print_ingestion(console, report);

            } else if (ask_cmd->parsed()) {
                std::optional<size_t> k;
                if (ask_k > 0) {
                    k = ask_k;
                }
                std::optional<float> threshold;
                if (ask_threshold > -2.0f) {
                    threshold = ask_threshold;
                }

                if (!ask_batch.empty()) {
                    rc = cmd_ask_batch(console, *engine, ask_batch, ask_force, k, threshold);
                } else {
                    if (ask_subject.empty() || ask_words.empty()) {
                        throw ConfigError("ask needs a subject and a question (or --batch FILE)");
                    }
                    AskResult result = engine->ask(ask_subject, join_words(ask_words), ask_force, k, threshold);
                    console.print_decision(result.decision);
                    if (result.ingestion) {
                        print_ingestion(console, *result.ingestion);
                    }
                    console.println();
                    print_matches(console, result.matches);
                }

            } else if (retrieve_cmd->parsed()) {
                size_t k = retrieve_k > 0 ? retrieve_k : settings.top_k;
                float threshold = retrieve_threshold > -2.0f ? retrieve_threshold : settings.similarity_threshold;
                print_matches(console, engine->retrieve(retrieve_subject, join_words(retrieve_words), k, threshold));

            } else if (status_cmd->parsed()) {
                if (!status_subject.empty()) {
                    IndexStats stats = engine->stats(status_subject);
                    console.print_header(stats.subject_id);
                    console.print_field("records", std::to_string(stats.record_count));
                    console.print_field("vectors", std::to_string(stats.vector_count));
                    console.print_field("next id", std::to_string(stats.next_id));
                    if (stats.corrupt) {
                        console.print_error("  corrupt: " + stats.corrupt_reason);
                    }
                    console.print_decision(engine->decide(status_subject));
                } else {
                    auto entries = engine->status();
                    if (entries.empty()) {
                        console.print_info("No subjects indexed yet.");
                    }
                    for (const auto& entry : entries) {
                        console.print_entry(entry);
                    }
                    for (const auto& key : engine->corrupt_subjects()) {
                        console.print_error(key + ": registry entry is corrupt (run 'quarry reset " + key + "')");
                    }
                }

            } else if (reset_cmd->parsed()) {
                size_t removed = engine->reset(reset_subject);
                console.print_success("Reset " + subject_key(reset_subject) + " (" +
                                      std::to_string(removed) + " questions removed)");

            } else if (export_cmd->parsed()) {
                std::string markdown = render_markdown_report(export_subject, engine->records(export_subject),
                                                              Engine::unix_now());
                if (export_output.empty()) {
                    console.print(markdown);
                } else {
                    std::ofstream out(export_output);
                    if (!out.is_open()) {
                        throw std::runtime_error("Cannot write " + export_output);
                    }
                    out << markdown;
                    console.print_success("Wrote " + export_output);
                }

            } else if (serve_cmd->parsed()) {
                HttpServer server(*engine);
                server.on_start([&console](const std::string& address, int port) {
                    console.print_header("=== quarry API ===");
                    console.println("Listening on http://" + address + ":" + std::to_string(port));
                    console.println("Press Ctrl+C to stop.");
                });
                g_server = &server;
                bool ok = server.start(server_address, server_port);
                g_server = nullptr;
                if (!ok) {
                    console.print_error("Error: cannot listen on " + server_address + ":" +
                                        std::to_string(server_port));
                    rc = 1;
                }
            }

            engine->flush();
        }
    } catch (const std::exception& e) {
        console.clear_status();
        console.print_error("Error: " + std::string(e.what()));
        rc = 1;
    }

    std::string summary = usage.summary();
    if (!summary.empty()) {
        console.println();
        console.print_info("Token usage:");
        console.println(summary);
    }
    return rc;
}
