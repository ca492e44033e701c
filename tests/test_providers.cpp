#include <catch2/catch.hpp>
#include "errors.hpp"
#include "usage_tracker.hpp"
#include "vector_store.hpp"
#include "deduplicator.hpp"
#include "providers/factory.hpp"
#include "providers/hashing_embedder.hpp"
#include "providers/http_fetcher.hpp"
#include "providers/transcript_reader.hpp"
#include "providers/openai/openai_provider.hpp"
#include "test_support.hpp"
#include <fstream>

using namespace quarry;
using namespace quarry::providers;
using namespace quarry::testing;

TEST_CASE("Hashing embedder", "[providers]") {
    HashingEmbedder embedder(128);

    SECTION("Vectors are unit length and deterministic") {
        auto a = embedder.embed("What inspired you to play cricket?");
        auto b = embedder.embed("What inspired you to play cricket?");
        REQUIRE(a.size() == 128);
        REQUIRE(l2_norm(a) == Approx(1.0f));
        REQUIRE(a == b);
    }

    SECTION("Case and punctuation do not matter") {
        auto a = embedder.embed("Don't you miss home?");
        auto b = embedder.embed("dont YOU miss home");
        REQUIRE(dot(a, b) == Approx(1.0f));
    }

    SECTION("Shared vocabulary scores higher than unrelated text") {
        auto base = embedder.embed("Why did you choose cricket as a career?");
        auto close = embedder.embed("Why did you choose cricket?");
        auto far = embedder.embed("Favourite breakfast food");
        REQUIRE(dot(base, close) > dot(base, far));
    }

    SECTION("Text without words cannot be embedded") {
        REQUIRE_THROWS_AS(embedder.embed("?!  ..."), EmbeddingError);
    }

    REQUIRE(embedding_terms("It's a Top-10 hit!") == std::vector<std::string>{"its", "a", "top", "10", "hit"});
    REQUIRE_THROWS_AS(HashingEmbedder(0), std::invalid_argument);
}

TEST_CASE("HTML to text", "[providers]") {
    std::string html =
        "<html><head><title>Ignored</title><style>p{color:red}</style></head>"
        "<body><h1>Interview</h1><script>var x = '<p>';</script>"
        "<p>Q: What&rsquo;s   next &amp; why?</p><div>A: Rest.</div>"
        "<br/>Tom &lt;3 Jerry</body></html>";

    std::string text = html_to_text(html);
    REQUIRE(text == "Interview\nQ: What's next & why?\nA: Rest.\nTom <3 Jerry\n");

    SECTION("Plain text only gets whitespace cleanup") {
        REQUIRE(html_to_text("  one   two \n\n\n three ") == "one two\nthree\n");
    }
}

TEST_CASE("File URLs are fetched from disk", "[providers]") {
    TempDir dir;
    HttpFetcher fetcher(1);

    std::string page = dir.file("page.html");
    {
        std::ofstream out(page);
        out << "<article><p>";
        for (int i = 0; i < 20; ++i) {
            out << "How did you train for season " << i << "? ";
        }
        out << "</p></article>";
    }
    std::string text = fetcher.fetch("file://" + page, {});
    REQUIRE(text.find("How did you train for season 0?") == 0);

    SECTION("Pages with too little text are unavailable") {
        std::string tiny = dir.file("tiny.html");
        {
            std::ofstream out(tiny);
            out << "<p>Cookie banner</p>";
        }
        REQUIRE_THROWS_AS(fetcher.fetch("file://" + tiny, {}), SourceUnavailableError);
    }

    SECTION("Missing files are unavailable") {
        REQUIRE_THROWS_AS(fetcher.fetch("file://" + dir.file("nope.html"), {}), SourceUnavailableError);
    }
}

TEST_CASE("Transcript files", "[providers]") {
    TempDir dir;
    TranscriptFileReader reader;

    SECTION("Whisper JSON keeps segment timing") {
        std::string path = dir.file("episode.json");
        {
            std::ofstream out(path);
            out << R"({"segments": [
                {"start": 0.0, "end": 4.0, "text": " Welcome to the podcast."},
                {"start": 4.0, "end": 9.5, "text": " What got you into sailing? "},
                {"start": 9.5, "end": 11.0, "text": "   "}
            ]})";
        }
        Transcript t = reader.transcribe("file://" + path, {});
        REQUIRE(t.segments.size() == 2);
        REQUIRE(t.segments[1].start_seconds == Approx(4.0));
        REQUIRE(t.segments[1].text == "What got you into sailing?");
        REQUIRE(t.text == "Welcome to the podcast. What got you into sailing?");
    }

    SECTION("Other files are plain text") {
        std::string path = dir.file("episode.txt");
        {
            std::ofstream out(path);
            out << "Why sailing? Why not.";
        }
        Transcript t = reader.transcribe(path, {});
        REQUIRE(t.text == "Why sailing? Why not.");
        REQUIRE(t.segments.empty());
    }

    SECTION("Malformed, empty and missing files are unavailable") {
        std::string broken = dir.file("broken.json");
        std::string empty = dir.file("empty.txt");
        {
            std::ofstream out(broken);
            out << R"({"segments": 7})";
        }
        {
            std::ofstream out(empty);
            out << "  \n";
        }
        REQUIRE_THROWS_AS(reader.transcribe(broken, {}), SourceUnavailableError);
        REQUIRE_THROWS_AS(reader.transcribe(empty, {}), SourceUnavailableError);
        REQUIRE_THROWS_AS(reader.transcribe(dir.file("missing.txt"), {}), SourceUnavailableError);
    }

    SECTION("Cancellation is honored before reading") {
        FetchOptions options;
        options.cancel_check = [] { return true; };
        REQUIRE_THROWS_AS(reader.transcribe(dir.file("anything.txt"), options), SourceUnavailableError);
    }
}

TEST_CASE("Refiner replies", "[providers]") {
    using openai::parse_refined_questions;

    REQUIRE(parse_refined_questions(R"(["What is next?", "Why now?"])") ==
            std::vector<std::string>{"What is next?", "Why now?"});

    SECTION("Surrounding prose and code fences are ignored") {
        std::string reply = "Here you go:\n```json\n[\"How did it start?\"]\n```";
        REQUIRE(parse_refined_questions(reply) == std::vector<std::string>{"How did it start?"});
    }

    SECTION("An empty array is a valid answer") {
        REQUIRE(parse_refined_questions("[]").empty());
    }

    SECTION("Broken replies are refinement errors") {
        REQUIRE_THROWS_AS(parse_refined_questions("I cannot help with that."), RefinementError);
        REQUIRE_THROWS_AS(parse_refined_questions("[\"unterminated]"), RefinementError);
        REQUIRE_THROWS_AS(parse_refined_questions("[1, 2]"), RefinementError);
    }
}

TEST_CASE("Provider factory", "[providers]") {
    EmbeddingSettings settings;
    settings.provider = "hashing";
    settings.dimension = 96;

    auto embedder = ProviderFactory::create_embedder(settings);
    REQUIRE(embedder->dimension() == 96);
    REQUIRE(embedder->model() == "hashing-v1");

    settings.provider = "word2vec";
    REQUIRE_THROWS_AS(ProviderFactory::create_embedder(settings), ProviderNotAvailableError);
}

TEST_CASE("Usage tracking", "[providers]") {
    UsageTracker usage;
    REQUIRE(usage.summary().empty());

    usage.record("gpt-4o-mini", "refinement", 100, 20);
    usage.record("gpt-4o-mini", "refinement", 50, 10);

    UsageTotals totals = usage.totals();
    REQUIRE(totals.calls == 2);
    REQUIRE(totals.input_tokens == 150);
    REQUIRE(totals.output_tokens == 30);
    REQUIRE(usage.summary() == "refinement: 2 calls, 150 in / 30 out\n");
}
