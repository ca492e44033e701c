#include <catch2/catch.hpp>
#include "extraction_pipeline.hpp"
#include "errors.hpp"
#include "test_support.hpp"

using namespace quarry;
using namespace quarry::testing;

static SourceText article_text(const std::string& url, const std::string& text) {
    SourceText source;
    source.source.type = SourceType::Article;
    source.source.url = url;
    source.source.title = "Article";
    source.text = text;
    return source;
}

static Candidate candidate(const std::string& text, const std::string& url) {
    SourceRef ref;
    ref.type = SourceType::Article;
    ref.url = url;
    return {text, ref};
}

TEST_CASE("Stage-1 candidates carry provenance", "[pipeline]") {
    ExtractionPipeline pipeline(ExtractionOptions{});

    SECTION("Plain text is scanned sentence by sentence") {
        auto candidates = pipeline.generate_candidates(
            article_text("https://example.com/a", "What inspired you? I love movies. How do you prepare? Research."));
        REQUIRE(candidates.size() == 2);
        REQUIRE(candidates[0].text == "What inspired you?");
        REQUIRE(candidates[1].text == "How do you prepare?");
        REQUIRE(candidates[0].source.url == "https://example.com/a");
        REQUIRE_FALSE(candidates[0].source.media_timestamp.has_value());
    }

    SECTION("Transcript segments stamp their start offset") {
        SourceText video;
        video.source.type = SourceType::Video;
        video.source.url = "https://video.example/v1";
        video.segments = {
            {0.0, "Welcome to the show. Thanks for having me."},
            {42.5, "So how did it all begin? It began in a garage."},
            {95.0, "Where do you see yourself next?"}
        };

        auto candidates = pipeline.generate_candidates(video);
        REQUIRE(candidates.size() == 2);
        REQUIRE(candidates[0].text == "So how did it all begin?");
        REQUIRE(candidates[0].source.media_timestamp == Approx(42.5));
        REQUIRE(candidates[1].text == "Where do you see yourself next?");
        REQUIRE(candidates[1].source.media_timestamp == Approx(95.0));
    }

    SECTION("Q&A articles yield interviewer lines only") {
        auto candidates = pipeline.generate_candidates(article_text(
            "https://example.com/qa",
            "Q: What does a normal training day look like?\n"
            "A: Why would anyone ask me that? I just run.\n"));
        REQUIRE(candidates.size() == 1);
        REQUIRE(candidates[0].text == "What does a normal training day look like?");
    }
}

TEST_CASE("Stage-2 refinement", "[pipeline]") {
    std::vector<Candidate> candidates = {
        candidate("So what was the first record you bought?", "https://a"),
        candidate("Is that right?", "https://b"),
        candidate("How do you warm up", "https://c")
    };

    SECTION("No refiner passes candidates through") {
        ExtractionPipeline pipeline(ExtractionOptions{});
        auto result = pipeline.refine(candidates);
        REQUIRE(result.questions.size() == 3);
        REQUIRE(result.batches == 0);
        REQUIRE_FALSE(result.heuristics_only());
    }

    SECTION("Refiner may drop and rewrite; provenance follows the input") {
        FakeRefiner refiner([](const std::vector<std::string>&) {
            return std::vector<std::string>{"How do you warm up before a match?",
                                            "So what was the first record you bought?"};
        });
        ExtractionPipeline pipeline(ExtractionOptions{}, &refiner);
        auto result = pipeline.refine(candidates);

        REQUIRE(result.stage1_count == 3);
        REQUIRE(result.questions.size() == 2);
        REQUIRE_FALSE(result.heuristics_only());

        // The unchanged string keeps its own source; the rewrite takes the next free one
        REQUIRE(result.questions[0].text == "How do you warm up before a match?");
        REQUIRE(result.questions[0].source.url == "https://b");
        REQUIRE(result.questions[1].text == "So what was the first record you bought?");
        REQUIRE(result.questions[1].source.url == "https://a");
    }

    SECTION("Blank refiner output is dropped") {
        FakeRefiner refiner([](const std::vector<std::string>& batch) {
            std::vector<std::string> out = batch;
            out[1] = "   ";
            return out;
        });
        ExtractionPipeline pipeline(ExtractionOptions{}, &refiner);
        auto result = pipeline.refine(candidates);
        REQUIRE(result.questions.size() == 2);
    }

    SECTION("A throwing refiner degrades to Stage-1 output") {
        FakeRefiner refiner([](const std::vector<std::string>&) -> std::vector<std::string> {
            throw RefinementError("model unavailable");
        });
        ExtractionPipeline pipeline(ExtractionOptions{}, &refiner);
        auto result = pipeline.refine(candidates);

        REQUIRE(result.heuristics_only());
        REQUIRE(result.degraded_batches == 1);
        REQUIRE(result.questions.size() == 3);
        REQUIRE(result.questions[0].text == candidates[0].text);
    }

    SECTION("Returning more strings than given breaks the contract") {
        FakeRefiner refiner([](const std::vector<std::string>& batch) {
            std::vector<std::string> out = batch;
            out.push_back("Where did that come from?");
            return out;
        });
        ExtractionPipeline pipeline(ExtractionOptions{}, &refiner);
        auto result = pipeline.refine(candidates);

        REQUIRE(result.heuristics_only());
        REQUIRE(result.questions.size() == 3);
    }
}

TEST_CASE("Refinement runs in fixed-size batches", "[pipeline]") {
    std::vector<Candidate> candidates;
    for (int i = 0; i < 7; ++i) {
        candidates.push_back(candidate("Question number " + std::to_string(i) + "?", "https://s"));
    }

    int calls = 0;
    FakeRefiner refiner([&calls](const std::vector<std::string>& batch) -> std::vector<std::string> {
        if (++calls == 2) {
            throw RefinementError("second batch fails");
        }
        return batch;
    });

    ExtractionOptions options;
    options.batch_size = 3;
    ExtractionPipeline pipeline(options, &refiner);
    auto result = pipeline.refine(candidates);

    REQUIRE(refiner.batches.size() == 3);
    REQUIRE(refiner.batches[0].size() == 3);
    REQUIRE(refiner.batches[2].size() == 1);
    REQUIRE(result.batches == 3);
    REQUIRE(result.degraded_batches == 1);
    // The failed batch falls back alone; order is preserved
    REQUIRE(result.questions.size() == 7);
    for (size_t i = 0; i < result.questions.size(); ++i) {
        REQUIRE(result.questions[i].text == candidates[i].text);
    }
}
