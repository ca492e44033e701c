#include <catch2/catch.hpp>
#include "retriever.hpp"
#include "errors.hpp"
#include "test_support.hpp"
#include <limits>

using namespace quarry;
using namespace quarry::testing;

namespace {

QuestionRecord record_of(const std::string& text) {
    QuestionRecord record;
    record.text = text;
    SourceRef source;
    source.url = "https://example.com/interview";
    record.sources.push_back(source);
    return record;
}

struct Fixture {
    TempDir dir;
    FakeEmbedder embedder;
    QuestionIndex index{dir.str(), TEST_DIMENSION};

    void add(const std::string& text) {
        index.commit("Marie Curie", record_of(text), embedder.embed(text));
    }
};

} // namespace

TEST_CASE("Retrieval returns the stored question itself", "[retriever]") {
    Fixture f;
    f.add("What first drew you to radioactivity research?");
    f.add("How did you fund the laboratory?");
    f.add("Do you ever rest?");

    Retriever retriever(f.index, f.embedder);
    auto matches = retriever.retrieve("Marie Curie", "What first drew you to radioactivity research?", 1, 0.5f);
    REQUIRE(matches.size() == 1);
    REQUIRE(matches[0].record.text == "What first drew you to radioactivity research?");
    REQUIRE(matches[0].score == Approx(1.0f).margin(1e-4));
}

TEST_CASE("Retrieval never pads with weak matches", "[retriever]") {
    Fixture f;
    f.embedder.pin("Where did you grow up?", 0);
    f.embedder.pin("What is your favourite element?", 1);
    f.embedder.pin("Who taught you chemistry?", 2);
    f.embedder.pin("Where was your childhood home?", 0);
    f.add("Where did you grow up?");
    f.add("What is your favourite element?");
    f.add("Who taught you chemistry?");

    Retriever retriever(f.index, f.embedder);

    SECTION("Only the matching question passes the threshold") {
        auto matches = retriever.retrieve("Marie Curie", "Where was your childhood home?", 5, 0.5f);
        REQUIRE(matches.size() == 1);
        REQUIRE(matches[0].record.text == "Where did you grow up?");
    }

    SECTION("A threshold above 1 returns nothing") {
        REQUIRE(retriever.retrieve("Marie Curie", "Where did you grow up?", 5, 1.01f).empty());
    }

    SECTION("A threshold of -1 returns up to k") {
        auto matches = retriever.retrieve("Marie Curie", "Where was your childhood home?", 2, -1.0f);
        REQUIRE(matches.size() == 2);
        REQUIRE(matches[0].score >= matches[1].score);
    }

    SECTION("k of zero returns nothing") {
        REQUIRE(retriever.retrieve("Marie Curie", "Where did you grow up?", 0, 0.0f).empty());
    }

    SECTION("An unknown subject has no matches") {
        REQUIRE(retriever.retrieve("Pierre Curie", "Where did you grow up?", 3, 0.0f).empty());
    }
}

TEST_CASE("Huge k values still return every match", "[retriever]") {
    Fixture f;
    f.add("What did your mother teach you?");
    f.add("How do you spend a Sunday?");

    SECTION("k times the over-fetch factor would overflow") {
        Retriever retriever(f.index, f.embedder, 4);
        auto matches = retriever.retrieve("Marie Curie", "What did your mother teach you?",
                                          size_t(1) << 62, 0.5f);
        REQUIRE(matches.size() == 1);
        REQUIRE(matches[0].record.text == "What did your mother teach you?");
    }

    SECTION("The largest k with a low threshold returns the whole subject") {
        Retriever retriever(f.index, f.embedder, 3);
        auto matches = retriever.retrieve("Marie Curie", "What did your mother teach you?",
                                          std::numeric_limits<size_t>::max(), -1.0f);
        REQUIRE(matches.size() == 2);
    }
}

TEST_CASE("Query embedding failures fail only the call", "[retriever]") {
    Fixture f;
    f.add("What keeps you going?");
    Retriever retriever(f.index, f.embedder);

    REQUIRE_THROWS_AS(retriever.retrieve("Marie Curie", "   ", 3, 0.5f), QueryEmbeddingError);
    REQUIRE_THROWS_AS(retriever.retrieve("Marie Curie", "?!", 3, 0.5f), QueryEmbeddingError);

    f.embedder.fail_on("What keeps you going?");
    REQUIRE_THROWS_AS(retriever.retrieve("Marie Curie", "What keeps you going?", 3, 0.5f), QueryEmbeddingError);

    // The index is untouched
    REQUIRE(f.index.count("Marie Curie") == 1);
}
