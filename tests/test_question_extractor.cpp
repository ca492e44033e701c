#include <catch2/catch.hpp>
#include "question_extractor.hpp"
#include <string>
#include <vector>

using namespace quarry;

TEST_CASE("Sentence splitting", "[extractor]") {
    SECTION("Splits at whitespace after terminators") {
        auto sentences = split_sentences("One two. Three four! Five six? Seven");
        REQUIRE(sentences == std::vector<std::string>{"One two.", "Three four!", "Five six?", "Seven"});
    }

    SECTION("Keeps decimals and abbreviations without trailing space together") {
        auto sentences = split_sentences("It cost 3.50 dollars. Really?");
        REQUIRE(sentences == std::vector<std::string>{"It cost 3.50 dollars.", "Really?"});
    }

    SECTION("Empty and blank input yield nothing") {
        REQUIRE(split_sentences("").empty());
        REQUIRE(split_sentences("   \n\t ").empty());
    }
}

TEST_CASE("Stage-1 candidate selection", "[extractor]") {
    QuestionExtractor extractor;

    SECTION("Keeps questions and drops declaratives") {
        auto candidates = extractor.extract("What inspired you? I love movies. How do you prepare? Research.");
        REQUIRE(candidates == std::vector<std::string>{"What inspired you?", "How do you prepare?"});
    }

    SECTION("Interrogative opener without a question mark is a candidate") {
        REQUIRE(extractor.is_candidate("Why did you leave the band."));
        REQUIRE(extractor.is_candidate("what, if anything, changed"));
    }

    SECTION("Declarative sentence without a question mark is not") {
        REQUIRE_FALSE(extractor.is_candidate("I grew up in Leeds."));
    }

    SECTION("Stage 1 never rewrites the sentence") {
        auto candidates = extractor.extract("Would you do it again. Sure.");
        REQUIRE(candidates == std::vector<std::string>{"Would you do it again."});
    }

    SECTION("Single-word questions fall under the minimum token count") {
        REQUIRE_FALSE(extractor.is_candidate("Really?"));
        REQUIRE(extractor.is_candidate("Really though?"));
    }
}

TEST_CASE("Token window is configurable", "[extractor]") {
    ExtractionLimits limits;
    limits.min_tokens = 3;
    limits.max_tokens = 5;
    QuestionExtractor extractor(limits);

    REQUIRE_FALSE(extractor.is_candidate("Why now?"));
    REQUIRE(extractor.is_candidate("Why now, though?"));
    REQUIRE(extractor.is_candidate("Why did you do that?"));
    REQUIRE_FALSE(extractor.is_candidate("Why did you do that back then?"));
}

TEST_CASE("Q&A formatted articles", "[extractor]") {
    QuestionExtractor extractor;

    SECTION("Extracts interviewer lines in the common markers") {
        std::string text =
            "Intro paragraph about the guest.\n"
            "Q: What was your first instrument growing up?\n"
            "A: A battered piano.\n"
            "**Q:** Tell us about   the first tour\n"
            "Interviewer: How did the band handle the pressure?\r\n"
            "Question: Describe the studio you recorded in.\n";

        auto questions = extractor.extract_qa(text);
        REQUIRE(questions == std::vector<std::string>{
            "What was your first instrument growing up?",
            "Tell us about the first tour?",
            "How did the band handle the pressure?",
            "Describe the studio you recorded in?"
        });
    }

    SECTION("Short interviewer lines are ignored") {
        REQUIRE(extractor.extract_qa("Q: Thanks!\nQ: Next one?\n").empty());
    }

    SECTION("Plain prose has no Q&A lines") {
        REQUIRE(extractor.extract_qa("What inspired you? How do you prepare?").empty());
    }
}
