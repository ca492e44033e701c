#include <catch2/catch.hpp>
#include "report.hpp"

using namespace quarry;

static SourceRef source_at(SourceType type, const std::string& url, const std::string& title,
                           std::optional<double> ts = std::nullopt) {
    SourceRef ref;
    ref.type = type;
    ref.url = url;
    ref.title = title;
    ref.media_timestamp = ts;
    return ref;
}

static QuestionRecord record_with(const std::string& text, std::vector<SourceRef> sources) {
    QuestionRecord record;
    record.text = text;
    record.sources = std::move(sources);
    return record;
}

TEST_CASE("Timestamp formatting", "[report]") {
    REQUIRE(format_timestamp(0) == "00:00");
    REQUIRE(format_timestamp(75.9) == "01:15");
    REQUIRE(format_timestamp(3725) == "62:05");
    REQUIRE(format_timestamp(-3) == "00:00");
    REQUIRE(format_utc(0) == "1970-01-01 00:00:00 UTC");
    REQUIRE(format_utc(1700000000) == "2023-11-14 22:13:20 UTC");
}

TEST_CASE("Markdown report", "[report]") {
    std::vector<QuestionRecord> records = {
        record_with("What got you started?",
                    {source_at(SourceType::Video, "https://v/1", "Late Show", 75.0)}),
        record_with("Who do you admire?",
                    {source_at(SourceType::Article, "https://a/1", "Weekly"),
                     source_at(SourceType::Audio, "https://p/3", "Pod", 30.0)}),
        record_with("Any advice for beginners?",
                    {source_at(SourceType::Video, "https://v/1", "Late Show", 130.0)})
    };

    std::string md = render_markdown_report("Serena Williams", records, 0);

    REQUIRE(md.find("# Questions Asked to Serena Williams\n") == 0);
    REQUIRE(md.find("**Generated:** 1970-01-01 00:00:00 UTC") != std::string::npos);
    REQUIRE(md.find("**Total Questions:** 3") != std::string::npos);

    // Sources appear in first-seen order, questions grouped under them
    size_t late_show = md.find("## Late Show");
    size_t weekly = md.find("## Weekly");
    REQUIRE(late_show != std::string::npos);
    REQUIRE(weekly != std::string::npos);
    REQUIRE(late_show < weekly);
    REQUIRE(md.find("### 2. Any advice for beginners?") < weekly);

    REQUIRE(md.find("- **Timestamp:** 01:15\n- **Link:** [01:15](https://v/1)") != std::string::npos);
    REQUIRE(md.find("### 1. Who do you admire?\n\n- **Link:** https://a/1\n") != std::string::npos);
    REQUIRE(md.find("- **Also asked in:** Pod at 00:30 (https://p/3)") != std::string::npos);
}

TEST_CASE("Empty report", "[report]") {
    std::string md = render_markdown_report("Nobody", {}, 0);
    REQUIRE(md.find("**Total Questions:** 0") != std::string::npos);
    REQUIRE(md.find("## ") == std::string::npos);
}
