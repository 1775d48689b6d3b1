#include <gtest/gtest.h>
#include "summarizers/HardeningSummarizer.h"
#include <nlohmann/json.hpp>

namespace compliance_gate {

using nlohmann::json;

TEST(HardeningSummarizerTest, PrimitivesAreUnrecognized) {
    EXPECT_FALSE(HardeningSummarizer::summarize(json(1)).has_value());
    EXPECT_FALSE(HardeningSummarizer::summarize(json("FATAL")).has_value());
    EXPECT_FALSE(HardeningSummarizer::summarize(json(nullptr)).has_value());
}

TEST(HardeningSummarizerTest, ObjectWithoutKnownFieldsIsUnrecognized) {
    EXPECT_FALSE(HardeningSummarizer::summarize(json::object()).has_value());
    EXPECT_FALSE(HardeningSummarizer::summarize(json::parse(R"({"summary": {"fatal": 1}})")).has_value());
    EXPECT_FALSE(HardeningSummarizer::summarize(json::parse(R"({"details": "none"})")).has_value());
    EXPECT_TRUE(std::holds_alternative<HardeningSummarizer::Unrecognized>(HardeningSummarizer::decode(json::object())));
}

TEST(HardeningSummarizerTest, EmptyDetailsIsRecognizedAndEmpty) {
    auto s = HardeningSummarizer::summarize(json::parse(R"({"summary": {}, "details": []})"));
    ASSERT_TRUE(s.has_value());
    EXPECT_TRUE(s->counts.empty());
    EXPECT_EQ(HardeningSummarizer::format(*s), "no findings");
}

TEST(HardeningSummarizerTest, EmptyTopLevelArrayIsRecognizedAndEmpty) {
    auto s = HardeningSummarizer::summarize(json::array());
    ASSERT_TRUE(s.has_value());
    EXPECT_TRUE(s->counts.empty());
}

TEST(HardeningSummarizerTest, DetailsLevelsAreUppercased) {
    auto doc = json::parse(R"({
        "details": [
            {"code": "CIS-DI-0001", "level": "warn"},
            {"code": "CIS-DI-0005", "level": "INFO"},
            {"code": "DKL-DI-0006", "level": "Info"},
            {"code": "DKL-DI-0001", "level": "FATAL"},
            {"code": "no-level"},
            "garbage"
        ]
    })");
    auto s = HardeningSummarizer::summarize(doc);
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->count("WARN"), 1u);
    EXPECT_EQ(s->count("INFO"), 2u);
    EXPECT_EQ(s->count("FATAL"), 1u);
    EXPECT_EQ(s->counts.size(), 3u);
    EXPECT_EQ(HardeningSummarizer::format(*s), "FATAL: 1, INFO: 2, WARN: 1");
}

TEST(HardeningSummarizerTest, FindingListCountsNestedDetails) {
    auto doc = json::parse(R"([
        {"code": "A", "level": "WARN", "details": [{"level": "info"}, {"level": "PASS"}]},
        {"code": "B", "level": "pass"},
        {"code": "C", "details": [{"level": "error"}]},
        42
    ])");
    auto s = HardeningSummarizer::summarize(doc);
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->count("WARN"), 1u);
    EXPECT_EQ(s->count("INFO"), 1u);
    EXPECT_EQ(s->count("PASS"), 2u);
    EXPECT_EQ(s->count("ERROR"), 1u);
}

TEST(HardeningSummarizerTest, ScalarLevelAndDetailsAreMerged) {
    auto doc = json::parse(R"({"level": "fatal", "details": [{"level": "WARN"}]})");
    auto s = HardeningSummarizer::summarize(doc);
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->count("FATAL"), 1u);
    EXPECT_EQ(s->count("WARN"), 1u);
}

TEST(HardeningSummarizerTest, ScalarLevelOnly) {
    auto s = HardeningSummarizer::summarize(json::parse(R"({"level": "pass"})"));
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->count("PASS"), 1u);
    auto schema = HardeningSummarizer::decode(json::parse(R"({"level": "pass"})"));
    ASSERT_TRUE(std::holds_alternative<HardeningSummarizer::Assessment>(schema));
    EXPECT_EQ(std::get<HardeningSummarizer::Assessment>(schema).details, nullptr);
}

TEST(HardeningSummarizerTest, EmptyLevelStringsAreNotCounted) {
    auto s = HardeningSummarizer::summarize(json::parse(R"({"level": "", "details": [{"level": ""}]})"));
    ASSERT_TRUE(s.has_value());
    EXPECT_TRUE(s->counts.empty());
}

TEST(HardeningSummarizerTest, WholeNumberFloatLevelsPrintAsIntegers) {
    auto s = HardeningSummarizer::summarize(json::parse(R"({"details": [{"level": 1.0}, {"level": 1}, {"level": 2.5}]})"));
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->count("1"), 2u);
    EXPECT_EQ(s->count("2.5"), 1u);
    EXPECT_EQ(s->count("1.0"), 0u);
}

}
