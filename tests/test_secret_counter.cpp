#include <gtest/gtest.h>
#include "summarizers/SecretCounter.h"
#include <nlohmann/json.hpp>

namespace compliance_gate {

using nlohmann::json;

TEST(SecretCounterTest, BareArrayCountsElements) {
    auto r = SecretCounter::count(json::parse(R"([{"RuleID": "aws-access-key"}, {"RuleID": "generic-api-key"}])"));
    EXPECT_TRUE(r.ok);
    EXPECT_EQ(r.count, 2u);
    EXPECT_TRUE(r.error.empty());
}

TEST(SecretCounterTest, EmptyArrayIsZero) {
    auto r = SecretCounter::count(json::array());
    EXPECT_TRUE(r.ok);
    EXPECT_EQ(r.count, 0u);
}

TEST(SecretCounterTest, EachAliasIsAccepted) {
    for (const char* alias : SecretCounter::kAliases) {
        json doc = json::object();
        doc[alias] = json::array({json::object(), json::object(), json::object()});
        auto r = SecretCounter::count(doc);
        EXPECT_TRUE(r.ok) << alias;
        EXPECT_EQ(r.count, 3u) << alias;
    }
}

TEST(SecretCounterTest, AliasPriorityOrder) {
    auto schema = SecretCounter::decode(json::parse(R"({"results": [1], "Leaks": [1, 2], "total": 9})"));
    ASSERT_TRUE(std::holds_alternative<SecretCounter::AliasedList>(schema));
    EXPECT_EQ(std::get<SecretCounter::AliasedList>(schema).field, "Leaks");
    EXPECT_EQ(std::get<SecretCounter::AliasedList>(schema).size, 2u);
}

TEST(SecretCounterTest, NonArrayAliasFallsThroughToTotal) {
    auto r = SecretCounter::count(json::parse(R"({"findings": "none", "total": 4})"));
    EXPECT_TRUE(r.ok);
    EXPECT_EQ(r.count, 4u);
}

TEST(SecretCounterTest, NumericTotal) {
    EXPECT_EQ(SecretCounter::count(json::parse(R"({"total": 0})")).count, 0u);
    EXPECT_TRUE(SecretCounter::count(json::parse(R"({"total": 0})")).ok);
    EXPECT_EQ(SecretCounter::count(json::parse(R"({"total": 3.0})")).count, 3u);
}

TEST(SecretCounterTest, ImplausibleTotalsAreUnrecognized) {
    EXPECT_FALSE(SecretCounter::count(json::parse(R"({"total": -1})")).ok);
    EXPECT_FALSE(SecretCounter::count(json::parse(R"({"total": 1.5})")).ok);
    EXPECT_FALSE(SecretCounter::count(json::parse(R"({"total": "3"})")).ok);
}

TEST(SecretCounterTest, UnknownStructureIsAnErrorNotZero) {
    for (const char* text : {R"({"version": "8.18.0"})", "{}", "null", "true", "12", R"("leaks")"}) {
        auto r = SecretCounter::count(json::parse(text));
        EXPECT_FALSE(r.ok) << text;
        EXPECT_EQ(r.error, "Unknown Gitleaks JSON structure (no findings array found)") << text;
    }
}

}
