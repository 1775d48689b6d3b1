#include <gtest/gtest.h>
#include "core/Config.h"
#include "core/ConfigValidator.h"
#include "core/Utils.h"
#include <cstdlib>

namespace compliance_gate {

class ConfigEnvTest : public ::testing::Test {
protected:
    void SetUp() override { clear(); }
    void TearDown() override { clear(); }
    static void clear() {
        for (const char* k : {"ARTIFACT_DIR", "GITHUB_SHA", "GITHUB_REF", "GITHUB_REPOSITORY", "GITHUB_RUN_ID", "GITHUB_SERVER_URL"}) unsetenv(k);
    }
};

TEST_F(ConfigEnvTest, DefaultsWithoutEnvironment) {
    Config cfg;
    load_environment(cfg);
    EXPECT_EQ(cfg.artifact_dir, "artifacts");
    EXPECT_TRUE(cfg.pipeline.commit.empty());
    EXPECT_EQ(cfg.pipeline.server_url, "https://github.com");
    EXPECT_EQ(cfg.pipeline.run_url(), "");
}

TEST_F(ConfigEnvTest, EnvironmentOverlay) {
    setenv("ARTIFACT_DIR", "/work/artifacts", 1);
    setenv("GITHUB_SHA", "0123abcd", 1);
    setenv("GITHUB_REF", "refs/pull/9/merge", 1);
    setenv("GITHUB_REPOSITORY", "acme/api", 1);
    setenv("GITHUB_RUN_ID", "1001", 1);
    setenv("GITHUB_SERVER_URL", "https://git.example.org", 1);
    Config cfg;
    load_environment(cfg);
    EXPECT_EQ(cfg.artifact_dir, "/work/artifacts");
    EXPECT_EQ(cfg.pipeline.commit, "0123abcd");
    EXPECT_EQ(cfg.pipeline.ref, "refs/pull/9/merge");
    EXPECT_EQ(cfg.pipeline.run_url(), "https://git.example.org/acme/api/actions/runs/1001");
}

TEST_F(ConfigEnvTest, EmptyValuesCountAsUnset) {
    setenv("ARTIFACT_DIR", "", 1);
    setenv("GITHUB_SERVER_URL", "", 1);
    Config cfg;
    load_environment(cfg);
    EXPECT_EQ(cfg.artifact_dir, "artifacts");
    EXPECT_EQ(cfg.pipeline.server_url, "https://github.com");
}

TEST(ConfigValidatorTest, AcceptsDefaults) {
    Config cfg;
    ConfigValidator v;
    EXPECT_TRUE(v.validate(cfg));
}

TEST(ConfigValidatorTest, TrimsAndRejectsEmptyArtifactDir) {
    ConfigValidator v;
    Config cfg;
    cfg.artifact_dir = "  out  ";
    EXPECT_TRUE(v.validate(cfg));
    EXPECT_EQ(cfg.artifact_dir, "out");
    cfg.artifact_dir = "   ";
    testing::internal::CaptureStderr();
    EXPECT_FALSE(v.validate(cfg));
    testing::internal::GetCapturedStderr();
}

TEST(ConfigValidatorTest, ReportNameMustBePlain) {
    EXPECT_TRUE(ConfigValidator::is_plain_file_name("compliance-report.md"));
    EXPECT_FALSE(ConfigValidator::is_plain_file_name(""));
    EXPECT_FALSE(ConfigValidator::is_plain_file_name(".."));
    EXPECT_FALSE(ConfigValidator::is_plain_file_name("../report.md"));
    EXPECT_FALSE(ConfigValidator::is_plain_file_name("sub/report.md"));
}

TEST(ConfigValidatorTest, SummaryJsonMustNotOverwriteReport) {
    ConfigValidator v;
    Config cfg;
    cfg.artifact_dir = "out";
    cfg.summary_json_file = "out/./compliance-report.md";
    testing::internal::CaptureStderr();
    EXPECT_FALSE(v.validate(cfg));
    testing::internal::GetCapturedStderr();
}

TEST(ConfigValidatorTest, ServerUrlWithoutSchemeFallsBack) {
    ConfigValidator v;
    Config cfg;
    cfg.pipeline.server_url = "github.example.com";
    testing::internal::CaptureStderr();
    EXPECT_TRUE(v.validate(cfg));
    testing::internal::GetCapturedStderr();
    EXPECT_EQ(cfg.pipeline.server_url, "https://github.com");
}

TEST(UtilsTest, TimeToIsoHasMillisecondsAndZulu) {
    std::chrono::system_clock::time_point epoch;
    EXPECT_EQ(utils::time_to_iso(epoch), "1970-01-01T00:00:00.000Z");
    auto tp = epoch + std::chrono::milliseconds(1714564800123);
    EXPECT_EQ(utils::time_to_iso(tp), "2024-05-01T12:00:00.123Z");
}

TEST(UtilsTest, Sha256OfKnownInput) {
    EXPECT_EQ(utils::sha256_hex("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(utils::sha256_hex(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(UtilsTest, CaseAndTrim) {
    EXPECT_EQ(utils::to_upper("Warn"), "WARN");
    EXPECT_EQ(utils::to_lower("FATAL"), "fatal");
    EXPECT_EQ(utils::trim(" \tx y\n"), "x y");
    EXPECT_EQ(utils::trim("   "), "");
}

}
