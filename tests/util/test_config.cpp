// BONDVAULT - Configuration File Parser Tests
// Copyright (c) 2024 BondVault Developers
// MIT License

#include <gtest/gtest.h>

#include "bondvault/util/config.h"
#include "bondvault/util/logging.h"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <unistd.h>

namespace bondvault {
namespace util {
namespace test {

// ============================================================================
// Test Fixtures
// ============================================================================

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.Clear();
    }

    void TearDown() override {
        for (const auto& file : tempFiles_) {
            std::remove(file.c_str());
        }
        tempFiles_.clear();
    }

    std::string CreateTempFile(const std::string& content) {
        char filename[] = "/tmp/bondvault_config_test_XXXXXX";
        int fd = mkstemp(filename);
        if (fd < 0) {
            throw std::runtime_error("Failed to create temp file");
        }
        close(fd);

        std::ofstream file(filename);
        file << content;
        file.close();

        tempFiles_.push_back(filename);
        return filename;
    }

    static std::string OracleSection() {
        return "[oracle]\n"
               "source_domain=0x0000000000000000000000000000000000000000000000000000000000000001\n"
               "source_sender=0x1111111111111111111111111111111111111111\n";
    }

    ConfigManager config_;
    std::vector<std::string> tempFiles_;
};

// ============================================================================
// Basic Parsing Tests
// ============================================================================

TEST_F(ConfigTest, ParseEmptyString) {
    auto result = config_.ParseString("");
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.Size(), 0u);
}

TEST_F(ConfigTest, CommentsAndBlankLinesIgnored) {
    auto result = config_.ParseString("# comment\n; other\n\n   \nkey=value\n");
    ASSERT_TRUE(result.success) << result.ToString();
    EXPECT_EQ(config_.Size(), 1u);
    EXPECT_EQ(config_.GetString("key", ""), "value");
}

TEST_F(ConfigTest, SectionsAreSeparate) {
    auto result = config_.ParseString("decimals=2\n[oracle]\ndecimals=8\n");
    ASSERT_TRUE(result.success);
    EXPECT_EQ(config_.GetUInt("decimals", 0), 2u);
    EXPECT_EQ(config_.GetUInt("decimals", 0, "oracle"), 8u);

    auto sections = config_.GetSections();
    ASSERT_EQ(sections.size(), 1u);
    EXPECT_EQ(sections[0], "oracle");
}

TEST_F(ConfigTest, QuotedValues) {
    ASSERT_TRUE(config_.ParseString("description=\"BOND / USD\"\n").success);
    EXPECT_EQ(config_.GetString("description", ""), "BOND / USD");
}

TEST_F(ConfigTest, LaterValueWins) {
    ASSERT_TRUE(config_.ParseString("loglevel=info\nloglevel=debug\n").success);
    EXPECT_EQ(config_.GetString("loglevel", ""), "debug");

    config_.Set("loglevel", "error");
    EXPECT_EQ(config_.GetString("loglevel", ""), "error");
}

TEST_F(ConfigTest, MalformedLinesReportLocation) {
    auto result = config_.ParseString("ok=1\nnot a pair\n", "test.conf");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorLine, 2);
    EXPECT_EQ(result.errorFile, "test.conf");
    EXPECT_NE(result.ToString().find("test.conf:2"), std::string::npos);

    ConfigManager other;
    EXPECT_FALSE(other.ParseString("[oracle\n").success);
    EXPECT_FALSE(other.ParseString("=value\n").success);
    EXPECT_FALSE(other.ParseString("bad key=1\n").success);
}

// ============================================================================
// Typed Getters
// ============================================================================

TEST_F(ConfigTest, IntegerGetters) {
    ASSERT_TRUE(config_.ParseString("a=42\nb=-7\nc=12abc\nd=+3\n"
                                    "e=99999999999999999999\n").success);
    EXPECT_EQ(config_.TryGetUInt("a"), 42u);
    EXPECT_FALSE(config_.TryGetUInt("b").has_value());
    EXPECT_FALSE(config_.TryGetUInt("c").has_value());
    EXPECT_FALSE(config_.TryGetUInt("d").has_value());
    EXPECT_FALSE(config_.TryGetUInt("e").has_value());
    EXPECT_EQ(config_.GetUInt("missing", 5), 5u);
}

TEST_F(ConfigTest, BooleanGetters) {
    ASSERT_TRUE(config_.ParseString("a=yes\nb=off\nc=maybe\n").success);
    EXPECT_TRUE(config_.GetBool("a", false));
    EXPECT_FALSE(config_.GetBool("b", true));
    EXPECT_FALSE(config_.TryGetBool("c").has_value());
    EXPECT_TRUE(config_.GetBool("c", true));
}

TEST_F(ConfigTest, ExpandEnvVars) {
    setenv("BONDVAULT_TEST_VAR", "/data", 1);
    EXPECT_EQ(ConfigManager::ExpandEnvVars("${BONDVAULT_TEST_VAR}/rounds"), "/data/rounds");
    EXPECT_EQ(ConfigManager::ExpandEnvVars("${BONDVAULT_UNSET_VAR_X}x"), "x");
    EXPECT_EQ(ConfigManager::ExpandEnvVars("${unterminated"), "${unterminated");
    unsetenv("BONDVAULT_TEST_VAR");
}

TEST_F(ConfigTest, ExpandTilde) {
    const char* saved = std::getenv("HOME");
    std::string previous = saved ? saved : "";

    setenv("HOME", "/home/tester", 1);
    EXPECT_EQ(ConfigManager::ExpandTilde("~/x"), "/home/tester/x");
    EXPECT_EQ(ConfigManager::ExpandTilde("/abs"), "/abs");
    EXPECT_EQ(ConfigManager::GetDefaultDataDir(), "/home/tester/.bondvault");

    if (saved) {
        setenv("HOME", previous.c_str(), 1);
    } else {
        unsetenv("HOME");
    }
}

TEST_F(ConfigTest, OriginTracksAssignment) {
    ASSERT_TRUE(config_.ParseString("\n[oracle]\ndecimals=8\n", "a.conf").success);
    EXPECT_EQ(config_.Origin("decimals", "oracle"), "a.conf:3");

    config_.Set("decimals", "6", "oracle");
    EXPECT_EQ(config_.Origin("decimals", "oracle"), "<override>");
    EXPECT_EQ(config_.Origin("missing"), "");
}

TEST_F(ConfigTest, ParseFile) {
    std::string path = CreateTempFile("loglevel=warn\n" + OracleSection());
    auto result = config_.ParseFile(path);
    ASSERT_TRUE(result.success) << result.ToString();
    EXPECT_EQ(config_.GetString("loglevel", ""), "warn");
    EXPECT_TRUE(config_.HasKey("source_sender", "oracle"));

    EXPECT_FALSE(config_.ParseFile("/nonexistent/bondvault.conf").success);
}

// ============================================================================
// Typed Settings
// ============================================================================

TEST_F(ConfigTest, LoadSettingsFromSample) {
    ASSERT_TRUE(config_.ParseString(SampleConfig()).success);

    Settings settings;
    auto result = LoadSettings(config_, settings);
    ASSERT_TRUE(result.success) << result.ToString();
    EXPECT_EQ(settings.logLevel, "info");
    EXPECT_EQ(settings.oracleDecimals, 8);
    EXPECT_EQ(settings.oracleDescription, "BOND / USD");
    EXPECT_EQ(settings.minMessengerVersion, 1u);
    EXPECT_EQ(settings.assetDecimals, 6);
    EXPECT_EQ(settings.sourceSender, Address::FromHex("1111111111111111111111111111111111111111"));
    EXPECT_FALSE(settings.sourceDomain.IsNull());
}

TEST_F(ConfigTest, LoadSettingsRequiresSource) {
    Settings settings;
    auto result = LoadSettings(config_, settings);
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.errorMessage.find("source_domain"), std::string::npos);

    config_.Set("source_domain",
                "0x0000000000000000000000000000000000000000000000000000000000000001",
                "oracle");
    result = LoadSettings(config_, settings);
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.errorMessage.find("source_sender"), std::string::npos);
}

TEST_F(ConfigTest, LoadSettingsRejectsBadValues) {
    Settings settings;

    ASSERT_TRUE(config_.ParseString(OracleSection() + "decimals=19\n", "bv.conf").success);
    auto result = LoadSettings(config_, settings);
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.errorMessage.find("oracle.decimals (bv.conf:4)"), std::string::npos);

    config_.Clear();
    ASSERT_TRUE(config_.ParseString(OracleSection() + "min_messenger_version=0\n").success);
    EXPECT_FALSE(LoadSettings(config_, settings).success);

    config_.Clear();
    ASSERT_TRUE(config_.ParseString("[oracle]\nsource_domain=0xzz\n"
                                    "source_sender=0x1111111111111111111111111111111111111111\n").success);
    EXPECT_FALSE(LoadSettings(config_, settings).success);

    config_.Clear();
    ASSERT_TRUE(config_.ParseString(OracleSection() + "[bond]\nasset_decimals=40\n").success);
    EXPECT_FALSE(LoadSettings(config_, settings).success);
}

TEST_F(ConfigTest, LoadSettingsLogCategories) {
    ASSERT_TRUE(config_.ParseString(OracleSection()).success);
    Settings settings;
    ASSERT_TRUE(LoadSettings(config_, settings).success);
    EXPECT_EQ(settings.logCategoryMask, ALL_LOG_CATEGORIES);

    config_.Set("logcategories", "oracle, vault");
    ASSERT_TRUE(LoadSettings(config_, settings).success);
    EXPECT_EQ(settings.logCategoryMask,
              CategoryBit(LogCategory::ORACLE) | CategoryBit(LogCategory::VAULT));

    config_.Set("logcategories", "oracle,metrics");
    auto result = LoadSettings(config_, settings);
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.errorMessage.find("metrics"), std::string::npos);
}

TEST_F(ConfigTest, LoadSettingsLeavesOutputOnFailure) {
    Settings settings;
    settings.logLevel = "trace";
    config_.Set("loglevel", "debug");
    EXPECT_FALSE(LoadSettings(config_, settings).success);
    EXPECT_EQ(settings.logLevel, "trace");
}

} // namespace test
} // namespace util
} // namespace bondvault
