// SEEDORDER - Configuration Parser Tests
// Copyright (c) 2024 SEEDORDER Developers
// MIT License

#include <gtest/gtest.h>

#include "seedorder/util/config.h"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>
#include <unistd.h>
#include <vector>

namespace seedorder {
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
        char filename[] = "/tmp/seedorder_config_test_XXXXXX";
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

    /// Parse argv-style arguments with the recover tool's option shape
    ConfigParseResult ParseArgs(std::vector<const char*> args) {
        args.insert(args.begin(), "seedorder-recover");
        CommandLineSpec spec;
        spec.valueKeys = {ConfigKeys::MAX_PERMUTATIONS, ConfigKeys::LANGUAGE,
                          ConfigKeys::DERIVATION, ConfigKeys::START, ConfigKeys::THREADS};
        spec.aliases = {{"l", ConfigKeys::LANGUAGE}, {"h", ConfigKeys::HELP}};
        return config_.ParseCommandLine(static_cast<int>(args.size()), args.data(), spec);
    }

    ConfigManager config_;
    std::vector<std::string> tempFiles_;
};

// ============================================================================
// File Syntax
// ============================================================================

TEST_F(ConfigTest, ParseEmptyString) {
    auto result = config_.ParseString("");
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.Size(), 0u);
}

TEST_F(ConfigTest, ParseComments) {
    std::string content = R"(
# max-permutations=5
; language=spanish
)";
    auto result = config_.ParseString(content);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.Size(), 0u);
}

TEST_F(ConfigTest, ParseKeyValuePairs) {
    std::string content = R"(
  max-permutations  =  5000000
language = japanese
)";
    auto result = config_.ParseString(content);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.GetString("language", "english"), "japanese");
    EXPECT_EQ(config_.GetUInt("max-permutations", 0), 5000000u);
}

TEST_F(ConfigTest, ParseQuotedValue) {
    std::string content = R"(
derivation="m/84'/0'/0'/0/3"
wordlistdir='/opt/bip39 lists'
)";
    auto result = config_.ParseString(content);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.GetString("derivation", ""), "m/84'/0'/0'/0/3");
    EXPECT_EQ(config_.GetString("wordlistdir", ""), "/opt/bip39 lists");
}

TEST_F(ConfigTest, ParseFlags) {
    std::string content = R"(
bip84
nostrictlanguage
)";
    auto result = config_.ParseString(content);
    EXPECT_TRUE(result.success);
    EXPECT_TRUE(config_.GetBool("bip84", false));
    EXPECT_FALSE(config_.GetBool("strictlanguage", true));
}

TEST_F(ConfigTest, ParseSection) {
    std::string content = R"(
threads=2

[extra]
threads=8
)";
    auto result = config_.ParseString(content);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.GetUInt("threads", 0), 2u);
    EXPECT_EQ(config_.GetUInt("threads", 0, "extra"), 8u);
}

TEST_F(ConfigTest, LineContinuation) {
    auto result = config_.ParseString("derivation=m/44'/0'\\\n/0'/0/0\n");
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.GetString("derivation", ""), "m/44'/0'/0'/0/0");
}

TEST_F(ConfigTest, FirstValueWinsWithinFile) {
    auto result = config_.ParseString("threads=2\nthreads=4\n");
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.GetUInt("threads", 0), 2u);
}

// ============================================================================
// Errors
// ============================================================================

TEST_F(ConfigTest, MissingSectionBracket) {
    auto result = config_.ParseString("[broken\n", "test.conf");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorLine, 1);
    EXPECT_EQ(result.Describe(), "test.conf:1: Missing closing bracket in section header");
}

TEST_F(ConfigTest, InvalidKeyCharacter) {
    auto result = config_.ParseString("ok=1\nbad key=1\n");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorLine, 2);
}

TEST_F(ConfigTest, LineTooLong) {
    auto result = config_.ParseString("key=" + std::string(MAX_LINE_LENGTH, 'x'));
    EXPECT_FALSE(result.success);
}

// ============================================================================
// Values
// ============================================================================

TEST_F(ConfigTest, IntegerSuffixesAreDecimal) {
    EXPECT_EQ(ConfigManager::ParseInt("5k"), 5000);
    EXPECT_EQ(ConfigManager::ParseInt("2M"), 2000000);
    EXPECT_EQ(ConfigManager::ParseInt("1g"), 1000000000);
    EXPECT_EQ(ConfigManager::ParseInt("-7"), -7);
    EXPECT_FALSE(ConfigManager::ParseInt("12x").has_value());
    EXPECT_FALSE(ConfigManager::ParseInt("").has_value());
    EXPECT_FALSE(ConfigManager::ParseInt("99999999999999999999").has_value());
}

TEST_F(ConfigTest, UnsignedRejectsNegative) {
    config_.Set("start", "-1");
    EXPECT_FALSE(config_.TryGetUInt("start").has_value());
    EXPECT_EQ(config_.GetUInt("start", 9), 9u);
    EXPECT_EQ(config_.GetInt("start", 9), -1);
    EXPECT_EQ(config_.GetInt("missing", 9), 9);
}

TEST_F(ConfigTest, BooleanSpellings) {
    for (const char* yes : {"true", "YES", "on", "1"}) {
        EXPECT_EQ(ConfigManager::ParseBool(yes), true) << yes;
    }
    for (const char* no : {"false", "No", "off", "0"}) {
        EXPECT_EQ(ConfigManager::ParseBool(no), false) << no;
    }
    EXPECT_FALSE(ConfigManager::ParseBool("maybe").has_value());
}

TEST_F(ConfigTest, EnvironmentExpansion) {
    setenv("SEEDORDER_TEST_DIR", "/srv/lists", 1);
    EXPECT_EQ(ConfigManager::ExpandEnvVars("${SEEDORDER_TEST_DIR}/x"), "/srv/lists/x");
    EXPECT_EQ(ConfigManager::ExpandEnvVars("$SEEDORDER_TEST_DIR"), "/srv/lists");
    unsetenv("SEEDORDER_TEST_DIR");
    EXPECT_EQ(ConfigManager::ExpandEnvVars("a$SEEDORDER_TEST_DIR"), "a");
}

TEST_F(ConfigTest, TildeExpansion) {
    setenv("HOME", "/home/tester", 1);
    EXPECT_EQ(ConfigManager::ExpandTilde("~/lists"), "/home/tester/lists");
    EXPECT_EQ(ConfigManager::ExpandTilde("~other/lists"), "~other/lists");
    EXPECT_EQ(ConfigManager::ExpandTilde("/abs"), "/abs");
}

TEST_F(ConfigTest, UnknownKeys) {
    ASSERT_TRUE(config_.ParseString("threads=2\ncolour=blue\n[s]\nwhatever=1\n").success);
    auto unknown = config_.UnknownKeys({ConfigKeys::THREADS});
    ASSERT_EQ(unknown.size(), 1u);
    EXPECT_EQ(unknown[0], "colour");
}

// ============================================================================
// Files
// ============================================================================

TEST_F(ConfigTest, ParseFile) {
    std::string path = CreateTempFile("language=czech\nthreads=3\n");
    auto result = config_.ParseFile(path);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.GetString("language", ""), "czech");
    EXPECT_EQ(config_.GetSource("language"), path);
}

TEST_F(ConfigTest, ParseMissingFile) {
    auto result = config_.ParseFile("/nonexistent/seedorder.conf");
    EXPECT_FALSE(result.success);
}

TEST_F(ConfigTest, IncludeDirective) {
    std::string inner = CreateTempFile("threads=6\n");
    std::string outer = CreateTempFile("include " + inner + "\nlanguage=french\n");
    auto result = config_.ParseFile(outer);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.GetUInt("threads", 0), 6u);
    EXPECT_EQ(config_.GetString("language", ""), "french");
}

// ============================================================================
// Command Line
// ============================================================================

TEST_F(ConfigTest, CommandLineValuesAndPositionals) {
    auto result = ParseArgs({"bc1qexample", "--max-permutations", "500", "-l", "korean",
                             "abandon", "--bip84", "about"});
    ASSERT_TRUE(result.success) << result.Describe();
    EXPECT_EQ(config_.GetUInt(ConfigKeys::MAX_PERMUTATIONS, 0), 500u);
    EXPECT_EQ(config_.GetString(ConfigKeys::LANGUAGE, ""), "korean");
    EXPECT_TRUE(config_.GetBool(ConfigKeys::BIP84, false));
    EXPECT_EQ(config_.GetSource(ConfigKeys::LANGUAGE), "<command-line>");

    const auto& positional = config_.GetPositional();
    ASSERT_EQ(positional.size(), 3u);
    EXPECT_EQ(positional[0], "bc1qexample");
    EXPECT_EQ(positional[2], "about");
}

TEST_F(ConfigTest, CommandLineEqualsForm) {
    auto result = ParseArgs({"--derivation=m/49'/0'/0'/0/0", "--threads=4"});
    ASSERT_TRUE(result.success);
    EXPECT_EQ(config_.GetString(ConfigKeys::DERIVATION, ""), "m/49'/0'/0'/0/0");
    EXPECT_EQ(config_.GetUInt(ConfigKeys::THREADS, 0), 4u);
}

TEST_F(ConfigTest, CommandLineNegation) {
    auto result = ParseArgs({"--nostrictlanguage"});
    ASSERT_TRUE(result.success);
    EXPECT_FALSE(config_.GetBool(ConfigKeys::STRICTLANGUAGE, true));
}

TEST_F(ConfigTest, CommandLineDoubleDashEndsOptions) {
    auto result = ParseArgs({"--", "--bip44", "-x"});
    ASSERT_TRUE(result.success);
    EXPECT_FALSE(config_.HasKey(ConfigKeys::BIP44));
    EXPECT_EQ(config_.GetPositional().size(), 2u);
}

TEST_F(ConfigTest, CommandLineErrors) {
    EXPECT_FALSE(ParseArgs({"-q"}).success);
    EXPECT_FALSE(ParseArgs({"--language"}).success);
}

TEST_F(ConfigTest, CommandLineOverridesFile) {
    ASSERT_TRUE(ParseArgs({"--threads", "8"}).success);
    std::string path = CreateTempFile("threads=2\nlanguage=italian\n");
    ASSERT_TRUE(config_.ParseFile(path).success);
    EXPECT_EQ(config_.GetUInt(ConfigKeys::THREADS, 0), 8u);
    EXPECT_EQ(config_.GetString(ConfigKeys::LANGUAGE, ""), "italian");
}

TEST_F(ConfigTest, DefaultConfigPath) {
    setenv("HOME", "/home/tester", 1);
    EXPECT_EQ(ConfigManager::GetDefaultConfigPath(), "/home/tester/.seedorder/seedorder.conf");
}

} // namespace test
} // namespace util
} // namespace seedorder
