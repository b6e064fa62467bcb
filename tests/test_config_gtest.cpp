// ==============================================================================
// test_config_gtest.cpp - Тесты загрузки конфигурации (GoogleTest)
// ==============================================================================

#include "warden/config.hpp"
#include "warden/errors.hpp"

#include <gtest/gtest.h>
#include <string>

namespace warden::config::test {

namespace {

std::string fixture(const std::string& name) {
    return std::string(CMAKE_SOURCE_DIR) + "/tests/fixtures/config/" + name;
}

}  // namespace

TEST(ConfigTest, Load_Fixture_AllSections) {
    auto result = load(fixture("warden.yml"));
    ASSERT_TRUE(result) << result.error.format();

    EXPECT_FALSE(result.config.engine.stop_on_first_match);
    EXPECT_EQ(result.config.engine.default_effect, policy::Effect::Warn);
    EXPECT_TRUE(result.config.engine.validate_on_load);

    EXPECT_EQ(result.config.audit.algorithm, audit::HashAlgorithm::Sha512);
    EXPECT_EQ(result.config.audit.max_append_retries, 25);

    EXPECT_EQ(result.config.evidence.default_max_per_source, 250u);
    EXPECT_FALSE(result.config.evidence.default_verify_chain);
}

TEST(ConfigTest, Load_Invalid_CollectsIssues) {
    auto result = load(fixture("invalid.yml"));
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error.message, "configuration failed validation");

    const auto& issues = result.error.issues;
    ASSERT_EQ(issues.size(), 3u);
    EXPECT_EQ(issues[0].rfind("engine.default_effect: ", 0), 0u);
    EXPECT_EQ(issues[1], "audit.max_append_retries: must be at least 1");
    EXPECT_EQ(issues[2], "evidence: expected a mapping");

    const std::string text = result.error.format();
    EXPECT_NE(text.find("failed to load config '"), std::string::npos);
    EXPECT_NE(text.find("\n    audit.max_append_retries"), std::string::npos);
}

TEST(ConfigTest, Load_MissingFile_ReportsError) {
    auto result = load(fixture("does-not-exist.yml"));
    EXPECT_FALSE(result);
    EXPECT_FALSE(result.error.message.empty());
    EXPECT_TRUE(result.error.issues.empty());
}

TEST(ConfigTest, ParseString_Empty_Defaults) {
    Config config = parse_config_string("");
    EXPECT_TRUE(config.engine.stop_on_first_match);
    EXPECT_EQ(config.engine.default_effect, policy::Effect::Deny);
    EXPECT_EQ(config.audit.algorithm, audit::HashAlgorithm::Sha256);
    EXPECT_EQ(config.audit.max_append_retries, 100);
    EXPECT_EQ(config.evidence.default_max_per_source, 100u);
    EXPECT_TRUE(config.evidence.default_verify_chain);
}

TEST(ConfigTest, ParseString_UnknownKeysIgnored) {
    Config config = parse_config_string("engine:\n  colour: blue\nlogging: verbose\n");
    EXPECT_TRUE(config.engine.stop_on_first_match);
}

TEST(ConfigTest, ParseString_NotAMapping_Throws) {
    EXPECT_THROW(parse_config_string("- engine\n- audit\n"), ValidationError);
}

TEST(ConfigTest, ParseString_TypeErrors) {
    try {
        parse_config_string(
            "engine:\n  stop_on_first_match: perhaps\naudit:\n  max_append_retries: many\n"
            "evidence:\n  max_per_source: 5000\n");
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        ASSERT_EQ(e.issues().size(), 3u);
        EXPECT_EQ(e.issues()[0], "engine.stop_on_first_match: expected a boolean");
        EXPECT_EQ(e.issues()[1], "audit.max_append_retries: expected an integer");
        EXPECT_EQ(e.issues()[2].rfind("evidence.max_per_source: must be between 1 and ", 0), 0u);
    }
}

}  // namespace warden::config::test
