#include <gtest/gtest.h>
#include <core/config.hpp>
#include <fstream>

TEST(Config, EmptyTextGivesDefaults) {
    auto result = Config::parse("");
    ASSERT_TRUE(result.is_ok()) << result.error;
    const Config& config = result.value;
    EXPECT_EQ(config.connection().host, "");
    EXPECT_EQ(config.connection().port, 22);
    EXPECT_EQ(config.connection().timeout, 10);
    EXPECT_EQ(config.session().connect_timeout, 15);
    EXPECT_TRUE(config.session().merge_messages);
    EXPECT_TRUE(config.prompts().extra_patterns.empty());
    EXPECT_TRUE(config.log().enabled);
}

TEST(Config, ParsesAllSections) {
    auto result = Config::parse(R"(
connection:
  host: build01
  port: 2222
  user: alice
  timeout: 4
session:
  connect_timeout: 30
  merge_messages: false
prompts:
  extra_patterns:
    - "token:$"
    - "PIN\\s*>"
log:
  enabled: false
  path: /tmp/x.log
)");
    ASSERT_TRUE(result.is_ok()) << result.error;
    const Config& config = result.value;
    EXPECT_EQ(config.connection().host, "build01");
    EXPECT_EQ(config.connection().port, 2222);
    EXPECT_EQ(config.connection().user, "alice");
    EXPECT_EQ(config.connection().timeout, 4);
    EXPECT_EQ(config.session().connect_timeout, 30);
    EXPECT_FALSE(config.session().merge_messages);
    ASSERT_EQ(config.prompts().extra_patterns.size(), 2u);
    EXPECT_EQ(config.prompts().extra_patterns[0], "token:$");
    EXPECT_EQ(config.prompts().extra_patterns[1], "PIN\\s*>");
    EXPECT_FALSE(config.log().enabled);
    EXPECT_EQ(config.log().path, "/tmp/x.log");
}

TEST(Config, ScalarPatternBecomesList) {
    auto result = Config::parse("prompts:\n  extra_patterns: \"otp:$\"\n");
    ASSERT_TRUE(result.is_ok());
    ASSERT_EQ(result.value.prompts().extra_patterns.size(), 1u);
    EXPECT_EQ(result.value.prompts().extra_patterns[0], "otp:$");
}

TEST(Config, NonPositiveTimeoutFallsBack) {
    auto result = Config::parse("session:\n  connect_timeout: 0\n");
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value.session().connect_timeout, 15);
}

TEST(Config, InvalidYamlIsError) {
    auto result = Config::parse("connection: [unclosed\n");
    EXPECT_TRUE(result.is_err());
    EXPECT_NE(result.error.find("Failed to parse config"), std::string::npos);
}

TEST(Config, NonMappingRootIsError) {
    auto result = Config::parse("- just\n- a list\n");
    EXPECT_TRUE(result.is_err());
}

TEST(Config, LoadFileMissing) {
    auto result = Config::load_file(fs::temp_directory_path() / "rterm_no_such_config.yaml");
    EXPECT_TRUE(result.is_err());
}

TEST(Config, LoadFileReadsYaml) {
    fs::path path = fs::temp_directory_path() / "rterm_test_config.yaml";
    {
        std::ofstream out(path);
        out << "connection:\n  host: example.org\n";
    }
    auto result = Config::load_file(path);
    fs::remove(path);
    ASSERT_TRUE(result.is_ok()) << result.error;
    EXPECT_EQ(result.value.connection().host, "example.org");
}
