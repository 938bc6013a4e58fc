#include <array>
#include <memory>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "shellrunner/cli/arg_parser.hpp"

namespace shellrunner::cli::test {

class ArgumentParserTest : public ::testing::Test {
protected:
  void SetUp() override {
    parser_ = std::make_unique<ArgumentParser>("test", "Test parser");
  }

  void TearDown() override {
    parser_.reset();
  }

  std::unique_ptr<ArgumentParser> parser_;
};

TEST_F(ArgumentParserTest, FlagsAndPositionals) {
  parser_->add_argument("quiet", "q").desc("Quiet mode");

  auto argv   = std::array<char const*, 4>{"test", "echo test", "-q", "false"};
  auto result = parser_->parse(argv.size(), argv.data());

  ASSERT_TRUE(result.has_value());
  EXPECT_TRUE(result->has("quiet"));
  EXPECT_EQ(result->get<std::string>("quiet"), "true");
  EXPECT_EQ(result->positional_, (std::vector<std::string>{"echo test", "false"}));
}

TEST_F(ArgumentParserTest, DoubleHyphenEndsOptions) {
  parser_->add_argument("quiet", "q").desc("Quiet mode");

  auto argv   = std::array<char const*, 5>{"test", "-q", "--", "-q", "--version"};
  auto result = parser_->parse(argv.size(), argv.data());

  ASSERT_TRUE(result.has_value());
  EXPECT_TRUE(result->has("quiet"));
  EXPECT_EQ(result->positional_, (std::vector<std::string>{"-q", "--version"}));
}

TEST_F(ArgumentParserTest, OptionValueForms) {
  parser_->add_argument("shell", "s").nargs(1).desc("Shell");
  parser_->add_argument("reporter").nargs(1).desc("Reporter");

  auto argv   = std::array<char const*, 4>{"test", "-s", "zsh", "--reporter=/opt/shellrunner-status"};
  auto result = parser_->parse(argv.size(), argv.data());

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->get<std::string>("shell"), "zsh");
  EXPECT_EQ(result->get<std::string>("reporter"), "/opt/shellrunner-status");
  EXPECT_TRUE(result->positional_.empty());
}

TEST_F(ArgumentParserTest, NumericValue) {
  parser_->add_argument("count", "c").nargs(1).desc("Count");

  auto argv   = std::array<char const*, 3>{"test", "--count", "42"};
  auto result = parser_->parse(argv.size(), argv.data());

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->get<int>("count"), 42);
  EXPECT_EQ(result->get_all("count").size(), 1U);
  EXPECT_EQ(result->get<int>("missing"), std::nullopt);
}

TEST_F(ArgumentParserTest, DefaultValues) {
  parser_->add_argument("shell", "s").nargs(1).default_value("sh").desc("Shell");

  auto argv   = std::array<char const*, 2>{"test", "true"};
  auto result = parser_->parse(argv.size(), argv.data());

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->get<std::string>("shell"), "sh");
}

TEST_F(ArgumentParserTest, CombinedShortFlags) {
  parser_->add_argument("quiet", "q").desc("Quiet mode");
  parser_->add_argument("verbose", "v").desc("Verbose mode");

  auto argv   = std::array<char const*, 2>{"test", "-qv"};
  auto result = parser_->parse(argv.size(), argv.data());

  ASSERT_TRUE(result.has_value());
  EXPECT_TRUE(result->has("quiet"));
  EXPECT_TRUE(result->has("verbose"));
}

TEST_F(ArgumentParserTest, ValueOptionCannotBeCombined) {
  parser_->add_argument("shell", "s").nargs(1).desc("Shell");
  parser_->add_argument("quiet", "q").desc("Quiet mode");

  auto argv   = std::array<char const*, 3>{"test", "-sq", "bash"};
  auto result = parser_->parse(argv.size(), argv.data());

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), "Option -s requires a value and cannot be combined with other short options");
}

TEST_F(ArgumentParserTest, UnknownOptions) {
  parser_->add_argument("quiet", "q").desc("Quiet mode");

  auto long_argv = std::array<char const*, 2>{"test", "--unknown"};
  auto long_opt  = parser_->parse(long_argv.size(), long_argv.data());
  ASSERT_FALSE(long_opt.has_value());
  EXPECT_EQ(long_opt.error(), "Unknown option: --unknown");

  auto short_argv = std::array<char const*, 2>{"test", "-qx"};
  auto short_opt  = parser_->parse(short_argv.size(), short_argv.data());
  ASSERT_FALSE(short_opt.has_value());
  EXPECT_EQ(short_opt.error(), "Unknown option: -x");
}

TEST_F(ArgumentParserTest, MissingValue) {
  parser_->add_argument("shell", "s").nargs(1).desc("Shell");
  parser_->add_argument("quiet", "q").desc("Quiet mode");

  auto argv   = std::array<char const*, 3>{"test", "--shell", "-q"};
  auto result = parser_->parse(argv.size(), argv.data());

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), "Option --shell requires 1 arguments, got 0");
}

TEST_F(ArgumentParserTest, FlagWithValue) {
  parser_->add_argument("quiet", "q").desc("Quiet mode");

  auto argv   = std::array<char const*, 2>{"test", "--quiet=yes"};
  auto result = parser_->parse(argv.size(), argv.data());

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), "Flag option --quiet does not accept a value");
}

TEST_F(ArgumentParserTest, OptionWithoutShortName) {
  parser_->add_argument("no-check").desc("Keep going");

  auto argv   = std::array<char const*, 3>{"test", "--no-check", "-"};
  auto result = parser_->parse(argv.size(), argv.data());

  ASSERT_TRUE(result.has_value());
  EXPECT_TRUE(result->has("no-check"));
  EXPECT_EQ(result->positional_, std::vector<std::string>{"-"});

  auto bad_argv = std::array<char const*, 2>{"test", "-n"};
  auto bad      = parser_->parse(bad_argv.size(), bad_argv.data());
  ASSERT_FALSE(bad.has_value());
  EXPECT_EQ(bad.error(), "Unknown option: -n");
}

TEST(DefaultArgumentParser, RecognizesEveryOption) {
  auto parser = create_default_arg_parser();

  auto argv = std::array<char const*, 11>{
      "shellrunner", "-s", "bash", "--no-check", "-q", "--no-echo", "--reporter", "/tmp/r", "-v", "--", "echo hi"
  };
  auto result = parser.parse(argv.size(), argv.data());

  ASSERT_TRUE(result.has_value()) << result.error();
  EXPECT_EQ(result->get<std::string>("shell"), "bash");
  EXPECT_TRUE(result->has("no-check"));
  EXPECT_TRUE(result->has("quiet"));
  EXPECT_TRUE(result->has("no-echo"));
  EXPECT_EQ(result->get<std::string>("reporter"), "/tmp/r");
  EXPECT_TRUE(result->has("verbose"));
  EXPECT_FALSE(result->has("help"));
  EXPECT_EQ(result->positional_, std::vector<std::string>{"echo hi"});
}

TEST(DefaultArgumentParser, HelpListsOptions) {
  auto parser = create_default_arg_parser();

  testing::internal::CaptureStdout();
  parser.print_help();
  auto help = testing::internal::GetCapturedStdout();

  EXPECT_TRUE(help.starts_with("Usage: shellrunner [OPTIONS] [--] COMMAND..."));
  EXPECT_NE(help.find("-s, --shell <value>"), std::string::npos);
  EXPECT_NE(help.find("--no-check"), std::string::npos);
  EXPECT_NE(help.find("-V, --version"), std::string::npos);
}

TEST(DefaultArgumentParser, Version) {
  testing::internal::CaptureStdout();
  ArgumentParser::print_version();
  EXPECT_EQ(testing::internal::GetCapturedStdout(), "shellrunner v0.5.0\n");
}

} // namespace shellrunner::cli::test
