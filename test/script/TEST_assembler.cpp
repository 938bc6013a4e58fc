#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "shellrunner/script/assembler.hpp"
#include "shellrunner/script/dialect.hpp"

namespace shellrunner::script::test {

namespace {

auto count_of(std::string const& haystack, std::string const& needle) -> size_t {
  size_t count = 0;
  for (auto pos = haystack.find(needle); pos != std::string::npos; pos = haystack.find(needle, pos + needle.size())) {
    ++count;
  }
  return count;
}

} // namespace

class AssemblerTest : public ::testing::Test {
protected:
  std::filesystem::path reporter_{"/usr/libexec/shellrunner-status"};
};

TEST_F(AssemblerTest, SingleCommandBash) {
  std::vector<std::string> commands{"echo test"};

  auto script = assemble(commands, dialect_of(DialectKind::Bash), reporter_, false);
  ASSERT_TRUE(script.has_value()) << script.error();
  EXPECT_EQ(*script, R"(echo test; '/usr/libexec/shellrunner-status' "${PIPESTATUS[*]}")");
}

TEST_F(AssemblerTest, CheckAddsExitClause) {
  std::vector<std::string> commands{"false"};

  auto bash = assemble(commands, dialect_of(DialectKind::Bash), reporter_, true);
  ASSERT_TRUE(bash.has_value());
  EXPECT_EQ(*bash, R"(false; '/usr/libexec/shellrunner-status' "${PIPESTATUS[*]}" || exit "$?")");

  auto fish = assemble(commands, dialect_of(DialectKind::Fish), reporter_, true);
  ASSERT_TRUE(fish.has_value());
  EXPECT_EQ(*fish, R"(false; '/usr/libexec/shellrunner-status' "$pipestatus" || exit "$status")");

  auto sh = assemble(commands, dialect_of(DialectKind::Posix), reporter_, true);
  ASSERT_TRUE(sh.has_value());
  EXPECT_EQ(*sh, R"(false; '/usr/libexec/shellrunner-status' "$?" || exit "$?")");
}

TEST_F(AssemblerTest, OneReportPerCommand) {
  std::vector<std::string> commands{"cd /", "echo a | grep a", "pwd"};

  auto script = assemble(commands, dialect_of(DialectKind::Zsh), reporter_, true);
  ASSERT_TRUE(script.has_value());
  EXPECT_EQ(count_of(*script, "'/usr/libexec/shellrunner-status'"), commands.size());
  EXPECT_EQ(count_of(*script, "|| exit"), commands.size());

  auto const report = status_report_invocation(dialect_of(DialectKind::Zsh), reporter_, true);
  EXPECT_EQ(*script, "cd /; " + report + "; echo a | grep a; " + report + "; pwd; " + report);
}

TEST_F(AssemblerTest, CommandsAreKeptVerbatimAndInOrder) {
  std::vector<std::string> commands{"printf '%s\\n' \"$HOME\"", "echo 'it''s'"};

  auto script = assemble(commands, dialect_of(DialectKind::Bash), reporter_, false);
  ASSERT_TRUE(script.has_value());
  auto first  = script->find(commands[0]);
  auto second = script->find(commands[1]);
  ASSERT_NE(first, std::string::npos);
  ASSERT_NE(second, std::string::npos);
  EXPECT_EQ(first, 0U);
  EXPECT_LT(first, second);
}

TEST_F(AssemblerTest, Deterministic) {
  std::vector<std::string> commands{"true | false", "echo done"};
  auto const& dialect = dialect_of(DialectKind::Fish);

  EXPECT_EQ(assemble(commands, dialect, reporter_, true), assemble(commands, dialect, reporter_, true));
}

TEST_F(AssemblerTest, ReporterPathIsQuoted) {
  std::vector<std::string> commands{"true"};

  auto script = assemble(commands, dialect_of(DialectKind::Bash), "/opt/it's here/shellrunner-status", false);
  ASSERT_TRUE(script.has_value());
  EXPECT_EQ(*script, R"(true; '/opt/it'\''s here/shellrunner-status' "${PIPESTATUS[*]}")");
}

TEST_F(AssemblerTest, EmptyCommandListFails) {
  std::vector<std::string> commands;

  auto script = assemble(commands, dialect_of(DialectKind::Bash), reporter_, true);
  ASSERT_FALSE(script.has_value());
  EXPECT_NE(script.error().find("empty"), std::string::npos);
}

} // namespace shellrunner::script::test
