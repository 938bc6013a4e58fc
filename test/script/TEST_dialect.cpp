#include <string>

#include <gtest/gtest.h>

#include "shellrunner/script/dialect.hpp"

namespace shellrunner::script::test {

struct DialectCase {
  std::string      shell_;
  DialectKind      kind_;
  std::string_view last_status_;
  std::string_view pipe_status_;
};

class DialectLookup : public ::testing::TestWithParam<DialectCase> {};

TEST_P(DialectLookup, Test) {
  auto const& param   = GetParam();
  auto const& dialect = dialect_for(param.shell_);
  EXPECT_EQ(dialect.kind_, param.kind_);
  EXPECT_EQ(dialect.last_status_expr_, param.last_status_);
  EXPECT_EQ(dialect.pipe_status_expr_, param.pipe_status_);
}

INSTANTIATE_TEST_SUITE_P(
    Dialect,
    DialectLookup,
    ::testing::Values(
        // clang-format off
        DialectCase{"bash", DialectKind::Bash, "$?", "${PIPESTATUS[*]}"},
        DialectCase{"zsh", DialectKind::Zsh, "$status", "$pipestatus"},
        DialectCase{"fish", DialectKind::Fish, "$status", "$pipestatus"},
        DialectCase{"sh", DialectKind::Posix, "$?", "$?"},
        DialectCase{"dash", DialectKind::Posix, "$?", "$?"},
        DialectCase{"ksh", DialectKind::Posix, "$?", "$?"},
        DialectCase{"Bash", DialectKind::Posix, "$?", "$?"},
        DialectCase{"", DialectKind::Posix, "$?", "$?"} // clang-format on
    )
);

TEST(Dialect, ChosenByFileName) {
  EXPECT_EQ(dialect_for_path("/bin/bash").kind_, DialectKind::Bash);
  EXPECT_EQ(dialect_for_path("/usr/local/bin/fish").kind_, DialectKind::Fish);
  EXPECT_EQ(dialect_for_path("/usr/bin/zsh").kind_, DialectKind::Zsh);
  EXPECT_EQ(dialect_for_path("/bin/sh").kind_, DialectKind::Posix);
  EXPECT_EQ(dialect_for_path("/opt/bash/bin/dash").kind_, DialectKind::Posix);
}

TEST(Dialect, PipeStatusAvailability) {
  EXPECT_TRUE(dialect_of(DialectKind::Bash).has_pipe_status());
  EXPECT_TRUE(dialect_of(DialectKind::Zsh).has_pipe_status());
  EXPECT_TRUE(dialect_of(DialectKind::Fish).has_pipe_status());
  EXPECT_FALSE(dialect_of(DialectKind::Posix).has_pipe_status());
}

TEST(Dialect, UnknownShellIsSharedPosixEntry) {
  EXPECT_EQ(&dialect_for("tcsh"), &dialect_of(DialectKind::Posix));
  EXPECT_EQ(dialect_of(DialectKind::Posix).name_, "sh");
}

} // namespace shellrunner::script::test
