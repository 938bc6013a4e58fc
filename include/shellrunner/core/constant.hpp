#pragma once

#include <cstddef>
#include <string_view>

namespace shellrunner::core::constant {

inline constexpr std::string_view EXE_NAME      = "shellrunner";
inline constexpr std::string_view EXE_DESC      = "Run shell commands and collect the status of every pipeline stage";
inline constexpr std::string_view VERSION       = "v0.5.0";
inline constexpr std::string_view REPORTER_NAME = "shellrunner-status";

// U+2F4C and U+2F8F (Kangxi radicals), UTF-8 encoded
inline constexpr std::string_view OPEN_MARKER  = "\xE2\xBD\x8C";
inline constexpr std::string_view CLOSE_MARKER = "\xE2\xBE\x8F";

inline constexpr std::string_view ENV_SHELL        = "SHELLRUNNER_SHELL";
inline constexpr std::string_view ENV_CHECK        = "SHELLRUNNER_CHECK";
inline constexpr std::string_view ENV_SHOW_OUTPUT  = "SHELLRUNNER_SHOW_OUTPUT";
inline constexpr std::string_view ENV_SHOW_COMMAND = "SHELLRUNNER_SHOW_COMMAND";
// Older spelling, read when ENV_SHOW_COMMAND is unset.
inline constexpr std::string_view ENV_SHOW_COMMANDS = "SHELLRUNNER_SHOW_COMMANDS";
inline constexpr std::string_view ENV_REPORTER     = "SHELLRUNNER_REPORTER";
inline constexpr std::string_view PATH_VAR         = "PATH";

inline constexpr int    SIGNAL_EXIT_CODE_OFFSET  = 128;
inline constexpr size_t DEFAULT_PIPE_BUFFER_SIZE = 8192;

} // namespace shellrunner::core::constant
