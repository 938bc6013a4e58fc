#include "shellrunner/cli/arg_parser.hpp"

#include <algorithm>
#include <expected>
#include <utility>
#include <string_view>

#include <fmt/core.h>

#include "shellrunner/core/constant.hpp"

namespace shellrunner::cli {

bool Arguments::has(std::string const& name) const noexcept {
  return args_.contains(name);
}

Option::Option(std::string name, std::string short_name) noexcept
    : name_{std::move(name)}, short_name_{std::move(short_name)} {}

auto Option::desc(std::string desc) noexcept -> Option& {
  description_ = std::move(desc);
  return *this;
}

auto Option::nargs(size_t n) noexcept -> Option& {
  nargs_ = n;
  return *this;
}

auto Option::default_value(std::string value) noexcept -> Option& {
  default_value_ = {std::move(value)};
  return *this;
}

ArgumentParser::ArgumentParser(std::string name, std::string desc) noexcept
    : name_{std::move(name)}, desc_{std::move(desc)} {}

auto ArgumentParser::add_argument(std::string name, std::string short_name) noexcept -> Option& {
  options_.emplace_back(std::move(name), std::move(short_name));
  return options_.back();
}

auto ArgumentParser::positional_usage(std::string usage) noexcept -> ArgumentParser& {
  positional_usage_ = std::move(usage);
  return *this;
}

auto ArgumentParser::parse(int argc, char const** argv) const -> core::Result<Arguments> {
  Arguments result;

  for (auto const& option : options_) {
    if (option.default_value_) {
      result.args_[option.name_] = *option.default_value_;
    }
  }

  bool options_ended = false;
  for (int i = 1; i < argc; ++i) {
    std::string_view arg{argv[i]};

    if (options_ended) {
      result.positional_.emplace_back(arg);
    } else if (arg == "--") {
      options_ended = true;
    } else if (arg.starts_with("--")) {
      // Long option
      std::string_view name        = arg.substr(2);
      size_t           eq_pos      = name.find('=');
      std::string_view option_name = name.substr(0, eq_pos);

      auto option_it = std::ranges::find_if(options_, [option_name](Option const& opt) {
        return opt.name_ == option_name;
      });

      if (option_it == options_.end()) {
        return std::unexpected(fmt::format("Unknown option: --{}", option_name));
      }

      if (option_it->nargs_ == 0) {
        if (eq_pos != std::string_view::npos) {
          return std::unexpected(fmt::format("Flag option --{} does not accept a value", option_name));
        }
        result.args_[option_it->name_] = std::vector<std::string>{"true"};
      } else {
        std::vector<std::string> values;
        values.reserve(option_it->nargs_);

        if (eq_pos != std::string_view::npos) {
          values.emplace_back(name.substr(eq_pos + 1));
        } else {
          for (size_t j = 0; j < option_it->nargs_ && i + 1 < argc; ++j) {
            ++i;
            if (std::string_view{argv[i]}.starts_with("-")) {
              --i;
              break;
            }
            values.emplace_back(argv[i]);
          }
        }

        if (values.size() < option_it->nargs_) {
          return std::unexpected(
              fmt::format("Option --{} requires {} arguments, got {}", option_name, option_it->nargs_, values.size())
          );
        }

        result.args_[option_it->name_] = std::move(values);
      }
    } else if (arg.starts_with("-") && arg.size() > 1) {
      // Short option(s)
      for (size_t j = 1; j < arg.size(); ++j) {
        char short_opt{arg[j]};

        auto option_it = std::ranges::find_if(options_, [&short_opt](Option const& opt) {
          return !opt.short_name_.empty() && opt.short_name_.front() == short_opt;
        });

        if (option_it == options_.end()) {
          return std::unexpected(fmt::format("Unknown option: -{}", short_opt));
        }

        if (option_it->nargs_ == 0) {
          result.args_[option_it->name_] = {"true"};
        } else {
          if (j < arg.size() - 1) {
            return std::unexpected(
                fmt::format("Option -{} requires a value and cannot be combined with other short options", short_opt)
            );
          }

          std::vector<std::string> values;
          for (size_t k = 0; k < option_it->nargs_ && i + 1 < argc; ++k) {
            ++i;
            if (std::string_view{argv[i]}.starts_with("-")) {
              --i;
              break;
            }
            values.emplace_back(argv[i]);
          }

          if (values.size() < option_it->nargs_) {
            return std::unexpected(
                fmt::format("Option -{} requires {} arguments, got {}", short_opt, option_it->nargs_, values.size())
            );
          }

          result.args_[option_it->name_] = std::move(values);
        }
      }
    } else {
      // Positional argument
      result.positional_.emplace_back(arg);
    }
  }

  return result;
}

void ArgumentParser::print_help(std::FILE* stream) const noexcept {
  fmt::print(stream, "Usage: {}", name_);
  if (!options_.empty()) {
    fmt::print(stream, " [OPTIONS]");
  }
  if (!positional_usage_.empty()) {
    fmt::print(stream, " {}", positional_usage_);
  }
  fmt::print(stream, "\n\n");

  if (!desc_.empty()) {
    fmt::print(stream, "{}\n\n", desc_);
  }

  if (!options_.empty()) {
    fmt::print(stream, "Options:\n");
    for (auto const& option : options_) {
      fmt::print(stream, "  ");

      if (!option.short_name_.empty()) {
        fmt::print(stream, "-{}", option.short_name_);
        if (!option.name_.empty()) {
          fmt::print(stream, ", ");
        }
      }

      if (!option.name_.empty()) {
        fmt::print(stream, "--{}", option.name_);
      }

      if (option.nargs_ > 0) {
        fmt::print(stream, " <value>");
        if (option.nargs_ > 1) {
          fmt::print(stream, "...");
        }
      }

      if (!option.description_.empty()) {
        fmt::print(stream, "\n    {}", option.description_);
      }

      if (option.default_value_) {
        fmt::print(stream, " (default: {})", option.default_value_->front());
      }

      fmt::print(stream, "\n");
    }
  }
}

void ArgumentParser::print_version(std::FILE* stream) noexcept {
  fmt::print(stream, "{} {}\n", core::constant::EXE_NAME, core::constant::VERSION);
}

auto create_default_arg_parser() -> ArgumentParser {
  // clang-format off
  ArgumentParser parser(std::string{core::constant::EXE_NAME}, std::string{core::constant::EXE_DESC});
  parser.positional_usage("[--] COMMAND...");

  parser.add_argument("shell", "s")
    .nargs(1)
    .desc("Shell name or path (default: $SHELLRUNNER_SHELL, then the invoking shell)");
  parser.add_argument("no-check")
    .desc("Keep going when a command fails and exit with its status");
  parser.add_argument("quiet", "q")
    .desc("Do not show command output while it runs");
  parser.add_argument("no-echo")
    .desc("Do not print the commands before running them");
  parser.add_argument("reporter")
    .nargs(1)
    .desc("Path of the shellrunner-status helper");
  parser.add_argument("verbose", "v")
    .desc("Print the resolved shell and the pipeline status to stderr");
  parser.add_argument("help", "h")
    .desc("Show help message");
  parser.add_argument("version", "V")
    .desc("Show version message");

  return parser;
  // clang-format on
}

} // namespace shellrunner::cli
