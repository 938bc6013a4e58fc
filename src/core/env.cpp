#include "shellrunner/core/env.hpp"

#include <cstdlib>
#include <unordered_map>
#include <utility>

#include "shellrunner/core/syscall.hpp"

extern "C" {
  extern char** environ; // NOLINT
}

namespace shellrunner::core::env {

namespace {

struct EnvVar {
  // An empty optional caches a variable known to be unset.
  std::unordered_map<std::string, std::optional<std::string>> cache_;

  EnvVar(EnvVar const&)            = delete;
  EnvVar& operator=(EnvVar const&) = delete;
  EnvVar(EnvVar&&)                 = delete;
  EnvVar& operator=(EnvVar&&)      = delete;

  // singleton
  static EnvVar& instance();

private:
  EnvVar()  = default;
  ~EnvVar() = default;
};

EnvVar& EnvVar::instance() {
  static EnvVar instance;
  return instance;
}

} // namespace

auto get(std::string_view name) -> std::optional<std::string> {
  auto& cache = EnvVar::instance().cache_;
  auto  key   = std::string{name};
  if (auto it = cache.find(key); it != cache.end()) {
    return it->second;
  }

  std::optional<std::string> value;
  if (char const* raw = std::getenv(key.c_str())) {
    value = raw;
  }
  cache.emplace(std::move(key), value);
  return value;
}

void set(std::string name, std::string value) {
  auto& cache = EnvVar::instance().cache_;
  if (setenv(name.c_str(), value.c_str(), 1) == 0) {
    cache.insert_or_assign(std::move(name), std::move(value));
  }
}

void unset(std::string const& name) {
  auto& cache = EnvVar::instance().cache_;
  if (unsetenv(name.c_str()) == 0) {
    cache.insert_or_assign(name, std::nullopt);
  }
}

void clear_cache() {
  EnvVar::instance().cache_.clear();
}

auto environ() -> char** {
  return ::environ;
}

auto self_executable() -> std::optional<std::string> {
  auto path = syscall::read_link("/proc/self/exe");
  if (!path) {
    return std::nullopt;
  }
  return *path;
}

} // namespace shellrunner::core::env
