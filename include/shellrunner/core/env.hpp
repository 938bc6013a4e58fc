#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace shellrunner::core::env {

// Lookups are cached; set() and unset() keep the cache and the process environment in sync.
auto get(std::string_view name) -> std::optional<std::string>;
void set(std::string name, std::string value);
void unset(std::string const& name);
void clear_cache();
auto environ() -> char**;

// Path of the running executable, or nullopt if /proc is unavailable.
auto self_executable() -> std::optional<std::string>;

} // namespace shellrunner::core::env
