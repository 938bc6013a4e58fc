#pragma once

#include <expected>
#include <string>

namespace shellrunner::core {

template<typename T, typename U = std::string>
using Result = std::expected<T, U>;

} // namespace shellrunner::core
