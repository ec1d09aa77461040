#pragma once
#include <spdlog/spdlog.h>
#include <memory>

namespace mcplite {

constexpr const char* LOGGER_NAME = "mcplite";

/// Shared library logger. Writes to stderr so stdout stays reserved for
/// protocol lines. Created on first use.
std::shared_ptr<spdlog::logger> logger();

/// Set the library logger's level and line pattern.
void init_logging(spdlog::level::level_enum level = spdlog::level::info);

} // namespace mcplite
