#include "mcplite/logging.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace mcplite {

std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> instance = [] {
        if (auto existing = spdlog::get(LOGGER_NAME)) {
            return existing;
        }
        return spdlog::stderr_color_mt(LOGGER_NAME);
    }();
    return instance;
}

void init_logging(spdlog::level::level_enum level) {
    auto log = logger();
    log->set_level(level);
    log->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    log->flush_on(spdlog::level::warn);
}

} // namespace mcplite
