#include "Log.h"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace LTextSanitizer {

spdlog::level::level_enum levelForVerbosity(int verbosity) noexcept {
    if (verbosity <= 0) return spdlog::level::warn;
    if (verbosity == 1) return spdlog::level::info;
    if (verbosity == 2) return spdlog::level::debug;
    return spdlog::level::trace;
}

void initLogging(int verbosity) {
    auto logger = spdlog::get("ltextsanitizer");
    if (!logger) {
        logger = spdlog::stderr_color_mt("ltextsanitizer");
    }
    logger->set_pattern("%n: [%^%l%$] %v");
    spdlog::set_default_logger(logger);
    spdlog::set_level(levelForVerbosity(verbosity));
}

} // namespace LTextSanitizer
