#ifndef LTEXTSANITIZER_LOG_H
#define LTEXTSANITIZER_LOG_H

#include <spdlog/common.h>

namespace LTextSanitizer {

// Maps -v count to a level: 0 warn, 1 info, 2 debug, 3+ trace.
spdlog::level::level_enum levelForVerbosity(int verbosity) noexcept;

// Installs a stderr logger as spdlog's default. stdout carries data only.
void initLogging(int verbosity);

} // namespace LTextSanitizer

#endif // LTEXTSANITIZER_LOG_H
