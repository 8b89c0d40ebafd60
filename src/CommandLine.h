#ifndef LTEXTSANITIZER_COMMANDLINE_H
#define LTEXTSANITIZER_COMMANDLINE_H

#include "StreamPipeline.h"
#include <string>

namespace LTextSanitizer {

inline constexpr const char* kVersion = "0.1.0";

struct CliOptions {
    PipelineConfig pipeline;
    int            verbosity = 0;
    std::string    inputPath;   // empty or "-" = stdin
};

struct ParseResult {
    enum class Status {
        Ok,
        Help,
        Version,
        Invalid
    };

    Status      status = Status::Ok;
    CliOptions  options;
    std::string message;   // set when status == Invalid
};

// Parses argv with getopt_long. Resets optind, so it may be called repeatedly.
ParseResult parseCommandLine(int argc, char* argv[]);

std::string usage(const char* prog);

} // namespace LTextSanitizer

#endif // LTEXTSANITIZER_COMMANDLINE_H
