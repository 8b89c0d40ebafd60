#include "ByteStream.h"
#include "CommandLine.h"
#include "Log.h"
#include "StreamPipeline.h"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <memory>
#include <spdlog/spdlog.h>
#include <unistd.h>

using namespace LTextSanitizer;

namespace {

constexpr int kExitIoFailure = 1;
constexpr int kExitUsage     = 2;

} // namespace

int main(int argc, char* argv[]) {
    const ParseResult parsed = parseCommandLine(argc, argv);
    switch (parsed.status) {
    case ParseResult::Status::Help:
        std::fputs(usage(argv[0]).c_str(), stdout);
        return EXIT_SUCCESS;
    case ParseResult::Status::Version:
        std::printf("ltextsanitizer %s\n", kVersion);
        return EXIT_SUCCESS;
    case ParseResult::Status::Invalid:
        initLogging(0);
        spdlog::error("{}", parsed.message);
        std::fputs(usage(argv[0]).c_str(), stderr);
        return kExitUsage;
    case ParseResult::Status::Ok:
        break;
    }

    const CliOptions& opts = parsed.options;
    initLogging(opts.verbosity);

    std::ifstream file;
    std::unique_ptr<ByteSource> source;
    if (opts.inputPath.empty() || opts.inputPath == "-") {
        source = std::make_unique<FdByteSource>(STDIN_FILENO);
    } else {
        file.open(opts.inputPath, std::ios::in | std::ios::binary);
        if (!file) {
            spdlog::error("cannot open '{}'", opts.inputPath);
            return kExitIoFailure;
        }
        source = std::make_unique<IstreamByteSource>(file);
    }
    FdByteSink sink(STDOUT_FILENO);

    StreamPipeline::StateError err = StreamPipeline::StateError::None;
    auto pipeline = StreamPipeline::Create(*source, sink, opts.pipeline, &err);
    if (!pipeline) {
        spdlog::error("invalid configuration: {} (got {})",
                      StreamPipeline::describe(err), opts.pipeline.bufferSize);
        return kExitUsage;
    }

    try {
        pipeline->run();
    } catch (const IoError& e) {
        spdlog::critical("{}", e.what());
        return kExitIoFailure;
    }
    return EXIT_SUCCESS;
}
