#ifndef LTEXTSANITIZER_STREAMPIPELINE_H
#define LTEXTSANITIZER_STREAMPIPELINE_H

#include "BoundaryResolver.h"
#include "BufferFiller.h"
#include "ByteStream.h"
#include "OutputFilter.h"
#include <cstddef>
#include <cstdint>
#include <memory>

namespace LTextSanitizer {

struct PipelineConfig {
    std::size_t bufferSize = 128;
    bool        asciiOnly  = false;
};

struct PipelineStats {
    std::size_t rounds       = 0;
    std::size_t bytesRead    = 0;
    std::size_t bytesWritten = 0;
};

// Pulls bytes from a source, keeps only well-formed UTF-8 (optionally only
// safe ASCII) and pushes the result to a sink, in O(bufferSize^2) memory.
class StreamPipeline {
public:
    enum class StateError {
        None,
        ZeroBufferSize,
        BufferTooSmall,
        BufferTooLarge,
        OutOfMemory
    };

    enum class State {
        Priming,
        Draining,
        Finished
    };

    // Must hold the longest UTF-8 encoding.
    static constexpr std::size_t kMinBufferSize = UTF8Handler::kMaxSequenceLength;
    // The resolver's validity table is bufferSize^2 / 2 bytes; 16 KiB keeps it near 128 MiB.
    static constexpr std::size_t kMaxBufferSize = 16 * 1024;

    static std::unique_ptr<StreamPipeline> Create(ByteSource& source,
                                                  ByteSink& sink,
                                                  const PipelineConfig& config,
                                                  StateError* err = nullptr);

    StreamPipeline(const StreamPipeline&) = delete;
    StreamPipeline& operator=(const StreamPipeline&) = delete;
    StreamPipeline(StreamPipeline&&) = delete;
    StreamPipeline& operator=(StreamPipeline&&) = delete;

    // Runs until the source is exhausted and the buffer is drained, then flushes.
    // IoError from the source or sink escapes and leaves the pipeline unusable.
    // Calling it again after it finished returns the same stats.
    PipelineStats run();

    State state() const noexcept { return state_; }
    const PipelineConfig& config() const noexcept { return config_; }
    const PipelineStats& stats() const noexcept { return stats_; }

    static const char* describe(StateError err) noexcept;

private:
    StreamPipeline(ByteSource& source, ByteSink& sink, const PipelineConfig& config);

    // Fills [from, bufferSize) and updates m_/takenLimit_ for the next round.
    void refill(std::size_t from);

    ByteSource&                source_;
    PipelineConfig             config_;
    OutputFilter               filter_;
    BoundaryResolver           resolver_;
    std::unique_ptr<uint8_t[]> buffer_;
    std::size_t                m_;
    std::size_t                takenLimit_;
    bool                       sourceExhausted_;
    State                      state_;
    PipelineStats              stats_;
};

} // namespace LTextSanitizer

#endif // LTEXTSANITIZER_STREAMPIPELINE_H
