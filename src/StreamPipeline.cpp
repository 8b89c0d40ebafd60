#include "StreamPipeline.h"

#include <cstring>
#include <new>
#include <spdlog/spdlog.h>

namespace LTextSanitizer {

StreamPipeline::StreamPipeline(ByteSource& source, ByteSink& sink, const PipelineConfig& config)
    : source_(source)
    , config_(config)
    , filter_(sink, config.asciiOnly)
    , resolver_(config.bufferSize)
    , buffer_(std::make_unique<uint8_t[]>(config.bufferSize))
    , m_(0)
    , takenLimit_(0)
    , sourceExhausted_(false)
    , state_(State::Priming)
{
}

std::unique_ptr<StreamPipeline> StreamPipeline::Create(ByteSource& source,
                                                       ByteSink& sink,
                                                       const PipelineConfig& config,
                                                       StateError* err)
{
    if (config.bufferSize == 0) {
        if (err) *err = StateError::ZeroBufferSize;
        return nullptr;
    }

    if (config.bufferSize < kMinBufferSize) {
        if (err) *err = StateError::BufferTooSmall;
        return nullptr;
    }

    if (config.bufferSize > kMaxBufferSize) {
        if (err) *err = StateError::BufferTooLarge;
        return nullptr;
    }

    try {
        auto p = std::unique_ptr<StreamPipeline>(new StreamPipeline(source, sink, config));
        if (err) *err = StateError::None;
        spdlog::debug("pipeline: buffer_size={} ascii_only={}", config.bufferSize, config.asciiOnly);
        return p;
    } catch (const std::bad_alloc&) {
        if (err) *err = StateError::OutOfMemory;
        return nullptr;
    }
}

const char* StreamPipeline::describe(StateError err) noexcept {
    switch (err) {
    case StateError::None:           return "no error";
    case StateError::ZeroBufferSize: return "buffer size must be positive";
    case StateError::BufferTooSmall: return "buffer size must be at least 4 bytes";
    case StateError::BufferTooLarge: return "buffer size must not exceed 16384 bytes";
    case StateError::OutOfMemory:    return "out of memory";
    }
    return "unknown error";
}

void StreamPipeline::refill(std::size_t from) {
    const std::size_t room = config_.bufferSize - from;
    std::size_t got = 0;
    bool full = false;

    if (!sourceExhausted_) {
        const auto r = BufferFiller::fill(source_, buffer_.get() + from, room);
        got  = r.count;
        full = r.status == BufferFiller::FillStatus::Filled;
        sourceExhausted_ = !full;
    }
    stats_.bytesRead += got;

    if (full) {
        m_ = config_.bufferSize;
        takenLimit_ = config_.bufferSize / 2;
    } else {
        // Nothing more will arrive: the next round must consume everything.
        m_ = from + got;
        takenLimit_ = m_;
    }
}

PipelineStats StreamPipeline::run() {
    if (state_ == State::Finished) return stats_;

    if (state_ == State::Priming) {
        refill(0);
        state_ = State::Draining;
    }

    while (m_ > 0) {
        const std::size_t taken = resolver_.resolve(buffer_.get(), m_, takenLimit_, filter_);
        ++stats_.rounds;
        spdlog::trace("round {}: m={} taken_limit={} taken={}", stats_.rounds, m_, takenLimit_, taken);

        const std::size_t kept = m_ - taken;
        if (kept > 0) {
            std::memmove(buffer_.get(), buffer_.get() + taken, kept);
        }
        refill(kept);
    }

    filter_.flush();
    stats_.bytesWritten = filter_.bytesWritten();
    state_ = State::Finished;
    spdlog::debug("pipeline finished: rounds={} read={} written={}",
                  stats_.rounds, stats_.bytesRead, stats_.bytesWritten);
    return stats_;
}

} // namespace LTextSanitizer
