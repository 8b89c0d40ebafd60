#ifndef LTEXTSANITIZER_BUFFERFILLER_H
#define LTEXTSANITIZER_BUFFERFILLER_H

#include "ByteStream.h"
#include <cstddef>
#include <cstdint>

namespace LTextSanitizer {

class BufferFiller {
public:
    enum class FillStatus {
        Filled,     // destination range completely filled
        ShortRead   // source hit end of stream first
    };

    struct FillResult {
        std::size_t count = 0;   // bytes stored in the destination
        FillStatus status = FillStatus::Filled;
    };

    // Reads from 'source' until [dst, dst + len) is full or a read returns 0.
    // The source is not queried again in this call once it reports end of stream.
    // IoError from the source propagates unchanged.
    [[nodiscard]] static FillResult fill(ByteSource& source, uint8_t* dst, std::size_t len);

private:
    BufferFiller() = delete;
};

} // namespace LTextSanitizer

#endif // LTEXTSANITIZER_BUFFERFILLER_H
