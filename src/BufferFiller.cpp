#include "BufferFiller.h"

namespace LTextSanitizer {

BufferFiller::FillResult BufferFiller::fill(ByteSource& source, uint8_t* dst, std::size_t len) {
    FillResult result;
    while (result.count < len) {
        const std::size_t got = source.read(dst + result.count, len - result.count);
        if (got == 0) {
            result.status = FillStatus::ShortRead;
            return result;
        }
        result.count += got;
    }
    return result;
}

} // namespace LTextSanitizer
