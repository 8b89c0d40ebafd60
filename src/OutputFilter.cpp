#include "OutputFilter.h"

namespace LTextSanitizer {

void OutputFilter::write(Utf8Span text) {
    if (text.empty()) return;

    if (!asciiOnly_) {
        forward(text.data(), text.size());
        return;
    }

    // Coalesce runs of kept bytes so the sink sees one write per run.
    const uint8_t* p = text.data();
    const std::size_t n = text.size();
    std::size_t runStart = 0;
    std::size_t pos = 0;
    while (pos < n) {
        // Lead bytes of valid text always have a non-zero length.
        const std::size_t width = UTF8Handler::sequenceLength(p[pos]);
        if (width == 1 && isSafeAscii(p[pos])) {
            ++pos;
            continue;
        }
        forward(p + runStart, pos - runStart);
        pos += width;
        runStart = pos;
    }
    forward(p + runStart, pos - runStart);
}

void OutputFilter::flush() {
    sink_.flush();
}

void OutputFilter::forward(const uint8_t* p, std::size_t n) {
    if (n == 0) return;
    sink_.write(p, n);
    bytesWritten_ += n;
}

} // namespace LTextSanitizer
