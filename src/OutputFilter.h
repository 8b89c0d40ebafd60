#ifndef LTEXTSANITIZER_OUTPUTFILTER_H
#define LTEXTSANITIZER_OUTPUTFILTER_H

#include "ByteStream.h"
#include "Utf8Span.h"
#include <cstddef>
#include <cstdint>

namespace LTextSanitizer {

// Write side of the pipeline. Receives verified text only, so the ASCII
// mode can walk scalars without re-validating.
class OutputFilter {
public:
    static constexpr uint8_t TAB   = 0x09;   // \t
    static constexpr uint8_t LF    = 0x0A;   // \n
    static constexpr uint8_t SPACE = 0x20;
    static constexpr uint8_t TILDE = 0x7E;

    OutputFilter(ByteSink& sink, bool asciiOnly) noexcept
        : sink_(sink), asciiOnly_(asciiOnly) {}

    OutputFilter(const OutputFilter&) = delete;
    OutputFilter& operator=(const OutputFilter&) = delete;

    void write(Utf8Span text);
    void flush();

    bool asciiOnly() const noexcept { return asciiOnly_; }

    // Bytes forwarded to the sink so far.
    std::size_t bytesWritten() const noexcept { return bytesWritten_; }

    // Tab, LF and printable ASCII.
    static constexpr bool isSafeAscii(uint8_t b) noexcept {
        return b == TAB || b == LF || (b >= SPACE && b <= TILDE);
    }

private:
    void forward(const uint8_t* p, std::size_t n);

    ByteSink&   sink_;
    bool        asciiOnly_;
    std::size_t bytesWritten_ = 0;
};

} // namespace LTextSanitizer

#endif // LTEXTSANITIZER_OUTPUTFILTER_H
