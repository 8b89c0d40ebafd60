#ifndef LTEXTSANITIZER_UTF8SPAN_H
#define LTEXTSANITIZER_UTF8SPAN_H

#include "UTF8Handler.h"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace LTextSanitizer {

class BoundaryResolver;

// Non-owning view over bytes known to be complete, well-formed UTF-8.
// Only the resolver (which has already proven validity) and verify() can mint one.
class Utf8Span {
public:
    // Checked construction for callers outside the resolver.
    [[nodiscard]] static std::optional<Utf8Span> verify(const uint8_t* data, std::size_t size) noexcept {
        if (size > 0 && data == nullptr) return std::nullopt;
        if (!UTF8Handler::isValid(data, size)) return std::nullopt;
        return Utf8Span(data, size);
    }

    [[nodiscard]] static std::optional<Utf8Span> verify(std::string_view text) noexcept {
        return verify(reinterpret_cast<const uint8_t*>(text.data()), text.size());
    }

    // A span never owns its bytes, so it cannot be made from a temporary string.
    static std::optional<Utf8Span> verify(std::string&&) = delete;

    const uint8_t* data() const noexcept { return data_; }
    std::size_t    size() const noexcept { return size_; }
    bool           empty() const noexcept { return size_ == 0; }

private:
    friend class BoundaryResolver;

    Utf8Span(const uint8_t* data, std::size_t size) noexcept : data_(data), size_(size) {}

    const uint8_t* data_;
    std::size_t    size_;
};

} // namespace LTextSanitizer

#endif // LTEXTSANITIZER_UTF8SPAN_H
