/*
    * UTF8 helper
    * Version: 0.1.0
    * Author: Shahin Youssefi
    * License: MIT
    * Date: 2025-10-02
    *
    * Table-driven UTF-8 scalar decoder shared by the boundary resolver
    * and the output filter. A sequence is accepted only if it is the shortest
    * form of a Unicode scalar value: no continuation lead bytes, no overlongs,
    * no surrogates, nothing above U+10FFFF.
    * NOTE: decode() is called O(n^2) times per round by the resolver, so the
    * code favors branch-light table lookups over readability.
*/

#ifndef LTEXTSANITIZER_UTF8HANDLER_H
#define LTEXTSANITIZER_UTF8HANDLER_H

#include <cstdint>
#include <cstddef>
#include <array>
#include <utility>

namespace LTextSanitizer {

/// \namespace utf8_detail
/// \brief Compile-time generation of the lead byte table. Not public API.
///
/// The generators live outside UTF8Handler so the table can be
/// constant-initialized in-class under C++17.
namespace utf8_detail {

    struct LeadInfo {
        uint8_t  width;     // 0 = cannot start a sequence
        uint8_t  mask;      // payload bits of the lead byte
        uint8_t  loCont;    // allowed range of the first continuation byte
        uint8_t  hiCont;
    };

    // Tightening the first continuation byte range per lead byte rejects
    // overlongs, surrogates and > U+10FFFF without decoding the scalar first.
    constexpr LeadInfo make_lead_info(std::size_t b) noexcept {
        if (b <= 0x7F)              return {1, 0x7F, 0x00, 0x00};
        if (b <= 0xC1)              return {0, 0x00, 0x00, 0x00}; // continuation / overlong 2-byte
        if (b <= 0xDF)              return {2, 0x1F, 0x80, 0xBF};
        if (b == 0xE0)              return {3, 0x0F, 0xA0, 0xBF}; // overlong below U+0800
        if (b == 0xED)              return {3, 0x0F, 0x80, 0x9F}; // surrogates
        if (b <= 0xEF)              return {3, 0x0F, 0x80, 0xBF};
        if (b == 0xF0)              return {4, 0x07, 0x90, 0xBF}; // overlong below U+10000
        if (b <= 0xF3)              return {4, 0x07, 0x80, 0xBF};
        if (b == 0xF4)              return {4, 0x07, 0x80, 0x8F}; // above U+10FFFF
        return {0, 0x00, 0x00, 0x00};
    }

    template<std::size_t... Is>
    constexpr std::array<LeadInfo, 256>
    generate_table_impl(std::index_sequence<Is...>) noexcept {
        return {{ make_lead_info(Is)... }};
    }

    constexpr std::array<LeadInfo, 256> generate_table() noexcept {
        return generate_table_impl(std::make_index_sequence<256>{});
    }
} // namespace utf8_detail

class UTF8Handler {
public:
    static constexpr std::size_t kMaxSequenceLength = 4;

    enum class DecodeStatus {
        Ok,
        NeedMore,
        Invalid
    };

    struct DecodeResult {
        uint32_t cp = 0;        // codepoint
        uint8_t width = 0;      // bytes consumed (or needed if NeedMore)
        DecodeStatus status = DecodeStatus::Invalid;
    };

    // Decodes one scalar from at most 'avail' bytes at p.
    // Invalid always reports width 1 so callers can resync on the next byte.
    [[nodiscard]] static DecodeResult decode(const uint8_t* p, std::size_t avail) noexcept;

    // Expected sequence length for a lead byte, 0 if b cannot start one.
    [[nodiscard]] static constexpr std::size_t sequenceLength(uint8_t b) noexcept {
        return lead_table[b].width;
    }

    // True if every byte of [p, p + len) forms complete scalars.
    [[nodiscard]] static bool isValid(const uint8_t* p, std::size_t len) noexcept;

private:
    alignas(64) static constexpr std::array<utf8_detail::LeadInfo, 256> lead_table =
        utf8_detail::generate_table();

    [[nodiscard]] static constexpr bool isContinuation(uint8_t b) noexcept {
        return (b & 0xC0) == 0x80;
    }

    UTF8Handler() = delete;
};

/// this library shall be compiled with GCC or Clang
#define LTS_LIKELY(x)   __builtin_expect(!!(x), 1)
#define LTS_UNLIKELY(x) __builtin_expect(!!(x), 0)

inline UTF8Handler::DecodeResult UTF8Handler::decode(const uint8_t* p, std::size_t avail) noexcept {
    DecodeResult result;

    if (LTS_UNLIKELY(avail == 0)) {
        result.status = DecodeStatus::NeedMore;
        result.width = 1;
        return result;
    }

    const uint8_t first = p[0];
    const utf8_detail::LeadInfo& info = lead_table[first];

    if (LTS_LIKELY(info.width == 1)) {
        result.cp = first;
        result.width = 1;
        result.status = DecodeStatus::Ok;
        return result;
    }

    if (LTS_UNLIKELY(info.width == 0)) {
        result.width = 1;
        return result;
    }

    // The first continuation byte is range-checked before NeedMore is reported,
    // so a truncated prefix that can never complete is Invalid, not NeedMore.
    if (avail >= 2 && (p[1] < info.loCont || p[1] > info.hiCont)) {
        result.width = 1;
        return result;
    }
    for (std::size_t k = 2; k < info.width && k < avail; ++k) {
        if (!isContinuation(p[k])) {
            result.width = 1;
            return result;
        }
    }
    if (LTS_UNLIKELY(avail < info.width)) {
        result.status = DecodeStatus::NeedMore;
        result.width = info.width;
        return result;
    }

    uint32_t cp = first & info.mask;
    for (std::size_t k = 1; k < info.width; ++k) {
        cp = (cp << 6) | (p[k] & 0x3Fu);
    }

    result.cp = cp;
    result.width = info.width;
    result.status = DecodeStatus::Ok;
    return result;
}

inline bool UTF8Handler::isValid(const uint8_t* p, std::size_t len) noexcept {
    std::size_t pos = 0;
    while (pos < len) {
        const DecodeResult r = decode(p + pos, len - pos);
        if (r.status != DecodeStatus::Ok) return false;
        pos += r.width;
    }
    return true;
}

#undef LTS_LIKELY
#undef LTS_UNLIKELY

} // namespace LTextSanitizer

#endif // LTEXTSANITIZER_UTF8HANDLER_H
