#define NO_UT_MAIN

#include "UnitTestFramework.h"
#include "UTF8Handler.h"
#include "TestStreams.h"

#include <initializer_list>
#include <string>
#include <vector>

using LTextSanitizer::UTF8Handler;
using S = UTF8Handler::DecodeStatus;
using R = UTF8Handler::DecodeResult;
using testing_streams::utf8Of;

static R lazyD(const std::initializer_list<uint8_t>& bytes, std::size_t avail) {
    std::vector<uint8_t> v(bytes);
    return UTF8Handler::decode(v.data(), avail);
}

static bool valid(const std::initializer_list<uint8_t>& bytes) {
    std::vector<uint8_t> v(bytes);
    return UTF8Handler::isValid(v.data(), v.size());
}

TEST_CASE(UTF8Handler_ASCIISingleByte) {
    auto r = lazyD({0x41}, 1);
    REQUIRE_EQ(r.status, S::Ok);
    REQUIRE_EQ(r.cp, 0x41u);
    REQUIRE_EQ(r.width, 1);

    r = lazyD({0x00}, 1);
    REQUIRE_EQ(r.status, S::Ok);
    REQUIRE_EQ(r.cp, 0x00u);

    r = lazyD({0x7F}, 1);
    REQUIRE_EQ(r.status, S::Ok);
    REQUIRE_EQ(r.cp, 0x7Fu);
}

TEST_CASE(UTF8Handler_InvalidLeadBytes) {
    for (unsigned b : {0x80u, 0xBFu, 0xC0u, 0xC1u, 0xF5u, 0xFEu, 0xFFu}) {
        const uint8_t byte = static_cast<uint8_t>(b);
        auto r = UTF8Handler::decode(&byte, 1);
        REQUIRE_EQ(r.status, S::Invalid);
        REQUIRE_EQ(r.width, 1);
        REQUIRE_EQ(UTF8Handler::sequenceLength(byte), 0u);
    }
}

TEST_CASE(UTF8Handler_SequenceLengthClasses) {
    REQUIRE_EQ(UTF8Handler::sequenceLength(0x41), 1u);
    REQUIRE_EQ(UTF8Handler::sequenceLength(0xC2), 2u);
    REQUIRE_EQ(UTF8Handler::sequenceLength(0xDF), 2u);
    REQUIRE_EQ(UTF8Handler::sequenceLength(0xE0), 3u);
    REQUIRE_EQ(UTF8Handler::sequenceLength(0xED), 3u);
    REQUIRE_EQ(UTF8Handler::sequenceLength(0xF0), 4u);
    REQUIRE_EQ(UTF8Handler::sequenceLength(0xF4), 4u);
}

TEST_CASE(UTF8Handler_TwoByte) {
    auto r = lazyD({0xC2, 0x80}, 2);
    REQUIRE_EQ(r.status, S::Ok);
    REQUIRE_EQ(r.cp, 0x80u);
    REQUIRE_EQ(r.width, 2);

    r = lazyD({0xDF, 0xBF}, 2);
    REQUIRE_EQ(r.status, S::Ok);
    REQUIRE_EQ(r.cp, 0x07FFu);

    r = lazyD({0xC2}, 1);
    REQUIRE_EQ(r.status, S::NeedMore);
    REQUIRE_EQ(r.width, 2);

    r = lazyD({0xC2, 0x41}, 2);
    REQUIRE_EQ(r.status, S::Invalid);
    REQUIRE_EQ(r.width, 1);
}

TEST_CASE(UTF8Handler_ThreeByte) {
    // U+4F60 你
    auto r = lazyD({0xE4, 0xBD, 0xA0}, 3);
    REQUIRE_EQ(r.status, S::Ok);
    REQUIRE_EQ(r.cp, 0x4F60u);
    REQUIRE_EQ(r.width, 3);

    r = lazyD({0xE0, 0xA0, 0x80}, 3);
    REQUIRE_EQ(r.status, S::Ok);
    REQUIRE_EQ(r.cp, 0x0800u);

    r = lazyD({0xEF, 0xBF, 0xBF}, 3);
    REQUIRE_EQ(r.status, S::Ok);
    REQUIRE_EQ(r.cp, 0xFFFFu);

    r = lazyD({0xE4, 0xBD}, 2);
    REQUIRE_EQ(r.status, S::NeedMore);
    REQUIRE_EQ(r.width, 3);
}

TEST_CASE(UTF8Handler_ThreeByte_OverlongAndSurrogate) {
    // Overlong U+007F
    auto r = lazyD({0xE0, 0x81, 0xBF}, 3);
    REQUIRE_EQ(r.status, S::Invalid);
    REQUIRE_EQ(r.width, 1);

    // U+D800 and U+DFFF
    REQUIRE_EQ(lazyD({0xED, 0xA0, 0x80}, 3).status, S::Invalid);
    REQUIRE_EQ(lazyD({0xED, 0xBF, 0xBF}, 3).status, S::Invalid);
    // U+D7FF is the last scalar before the surrogates
    REQUIRE_EQ(lazyD({0xED, 0x9F, 0xBF}, 3).status, S::Ok);
}

TEST_CASE(UTF8Handler_TruncatedPrefixThatCannotCompleteIsInvalid) {
    // E0 80 can only continue into an overlong; reporting NeedMore would stall.
    REQUIRE_EQ(lazyD({0xE0, 0x80}, 2).status, S::Invalid);
    REQUIRE_EQ(lazyD({0xED, 0xA0}, 2).status, S::Invalid);
    REQUIRE_EQ(lazyD({0xF0, 0x80}, 2).status, S::Invalid);
    REQUIRE_EQ(lazyD({0xF4, 0x90}, 2).status, S::Invalid);
    REQUIRE_EQ(lazyD({0xF0, 0x90, 0x41}, 3).status, S::Invalid);

    REQUIRE_EQ(lazyD({0xF0, 0x90}, 2).status, S::NeedMore);
    REQUIRE_EQ(lazyD({0xF0, 0x90, 0x80}, 3).status, S::NeedMore);
}

TEST_CASE(UTF8Handler_FourByte) {
    // U+1F600
    auto r = lazyD({0xF0, 0x9F, 0x98, 0x80}, 4);
    REQUIRE_EQ(r.status, S::Ok);
    REQUIRE_EQ(r.cp, 0x1F600u);
    REQUIRE_EQ(r.width, 4);

    r = lazyD({0xF4, 0x8F, 0xBF, 0xBF}, 4);
    REQUIRE_EQ(r.status, S::Ok);
    REQUIRE_EQ(r.cp, 0x10FFFFu);

    // U+110000
    REQUIRE_EQ(lazyD({0xF4, 0x90, 0x80, 0x80}, 4).status, S::Invalid);
    // Overlong U+FFFF
    REQUIRE_EQ(lazyD({0xF0, 0x8F, 0xBF, 0xBF}, 4).status, S::Invalid);
}

TEST_CASE(UTF8Handler_AvailZero) {
    auto r = UTF8Handler::decode(nullptr, 0);
    REQUIRE_EQ(r.status, S::NeedMore);
    REQUIRE_EQ(r.width, 1);
}

TEST_CASE(UTF8Handler_DecodesEveryScalarValue) {
    // Every scalar value's shortest form decodes back to it with the same width.
    for (uint32_t cp = 0; cp <= 0x10FFFF; cp += (cp < 0x3000 ? 1 : 97)) {
        const std::string enc = utf8Of(cp);
        if (cp >= 0xD800 && cp <= 0xDFFF) {
            REQUIRE(enc.empty());
            continue;
        }
        const auto* p = reinterpret_cast<const uint8_t*>(enc.data());
        const auto d = UTF8Handler::decode(p, enc.size());
        REQUIRE_EQ(d.status, S::Ok);
        REQUIRE_EQ(d.cp, cp);
        REQUIRE_EQ(static_cast<std::size_t>(d.width), enc.size());
        REQUIRE_EQ(UTF8Handler::sequenceLength(p[0]), enc.size());
    }
}

TEST_CASE(UTF8Handler_IsValidSequences) {
    REQUIRE(valid({}));
    REQUIRE(valid({'h', 'i'}));
    REQUIRE(valid({0xE4, 0xBD, 0xA0, 'A'}));
    REQUIRE(valid({0xF0, 0x9F, 0x98, 0x80, 0xC2, 0xA9}));

    REQUIRE(!valid({0xE4, 0xBD}));            // truncated at end
    REQUIRE(!valid({0xBD, 0xA0}));            // orphan continuations
    REQUIRE(!valid({'a', 0xFF, 'b'}));
    REQUIRE(!valid({0xC0, 0x80}));            // overlong NUL
}
