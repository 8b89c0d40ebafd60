#include "BoundaryResolver.h"

#include <limits>

namespace LTextSanitizer {

BoundaryResolver::BoundaryResolver(std::size_t capacity)
    : capacity_(capacity)
    , cost_(capacity + 1, 0)
    , backtrack_(capacity, 0)
    , valid_(capacity * (capacity + 1) / 2, 0)
{
}

void BoundaryResolver::buildTables(const uint8_t* buffer) {
    const std::size_t m = m_;
    cost_[m] = 0;

    for (std::size_t i = m; i-- > 0;) {
        // One decode per start index: whether [i, j) is valid only depends on
        // the scalar at i and on row (i + width), which is already filled in.
        const auto r = UTF8Handler::decode(buffer + i, m - i);
        const std::size_t width = (r.status == UTF8Handler::DecodeStatus::Ok) ? r.width : 0;

        std::size_t best = std::numeric_limits<std::size_t>::max();
        std::size_t bestJ = i + 1;
        for (std::size_t j = i + 1; j <= m; ++j) {
            bool ok = false;
            if (width != 0 && i + width <= j) {
                ok = (i + width == j) || valid_[index(i + width, j)] != 0;
            }
            valid_[index(i, j)] = ok ? 1 : 0;

            const std::size_t total = (ok ? 0 : j - i) + cost_[j];
            if (total < best) {
                best = total;
                bestJ = j;
            }
        }
        cost_[i] = best;
        backtrack_[i] = bestJ;
    }
}

std::size_t BoundaryResolver::resolve(const uint8_t* buffer, std::size_t m, std::size_t takenLimit, OutputFilter& out) {
    if (m == 0) return 0;
    m_ = m;
    buildTables(buffer);

    std::size_t i = 0;
    while (i <= takenLimit && i < m) {
        const std::size_t j = backtrack_[i];
        if (valid_[index(i, j)] != 0) {
            out.write(Utf8Span(buffer + i, j - i));
        }
        i = j;
    }
    return i;
}

} // namespace LTextSanitizer
