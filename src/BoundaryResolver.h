#ifndef LTEXTSANITIZER_BOUNDARYRESOLVER_H
#define LTEXTSANITIZER_BOUNDARYRESOLVER_H

#include "OutputFilter.h"
#include "Utf8Span.h"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace LTextSanitizer {

// Decides how much of the working buffer can be consumed this round.
//
// Every split point is priced by a dynamic program: a span [i, j) costs 0 if
// it is complete UTF-8 and (j - i) otherwise, and cost[i] is the cheapest
// partition of [i, m). Walking backtrack[] from 0 emits the valid spans and
// skips the invalid ones. Spans may start at any index <= takenLimit; the span
// that crosses takenLimit is taken whole, so a character is never cut.
//
// Ties between end points go to the smallest j, which makes every chosen valid
// span a single scalar and every discarded span a single byte.
//
// All tables are sized for 'capacity' at construction and reused each round.
class BoundaryResolver {
public:
    explicit BoundaryResolver(std::size_t capacity);

    BoundaryResolver(const BoundaryResolver&) = delete;
    BoundaryResolver& operator=(const BoundaryResolver&) = delete;

    // Classifies buffer[0, m), writes the valid spans of the consumed prefix to
    // 'out' in order and returns the prefix length. Requires m <= capacity()
    // and takenLimit <= m. Returns a value >= 1 whenever m > 0.
    std::size_t resolve(const uint8_t* buffer, std::size_t m, std::size_t takenLimit, OutputFilter& out);

    std::size_t capacity() const noexcept { return capacity_; }

    // Results of the most recent resolve(), valid until the next call.
    std::size_t cost(std::size_t i) const noexcept { return cost_[i]; }
    std::size_t backtrack(std::size_t i) const noexcept { return backtrack_[i]; }
    bool isValidSpan(std::size_t i, std::size_t j) const noexcept { return valid_[index(i, j)] != 0; }

private:
    // Row i of the triangle holds j = i+1 .. m, so it has (m - i) entries.
    std::size_t index(std::size_t i, std::size_t j) const noexcept {
        return i * m_ - (i * (i - 1)) / 2 + (j - i - 1);
    }

    void buildTables(const uint8_t* buffer);

    std::size_t capacity_;
    std::size_t m_ = 0;
    std::vector<std::size_t> cost_;
    std::vector<std::size_t> backtrack_;
    std::vector<uint8_t>     valid_;
};

} // namespace LTextSanitizer

#endif // LTEXTSANITIZER_BOUNDARYRESOLVER_H
