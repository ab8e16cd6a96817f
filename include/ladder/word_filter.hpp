#pragma once

#include <cstddef>
#include <limits>
#include <string_view>

namespace ladder {

// Admission predicate for dictionary candidates.
// A word is admitted when it is non-empty, consists only of ASCII 'a'..'z',
// and its length falls inside [min_length, max_length] (inclusive).
struct WordFilter {
    static constexpr std::size_t kDefaultMinLength = 1;
    static constexpr std::size_t kUnbounded = std::numeric_limits<std::size_t>::max();

    std::size_t min_length = kDefaultMinLength;
    std::size_t max_length = kUnbounded;

    // Throws std::invalid_argument when min_length > max_length.
    void validate() const;

    bool accepts(std::string_view candidate) const;

    bool operator()(std::string_view candidate) const { return accepts(candidate); }
};

} // namespace ladder
