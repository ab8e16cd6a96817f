#include "ladder/word_filter.hpp"

#include <stdexcept>
#include <string>

namespace ladder {

void WordFilter::validate() const {
    if (min_length > max_length) {
        throw std::invalid_argument("min length " + std::to_string(min_length) +
                                    " exceeds max length " + std::to_string(max_length));
    }
}

bool WordFilter::accepts(std::string_view candidate) const {
    if (candidate.empty()) return false;
    if (candidate.size() < min_length || candidate.size() > max_length) return false;
    for (char c : candidate) {
        // Anything outside a..z is either not a letter or not lowercase.
        if (c < 'a' || c > 'z') return false;
    }
    return true;
}

} // namespace ladder
