#pragma once

#include <istream>
#include <stdexcept>
#include <string>
#include <vector>

namespace ladder {

// The word list could not be opened or read.
class DictionaryError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Reads a word list, one candidate per line. No filtering happens here; a
// trailing '\r' (CRLF files) is stripped so that the filter sees the bare word.
std::vector<std::string> read_words(std::istream& in);

// Reads the word list at path, or stdin when path is "-".
// Throws DictionaryError if the file cannot be opened or reading fails.
std::vector<std::string> read_words(const std::string& path);

} // namespace ladder
