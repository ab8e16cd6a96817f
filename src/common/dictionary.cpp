#include "ladder/dictionary.hpp"

#include <fstream>
#include <iostream>
#include <stdexcept>

namespace ladder {

std::vector<std::string> read_words(std::istream& in) {
    std::vector<std::string> words;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        words.push_back(std::move(line));
        line.clear();
    }
    if (in.bad()) {
        throw DictionaryError("read error after " + std::to_string(words.size()) + " lines");
    }
    return words;
}

std::vector<std::string> read_words(const std::string& path) {
    if (path == "-") return read_words(std::cin);

    std::ifstream file(path);
    if (!file.is_open()) {
        throw DictionaryError("could not open word list '" + path + "'");
    }
    try {
        return read_words(file);
    } catch (const DictionaryError& e) {
        throw DictionaryError(path + ": " + e.what());
    }
}

} // namespace ladder
