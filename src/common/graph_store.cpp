#include "ladder/graph_store.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>

#include "ladder/cli.hpp"
#include "ladder/csv.hpp"

namespace ladder {

namespace {

const std::vector<std::string> kSnapshotColumns = {"length", "word", "label", "neighbors"};

std::vector<std::string> split_words(const std::string& cell) {
    std::vector<std::string> out;
    std::istringstream iss(cell);
    std::string w;
    while (iss >> w) out.push_back(std::move(w));
    return out;
}

std::string join_words(const std::vector<std::string>& words) {
    std::string out;
    for (size_t i = 0; i < words.size(); ++i) {
        if (i) out.push_back(' ');
        out += words[i];
    }
    return out;
}

} // namespace

CsvGraphStore::CsvGraphStore(std::string path) : path_(std::move(path)) {}

LengthPartitionedGraph CsvGraphStore::parse(std::istream& in) {
    CSVReader reader(in);
    std::vector<std::string> cells;

    if (!reader.next(cells)) throw std::runtime_error("snapshot is empty");
    if (cells != kSnapshotColumns) throw std::runtime_error("unexpected snapshot header");

    LengthPartitionedGraph graph;
    while (reader.next(cells)) {
        const std::string at = "line " + std::to_string(reader.line_number()) + ": ";
        if (cells.size() != kSnapshotColumns.size()) {
            throw std::runtime_error(at + "expected " + std::to_string(kSnapshotColumns.size()) +
                                     " cells, got " + std::to_string(cells.size()));
        }
        long long length = 0;
        long long label = 0;
        try {
            length = parse_int64(cells[0], 1, std::numeric_limits<int>::max());
            label = parse_int64(cells[2], 1, std::numeric_limits<unsigned>::max());
        } catch (const std::exception& e) {
            throw std::runtime_error(at + e.what());
        }
        const std::string& word = cells[1];
        if (word.size() != static_cast<std::size_t>(length)) {
            throw std::runtime_error(at + "word '" + word + "' does not have length " + cells[0]);
        }
        try {
            graph.subgraph_for(static_cast<std::size_t>(length))
                .restore_node(word, static_cast<unsigned>(label), split_words(cells[3]));
        } catch (const std::invalid_argument& e) {
            throw std::runtime_error(at + e.what());
        }
    }

    graph.check_invariants();
    return graph;
}

std::optional<LengthPartitionedGraph> CsvGraphStore::try_load() {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) return std::nullopt;

    std::ifstream file(path_);
    if (!file.is_open()) {
        std::cerr << "Cannot open forest snapshot " << path_ << "; rebuilding.\n";
        return std::nullopt;
    }
    try {
        return parse(file);
    } catch (const std::exception& e) {
        std::cerr << "Ignoring forest snapshot " << path_ << ": " << e.what() << "\n";
        return std::nullopt;
    }
}

void CsvGraphStore::save(const LengthPartitionedGraph& graph) {
    CSVWriter out(path_);
    if (!out.is_open()) {
        throw SnapshotError("cannot create forest snapshot '" + path_ + "'");
    }
    out.header(kSnapshotColumns);

    std::vector<const WordNode*> rows;
    for (const auto& [len, g] : graph.subgraphs()) {
        rows.clear();
        rows.reserve(g.word_count());
        for (const auto& [word, node] : g.nodes()) rows.push_back(&node);
        std::sort(rows.begin(), rows.end(), [](const WordNode* a, const WordNode* b) {
            return a->word < b->word;
        });
        for (const WordNode* n : rows) {
            out.row(len, n->word, n->label, join_words(n->neighbors));
        }
    }

    if (!out.close()) {
        throw SnapshotError("failed writing forest snapshot '" + path_ + "'");
    }
}

} // namespace ladder
