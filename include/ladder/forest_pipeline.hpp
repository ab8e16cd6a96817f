#pragma once

#include <functional>
#include <ostream>
#include <string>
#include <vector>

#include "ladder/graph_store.hpp"
#include "ladder/word_filter.hpp"
#include "ladder/word_graph.hpp"

namespace ladder {

// Supplies the raw dictionary; called at most once, and only when a build is needed.
using WordSource = std::function<std::vector<std::string>()>;

struct PipelineConfig {
    static constexpr const char* kDefaultDictionary = "/usr/share/dict/words";
    static constexpr unsigned kAutoThreads = 0;

    WordFilter filter{};
    unsigned threads = kAutoThreads; // 0 = hardware concurrency
    bool rebuild = false;            // ignore any stored snapshot
};

struct LoadResult {
    LengthPartitionedGraph graph;
    bool from_store = false;
    std::size_t candidates = 0;  // raw dictionary lines seen (build only)
    double sec_load = 0.0;       // snapshot read, or dictionary read + filtering
    double sec_explore = 0.0;    // forest labeling (build only)
    double sec_save = 0.0;       // snapshot write (build only)
};

// Add the words accepted by filter to graph, unlabeled. Returns the number of
// accepted entries; a repeated word is counted each time it appears.
std::size_t admit_words(LengthPartitionedGraph& graph, const std::vector<std::string>& words,
                        const WordFilter& filter);

// Filter words, bucket them by length and label every forest.
LengthPartitionedGraph build_graph(const std::vector<std::string>& words, const WordFilter& filter,
                                   unsigned threads);

// Restore the graph from store, or build it from source and save it exactly once.
// Progress lines go to log. Exceptions from source (unreadable dictionary) and
// from store.save() (unwritable snapshot) propagate to the caller.
LoadResult load_or_build(GraphStore& store, const WordSource& source, const PipelineConfig& config,
                         std::ostream& log);

} // namespace ladder
